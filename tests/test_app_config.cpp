#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "app_config.hpp"

namespace {

bool parse(std::vector<std::string> args, AppConfig& cfg, std::string& err) {
    args.insert(args.begin(), "msgbridge");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return parse_args(static_cast<int>(argv.size()), argv.data(), cfg, err);
}

} // namespace

TEST_CASE("defaults are usable as they are", "[config]") {
    AppConfig cfg;
    std::string err;
    REQUIRE(parse({}, cfg, err));
    CHECK(cfg.data_dir == default_data_dir());
    CHECK(cfg.bind_address == "127.0.0.1");
    CHECK(cfg.port == 9002);
    CHECK(cfg.command_capacity == 32);
    CHECK(cfg.reply_timeout_ms == 0);
    CHECK(cfg.validate());
}

TEST_CASE("options override the defaults", "[config]") {
    AppConfig cfg;
    std::string err;
    REQUIRE(parse({"--data-dir", "/var/lib/mb", "--bind", "0.0.0.0", "--port", "7000",
                   "--capacity", "4", "--reply-timeout-ms", "2500", "--debug"}, cfg, err));
    CHECK(cfg.store_path() == "/var/lib/mb/session.db");
    CHECK(cfg.bind_address == "0.0.0.0");
    CHECK(cfg.port == 7000);
    CHECK(cfg.command_capacity == 4);
    CHECK(cfg.reply_timeout_ms == 2500);
    CHECK(cfg.debug);
    CHECK(cfg.validate());
}

TEST_CASE("bad command lines are rejected with a reason", "[config]") {
    AppConfig cfg;
    std::string err;

    CHECK_FALSE(parse({"--port"}, cfg, err));
    CHECK(err == "--port needs a value");

    CHECK_FALSE(parse({"--port", "70000"}, cfg, err));
    CHECK(err == "port out of range");

    CHECK_FALSE(parse({"--capacity", "lots"}, cfg, err));
    CHECK(err == "bad value for --capacity");

    CHECK_FALSE(parse({"--capacity", "-1"}, cfg, err));
    CHECK(err == "capacity must be positive");

    CHECK_FALSE(parse({"--capacity", "0"}, cfg, err));
    CHECK(err == "capacity must be positive");

    CHECK_FALSE(parse({"--verbose"}, cfg, err));
    CHECK(err == "unknown option --verbose");
}

TEST_CASE("validate catches values the parser lets through", "[config]") {
    std::string err;
    AppConfig zero_capacity;
    zero_capacity.command_capacity = 0;
    CHECK_FALSE(zero_capacity.validate());

    AppConfig negative_timeout;
    REQUIRE(parse({"--reply-timeout-ms", "-5"}, negative_timeout, err));
    CHECK_FALSE(negative_timeout.validate());

    AppConfig help;
    REQUIRE(parse({"-h"}, help, err));
    CHECK(help.help);
}
