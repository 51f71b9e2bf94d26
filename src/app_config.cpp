#include "../include/app_config.hpp"

#include <cstdlib>
#include <exception>

std::string default_data_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return std::string(home) + "/.local/share/msgbridge";
    return "./msgbridge-data";
}

bool parse_args(int argc, char* argv[], AppConfig& cfg, std::string& error) {
    cfg.data_dir = default_data_dir();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto need_value = [&]() -> const char* {
            if (i + 1 >= argc) {
                error = arg + " needs a value";
                return nullptr;
            }
            return argv[++i];
        };

        try {
            if (arg == "--data-dir") {
                const char* v = need_value(); if (!v) return false;
                cfg.data_dir = v;
            } else if (arg == "--bind") {
                const char* v = need_value(); if (!v) return false;
                cfg.bind_address = v;
            } else if (arg == "--port") {
                const char* v = need_value(); if (!v) return false;
                int p = std::stoi(v);
                if (p <= 0 || p > 65535) { error = "port out of range"; return false; }
                cfg.port = static_cast<uint16_t>(p);
            } else if (arg == "--capacity") {
                const char* v = need_value(); if (!v) return false;
                // signed parse, stoul would wrap "-1" to a huge bound
                long n = std::stol(v);
                if (n <= 0) { error = "capacity must be positive"; return false; }
                cfg.command_capacity = static_cast<std::size_t>(n);
            } else if (arg == "--reply-timeout-ms") {
                const char* v = need_value(); if (!v) return false;
                cfg.reply_timeout_ms = std::stol(v);
            } else if (arg == "--debug") {
                cfg.debug = true;
            } else if (arg == "--help" || arg == "-h") {
                cfg.help = true;
            } else {
                error = "unknown option " + arg;
                return false;
            }
        } catch (const std::exception&) {
            error = "bad value for " + arg;
            return false;
        }
    }
    return true;
}
