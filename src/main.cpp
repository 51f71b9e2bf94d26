#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio.hpp>

#include "../include/app_config.hpp"
#include "../include/dummy_backend.hpp"
#include "../include/session.hpp"
#include "../include/shared_status.hpp"
#include "../include/tsqueue.hpp"
#include "../include/ui_bridge.hpp"
#include "../include/ui_link.hpp"

static void print_usage() {
    std::cout <<
        "usage: msgbridge [options]\n"
        "  --data-dir DIR          where the session store lives (default " << default_data_dir() << ")\n"
        "  --bind ADDR             websocket listen address (default 127.0.0.1)\n"
        "  --port N                websocket port (default 9002)\n"
        "  --capacity N            queued commands before callers wait (default 32)\n"
        "  --reply-timeout-ms N    give up waiting on the session after N ms (default 0, never)\n"
        "  --debug                 log every session event\n"
        "  -h, --help              this text\n";
}

int main(int argc, char* argv[]) {
    AppConfig cfg;
    std::string err;
    if (!parse_args(argc, argv, cfg, err)) {
        std::cerr << "[MAIN] " << err << "\n";
        print_usage();
        return 1;
    }
    if (cfg.help) {
        print_usage();
        return 0;
    }
    if (!cfg.validate()) {
        std::cerr << "[MAIN] invalid configuration\n";
        return 1;
    }

    // request frames from the ui, pushed by the link's io thread, handled by this one
    TSQueue<UiFrame> requests;
    SharedStatus status;

    UiLink link(requests);
    link.set_greeting([&status]{ return encode_status(status.snapshot()); });

    UiLinkConfig lcfg;
    lcfg.address = cfg.bind_address;
    lcfg.port    = cfg.port;
    if (!link.start(lcfg)) return 1;

    LinkNotifier notifier(link);

    SessionConfig scfg;
    scfg.store_path       = cfg.store_path();
    scfg.command_capacity = cfg.command_capacity;
    scfg.reply_timeout    = std::chrono::milliseconds(cfg.reply_timeout_ms);
    scfg.verbose          = cfg.debug;

    Session session(status, notifier, []{ return std::make_unique<DummyBackend>(); }, scfg);
    UiBridge bridge(session);

    // ctrl-c / SIGTERM closes the request list, which ends the loop below
    boost::asio::io_context sig_ioc;
    boost::asio::signal_set signals(sig_ioc, SIGINT, SIGTERM);
    signals.async_wait([&requests](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        std::cout << "[MAIN] signal " << signo << ", shutting down\n";
        requests.close();
    });
    std::thread sig_thread([&sig_ioc]{ sig_ioc.run(); });

    uint64_t seq = 1; //counter, used for logging
    while (auto frame = requests.pop()) {
        if (cfg.debug) std::cout << "[MAIN] (seq " << seq << ", client " << frame->client << ") " << frame->text << "\n";
        ++seq;
        uint64_t client = frame->client;
        bridge.handle_async(frame->text, [&link, client](std::string reply) {
            link.send_to(client, std::move(reply));
        });
    }

    // sends still waiting on the actor get ActorUnavailable once it is gone
    session.shutdown();
    bridge.drain();
    link.stop();
    sig_ioc.stop();
    if (sig_thread.joinable()) sig_thread.join();
    return 0;
}
