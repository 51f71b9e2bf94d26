#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "tsqueue.hpp"

//one text frame from a ui client, tagged so the reply can find its way back
struct UiFrame {
    uint64_t client = 0;
    std::string text;
};

struct UiLinkConfig {
    std::string address = "127.0.0.1";
    uint16_t port = 9002;                       // 0 picks a free port, see UiLink::port()
    std::size_t max_frame_bytes = 1 << 20;
};

//websocket server for the graphical shell. requests land in the inbox, replies go back to
//the client that asked, notifications go to everyone
class UiLink {
public:
    // frame sent to each client right after its handshake
    using GreetingFn = std::function<std::string()>;

    explicit UiLink(TSQueue<UiFrame>& inbox);
    ~UiLink();

    UiLink(const UiLink&) = delete;
    UiLink& operator=(const UiLink&) = delete;

    void set_greeting(GreetingFn fn);

    // false if the listener could not be opened
    bool start(const UiLinkConfig& cfg);
    void stop();

    void send_to(uint64_t client, std::string text);
    void broadcast(std::string text);

    uint16_t port() const;
    std::size_t clients() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
