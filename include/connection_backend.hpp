#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "events.hpp"
#include "message_types.hpp"

//the protocol implementation the session drives. owned by exactly one thread (the session actor),
//none of the calls below may be made from anywhere else
class IConnectionBackend {
public:
    virtual ~IConnectionBackend() = default;

    // backend calls these from its own threads, whenever it likes
    using EventCallback = std::function<void(InboundEvent)>;
    virtual void set_event_callback(EventCallback cb) = 0;

    // fired once when run() has finished for good (disconnect, fatal error)
    using CompletionCallback = std::function<void(const std::string& reason)>;
    virtual void set_completion_callback(CompletionCallback cb) = 0;

    // open the store and build the session, false + error text on failure
    virtual bool build(const std::string& store_path, std::string& error) = 0;

    // connect and start producing events. returns straight away
    virtual bool run(std::string& error) = 0;

    virtual bool send(const Jid& to, const OutboundMessage& msg, std::string& message_id, std::string& error) = 0;

    virtual bool upload(const std::vector<uint8_t>& bytes, MediaKind kind, UploadedMedia& out, std::string& error) = 0;

    // stop everything, no callbacks after this returns
    virtual void shutdown() = 0;
};

using BackendFactory = std::function<std::unique_ptr<IConnectionBackend>()>;
