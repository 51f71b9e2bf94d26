#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <boost/asio/thread_pool.hpp>
#include <boost/system/error_code.hpp>
#include <nlohmann/json.hpp>
#include "notification_sink.hpp"
#include "session.hpp"
#include "shared_status.hpp"
#include "ui_link.hpp"

//one decoded request frame from the shell
//  {"id": 7, "cmd": "send_message", "contact": "+1 555-0100", "message": "hi"}
struct UiRequest {
    nlohmann::json id;      // echoed in the reply, null when the client sent none
    std::string cmd;        // init | is_ready | send_message | send_media_message
    nlohmann::json args;    // the whole request object
};

bool decode_request(const std::string& frame, UiRequest& out, std::string& error);

std::string encode_notification(const UiNotification& n);
// {"type":"status","authenticated":..,"ready":..}, greets a freshly connected shell
std::string encode_status(const SharedStatus::Snapshot& s);
std::string encode_reply_ok(const nlohmann::json& id, const nlohmann::json& result);
std::string encode_reply_error(const nlohmann::json& id, const boost::system::error_code& ec, const std::string& text);

//turns request frames into session calls. init / is_ready / malformed requests are answered on the
//calling thread, sends run on a small worker pool so a stalled send never holds up a status poll
class UiBridge {
public:
    using ReplyFn = std::function<void(std::string)>;

    explicit UiBridge(Session& session, std::size_t workers = 4);
    ~UiBridge();

    UiBridge(const UiBridge&) = delete;
    UiBridge& operator=(const UiBridge&) = delete;

    // one frame in, one reply frame out, blocks for as long as the session call does
    std::string handle(const std::string& frame);

    // reply may run before this returns (quick commands) or later on a worker (sends)
    void handle_async(const std::string& frame, ReplyFn reply);

    // waits until every queued send has replied. no requests may follow
    void drain();

private:
    std::string dispatch(const UiRequest& req);

    Session& session_;
    boost::asio::thread_pool workers_;
};

//notification sink that pushes every notification to all connected shells
class LinkNotifier : public INotificationSink {
public:
    explicit LinkNotifier(UiLink& link) : link_(link) {}
    void notify(const UiNotification& n) override;

private:
    UiLink& link_;
};
