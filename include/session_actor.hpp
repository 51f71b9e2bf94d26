#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include "command_channel.hpp"
#include "connection_backend.hpp"
#include "notification_sink.hpp"
#include "shared_status.hpp"

struct SessionConfig {
    std::string store_path = "session.db";          // handed to the backend untouched
    std::size_t command_capacity = 32;              // mailbox bound, callers wait when it is full
    std::chrono::milliseconds reply_timeout{0};     // 0 = wait for the actor forever
    bool verbose = false;                           // log every event the actor sees
};

//sole owner of the connection backend. one thread builds it, runs it, feeds it commands,
//reacts to its events and tears it down again
class SessionActor {
public:
    // called on the actor thread once the backend is built, before the loop starts
    using PublishFn = std::function<void(CommandSender)>;

    SessionActor(SharedStatus& status, INotificationSink& sink, BackendFactory factory, SessionConfig cfg);
    ~SessionActor();

    SessionActor(const SessionActor&) = delete;
    SessionActor& operator=(const SessionActor&) = delete;

    // spawns the actor thread, false if it was already started
    bool start(PublishFn publish);

    // closes the mailbox (commands already queued still run) and waits for the thread
    void stop();

    // true once the loop has exited, or the backend never got built
    bool finished() const { return finished_.load(); }

    // inputs waiting in the mailbox, events and completions included
    std::size_t queued() const { return mailbox_ ? mailbox_->size() : 0; }

private:
    void thread_main(PublishFn publish);
    void loop();
    void handle_event(InboundEvent& ev);
    void handle_command(Command& cmd);
    SendOutcome exec_send_text(CmdSendText& c);
    SendOutcome exec_send_media(CmdSendMedia& c);
    void terminate(const std::string& why);
    void release_backend();
    void emit(const UiNotification& n);

    SharedStatus& status_;
    INotificationSink& sink_;
    BackendFactory factory_;
    SessionConfig cfg_;

    std::shared_ptr<Mailbox> mailbox_;
    std::unique_ptr<IConnectionBackend> backend_;  // touched by the actor thread only

    std::thread th_;
    std::atomic<bool> started_{false};
    std::atomic<bool> finished_{false};

    // actor thread state
    bool last_was_logged_out_ = false;
    uint64_t seq_ = 1;
};
