#pragma once
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <boost/system/error_code.hpp>
#include "command_channel.hpp"
#include "commands.hpp"
#include "connection_backend.hpp"
#include "notification_sink.hpp"
#include "session_actor.hpp"
#include "shared_status.hpp"

//what the ui talks to. every call here runs on the caller's thread and only ever reaches
//the backend by queueing a command for the session actor and waiting on its reply slot
class Session {
public:
    Session(SharedStatus& status, INotificationSink& sink, BackendFactory factory, SessionConfig cfg);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // starts the actor. no-op while one is alive, starts a fresh one after the last ended.
    // only fails if the store directory can't be created, build errors are logged by the actor
    boost::system::error_code init();

    bool is_ready() const { return status_.is_ready(); }

    SendOutcome send_text(const std::string& recipient, const std::string& body);

    // kind_label: "image", "video", "audio", anything else is sent as a document
    SendOutcome send_media(const std::string& recipient,
                           const std::string& caption,
                           const std::string& file_path,
                           const std::string& kind_label);

    // drops our sender and waits for the actor to wind down
    void shutdown();

    // mailbox depth of the current actor, 0 when there is none
    std::size_t queued_commands();

private:
    void publish(CommandSender s);
    CommandSender current_sender() const;
    SendOutcome submit(const CommandSender& s, Command cmd, std::future<SendOutcome> reply);

    SharedStatus& status_;
    INotificationSink& sink_;
    BackendFactory factory_;
    SessionConfig cfg_;

    std::mutex init_mx_;                  // serialises init()/shutdown()
    std::unique_ptr<SessionActor> actor_;

    mutable std::mutex sender_mx_;
    CommandSender sender_;                // invalid until the actor publishes
};
