#include "../include/session.hpp"
#include "../include/media_classifier.hpp"
#include "../include/recipient.hpp"
#include "../include/session_error.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

// whole file into memory, no streaming
static bool read_file(const std::string& path, std::vector<uint8_t>& out, std::string& error) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        error = path + ": is a directory";
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = path + ": " + std::strerror(errno);
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = path + ": read failed";
        return false;
    }
    return true;
}

Session::Session(SharedStatus& status, INotificationSink& sink, BackendFactory factory, SessionConfig cfg)
    : status_(status), sink_(sink), factory_(std::move(factory)), cfg_(std::move(cfg)) {}

Session::~Session() { shutdown(); }

boost::system::error_code Session::init() {
    std::lock_guard<std::mutex> lk(init_mx_);

    if (actor_ && !actor_->finished()) return {};   // already up (or still building)

    // previous session ended, clear it out before starting over
    if (actor_) {
        actor_->stop();
        actor_.reset();
    }
    {
        std::lock_guard<std::mutex> slk(sender_mx_);
        sender_ = CommandSender();
    }

    fs::path parent = fs::path(cfg_.store_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[SESSION] cannot create " << parent << ": " << ec.message() << std::endl;
            return make_error_code(SessionErrc::LocalIOError);
        }
    }
    std::cout << "[SESSION] using store path: " << cfg_.store_path << std::endl;

    actor_ = std::make_unique<SessionActor>(status_, sink_, factory_, cfg_);
    actor_->start([this](CommandSender s){ publish(std::move(s)); });
    return {};
}

void Session::shutdown() {
    std::lock_guard<std::mutex> lk(init_mx_);
    {
        std::lock_guard<std::mutex> slk(sender_mx_);
        sender_ = CommandSender();
    }
    if (actor_) {
        actor_->stop();
        actor_.reset();
    }
    // the actor may have published while we were stopping it
    std::lock_guard<std::mutex> slk(sender_mx_);
    sender_ = CommandSender();
}

std::size_t Session::queued_commands() {
    std::lock_guard<std::mutex> lk(init_mx_);
    return actor_ ? actor_->queued() : 0;
}

//actor thread hands us its sender once the backend is built
void Session::publish(CommandSender s) {
    std::lock_guard<std::mutex> lk(sender_mx_);
    sender_ = std::move(s);
}

CommandSender Session::current_sender() const {
    std::lock_guard<std::mutex> lk(sender_mx_);
    return sender_;
}

SendOutcome Session::send_text(const std::string& recipient, const std::string& body) {
    if (!status_.is_ready())
        return SendOutcome::failure(SessionErrc::NotReady, make_error_code(SessionErrc::NotReady).message());

    CommandSender s = current_sender();
    if (!s)
        return SendOutcome::failure(SessionErrc::NotInitialized, make_error_code(SessionErrc::NotInitialized).message());

    Jid jid = make_user_jid(recipient);
    std::cout << "[SESSION] sending message to contact: " << jid.user << std::endl;

    CmdSendText cmd{std::move(jid), TextMessage{body}, ReplySlot{}};
    std::future<SendOutcome> reply = cmd.reply.get_future();
    return submit(s, Command{std::move(cmd)}, std::move(reply));
}

SendOutcome Session::send_media(const std::string& recipient,
                                const std::string& caption,
                                const std::string& file_path,
                                const std::string& kind_label) {
    if (!status_.is_ready())
        return SendOutcome::failure(SessionErrc::NotReady, make_error_code(SessionErrc::NotReady).message());

    CommandSender s = current_sender();
    if (!s)
        return SendOutcome::failure(SessionErrc::NotInitialized, make_error_code(SessionErrc::NotInitialized).message());

    Jid jid = make_user_jid(recipient);
    std::cout << "[SESSION] sending " << kind_label << " to: " << jid.user << std::endl;

    CmdSendMedia cmd;
    std::string err;
    if (!read_file(file_path, cmd.bytes, err)) {
        std::cerr << "[SESSION] " << err << std::endl;
        return SendOutcome::failure(SessionErrc::LocalIOError, err);
    }
    std::cout << "[SESSION] read media file: " << cmd.bytes.size() << " bytes" << std::endl;

    MediaClass mc = classify_media(kind_label, file_path);
    cmd.recipient = std::move(jid);
    cmd.kind      = mc.kind;
    cmd.mime      = std::move(mc.mime);
    cmd.caption   = caption;
    cmd.file_name = display_file_name(file_path);

    std::future<SendOutcome> reply = cmd.reply.get_future();
    return submit(s, Command{std::move(cmd)}, std::move(reply));
}

//enqueue, then wait on the reply slot. a dropped slot means the actor is gone
SendOutcome Session::submit(const CommandSender& s, Command cmd, std::future<SendOutcome> reply) {
    if (!s.send(std::move(cmd))) {
        return SendOutcome::failure(SessionErrc::ActorUnavailable,
                                    make_error_code(SessionErrc::ActorUnavailable).message());
    }

    if (cfg_.reply_timeout.count() > 0 &&
        reply.wait_for(cfg_.reply_timeout) == std::future_status::timeout) {
        std::cerr << "[SESSION] no reply after " << cfg_.reply_timeout.count() << "ms" << std::endl;
        return SendOutcome::failure(SessionErrc::ReplyTimeout, make_error_code(SessionErrc::ReplyTimeout).message());
    }

    try {
        return reply.get();
    } catch (const std::future_error& e) {
        std::cerr << "[SESSION] actor task ended unexpectedly: " << e.what() << std::endl;
        return SendOutcome::failure(SessionErrc::ActorUnavailable,
                                    make_error_code(SessionErrc::ActorUnavailable).message());
    }
}
