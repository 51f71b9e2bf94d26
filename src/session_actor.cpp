#include "../include/session_actor.hpp"
#include "../include/event_projector.hpp"
#include "../include/session_error.hpp"

#include <exception>
#include <iostream>

SessionActor::SessionActor(SharedStatus& status, INotificationSink& sink, BackendFactory factory, SessionConfig cfg)
    : status_(status), sink_(sink), factory_(std::move(factory)), cfg_(std::move(cfg)) {}

SessionActor::~SessionActor() { stop(); }

//creates the mailbox and launches the actor thread
bool SessionActor::start(PublishFn publish) {
    if (started_.exchange(true)) return false;
    mailbox_ = make_mailbox(cfg_.command_capacity);
    th_ = std::thread(&SessionActor::thread_main, this, std::move(publish));
    return true;
}

//no more commands accepted; whatever is queued is still answered before the loop ends
void SessionActor::stop() {
    if (mailbox_) mailbox_->close();
    if (th_.joinable()) th_.join();
}

//build -> publish sender -> run -> loop -> cleanup, all on this one thread
void SessionActor::thread_main(PublishFn publish) {
    try {
        backend_ = factory_ ? factory_() : nullptr;
    } catch (const std::exception& e) {
        std::cerr << "[ACTOR] backend factory failed: " << e.what() << std::endl;
        backend_.reset();
    }
    if (!backend_) {
        std::cerr << "[ACTOR] no connection backend available" << std::endl;
        mailbox_->close();
        finished_ = true;
        return;
    }

    // backend threads only ever reach us through the mailbox
    std::shared_ptr<Mailbox> mb = mailbox_;
    backend_->set_event_callback([mb](InboundEvent ev) {
        mb->push_nowait(ActorInput{std::move(ev)});
    });
    backend_->set_completion_callback([mb](const std::string& reason) {
        mb->push_nowait(ActorInput{RunFinished{reason}});
    });

    std::string err;
    bool built = false;
    try {
        built = backend_->build(cfg_.store_path, err);
    } catch (const std::exception& e) {
        err = e.what();
    }
    if (!built) {
        std::cerr << "[ACTOR] failed to build session: " << err << std::endl;
        release_backend();
        mailbox_->close();
        finished_ = true;
        return;
    }
    std::cout << "[ACTOR] session built, starting..." << std::endl;

    if (publish) publish(CommandSender(mailbox_));

    bool running = false;
    try {
        running = backend_->run(err);
    } catch (const std::exception& e) {
        err = e.what();
    }
    if (!running) {
        std::cerr << "[ACTOR] failed to run session: " << err << std::endl;
        terminate("run failed");
        return;
    }
    std::cout << "[ACTOR] session started" << std::endl;

    loop();
}

//single authoritative loop, whichever of event / command / completion arrives first gets handled
void SessionActor::loop() {
    for (;;) {
        std::optional<ActorInput> in = mailbox_->pop();
        if (!in) {
            terminate("command channel closed");
            return;
        }

        if (auto* ev = std::get_if<InboundEvent>(&*in)) {
            handle_event(*ev);
        } else if (auto* cmd = std::get_if<Command>(&*in)) {
            handle_command(*cmd);
        } else if (auto* done = std::get_if<RunFinished>(&*in)) {
            terminate(done->reason.empty() ? "connection ended" : done->reason);
            return;
        }
    }
}

void SessionActor::handle_event(InboundEvent& ev) {
    ev.seq = seq_++;
    Projection p = project_event(ev);

    if (p.status) apply_status(*p.status, status_);
    if (!p.diagnostic.empty()) std::cout << "[ACTOR] " << p.diagnostic << std::endl;
    else if (cfg_.verbose) std::cout << "[ACTOR] (seq " << ev.seq << ") " << event_type_name(ev.type) << std::endl;

    if (p.notification) emit(*p.notification);
}

//runs the command against the backend and always answers its reply slot exactly once
void SessionActor::handle_command(Command& cmd) {
    SendOutcome out;
    try {
        if (auto* t = std::get_if<CmdSendText>(&cmd)) {
            out = exec_send_text(*t);
            t->reply.set_value(std::move(out));
        } else if (auto* m = std::get_if<CmdSendMedia>(&cmd)) {
            out = exec_send_media(*m);
            m->reply.set_value(std::move(out));
        }
    } catch (const std::future_error& e) {
        // reply slot already used, the caller has its answer
        std::cerr << "[ACTOR] reply slot: " << e.what() << std::endl;
    }
}

SendOutcome SessionActor::exec_send_text(CmdSendText& c) {
    std::cout << "[ACTOR] sending message to " << c.recipient.str() << std::endl;
    std::string id, err;
    bool ok = false;
    try {
        ok = backend_->send(c.recipient, OutboundMessage{c.payload}, id, err);
    } catch (const std::exception& e) {
        err = e.what();
    }
    if (!ok) {
        std::cerr << "[ACTOR] failed to send message: " << err << std::endl;
        return SendOutcome::failure(SessionErrc::BackendError, "Failed to send message: " + err);
    }
    std::cout << "[ACTOR] message sent with ID: " << id << std::endl;
    return SendOutcome::success(std::move(id));
}

SendOutcome SessionActor::exec_send_media(CmdSendMedia& c) {
    std::cout << "[ACTOR] uploading " << media_kind_name(c.kind) << " (" << c.bytes.size()
              << " bytes) for " << c.recipient.str() << std::endl;

    UploadedMedia up;
    std::string err;
    bool ok = false;
    try {
        ok = backend_->upload(c.bytes, c.kind, up, err);
    } catch (const std::exception& e) {
        err = e.what();
    }
    if (!ok) {
        std::cerr << "[ACTOR] upload failed: " << err << std::endl;
        return SendOutcome::failure(SessionErrc::BackendError, "Failed to upload media: " + err);
    }

    OutboundMessage msg = build_media_message(up, c.kind, c.mime, c.caption, c.file_name);

    std::string id;
    ok = false;
    try {
        ok = backend_->send(c.recipient, msg, id, err);
    } catch (const std::exception& e) {
        err = e.what();
    }
    if (!ok) {
        std::cerr << "[ACTOR] failed to send media message: " << err << std::endl;
        return SendOutcome::failure(SessionErrc::BackendError, "Failed to send media message: " + err);
    }
    std::cout << "[ACTOR] media message sent with ID: " << id << std::endl;
    return SendOutcome::success(std::move(id));
}

//loop exit, for whatever reason. readiness is revoked before anyone can queue another command
void SessionActor::terminate(const std::string& why) {
    std::cout << "[ACTOR] session ending: " << why << std::endl;

    status_.reset();
    if (!last_was_logged_out_) emit(logged_out_notification());

    // late commands are dropped unanswered, their callers get ActorUnavailable
    mailbox_->close();
    ActorInput leftover;
    std::size_t dropped = 0;
    while (mailbox_->try_pop(leftover)) {
        if (std::holds_alternative<Command>(leftover)) ++dropped;
    }
    if (dropped) std::cerr << "[ACTOR] dropped " << dropped << " queued command(s)" << std::endl;

    release_backend();
    finished_ = true;
}

//shutdown errors are logged, the backend is dropped either way
void SessionActor::release_backend() {
    if (!backend_) return;
    try {
        backend_->shutdown();
    } catch (const std::exception& e) {
        std::cerr << "[ACTOR] backend shutdown failed: " << e.what() << std::endl;
    }
    backend_.reset();
}

void SessionActor::emit(const UiNotification& n) {
    last_was_logged_out_ = (n.name == "logged-out");
    sink_.notify(n);
}
