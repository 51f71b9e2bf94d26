#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "connection_backend.hpp"
#include "notification_sink.hpp"

namespace test_helpers {

// polls pred until it holds or the timeout runs out
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// what the test sees and steers. outlives the backend, which the actor destroys on exit
struct FakeBackendControl {
    std::mutex mx;
    std::condition_variable cv;

    IConnectionBackend::EventCallback on_event;
    IConnectionBackend::CompletionCallback on_complete;

    // knobs
    bool fail_build = false;
    bool fail_run = false;
    std::string fail_send;      // non-empty: send fails with this text
    std::string fail_upload;
    bool hold_sends = false;    // send() parks until release()
    bool throw_build = false;   // throw instead of returning false
    bool throw_run = false;
    bool throw_shutdown = false;

    // observations
    int created = 0;
    bool built = false;
    bool running = false;
    bool shut_down = false;
    std::string store_path;
    std::vector<std::string> calls;     // "send-begin:<user>", "send-end:<user>", "upload:<kind>"
    std::vector<OutboundMessage> sent;
    std::vector<Jid> recipients;
    int in_flight = 0;
    int max_in_flight = 0;
    std::thread::id owner;
    bool touched_from_other_thread = false;
    int next_id = 1;

    void emit(InboundEvent ev) {
        IConnectionBackend::EventCallback cb;
        { std::lock_guard<std::mutex> lk(mx); cb = on_event; }
        if (cb) cb(std::move(ev));
    }

    void finish(const std::string& reason) {
        IConnectionBackend::CompletionCallback cb;
        { std::lock_guard<std::mutex> lk(mx); cb = on_complete; }
        if (cb) cb(reason);
    }

    void release() {
        { std::lock_guard<std::mutex> lk(mx); hold_sends = false; }
        cv.notify_all();
    }

    template <typename F>
    auto read(F f) {
        std::lock_guard<std::mutex> lk(mx);
        return f();
    }
};

class FakeBackend : public IConnectionBackend {
public:
    explicit FakeBackend(std::shared_ptr<FakeBackendControl> ctl) : ctl_(std::move(ctl)) {
        std::lock_guard<std::mutex> lk(ctl_->mx);
        ++ctl_->created;
    }

    ~FakeBackend() override { shutdown(); }

    void set_event_callback(EventCallback cb) override {
        std::lock_guard<std::mutex> lk(ctl_->mx);
        note_thread();
        ctl_->on_event = std::move(cb);
    }

    void set_completion_callback(CompletionCallback cb) override {
        std::lock_guard<std::mutex> lk(ctl_->mx);
        note_thread();
        ctl_->on_complete = std::move(cb);
    }

    bool build(const std::string& store_path, std::string& error) override {
        std::lock_guard<std::mutex> lk(ctl_->mx);
        note_thread();
        ctl_->store_path = store_path;
        if (ctl_->throw_build) throw std::runtime_error("store corrupt");
        if (ctl_->fail_build) { error = "store locked"; return false; }
        ctl_->built = true;
        return true;
    }

    bool run(std::string& error) override {
        std::lock_guard<std::mutex> lk(ctl_->mx);
        note_thread();
        if (ctl_->throw_run) throw std::runtime_error("socket closed");
        if (ctl_->fail_run) { error = "handshake refused"; return false; }
        ctl_->running = true;
        return true;
    }

    bool send(const Jid& to, const OutboundMessage& msg, std::string& message_id, std::string& error) override {
        std::unique_lock<std::mutex> lk(ctl_->mx);
        note_thread();
        ctl_->calls.push_back("send-begin:" + to.user);
        ctl_->in_flight++;
        if (ctl_->in_flight > ctl_->max_in_flight) ctl_->max_in_flight = ctl_->in_flight;
        ctl_->cv.wait(lk, [&]{ return !ctl_->hold_sends; });
        ctl_->in_flight--;
        ctl_->calls.push_back("send-end:" + to.user);

        if (!ctl_->fail_send.empty()) { error = ctl_->fail_send; return false; }
        ctl_->sent.push_back(msg);
        ctl_->recipients.push_back(to);
        message_id = "MSG" + std::to_string(ctl_->next_id++);
        return true;
    }

    bool upload(const std::vector<uint8_t>& bytes, MediaKind kind, UploadedMedia& out, std::string& error) override {
        std::lock_guard<std::mutex> lk(ctl_->mx);
        note_thread();
        ctl_->calls.push_back(std::string("upload:") + media_kind_name(kind));
        if (!ctl_->fail_upload.empty()) { error = ctl_->fail_upload; return false; }
        out.url = "https://media.test/blob";
        out.direct_path = "/blob";
        out.media_key = {1, 2, 3};
        out.file_enc_sha256 = {4, 5};
        out.file_sha256 = {6};
        out.file_length = bytes.size();
        return true;
    }

    void shutdown() override {
        std::lock_guard<std::mutex> lk(ctl_->mx);
        if (ctl_->shut_down) return;
        note_thread();
        ctl_->shut_down = true;
        ctl_->running = false;
        ctl_->on_event = nullptr;
        ctl_->on_complete = nullptr;
        if (ctl_->throw_shutdown) throw std::runtime_error("already disconnected");
    }

private:
    // caller holds ctl_->mx
    void note_thread() {
        auto me = std::this_thread::get_id();
        if (ctl_->owner == std::thread::id()) ctl_->owner = me;
        else if (ctl_->owner != me) ctl_->touched_from_other_thread = true;
    }

    std::shared_ptr<FakeBackendControl> ctl_;
};

inline BackendFactory fake_factory(std::shared_ptr<FakeBackendControl> ctl) {
    return [ctl]{ return std::make_unique<FakeBackend>(ctl); };
}

// keeps every notification for later inspection
class RecordingSink : public INotificationSink {
public:
    void notify(const UiNotification& n) override {
        std::lock_guard<std::mutex> lk(mx_);
        seen_.push_back(n);
    }

    std::vector<UiNotification> seen() const {
        std::lock_guard<std::mutex> lk(mx_);
        return seen_;
    }

    int count(const std::string& name) const {
        std::lock_guard<std::mutex> lk(mx_);
        int n = 0;
        for (auto& s : seen_) if (s.name == name) ++n;
        return n;
    }

private:
    mutable std::mutex mx_;
    std::vector<UiNotification> seen_;
};

} // namespace test_helpers
