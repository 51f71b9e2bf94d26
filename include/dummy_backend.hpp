#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include "connection_backend.hpp"

struct DummyBackendConfig {
    std::chrono::milliseconds pair_delay{3000};     // how long the fake phone takes to scan the qr code
    std::chrono::milliseconds connect_delay{500};
};

//loopback stand-in for the real protocol stack. pairs once (remembered in the store file),
//connects, hands out message ids and fake upload descriptors. nothing leaves the machine
class DummyBackend : public IConnectionBackend {
public:
    explicit DummyBackend(DummyBackendConfig cfg = {});
    ~DummyBackend() override;

    void set_event_callback(EventCallback cb) override { on_event_ = std::move(cb); }
    void set_completion_callback(CompletionCallback cb) override { on_complete_ = std::move(cb); }

    bool build(const std::string& store_path, std::string& error) override;
    bool run(std::string& error) override;
    bool send(const Jid& to, const OutboundMessage& msg, std::string& message_id, std::string& error) override;
    bool upload(const std::vector<uint8_t>& bytes, MediaKind kind, UploadedMedia& out, std::string& error) override;
    void shutdown() override;

private:
    void run_loop();
    bool sleep_for(std::chrono::milliseconds d);  // false if shutdown interrupted the wait
    void raise(InboundEvent ev);

    DummyBackendConfig cfg_;
    EventCallback on_event_;
    CompletionCallback on_complete_;

    std::string store_path_;
    bool paired_ = false;
    bool built_ = false;

    std::thread th_;
    std::atomic<bool> running_{false};
    std::mutex wait_mx_;
    std::condition_variable wait_cv_;

    uint64_t next_id_ = 1;
};
