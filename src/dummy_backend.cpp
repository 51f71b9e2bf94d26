#include "../include/dummy_backend.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

DummyBackend::DummyBackend(DummyBackendConfig cfg) : cfg_(cfg) {}
DummyBackend::~DummyBackend() { shutdown(); }

//opens (or creates) the store file, a "paired" line means we skip the qr step
bool DummyBackend::build(const std::string& store_path, std::string& error) {
    store_path_ = store_path;
    {
        std::ifstream in(store_path_);
        std::string line;
        while (in && std::getline(in, line)) {
            if (line == "paired") paired_ = true;
        }
    }
    std::ofstream touch(store_path_, std::ios::app);
    if (!touch) {
        error = "cannot open store " + store_path_;
        return false;
    }
    built_ = true;
    std::cout << "[DummyBackend] store " << store_path_ << (paired_ ? " (paired)" : " (new device)") << "\n";
    return true;
}

bool DummyBackend::run(std::string& error) {
    if (!built_) {
        error = "session not built";
        return false;
    }
    if (running_) return true;
    running_ = true;
    th_ = std::thread([this]{ run_loop(); });
    return true;
}

void DummyBackend::shutdown() {
    if (!running_) return;
    {
        std::lock_guard<std::mutex> lk(wait_mx_);
        running_ = false;
    }
    wait_cv_.notify_all();
    if (th_.joinable()) th_.join();
    std::cout << "[DummyBackend] stopped\n";
}

bool DummyBackend::sleep_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(wait_mx_);
    return !wait_cv_.wait_for(lk, d, [this]{ return !running_.load(); });
}

void DummyBackend::raise(InboundEvent ev) {
    if (on_event_) on_event_(std::move(ev));
}

void DummyBackend::run_loop() {
    if (!paired_) {
        raise(make_pairing_code("2@dummy-ref," + std::to_string(std::random_device{}()) + ",msgbridge"));
        if (!sleep_for(cfg_.pair_delay)) return;
        paired_ = true;
        {
            std::ofstream out(store_path_, std::ios::app);
            out << "paired\n";
        }
        raise(make_pair_succeeded());
    }

    if (!sleep_for(cfg_.connect_delay)) return;
    raise(make_connected());

    // stay "online" until shutdown
    while (running_) {
        if (!sleep_for(std::chrono::seconds(1))) return;
    }
}

bool DummyBackend::send(const Jid& to, const OutboundMessage& msg, std::string& message_id, std::string& error) {
    if (!running_) {
        error = "not connected";
        return false;
    }
    if (to.user.empty()) {
        error = "empty recipient";
        return false;
    }

    std::ostringstream id;
    id << "3EB0" << std::uppercase << std::hex << std::setw(12) << std::setfill('0') << next_id_++;
    message_id = id.str();

    const char* kind = std::holds_alternative<TextMessage>(msg) ? "text" : "media";
    std::cout << "[DummyBackend] send " << kind << " to " << to.str() << " id=" << message_id << "\n";
    return true;
}

//no real encryption here, just a random key and the length so the message has something to carry
bool DummyBackend::upload(const std::vector<uint8_t>& bytes, MediaKind kind, UploadedMedia& out, std::string& error) {
    if (!running_) {
        error = "not connected";
        return false;
    }

    std::random_device rd;
    out.media_key.resize(32);
    for (auto& b : out.media_key) b = static_cast<uint8_t>(rd() & 0xFF);

    std::ostringstream path;
    path << "/v/t62.dummy/" << media_kind_name(kind) << "/" << next_id_;
    out.direct_path = path.str();
    out.url = "https://media.invalid" + out.direct_path;
    out.file_length = bytes.size();

    std::cout << "[DummyBackend] upload " << bytes.size() << " bytes -> " << out.url << "\n";
    return true;
}
