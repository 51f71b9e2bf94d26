#pragma once
#include <cstdint>
#include <string>
#include <variant>

//============ INBOUND EVENT TYPES ==========
// what the connection backend reports, already projected to the few kinds the session cares about
enum class EventType {
    PairingCode,
    PairSucceeded,
    Connected,
    LoggedOut,
    MessageReceived,
    Other,
};

//=========== PAYLOAD TYPES ===========
struct EvPairingCode {
    std::string code;      // qr payload the ui renders for the phone to scan
};

struct EvPairSucceeded {};
struct EvConnected {};

struct EvLoggedOut {
    std::string reason;    // optional, diagnostics only
};

struct EvMessageReceived {
    std::string sender;
};

struct EvOther {
    std::string name;
};

//======= WRAPPER =======
using EventPayload = std::variant<
    EvPairingCode,
    EvPairSucceeded,
    EvConnected,
    EvLoggedOut,
    EvMessageReceived,
    EvOther
>;

//========= EVENT STRUCTURE =======
struct InboundEvent {
    EventType type;
    EventPayload data;
    uint64_t seq = 0;  // stamped by the actor, for logging
};

// convenience builders so backends don't have to spell out type + payload twice
inline InboundEvent make_pairing_code(std::string code) {
    return InboundEvent{EventType::PairingCode, EvPairingCode{std::move(code)}};
}
inline InboundEvent make_pair_succeeded() { return InboundEvent{EventType::PairSucceeded, EvPairSucceeded{}}; }
inline InboundEvent make_connected() { return InboundEvent{EventType::Connected, EvConnected{}}; }
inline InboundEvent make_logged_out(std::string reason = {}) {
    return InboundEvent{EventType::LoggedOut, EvLoggedOut{std::move(reason)}};
}
inline InboundEvent make_message_received(std::string sender) {
    return InboundEvent{EventType::MessageReceived, EvMessageReceived{std::move(sender)}};
}
inline InboundEvent make_other(std::string name) {
    return InboundEvent{EventType::Other, EvOther{std::move(name)}};
}

const char* event_type_name(EventType t);
