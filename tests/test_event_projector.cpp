#include <catch2/catch.hpp>

#include <random>
#include <vector>

#include "event_projector.hpp"

namespace {

SharedStatus::Snapshot run_events(const std::vector<InboundEvent>& events) {
    SharedStatus status;
    for (auto& ev : events) {
        auto p = project_event(ev);
        if (p.status) apply_status(*p.status, status);
    }
    return status.snapshot();
}

// reference model, written straight from the table
SharedStatus::Snapshot model_step(SharedStatus::Snapshot s, EventType t) {
    switch (t) {
        case EventType::PairSucceeded: s.authenticated = true; break;
        case EventType::Connected:     s.authenticated = true; s.ready = true; break;
        case EventType::LoggedOut:     s = {}; break;
        default: break;
    }
    return s;
}

InboundEvent make_event(EventType t) {
    switch (t) {
        case EventType::PairingCode:     return make_pairing_code("2@abc");
        case EventType::PairSucceeded:   return make_pair_succeeded();
        case EventType::Connected:       return make_connected();
        case EventType::LoggedOut:       return make_logged_out();
        case EventType::MessageReceived: return make_message_received("15550100@s.whatsapp.net");
        case EventType::Other:           return make_other("presence");
    }
    return make_other("?");
}

} // namespace

TEST_CASE("pairing code only reaches the ui", "[projector]") {
    auto p = project_event(make_pairing_code("2@xyz,key"));
    CHECK_FALSE(p.status.has_value());
    REQUIRE(p.notification);
    CHECK(p.notification->name == "qr-code");
    CHECK(p.notification->payload["code"] == "2@xyz,key");
}

TEST_CASE("pair success authenticates but does not make the session ready", "[projector]") {
    auto p = project_event(make_pair_succeeded());
    REQUIRE(p.status);
    CHECK(p.status->authenticated == std::optional<bool>(true));
    CHECK_FALSE(p.status->ready.has_value());
    REQUIRE(p.notification);
    CHECK(p.notification->name == "auth-success");
}

TEST_CASE("connected sets both flags", "[projector]") {
    auto p = project_event(make_connected());
    REQUIRE(p.status);
    CHECK(p.status->authenticated == std::optional<bool>(true));
    CHECK(p.status->ready == std::optional<bool>(true));
    REQUIRE(p.notification);
    CHECK(p.notification->name == "auth-success");
    CHECK(p.notification->payload.empty());
}

TEST_CASE("logged out clears both flags", "[projector]") {
    auto p = project_event(make_logged_out("device removed"));
    REQUIRE(p.status);
    CHECK(p.status->authenticated == std::optional<bool>(false));
    CHECK(p.status->ready == std::optional<bool>(false));
    REQUIRE(p.notification);
    CHECK(p.notification->name == "logged-out");
    CHECK(p.diagnostic == "logged out: device removed");
}

TEST_CASE("received messages and other events leave status alone", "[projector]") {
    auto msg = project_event(make_message_received("1555@s.whatsapp.net"));
    CHECK_FALSE(msg.status.has_value());
    CHECK_FALSE(msg.notification.has_value());
    CHECK(msg.diagnostic == "message received from: 1555@s.whatsapp.net");

    auto other = project_event(make_other("receipt"));
    CHECK_FALSE(other.status.has_value());
    CHECK_FALSE(other.notification.has_value());
    CHECK(other.diagnostic.empty());
}

TEST_CASE("a payload that does not match its type is ignored", "[projector]") {
    for (auto t : {EventType::PairingCode, EventType::LoggedOut, EventType::MessageReceived}) {
        InboundEvent ev{t, EvConnected{}};
        Projection p;
        REQUIRE_NOTHROW(p = project_event(ev));
        CHECK_FALSE(p.status.has_value());
        CHECK_FALSE(p.notification.has_value());
        CHECK(p.diagnostic.empty());
    }
}

TEST_CASE("status follows the events in order", "[projector]") {
    CHECK(run_events({make_pair_succeeded()}) == SharedStatus::Snapshot{true, false});
    CHECK(run_events({make_connected(), make_logged_out()}) == SharedStatus::Snapshot{false, false});
    CHECK(run_events({make_logged_out(), make_connected()}) == SharedStatus::Snapshot{true, true});
    CHECK(run_events({make_connected(), make_pairing_code("x"), make_other("y")}) == SharedStatus::Snapshot{true, true});
}

TEST_CASE("random event sequences match the reference table", "[projector]") {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> pick(0, 5);

    for (int round = 0; round < 200; ++round) {
        std::vector<InboundEvent> events;
        SharedStatus::Snapshot expected;
        int len = 1 + round % 12;
        for (int i = 0; i < len; ++i) {
            auto t = static_cast<EventType>(pick(rng));
            events.push_back(make_event(t));
            expected = model_step(expected, t);
        }
        INFO("round " << round);
        CHECK(run_events(events) == expected);
    }
}
