#include "../include/event_projector.hpp"

const char* event_type_name(EventType t) {
    switch (t) {
        case EventType::PairingCode:     return "PairingCode";
        case EventType::PairSucceeded:   return "PairSucceeded";
        case EventType::Connected:       return "Connected";
        case EventType::LoggedOut:       return "LoggedOut";
        case EventType::MessageReceived: return "MessageReceived";
        case EventType::Other:           return "Other";
    }
    return "Other";
}

//a payload that doesn't match its type is projected like Other
Projection project_event(const InboundEvent& ev) {
    Projection p;
    switch (ev.type) {
        case EventType::PairingCode: {
            const auto* d = std::get_if<EvPairingCode>(&ev.data);
            if (!d) break;
            p.notification = qr_code_notification(d->code);
            p.diagnostic = "QR code generated";
            break;
        }
        case EventType::PairSucceeded:
            p.status = StatusUpdate{true, std::nullopt};
            p.notification = auth_success_notification();
            p.diagnostic = "pair success";
            break;

        case EventType::Connected:
            p.status = StatusUpdate{true, true};
            p.notification = auth_success_notification();
            p.diagnostic = "connected, session is ready";
            break;

        case EventType::LoggedOut: {
            const auto* d = std::get_if<EvLoggedOut>(&ev.data);
            if (!d) break;
            p.status = StatusUpdate{false, false};
            p.notification = logged_out_notification();
            p.diagnostic = d->reason.empty() ? "logged out" : "logged out: " + d->reason;
            break;
        }
        case EventType::MessageReceived: {
            const auto* d = std::get_if<EvMessageReceived>(&ev.data);
            if (!d) break;
            p.diagnostic = "message received from: " + d->sender;
            break;
        }
        case EventType::Other:
            break;
    }
    return p;
}

void apply_status(const StatusUpdate& up, SharedStatus& status) {
    auto cur = status.snapshot();
    status.set(up.authenticated.value_or(cur.authenticated), up.ready.value_or(cur.ready));
}
