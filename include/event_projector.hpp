#pragma once
#include <optional>
#include <string>
#include "events.hpp"
#include "notification_sink.hpp"
#include "shared_status.hpp"

//flags an event changes. unset means "leave as is"
struct StatusUpdate {
    std::optional<bool> authenticated;
    std::optional<bool> ready;
};

//side effects of one inbound event, computed without touching anything
struct Projection {
    std::optional<StatusUpdate> status;
    std::optional<UiNotification> notification;
    std::string diagnostic;  // log line, empty when there is nothing worth saying
};

//  PairingCode     -> qr-code{code}
//  PairSucceeded   -> authenticated        + auth-success
//  Connected       -> authenticated, ready + auth-success
//  LoggedOut       -> neither              + logged-out
//  MessageReceived -> diagnostic only
//  Other           -> nothing
Projection project_event(const InboundEvent& ev);

void apply_status(const StatusUpdate& up, SharedStatus& status);
