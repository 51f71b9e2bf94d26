#include "../include/session_error.hpp"

#include <ostream>
#include <string>

namespace {

class SessionCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "msgbridge/session"; }

    std::string message(int val) const override {
        switch (static_cast<SessionErrc>(val)) {
            case SessionErrc::NotInitialized:
                return "WhatsApp not initialized";
            case SessionErrc::NotReady:
                return "WhatsApp is not ready yet. Please wait for connection to complete.";
            case SessionErrc::LocalIOError:
                return "Local file operation failed";
            case SessionErrc::BackendError:
                return "Connection backend rejected the operation";
            case SessionErrc::ActorUnavailable:
                return "Session actor ended unexpectedly";
            case SessionErrc::ReplyTimeout:
                return "Timed out waiting for the session to reply";
            case SessionErrc::InvalidRequest:
                return "Malformed request";
        }
        return "Unknown session error";
    }
};

} // namespace

const boost::system::error_category& session_category() noexcept {
    static const SessionCategory cat;
    return cat;
}

boost::system::error_code make_error_code(SessionErrc e) {
    return boost::system::error_code(static_cast<int>(e), session_category());
}

const char* session_errc_symbol(SessionErrc e) {
    switch (e) {
        case SessionErrc::NotInitialized:   return "NOT_INITIALIZED";
        case SessionErrc::NotReady:         return "NOT_READY";
        case SessionErrc::LocalIOError:     return "LOCAL_IO_ERROR";
        case SessionErrc::BackendError:     return "BACKEND_ERROR";
        case SessionErrc::ActorUnavailable: return "ACTOR_UNAVAILABLE";
        case SessionErrc::ReplyTimeout:     return "REPLY_TIMEOUT";
        case SessionErrc::InvalidRequest:   return "INVALID_REQUEST";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, SessionErrc e) {
    return os << session_errc_symbol(e);
}
