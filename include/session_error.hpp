#pragma once
#include <iosfwd>
#include <boost/system/error_code.hpp>

//failures a caller of the session can see. 0 is never used so a default error_code means success
enum class SessionErrc {
    NotInitialized = 1,  // no command sender published yet (init() not called or still building)
    NotReady,            // session not connected, ready flag is false
    LocalIOError,        // reading the media file or preparing the store dir failed
    BackendError,        // send/upload rejected by the connection backend
    ActorUnavailable,    // actor went away before answering
    ReplyTimeout,        // reply did not arrive within SessionConfig::reply_timeout
    InvalidRequest,      // ui bridge could not decode a request
};

const boost::system::error_category& session_category() noexcept;

boost::system::error_code make_error_code(SessionErrc e);

// stable upper case symbol, used on the wire ("NOT_READY")
const char* session_errc_symbol(SessionErrc e);

std::ostream& operator<<(std::ostream& os, SessionErrc e);

namespace boost::system {
template<>
struct is_error_code_enum<::SessionErrc> {
    static const bool value = true;
};
} // namespace boost::system
