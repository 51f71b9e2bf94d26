#pragma once
#include <cstdint>
#include <future>
#include <string>
#include <variant>
#include <vector>
#include <boost/system/error_code.hpp>
#include "message_types.hpp"

//result of one send. message_id is only meaningful when ec is clear
struct SendOutcome {
    std::string message_id;
    boost::system::error_code ec;
    std::string error_text;  // human readable, carries the backend's own text when it failed

    bool ok() const { return !ec; }
    explicit operator bool() const { return ok(); }

    static SendOutcome success(std::string id) {
        SendOutcome o; o.message_id = std::move(id); return o;
    }
    static SendOutcome failure(boost::system::error_code ec, std::string text) {
        SendOutcome o; o.ec = ec; o.error_text = std::move(text); return o;
    }
};

//single use reply slot. the actor owns the promise, the caller waits on the matching future.
//if the promise dies unanswered the caller sees broken_promise instead of hanging
using ReplySlot = std::promise<SendOutcome>;

//=========== COMMAND TYPES ===========
struct CmdSendText {
    Jid recipient;
    TextMessage payload;
    ReplySlot reply;
};

struct CmdSendMedia {
    Jid recipient;
    std::vector<uint8_t> bytes;
    MediaKind kind = MediaKind::Document;
    std::string mime;
    std::string caption;
    std::string file_name;
    ReplySlot reply;
};

using Command = std::variant<CmdSendText, CmdSendMedia>;
