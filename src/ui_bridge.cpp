#include "../include/ui_bridge.hpp"
#include "../include/session_error.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include <boost/asio/post.hpp>

using nlohmann::json;

// backend text (qr payloads, error strings) is not guaranteed to be valid utf-8
static std::string to_wire(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

static bool is_send(const std::string& cmd) {
    return cmd == "send_message" || cmd == "send_media_message";
}

static const char* errc_symbol(const boost::system::error_code& ec) {
    if (ec.category() == session_category()) return session_errc_symbol(static_cast<SessionErrc>(ec.value()));
    return "ERROR";
}

// pulls a required string member, false if it is missing or not a string
static bool get_string(const json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

static std::string string_or_empty(const json& obj, const char* key) {
    std::string out;
    return get_string(obj, key, out) ? out : std::string();
}

bool decode_request(const std::string& frame, UiRequest& out, std::string& error) {
    json j = json::parse(frame, nullptr, false);
    if (j.is_discarded()) {
        error = "request is not valid JSON";
        return false;
    }
    if (!j.is_object()) {
        error = "request must be a JSON object";
        return false;
    }

    out.id = j.contains("id") ? j["id"] : json();
    if (!get_string(j, "cmd", out.cmd)) {
        error = "missing \"cmd\"";
        return false;
    }
    out.args = std::move(j);
    return true;
}

std::string encode_notification(const UiNotification& n) {
    json j = {
        {"type", "event"},
        {"event", n.name},
        {"payload", n.payload},
    };
    return to_wire(j);
}

std::string encode_status(const SharedStatus::Snapshot& s) {
    json j = {
        {"type", "status"},
        {"authenticated", s.authenticated},
        {"ready", s.ready},
    };
    return to_wire(j);
}

std::string encode_reply_ok(const json& id, const json& result) {
    json j = {
        {"type", "reply"},
        {"id", id},
        {"ok", true},
        {"result", result},
    };
    return to_wire(j);
}

std::string encode_reply_error(const json& id, const boost::system::error_code& ec, const std::string& text) {
    json j = {
        {"type", "reply"},
        {"id", id},
        {"ok", false},
        {"error", text.empty() ? ec.message() : text},
        {"code", errc_symbol(ec)},
    };
    return to_wire(j);
}

UiBridge::UiBridge(Session& session, std::size_t workers)
    : session_(session), workers_(workers == 0 ? 1 : workers) {}

UiBridge::~UiBridge() { drain(); }

void UiBridge::drain() { workers_.join(); }

void UiBridge::handle_async(const std::string& frame, ReplyFn reply) {
    UiRequest req;
    std::string err;
    if (!decode_request(frame, req, err) || !is_send(req.cmd)) {
        reply(handle(frame));
        return;
    }

    boost::asio::post(workers_, [this, req = std::move(req), reply = std::move(reply)] {
        try {
            reply(dispatch(req));
        } catch (const std::exception& e) {
            std::cerr << "[UI] " << req.cmd << " failed: " << e.what() << std::endl;
            reply(encode_reply_error(req.id, make_error_code(SessionErrc::BackendError), e.what()));
        }
    });
}

std::string UiBridge::handle(const std::string& frame) {
    UiRequest req;
    std::string err;
    if (!decode_request(frame, req, err)) {
        std::cerr << "[UI] bad request: " << err << std::endl;
        // id may still be recoverable from a well formed object without cmd
        return encode_reply_error(req.id, make_error_code(SessionErrc::InvalidRequest), err);
    }
    return dispatch(req);
}

std::string UiBridge::dispatch(const UiRequest& req) {
    if (req.cmd == "init") {
        auto ec = session_.init();
        if (ec) return encode_reply_error(req.id, ec, ec.message());
        return encode_reply_ok(req.id, nullptr);
    }

    if (req.cmd == "is_ready") {
        return encode_reply_ok(req.id, session_.is_ready());
    }

    auto invalid = [&](const std::string& what) {
        return encode_reply_error(req.id, make_error_code(SessionErrc::InvalidRequest), what);
    };

    if (req.cmd == "send_message") {
        std::string contact, message;
        if (!get_string(req.args, "contact", contact) || !get_string(req.args, "message", message))
            return invalid("send_message needs \"contact\" and \"message\"");

        SendOutcome r = session_.send_text(contact, message);
        if (!r) return encode_reply_error(req.id, r.ec, r.error_text);
        return encode_reply_ok(req.id, r.message_id);
    }

    if (req.cmd == "send_media_message") {
        std::string contact, path;
        if (!get_string(req.args, "contact", contact) || !get_string(req.args, "media_path", path))
            return invalid("send_media_message needs \"contact\" and \"media_path\"");
        // caption and type are optional, empty type means document
        std::string text = string_or_empty(req.args, "message_text");
        std::string type = string_or_empty(req.args, "media_type");

        SendOutcome r = session_.send_media(contact, text, path, type);
        if (!r) return encode_reply_error(req.id, r.ec, r.error_text);
        return encode_reply_ok(req.id, r.message_id);
    }

    return invalid("unknown command: " + req.cmd);
}

void LinkNotifier::notify(const UiNotification& n) {
    link_.broadcast(encode_notification(n));
}
