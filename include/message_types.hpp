#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

//media families the backend knows how to upload
enum class MediaKind : uint8_t {
    Image,
    Video,
    Audio,
    Document,
};

const char* media_kind_name(MediaKind k);

//protocol address of a user, "<user>@<server>"
struct Jid {
    std::string user;
    std::string server;

    std::string str() const { return user + "@" + server; }
    bool operator==(const Jid& o) const { return user == o.user && server == o.server; }
};

//what the backend hands back after an upload. every field is copied into the outbound message untouched
struct UploadedMedia {
    std::string url;
    std::string direct_path;
    std::vector<uint8_t> media_key;
    std::vector<uint8_t> file_enc_sha256;
    std::vector<uint8_t> file_sha256;
    uint64_t file_length = 0;
};

//=========== OUTBOUND PAYLOADS ===========
struct TextMessage {
    std::string text;
};

// common part of every media message
struct MediaFields {
    std::string url;
    std::string direct_path;
    std::vector<uint8_t> media_key;
    std::vector<uint8_t> file_enc_sha256;
    std::vector<uint8_t> file_sha256;
    uint64_t file_length = 0;
    std::string mimetype;
};

struct ImageMessage {
    MediaFields media;
    std::optional<std::string> caption;
};

struct VideoMessage {
    MediaFields media;
    std::optional<std::string> caption;
};

struct DocumentMessage {
    MediaFields media;
    std::string file_name;
};

using OutboundMessage = std::variant<
    TextMessage,
    ImageMessage,
    VideoMessage,
    DocumentMessage
>;

//kind specific payload from an upload descriptor
//image/video keep a non-empty caption, anything else goes out as a document carrying the file name
OutboundMessage build_media_message(const UploadedMedia& up,
                                    MediaKind kind,
                                    const std::string& mime,
                                    const std::string& caption,
                                    const std::string& file_name);
