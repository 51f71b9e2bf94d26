#include "../include/media_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace {

using MimeTable = std::unordered_map<std::string, std::string>;

const MimeTable kImageMimes = {
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png", "image/png"},
    {"gif", "image/gif"},
    {"webp", "image/webp"},
};

const MimeTable kVideoMimes = {
    {"mp4", "video/mp4"},
    {"mov", "video/quicktime"},
    {"avi", "video/x-msvideo"},
    {"mkv", "video/x-matroska"},
};

const MimeTable kAudioMimes = {
    {"mp3", "audio/mpeg"},
    {"ogg", "audio/ogg"},
    {"wav", "audio/wav"},
    {"m4a", "audio/mp4"},
};

const MimeTable kDocumentMimes = {
    {"pdf", "application/pdf"},
    {"doc", "application/msword"},
    {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {"xls", "application/vnd.ms-excel"},
    {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {"zip", "application/zip"},
    {"txt", "text/plain"},
};

std::string lookup(const MimeTable& table, const std::string& ext, const char* fallback) {
    auto it = table.find(ext);
    return it != table.end() ? it->second : std::string(fallback);
}

} // namespace

std::string file_extension(const std::string& path) {
    std::filesystem::path p(path);
    std::string ext = p.filename().extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string display_file_name(const std::string& path) {
    std::string name = std::filesystem::path(path).filename().string();
    if (name.empty() || name == "." || name == "..") return "document";
    return name;
}

MediaClass classify_media(const std::string& label, const std::string& path) {
    const std::string ext = file_extension(path);

    if (label == "image") return {MediaKind::Image, lookup(kImageMimes, ext, "image/jpeg")};
    if (label == "video") return {MediaKind::Video, lookup(kVideoMimes, ext, "video/mp4")};
    if (label == "audio") return {MediaKind::Audio, lookup(kAudioMimes, ext, "audio/mpeg")};

    // "document", "" and anything unrecognised
    return {MediaKind::Document, lookup(kDocumentMimes, ext, "application/octet-stream")};
}
