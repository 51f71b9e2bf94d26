#pragma once
#include <string>
#include "message_types.hpp"

struct MediaClass {
    MediaKind kind = MediaKind::Document;
    std::string mime;
};

// label is the ui's "image" / "video" / "audio" / anything else (document).
// unknown extensions fall back to a per family default mime
MediaClass classify_media(const std::string& label, const std::string& path);

// lower-cased text after the last '.' of the final path segment, "" when there is none
std::string file_extension(const std::string& path);

// final path segment, "document" when the path has none
std::string display_file_name(const std::string& path);
