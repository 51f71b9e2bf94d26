#include "../include/message_types.hpp"

const char* media_kind_name(MediaKind k) {
    switch (k) {
        case MediaKind::Image:    return "image";
        case MediaKind::Video:    return "video";
        case MediaKind::Audio:    return "audio";
        case MediaKind::Document: return "document";
    }
    return "document";
}

static MediaFields media_fields(const UploadedMedia& up, const std::string& mime) {
    MediaFields f;
    f.url             = up.url;
    f.direct_path     = up.direct_path;
    f.media_key       = up.media_key;
    f.file_enc_sha256 = up.file_enc_sha256;
    f.file_sha256     = up.file_sha256;
    f.file_length     = up.file_length;
    f.mimetype        = mime;
    return f;
}

OutboundMessage build_media_message(const UploadedMedia& up,
                                    MediaKind kind,
                                    const std::string& mime,
                                    const std::string& caption,
                                    const std::string& file_name) {
    switch (kind) {
        case MediaKind::Image: {
            ImageMessage img{media_fields(up, mime), std::nullopt};
            if (!caption.empty()) img.caption = caption;
            return img;
        }
        case MediaKind::Video: {
            VideoMessage vid{media_fields(up, mime), std::nullopt};
            if (!caption.empty()) vid.caption = caption;
            return vid;
        }
        default:
            // audio rides along as a document too, the caption is dropped
            return DocumentMessage{media_fields(up, mime), file_name};
    }
}
