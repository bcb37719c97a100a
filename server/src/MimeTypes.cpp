#include "MimeTypes.h"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace {

    const std::unordered_map<std::string, std::string> kAudioMimeToExt = {
        { "audio/ogg; codecs=opus",  "ogg" },
        { "audio/ogg",               "ogg" },
        { "audio/webm; codecs=opus", "webm" },
        { "audio/webm",              "webm" },
        { "audio/mp4; codecs=opus",  "m4a" },
        { "audio/mp4",               "m4a" },
        { "audio/m4a",               "m4a" },
    };

    const std::unordered_map<std::string, std::string> kAudioExtToMime = {
        { "ogg",  "audio/ogg" },
        { "webm", "audio/webm" },
        { "m4a",  "audio/mp4" },
    };

    // Primary MIME type (parameters stripped) -> canonical extension.
    const std::unordered_map<std::string, std::string> kMimeToExt = {
        { "image/jpeg", "jpg" },
        { "image/pjpeg", "jpg" },
        { "image/png", "png" },
        { "image/gif", "gif" },
        { "image/webp", "webp" },
        { "image/bmp", "bmp" },
        { "image/svg+xml", "svg" },
        { "image/tiff", "tiff" },
        { "image/x-icon", "ico" },
        { "image/vnd.microsoft.icon", "ico" },
        { "image/heic", "heic" },
        { "image/avif", "avif" },
        { "video/mp4", "mp4" },
        { "video/webm", "webm" },
        { "video/quicktime", "mov" },
        { "video/x-msvideo", "avi" },
        { "video/mpeg", "mpeg" },
        { "video/ogg", "ogv" },
        { "video/x-matroska", "mkv" },
        { "audio/mpeg", "mp3" },
        { "audio/ogg", "ogg" },
        { "audio/webm", "weba" },
        { "audio/wav", "wav" },
        { "audio/x-wav", "wav" },
        { "audio/mp4", "m4a" },
        { "audio/aac", "aac" },
        { "application/pdf", "pdf" },
        { "application/zip", "zip" },
        { "application/gzip", "gz" },
        { "application/x-tar", "tar" },
        { "application/json", "json" },
        { "application/xml", "xml" },
        { "application/msword", "doc" },
        { "application/vnd.openxmlformats-officedocument.wordprocessingml.document", "docx" },
        { "application/vnd.ms-excel", "xls" },
        { "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet", "xlsx" },
        { "application/vnd.ms-powerpoint", "ppt" },
        { "application/vnd.openxmlformats-officedocument.presentationml.presentation", "pptx" },
        { "text/plain", "txt" },
        { "text/csv", "csv" },
        { "text/html", "html" },
        { "text/markdown", "md" },
    };

    const std::unordered_map<std::string, std::string> kExtToMime = {
        { "jpg", "image/jpeg" },
        { "jpeg", "image/jpeg" },
        { "png", "image/png" },
        { "gif", "image/gif" },
        { "webp", "image/webp" },
        { "bmp", "image/bmp" },
        { "svg", "image/svg+xml" },
        { "tiff", "image/tiff" },
        { "ico", "image/vnd.microsoft.icon" },
        { "heic", "image/heic" },
        { "avif", "image/avif" },
        { "mp4", "video/mp4" },
        { "webm", "video/webm" },
        { "mov", "video/quicktime" },
        { "avi", "video/x-msvideo" },
        { "mpeg", "video/mpeg" },
        { "ogv", "video/ogg" },
        { "mkv", "video/x-matroska" },
        { "mp3", "audio/mpeg" },
        { "ogg", "audio/ogg" },
        { "weba", "audio/webm" },
        { "wav", "audio/x-wav" },
        { "m4a", "audio/mp4" },
        { "aac", "audio/aac" },
        { "pdf", "application/pdf" },
        { "zip", "application/zip" },
        { "gz", "application/gzip" },
        { "tar", "application/x-tar" },
        { "json", "application/json" },
        { "xml", "application/xml" },
        { "doc", "application/msword" },
        { "docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document" },
        { "xls", "application/vnd.ms-excel" },
        { "xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet" },
        { "ppt", "application/vnd.ms-powerpoint" },
        { "pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation" },
        { "txt", "text/plain" },
        { "csv", "text/csv" },
        { "html", "text/html" },
        { "md", "text/markdown" },
    };

    std::string ToLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string Trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return {};
        const auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    std::string PrimaryMime(const std::string& normalized) {
        return Trim(normalized.substr(0, normalized.find(';')));
    }

    std::string KeyExtension(const std::string& key) {
        const auto dot = key.find_last_of('.');
        if (dot == std::string::npos) return {};
        return ToLower(key.substr(dot + 1));
    }

    bool IsSafeExtension(const std::string& ext) {
        if (ext.empty() || ext.size() > 16) return false;
        return std::all_of(ext.begin(), ext.end(), [](unsigned char c) { return std::isalnum(c) != 0; });
    }

} // namespace

namespace BlackRoom {

    std::string NormalizeMime(const std::string& mime) {
        return ToLower(Trim(mime));
    }

    std::string AudioExtensionFor(const std::string& mime) {
        const std::string ct = NormalizeMime(mime);
        auto it = kAudioMimeToExt.find(ct);
        if (it != kAudioMimeToExt.end()) return it->second;
        if (ct.rfind("audio/", 0) == 0) {
            if (ct.find("webm") != std::string::npos) return "webm";
            if (ct.find("ogg") != std::string::npos) return "ogg";
            if (ct.find("mp4") != std::string::npos || ct.find("m4a") != std::string::npos) return "m4a";
        }
        return "webm";
    }

    std::string BlobExtensionFor(const std::string& mime, const std::string& filename) {
        auto it = kMimeToExt.find(PrimaryMime(NormalizeMime(mime)));
        if (it != kMimeToExt.end()) return it->second;

        const auto slash = filename.find_last_of("/\\");
        const std::string base = slash == std::string::npos ? filename : filename.substr(slash + 1);
        const auto dot = base.find_last_of('.');
        if (dot != std::string::npos && dot > 0) {
            std::string ext = ToLower(base.substr(dot + 1));
            if (IsSafeExtension(ext)) return ext;
        }
        return "bin";
    }

    std::string AudioContentTypeForKey(const std::string& key) {
        auto it = kAudioExtToMime.find(KeyExtension(key));
        return it != kAudioExtToMime.end() ? it->second : "audio/webm";
    }

    std::string BlobContentTypeForKey(const std::string& key) {
        auto it = kExtToMime.find(KeyExtension(key));
        return it != kExtToMime.end() ? it->second : "application/octet-stream";
    }

    ContentKind ClassifyMime(const std::string& mime) {
        const std::string ct = NormalizeMime(mime);
        if (ct.rfind("image/", 0) == 0) return ContentKind::Image;
        if (ct.rfind("video/", 0) == 0) return ContentKind::Video;
        return ContentKind::File;
    }

} // namespace BlackRoom
