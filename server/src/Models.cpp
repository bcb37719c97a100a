#include "Models.h"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace BlackRoom {

    const char* ToString(ContentKind kind) {
        switch (kind) {
        case ContentKind::Text:   return "text";
        case ContentKind::Voice:  return "voice";
        case ContentKind::Image:  return "image";
        case ContentKind::Video:  return "video";
        case ContentKind::File:   return "file";
        case ContentKind::System: return "system";
        }
        return "text";
    }

    std::optional<ContentKind> ParseContentKind(const std::string& s) {
        if (s == "text")   return ContentKind::Text;
        if (s == "voice")  return ContentKind::Voice;
        if (s == "image")  return ContentKind::Image;
        if (s == "video")  return ContentKind::Video;
        if (s == "file")   return ContentKind::File;
        if (s == "system") return ContentKind::System;
        return std::nullopt;
    }

    std::string UtcNowIso() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        const auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;
        struct tm tm_buf {};
        gmtime_r(&t, &tm_buf);
        char date[32];
        std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm_buf);
        char out[48];
        std::snprintf(out, sizeof(out), "%s.%06d", date, static_cast<int>(us.count()));
        return out;
    }

} // namespace BlackRoom
