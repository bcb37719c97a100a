#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace BlackRoom {

    enum class ContentKind : uint8_t {
        Text,
        Voice,
        Image,
        Video,
        File,
        System
    };

    const char* ToString(ContentKind kind);
    std::optional<ContentKind> ParseContentKind(const std::string& s);

    struct Device {
        int64_t id = 0;
        std::optional<std::string> fingerprint;
        std::optional<std::string> label;
        std::optional<std::string> userAgent;
        std::optional<std::string> ipFirst;
        std::optional<std::string> ipLast;
        std::string firstSeen;
        std::string lastSeen;
        bool active = true;
    };

    struct Room {
        int64_t id = 0;
        std::string name;
        std::string createdAt;
    };

    // Immutable once appended.
    struct Message {
        int64_t id = 0;
        int64_t roomId = 0;
        std::optional<int64_t> deviceId;
        ContentKind kind = ContentKind::Text;
        std::optional<std::string> content;
        std::optional<std::string> fileRef;
        std::optional<std::string> ipAtSend;
        std::optional<std::string> uaAtSend;
        std::string createdAt;
    };

    // Network/agent metadata the transport could supply for a sender.
    struct SenderInfo {
        std::optional<std::string> ip;
        std::optional<std::string> userAgent;
    };

    /// UTC ISO-8601 with microseconds, e.g. 2026-10-18T09:15:02.123456. Text order is time order.
    std::string UtcNowIso();

} // namespace BlackRoom
