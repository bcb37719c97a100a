#pragma once
#include "Models.h"
#include <optional>
#include <string>
#include <vector>

namespace BlackRoom {

    class Database;

    struct HistoryEntry {
        Message message;
        std::string room;
        std::optional<std::string> deviceLabel;
    };

    // Append-only message store. Rows are never updated or deleted.
    class MessageLog {
    public:
        explicit MessageLog(Database& db) : m_Db(db) {}

        Message Append(const Room& room,
            std::optional<int64_t> deviceId,
            ContentKind kind,
            const std::optional<std::string>& content,
            const std::optional<std::string>& fileRef,
            const SenderInfo& sender);

        /// At most `limit` most recent messages of the room, oldest first. Unknown room -> empty.
        std::vector<HistoryEntry> History(const std::string& roomName, int limit);

    private:
        Database& m_Db;
    };

} // namespace BlackRoom
