#include "MessageLog.h"
#include "Database.h"
#include <algorithm>

namespace BlackRoom {

    Message MessageLog::Append(const Room& room,
        std::optional<int64_t> deviceId,
        ContentKind kind,
        const std::optional<std::string>& content,
        const std::optional<std::string>& fileRef,
        const SenderInfo& sender)
    {
        Message m;
        m.roomId = room.id;
        m.deviceId = deviceId;
        m.kind = kind;
        m.content = content;
        m.fileRef = fileRef;
        m.ipAtSend = sender.ip;
        m.uaAtSend = sender.userAgent;

        auto lock = m_Db.WriteLock();
        m.createdAt = UtcNowIso();
        Database::Statement ins(m_Db,
            "INSERT INTO messages (room_id, device_id, content_type, content, file_ref, ip_at_send, ua_at_send, created_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
        ins.Bind(1, m.roomId);
        ins.Bind(2, m.deviceId);
        ins.Bind(3, std::string(ToString(kind)));
        ins.Bind(4, m.content);
        ins.Bind(5, m.fileRef);
        ins.Bind(6, m.ipAtSend);
        ins.Bind(7, m.uaAtSend);
        ins.Bind(8, m.createdAt);
        ins.Step();
        m.id = m_Db.LastInsertId();
        return m;
    }

    std::vector<HistoryEntry> MessageLog::History(const std::string& roomName, int limit) {
        std::vector<HistoryEntry> out;
        if (limit <= 0) return out;

        auto lock = m_Db.ReadLock();
        Database::Statement stmt(m_Db,
            "SELECT m.id, m.room_id, m.device_id, m.content_type, m.content, m.file_ref, m.ip_at_send, m.ua_at_send, m.created_at, r.name, d.label "
            "FROM messages m "
            "JOIN rooms r ON r.id = m.room_id "
            "LEFT JOIN devices d ON d.id = m.device_id "
            "WHERE r.name = ? "
            "ORDER BY m.created_at DESC, m.id DESC LIMIT ?;");
        stmt.Bind(1, roomName);
        stmt.Bind(2, static_cast<int64_t>(limit));
        while (stmt.Step()) {
            HistoryEntry e;
            e.message.id = stmt.ColumnInt64(0);
            e.message.roomId = stmt.ColumnInt64(1);
            e.message.deviceId = stmt.ColumnOptionalInt64(2);
            const std::string kind = stmt.ColumnText(3);
            e.message.kind = ParseContentKind(kind).value_or(ContentKind::File);
            e.message.content = stmt.ColumnOptionalText(4);
            e.message.fileRef = stmt.ColumnOptionalText(5);
            e.message.ipAtSend = stmt.ColumnOptionalText(6);
            e.message.uaAtSend = stmt.ColumnOptionalText(7);
            e.message.createdAt = stmt.ColumnText(8);
            e.room = stmt.ColumnText(9);
            e.deviceLabel = stmt.ColumnOptionalText(10);
            out.push_back(std::move(e));
        }
        std::reverse(out.begin(), out.end());
        return out;
    }

} // namespace BlackRoom
