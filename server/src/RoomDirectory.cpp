#include "RoomDirectory.h"
#include "Database.h"
#include "Errors.h"
#include "Logger.h"

namespace BlackRoom {

    std::optional<Room> RoomDirectory::FindLocked(const std::string& name) {
        Database::Statement stmt(m_Db, "SELECT id, name, created_at FROM rooms WHERE name = ?;");
        stmt.Bind(1, name);
        if (!stmt.Step()) return std::nullopt;
        Room r;
        r.id = stmt.ColumnInt64(0);
        r.name = stmt.ColumnText(1);
        r.createdAt = stmt.ColumnText(2);
        return r;
    }

    std::optional<Room> RoomDirectory::Find(const std::string& name) {
        auto lock = m_Db.ReadLock();
        return FindLocked(name);
    }

    Room RoomDirectory::Ensure(const std::string& name) {
        {
            auto lock = m_Db.ReadLock();
            if (auto existing = FindLocked(name)) return *existing;
        }

        auto lock = m_Db.WriteLock();
        {
            Database::Statement ins(m_Db, "INSERT OR IGNORE INTO rooms (name, created_at) VALUES (?, ?);");
            ins.Bind(1, name);
            ins.Bind(2, UtcNowIso());
            ins.Step();
            if (m_Db.Changes() > 0) LOG_STORAGE("room created: " + name);
        }
        auto room = FindLocked(name);
        if (!room) throw StorageError("room insert did not persist: " + name);
        return *room;
    }

} // namespace BlackRoom
