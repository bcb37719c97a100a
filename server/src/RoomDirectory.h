#pragma once
#include "Models.h"
#include <optional>
#include <string>

namespace BlackRoom {

    class Database;

    class RoomDirectory {
    public:
        explicit RoomDirectory(Database& db) : m_Db(db) {}

        /// Returns the room, creating it on first reference. Concurrent first references
        /// create exactly one row (unique name + INSERT OR IGNORE).
        Room Ensure(const std::string& name);

        std::optional<Room> Find(const std::string& name);

    private:
        std::optional<Room> FindLocked(const std::string& name);

        Database& m_Db;
    };

} // namespace BlackRoom
