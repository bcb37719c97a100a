#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace BlackRoom {

    // One SQLite connection shared by every session. Callers hold WriteLock() or ReadLock()
    // around each multi-statement operation; every failure throws StorageError.
    class Database {
    public:
        explicit Database(const std::string& path);
        ~Database();

        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        std::unique_lock<std::shared_mutex> WriteLock() { return std::unique_lock<std::shared_mutex>(m_RwMutex); }
        std::shared_lock<std::shared_mutex> ReadLock() { return std::shared_lock<std::shared_mutex>(m_RwMutex); }

        void Exec(const char* sql);
        int64_t LastInsertId() const;
        int Changes() const;
        std::string LastError() const;
        const std::string& Path() const { return m_Path; }

        class Statement {
        public:
            Statement(Database& db, const char* sql);
            ~Statement();

            Statement(const Statement&) = delete;
            Statement& operator=(const Statement&) = delete;

            void Bind(int index, const std::string& value);
            void Bind(int index, int64_t value);
            void Bind(int index, const std::optional<std::string>& value);
            void Bind(int index, const std::optional<int64_t>& value);
            void BindNull(int index);

            /// True while a row is available, false once the statement is done.
            bool Step();

            int64_t ColumnInt64(int col) const;
            std::string ColumnText(int col) const;
            std::optional<std::string> ColumnOptionalText(int col) const;
            std::optional<int64_t> ColumnOptionalInt64(int col) const;

        private:
            Database& m_Db;
            sqlite3_stmt* m_Stmt = nullptr;
        };

        // BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
        class Transaction {
        public:
            explicit Transaction(Database& db);
            ~Transaction();

            Transaction(const Transaction&) = delete;
            Transaction& operator=(const Transaction&) = delete;

            void Commit();

        private:
            Database& m_Db;
            bool m_Done = false;
        };

    private:
        void CreateSchema();

        sqlite3* m_Db = nullptr;
        std::string m_Path;
        std::shared_mutex m_RwMutex;
    };

} // namespace BlackRoom
