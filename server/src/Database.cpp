#include "Database.h"
#include "Errors.h"
#include "Logger.h"
#include <sqlite3.h>
#include <filesystem>

namespace BlackRoom {

    Database::Database(const std::string& path) : m_Path(path) {
        const std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) throw StorageError("cannot create database directory " + parent.string() + ": " + ec.message());
        }

        if (sqlite3_open_v2(path.c_str(), &m_Db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
            std::string err = m_Db ? sqlite3_errmsg(m_Db) : "out of memory";
            sqlite3_close(m_Db);
            m_Db = nullptr;
            throw StorageError("can't open database " + path + ": " + err);
        }
        sqlite3_busy_timeout(m_Db, 5000);
        try {
            Exec("PRAGMA journal_mode=WAL;");
            Exec("PRAGMA synchronous=NORMAL;");
            Exec("PRAGMA foreign_keys=ON;");
            CreateSchema();
        }
        catch (...) {
            sqlite3_close(m_Db);
            m_Db = nullptr;
            throw;
        }
        LOG_STORAGE("opened " + path);
    }

    Database::~Database() {
        if (m_Db) sqlite3_close(m_Db);
    }

    void Database::CreateSchema() {
        const char* sql =
            "CREATE TABLE IF NOT EXISTS devices ("
            " id INTEGER PRIMARY KEY AUTOINCREMENT,"
            " device_fingerprint TEXT UNIQUE,"
            " label TEXT,"
            " user_agent TEXT,"
            " ip_first TEXT,"
            " ip_last TEXT,"
            " first_seen TEXT NOT NULL,"
            " last_seen TEXT NOT NULL,"
            " active INTEGER NOT NULL DEFAULT 1);"
            "CREATE INDEX IF NOT EXISTS ix_devices_last_seen ON devices (last_seen DESC);"
            "CREATE INDEX IF NOT EXISTS ix_devices_label ON devices (label);"
            "CREATE TABLE IF NOT EXISTS rooms ("
            " id INTEGER PRIMARY KEY AUTOINCREMENT,"
            " name TEXT NOT NULL UNIQUE,"
            " created_at TEXT NOT NULL);"
            "CREATE TABLE IF NOT EXISTS messages ("
            " id INTEGER PRIMARY KEY AUTOINCREMENT,"
            " room_id INTEGER NOT NULL REFERENCES rooms(id),"
            " device_id INTEGER REFERENCES devices(id),"
            " content_type TEXT NOT NULL DEFAULT 'text',"
            " content TEXT,"
            " file_ref TEXT,"
            " ip_at_send TEXT,"
            " ua_at_send TEXT,"
            " created_at TEXT NOT NULL);"
            "CREATE INDEX IF NOT EXISTS ix_messages_room_created ON messages (room_id, created_at);"
            "CREATE INDEX IF NOT EXISTS ix_messages_device_created ON messages (device_id, created_at);";
        Exec(sql);
    }

    void Database::Exec(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(m_Db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : LastError();
            sqlite3_free(err);
            throw StorageError("exec failed: " + msg);
        }
    }

    int64_t Database::LastInsertId() const {
        return static_cast<int64_t>(sqlite3_last_insert_rowid(m_Db));
    }

    int Database::Changes() const {
        return sqlite3_changes(m_Db);
    }

    std::string Database::LastError() const {
        return m_Db ? sqlite3_errmsg(m_Db) : "database closed";
    }

    // ---------------------------------------------------------------------------
    // Statement
    // ---------------------------------------------------------------------------

    Database::Statement::Statement(Database& db, const char* sql) : m_Db(db) {
        if (sqlite3_prepare_v2(db.m_Db, sql, -1, &m_Stmt, nullptr) != SQLITE_OK) {
            std::string err = db.LastError();
            sqlite3_finalize(m_Stmt);
            m_Stmt = nullptr;
            throw StorageError("prepare failed: " + err);
        }
    }

    Database::Statement::~Statement() {
        sqlite3_finalize(m_Stmt);
    }

    void Database::Statement::Bind(int index, const std::string& value) {
        if (sqlite3_bind_text(m_Stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK)
            throw StorageError("bind failed: " + m_Db.LastError());
    }

    void Database::Statement::Bind(int index, int64_t value) {
        if (sqlite3_bind_int64(m_Stmt, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK)
            throw StorageError("bind failed: " + m_Db.LastError());
    }

    void Database::Statement::Bind(int index, const std::optional<std::string>& value) {
        if (value) Bind(index, *value);
        else BindNull(index);
    }

    void Database::Statement::Bind(int index, const std::optional<int64_t>& value) {
        if (value) Bind(index, *value);
        else BindNull(index);
    }

    void Database::Statement::BindNull(int index) {
        if (sqlite3_bind_null(m_Stmt, index) != SQLITE_OK)
            throw StorageError("bind failed: " + m_Db.LastError());
    }

    bool Database::Statement::Step() {
        const int rc = sqlite3_step(m_Stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError("step failed: " + m_Db.LastError());
    }

    int64_t Database::Statement::ColumnInt64(int col) const {
        return static_cast<int64_t>(sqlite3_column_int64(m_Stmt, col));
    }

    std::string Database::Statement::ColumnText(int col) const {
        const auto* t = reinterpret_cast<const char*>(sqlite3_column_text(m_Stmt, col));
        return t ? std::string(t, static_cast<size_t>(sqlite3_column_bytes(m_Stmt, col))) : std::string();
    }

    std::optional<std::string> Database::Statement::ColumnOptionalText(int col) const {
        if (sqlite3_column_type(m_Stmt, col) == SQLITE_NULL) return std::nullopt;
        return ColumnText(col);
    }

    std::optional<int64_t> Database::Statement::ColumnOptionalInt64(int col) const {
        if (sqlite3_column_type(m_Stmt, col) == SQLITE_NULL) return std::nullopt;
        return ColumnInt64(col);
    }

    // ---------------------------------------------------------------------------
    // Transaction
    // ---------------------------------------------------------------------------

    Database::Transaction::Transaction(Database& db) : m_Db(db) {
        m_Db.Exec("BEGIN IMMEDIATE;");
    }

    Database::Transaction::~Transaction() {
        if (m_Done) return;
        if (sqlite3_exec(m_Db.m_Db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK)
            LOG_ERROR("rollback failed: " + m_Db.LastError());
    }

    void Database::Transaction::Commit() {
        m_Db.Exec("COMMIT;");
        m_Done = true;
    }

} // namespace BlackRoom
