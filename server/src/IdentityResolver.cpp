#include "IdentityResolver.h"
#include "Database.h"
#include "Errors.h"
#include "Logger.h"

namespace {

    constexpr const char* kDeviceColumns =
        "id, device_fingerprint, label, user_agent, ip_first, ip_last, first_seen, last_seen, active";

    std::optional<std::string> NonEmpty(const std::optional<std::string>& v) {
        if (!v || v->empty()) return std::nullopt;
        return v;
    }

    std::optional<std::string> Trimmed(const std::optional<std::string>& v) {
        if (!v) return std::nullopt;
        const auto first = v->find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return std::nullopt;
        const auto last = v->find_last_not_of(" \t\r\n");
        return v->substr(first, last - first + 1);
    }

    BlackRoom::Device ReadDevice(const BlackRoom::Database::Statement& stmt) {
        BlackRoom::Device d;
        d.id = stmt.ColumnInt64(0);
        d.fingerprint = stmt.ColumnOptionalText(1);
        d.label = stmt.ColumnOptionalText(2);
        d.userAgent = stmt.ColumnOptionalText(3);
        d.ipFirst = stmt.ColumnOptionalText(4);
        d.ipLast = stmt.ColumnOptionalText(5);
        d.firstSeen = stmt.ColumnText(6);
        d.lastSeen = stmt.ColumnText(7);
        d.active = stmt.ColumnInt64(8) != 0;
        return d;
    }

} // namespace

namespace BlackRoom {

    std::optional<Device> IdentityResolver::FindByFingerprintLocked(const std::string& fingerprint) {
        const std::string sql = std::string("SELECT ") + kDeviceColumns + " FROM devices WHERE device_fingerprint = ?;";
        Database::Statement stmt(m_Db, sql.c_str());
        stmt.Bind(1, fingerprint);
        if (!stmt.Step()) return std::nullopt;
        return ReadDevice(stmt);
    }

    std::optional<Device> IdentityResolver::FindByLabelLocked(const std::string& label) {
        const std::string sql = std::string("SELECT ") + kDeviceColumns + " FROM devices WHERE label = ? ORDER BY id ASC LIMIT 1;";
        Database::Statement stmt(m_Db, sql.c_str());
        stmt.Bind(1, label);
        if (!stmt.Step()) return std::nullopt;
        return ReadDevice(stmt);
    }

    std::optional<Device> IdentityResolver::FindByIdLocked(int64_t id) {
        const std::string sql = std::string("SELECT ") + kDeviceColumns + " FROM devices WHERE id = ?;";
        Database::Statement stmt(m_Db, sql.c_str());
        stmt.Bind(1, id);
        if (!stmt.Step()) return std::nullopt;
        return ReadDevice(stmt);
    }

    std::optional<Device> IdentityResolver::FindById(int64_t id) {
        auto lock = m_Db.ReadLock();
        return FindByIdLocked(id);
    }

    Device IdentityResolver::Resolve(const std::optional<std::string>& fingerprint,
        const std::optional<std::string>& label,
        const SenderInfo& sender)
    {
        const auto fp = NonEmpty(fingerprint);
        const auto newLabel = Trimmed(label);
        const auto ip = NonEmpty(sender.ip);
        const auto ua = NonEmpty(sender.userAgent);
        const std::string now = UtcNowIso();

        auto lock = m_Db.WriteLock();
        Database::Transaction tx(m_Db);

        std::optional<Device> dev;
        if (fp) dev = FindByFingerprintLocked(*fp);
        else if (newLabel) dev = FindByLabelLocked(*newLabel);

        int64_t id = 0;
        if (!dev) {
            Database::Statement ins(m_Db,
                "INSERT OR IGNORE INTO devices (device_fingerprint, label, user_agent, ip_first, ip_last, first_seen, last_seen, active) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, 1);");
            ins.Bind(1, fp);
            ins.Bind(2, newLabel);
            ins.Bind(3, ua);
            ins.Bind(4, ip);
            ins.Bind(5, ip);
            ins.Bind(6, now);
            ins.Bind(7, now);
            ins.Step();
            if (m_Db.Changes() > 0) {
                id = m_Db.LastInsertId();
                RelayTrace::log("step=device_created id=" + std::to_string(id));
            }
            else if (fp) {
                // Another writer on the same file inserted this fingerprint first.
                dev = FindByFingerprintLocked(*fp);
            }
        }

        if (dev) {
            id = dev->id;
            const std::optional<std::string> storedLabel =
                (newLabel && newLabel != dev->label) ? newLabel : dev->label;
            Database::Statement upd(m_Db,
                "UPDATE devices SET label = ?, user_agent = ?, ip_last = ?, last_seen = ? WHERE id = ?;");
            upd.Bind(1, storedLabel);
            upd.Bind(2, ua ? ua : dev->userAgent);
            upd.Bind(3, ip ? ip : dev->ipLast);
            upd.Bind(4, now);
            upd.Bind(5, id);
            upd.Step();
        }

        auto resolved = FindByIdLocked(id);
        tx.Commit();
        if (!resolved) throw StorageError("device row vanished during resolve");
        return *resolved;
    }

    bool IdentityResolver::Deactivate(int64_t id) {
        auto lock = m_Db.WriteLock();
        Database::Statement stmt(m_Db, "UPDATE devices SET active = 0 WHERE id = ?;");
        stmt.Bind(1, id);
        stmt.Step();
        return m_Db.Changes() > 0;
    }

} // namespace BlackRoom
