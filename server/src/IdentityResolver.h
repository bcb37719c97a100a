#pragma once
#include "Models.h"
#include <optional>
#include <string>

namespace BlackRoom {

    class Database;

    // Maps an account-less sender to a stable Device row.
    //
    // Lookup order: fingerprint (unique), then label. The label match is a best-effort
    // heuristic for clients that never send a fingerprint; two devices sharing a label are
    // indistinguishable through it and the oldest matching row wins.
    class IdentityResolver {
    public:
        explicit IdentityResolver(Database& db) : m_Db(db) {}

        /// Finds or creates the device. Never fails except on storage errors (StorageError).
        /// Empty strings are treated as absent.
        Device Resolve(const std::optional<std::string>& fingerprint,
            const std::optional<std::string>& label,
            const SenderInfo& sender);

        std::optional<Device> FindById(int64_t id);

        /// Devices are never deleted; this only clears the active flag.
        bool Deactivate(int64_t id);

    private:
        std::optional<Device> FindByFingerprintLocked(const std::string& fingerprint);
        std::optional<Device> FindByLabelLocked(const std::string& label);
        std::optional<Device> FindByIdLocked(int64_t id);

        Database& m_Db;
    };

} // namespace BlackRoom
