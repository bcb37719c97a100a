#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace BlackRoom {

    constexpr uint16_t DEFAULT_HTTP_PORT = 8000;

    struct ServerConfig {
        std::string bindAddress = "0.0.0.0";
        uint16_t port = DEFAULT_HTTP_PORT;
        unsigned int threads = 0;           // 0 = derive from hardware_concurrency
        std::string databasePath = "db/blackroom.sqlite3";
        std::string dataDir = "data";
        int historyDefaultLimit = 100;
        int historyMaxLimit = 1000;
        size_t maxBodyBytes = 64u * 1024u * 1024u;
        std::string defaultUploadRoom = "alpha";
        std::vector<std::string> seedRooms{ "alpha" };
        std::string corsAllowOrigin = "*";
        bool trace = false;
        std::string logFile;                // empty = stderr only

        std::string AudioDir() const { return dataDir + "/audio"; }
        std::string FilesDir() const { return dataDir + "/files"; }
    };

    /// Reads a JSON config file (empty path = defaults), then applies BLACKROOM_* environment
    /// overrides and validates. Throws ConfigError.
    ServerConfig LoadConfig(const std::string& path);

    /// Same as LoadConfig but from an in-memory JSON document; no environment overrides.
    ServerConfig ParseConfig(const std::string& jsonText);

    unsigned int ResolveThreadCount(unsigned int requested);

} // namespace BlackRoom
