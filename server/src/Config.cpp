#include "Config.h"
#include "Errors.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

using json = nlohmann::json;

namespace {

    // The relay is I/O-bound; past ~16 threads the room lock contention outweighs any gain.
    constexpr unsigned int kMaxThreads = 16u;

    void ApplyJson(BlackRoom::ServerConfig& cfg, const json& j) {
        if (!j.is_object())
            throw BlackRoom::ConfigError("config root must be a JSON object");

        cfg.bindAddress = j.value("bind_address", cfg.bindAddress);
        const int port = j.value("port", static_cast<int>(cfg.port));
        if (port < 1 || port > 65535)
            throw BlackRoom::ConfigError("port out of range: " + std::to_string(port));
        cfg.port = static_cast<uint16_t>(port);

        const int threads = j.value("threads", static_cast<int>(cfg.threads));
        if (threads < 0) throw BlackRoom::ConfigError("threads must not be negative");
        cfg.threads = static_cast<unsigned int>(threads);

        cfg.databasePath = j.value("database_path", cfg.databasePath);
        cfg.dataDir = j.value("data_dir", cfg.dataDir);
        cfg.historyDefaultLimit = j.value("history_default_limit", cfg.historyDefaultLimit);
        cfg.historyMaxLimit = j.value("history_max_limit", cfg.historyMaxLimit);
        cfg.maxBodyBytes = j.value("max_body_bytes", cfg.maxBodyBytes);
        cfg.defaultUploadRoom = j.value("default_upload_room", cfg.defaultUploadRoom);
        if (j.contains("seed_rooms"))
            cfg.seedRooms = j.at("seed_rooms").get<std::vector<std::string>>();
        cfg.corsAllowOrigin = j.value("cors_allow_origin", cfg.corsAllowOrigin);
        cfg.trace = j.value("trace", cfg.trace);
        cfg.logFile = j.value("log_file", cfg.logFile);
    }

    void ApplyEnv(BlackRoom::ServerConfig& cfg) {
        if (const char* v = std::getenv("BLACKROOM_BIND")) cfg.bindAddress = v;
        if (const char* v = std::getenv("BLACKROOM_PORT")) {
            int port = 0;
            try { port = std::stoi(v); }
            catch (const std::exception&) { throw BlackRoom::ConfigError(std::string("BLACKROOM_PORT is not a number: ") + v); }
            if (port < 1 || port > 65535)
                throw BlackRoom::ConfigError("BLACKROOM_PORT out of range: " + std::to_string(port));
            cfg.port = static_cast<uint16_t>(port);
        }
        if (const char* v = std::getenv("BLACKROOM_THREADS")) {
            try { cfg.threads = static_cast<unsigned int>(std::stoul(v)); }
            catch (const std::exception&) { throw BlackRoom::ConfigError(std::string("BLACKROOM_THREADS is not a number: ") + v); }
        }
        if (const char* v = std::getenv("BLACKROOM_DB")) cfg.databasePath = v;
        if (const char* v = std::getenv("BLACKROOM_DATA_DIR")) cfg.dataDir = v;
        if (const char* v = std::getenv("BLACKROOM_LOG_FILE")) cfg.logFile = v;
        if (const char* v = std::getenv("BLACKROOM_TRACE"))
            cfg.trace = (v[0] == '1' || v[0] == 'y' || v[0] == 'Y');
    }

    void Validate(const BlackRoom::ServerConfig& cfg) {
        if (cfg.historyDefaultLimit <= 0 || cfg.historyMaxLimit <= 0)
            throw BlackRoom::ConfigError("history limits must be positive");
        if (cfg.historyDefaultLimit > cfg.historyMaxLimit)
            throw BlackRoom::ConfigError("history_default_limit exceeds history_max_limit");
        if (cfg.maxBodyBytes == 0)
            throw BlackRoom::ConfigError("max_body_bytes must be positive");
        if (cfg.databasePath.empty() || cfg.dataDir.empty())
            throw BlackRoom::ConfigError("database_path and data_dir must be set");
        if (cfg.defaultUploadRoom.empty())
            throw BlackRoom::ConfigError("default_upload_room must be set");
    }

} // namespace

namespace BlackRoom {

    ServerConfig ParseConfig(const std::string& jsonText) {
        ServerConfig cfg;
        try {
            ApplyJson(cfg, json::parse(jsonText));
        }
        catch (const json::exception& e) {
            throw ConfigError(std::string("invalid config: ") + e.what());
        }
        Validate(cfg);
        return cfg;
    }

    ServerConfig LoadConfig(const std::string& path) {
        ServerConfig cfg;
        if (!path.empty()) {
            std::ifstream file(path);
            if (!file.is_open())
                throw ConfigError("cannot open config file: " + path);
            std::stringstream buffer;
            buffer << file.rdbuf();
            try {
                ApplyJson(cfg, json::parse(buffer.str()));
            }
            catch (const json::exception& e) {
                throw ConfigError("invalid config " + path + ": " + e.what());
            }
        }
        ApplyEnv(cfg);
        Validate(cfg);
        return cfg;
    }

    unsigned int ResolveThreadCount(unsigned int requested) {
        unsigned int n = requested;
        if (n == 0) n = std::thread::hardware_concurrency();
        if (n == 0) n = 4;
        return std::clamp(n, 1u, kMaxThreads);
    }

} // namespace BlackRoom
