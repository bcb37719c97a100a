#pragma once
#include <string>
#include <fstream>
#include <mutex>

namespace BlackRoom {

    class Logger {
    public:
        static Logger& Instance();

        /// Mirrors every line into filePath in addition to stderr.
        bool Initialize(const std::string& filePath);
        void Log(const std::string& prefix, const std::string& message);
        void Shutdown();

    private:
        Logger() = default;
        ~Logger() { Shutdown(); }

        std::mutex m_Mutex;
        std::ofstream m_File;
    };

    // Broadcast hot-path trace. Off unless enabled from config or BLACKROOM_TRACE.
    struct RelayTrace {
        static void init(bool enableOverride = false);
        static void log(const std::string& msg);
        static bool enabled() { return s_enabled; }

    private:
        static std::ofstream s_file;
        static std::mutex s_mutex;
        static bool s_enabled;
    };

    #define LOG_INFO(msg)       BlackRoom::Logger::Instance().Log("INFO", msg)
    #define LOG_ERROR(msg)      BlackRoom::Logger::Instance().Log("ERROR", msg)
    #define LOG_NETWORK(msg)    BlackRoom::Logger::Instance().Log("Network", msg)
    #define LOG_STORAGE(msg)    BlackRoom::Logger::Instance().Log("Storage", msg)

} // namespace BlackRoom
