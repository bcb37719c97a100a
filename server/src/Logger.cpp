#include "Logger.h"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <cstdio>

namespace {

    bool FormatClock(char* out, size_t outSize) {
        const auto now = std::chrono::system_clock::now();
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        struct tm tm_buf {};
        if (localtime_r(&t, &tm_buf) == nullptr) return false;
        char timeBuf[16];
        if (std::strftime(timeBuf, sizeof(timeBuf), "%H:%M:%S", &tm_buf) == 0) return false;
        std::snprintf(out, outSize, "%s.%03d", timeBuf, static_cast<int>(ms.count()));
        return true;
    }

} // namespace

namespace BlackRoom {

    Logger& Logger::Instance() {
        static Logger instance;
        return instance;
    }

    bool Logger::Initialize(const std::string& filePath) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_File.open(filePath, std::ios::app);
        return m_File.is_open();
    }

    void Logger::Log(const std::string& prefix, const std::string& message) {
        char clock[32];
        if (!FormatClock(clock, sizeof(clock))) clock[0] = '\0';

        std::lock_guard<std::mutex> lock(m_Mutex);
        std::fprintf(stderr, "%s [%s] %s\n", clock, prefix.c_str(), message.c_str());
        if (m_File.is_open()) {
            m_File << clock << " [" << prefix << "] " << message << "\n";
            m_File.flush();
        }
    }

    void Logger::Shutdown() {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_File.is_open()) m_File.close();
    }

    std::ofstream RelayTrace::s_file;
    std::mutex    RelayTrace::s_mutex;
    bool          RelayTrace::s_enabled = false;

    void RelayTrace::init(bool enableOverride) {
        s_enabled = enableOverride;
        if (const char* e = std::getenv("BLACKROOM_TRACE"))
            s_enabled = s_enabled || (e[0] == '1' || e[0] == 'y' || e[0] == 'Y');
        if (s_enabled) {
            std::lock_guard<std::mutex> lock(s_mutex);
            s_file.open("relay_trace.log", std::ios::out | std::ios::trunc);
        }
    }

    void RelayTrace::log(const std::string& msg) {
        if (!s_enabled) return;

        char clock[32];
        if (!FormatClock(clock, sizeof(clock))) return;

        char lineBuf[4096];
        const int n = std::snprintf(lineBuf, sizeof(lineBuf), "%s [TRACE] %s\n", clock, msg.c_str());
        if (n <= 0 || static_cast<size_t>(n) >= sizeof(lineBuf)) return;

        std::lock_guard<std::mutex> lock(s_mutex);
        if (!s_file.is_open()) return;
        s_file.write(lineBuf, static_cast<std::streamsize>(n));
        s_file.flush();
    }

} // namespace BlackRoom
