#include "ContentStore.h"
#include "Crypto.h"
#include "Errors.h"
#include "Logger.h"
#include "MimeTypes.h"
#include <atomic>
#include <fstream>
#include <sstream>
#include <thread>

namespace {

    std::atomic<uint64_t> g_TempCounter{ 0 };

    std::string TempSuffix() {
        std::ostringstream ss;
        ss << ".tmp-" << std::hash<std::thread::id>{}(std::this_thread::get_id())
            << '-' << g_TempCounter.fetch_add(1, std::memory_order_relaxed);
        return ss.str();
    }

} // namespace

namespace BlackRoom {

    ContentStore::ContentStore(std::filesystem::path dir, StoreKind kind)
        : m_Dir(std::move(dir)), m_Kind(kind)
    {
        std::error_code ec;
        std::filesystem::create_directories(m_Dir, ec);
        if (ec) throw StorageError("cannot create blob directory " + m_Dir.string() + ": " + ec.message());
    }

    std::string ContentStore::ValidateKey(const std::string& objectKey) {
        const auto first = objectKey.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) throw InvalidObjectKey(objectKey);
        const auto last = objectKey.find_last_not_of(" \t\r\n");
        std::string key = objectKey.substr(first, last - first + 1);
        if (key.find('/') != std::string::npos || key.find('\\') != std::string::npos
            || key.find("..") != std::string::npos || key.find('\0') != std::string::npos)
            throw InvalidObjectKey(objectKey);
        return key;
    }

    std::string ContentStore::ExtensionFor(const std::string& declaredMime, const std::string& filename) const {
        if (m_Kind == StoreKind::Audio) return AudioExtensionFor(declaredMime);
        return BlobExtensionFor(declaredMime, filename);
    }

    std::string ContentStore::ContentTypeFor(const std::string& objectKey) const {
        if (m_Kind == StoreKind::Audio) return AudioContentTypeForKey(objectKey);
        return BlobContentTypeForKey(objectKey);
    }

    PutResult ContentStore::Put(const std::string& bytes, const std::string& declaredMime, const std::string& filename) {
        if (bytes.empty()) throw ValidationError("empty file");

        PutResult result;
        result.objectKey = Sha256Hex(bytes) + "." + ExtensionFor(declaredMime, filename);
        const std::filesystem::path dest = m_Dir / result.objectKey;

        std::error_code ec;
        if (std::filesystem::exists(dest, ec)) {
            RelayTrace::log("step=blob_dedup key=" + result.objectKey);
            return result;
        }

        const std::filesystem::path tmp = m_Dir / (result.objectKey + TempSuffix());
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) throw StorageError("cannot open " + tmp.string());
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                out.close();
                std::filesystem::remove(tmp, ec);
                throw StorageError("short write to " + tmp.string());
            }
        }
        // rename() replaces atomically; a concurrent writer of the same key wrote identical bytes.
        std::filesystem::rename(tmp, dest, ec);
        if (ec) {
            std::error_code rmEc;
            std::filesystem::remove(tmp, rmEc);
            throw StorageError("cannot store " + dest.string() + ": " + ec.message());
        }
        result.written = true;
        LOG_STORAGE("stored " + result.objectKey + " (" + std::to_string(bytes.size()) + " bytes)");
        return result;
    }

    std::optional<std::filesystem::path> ContentStore::Locate(const std::string& objectKey) const {
        const std::string key = ValidateKey(objectKey);
        const std::filesystem::path path = m_Dir / key;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) return std::nullopt;
        return path;
    }

    std::optional<std::string> ContentStore::Get(const std::string& objectKey) const {
        auto path = Locate(objectKey);
        if (!path) return std::nullopt;
        std::ifstream in(*path, std::ios::binary);
        if (!in.is_open()) return std::nullopt;
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

} // namespace BlackRoom
