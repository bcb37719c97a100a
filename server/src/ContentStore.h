#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace BlackRoom {

    enum class StoreKind {
        Audio,   // voice notes, audio MIME table, default "webm"
        Blob     // images, videos, documents, default "bin"
    };

    struct PutResult {
        std::string objectKey;
        bool written = false;   // false when identical bytes were already stored
    };

    // Content-addressed blob directory: object key = sha256(bytes) + "." + extension.
    class ContentStore {
    public:
        ContentStore(std::filesystem::path dir, StoreKind kind);

        /// Stores the payload unless its key already exists. Throws ValidationError on an empty
        /// payload and StorageError when the file cannot be written.
        PutResult Put(const std::string& bytes, const std::string& declaredMime, const std::string& filename = {});

        /// Throws InvalidObjectKey for traversal keys before any filesystem access.
        std::optional<std::filesystem::path> Locate(const std::string& objectKey) const;
        std::optional<std::string> Get(const std::string& objectKey) const;

        std::string ContentTypeFor(const std::string& objectKey) const;
        std::string ExtensionFor(const std::string& declaredMime, const std::string& filename) const;

        const std::filesystem::path& Directory() const { return m_Dir; }

        /// Trimmed key, or InvalidObjectKey when empty or containing '/', '\\' or "..".
        static std::string ValidateKey(const std::string& objectKey);

    private:
        std::filesystem::path m_Dir;
        StoreKind m_Kind;
    };

} // namespace BlackRoom
