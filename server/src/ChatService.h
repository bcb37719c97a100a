#pragma once
#include "Config.h"
#include "ContentStore.h"
#include "IdentityResolver.h"
#include "MessageLog.h"
#include "Models.h"
#include "RoomDirectory.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace BlackRoom {

    class Database;
    class RoomHub;

    struct IngestRequest {
        std::string room;
        ContentKind kind = ContentKind::Text;
        std::optional<std::string> content;
        std::optional<std::string> fileRef;
        std::optional<std::string> fingerprint;
        std::optional<std::string> label;
        std::optional<std::string> mime;     // declared upload type, echoed in the broadcast
        SenderInfo sender;                   // empty on the streaming path
    };

    struct IngestResult {
        Message message;
        Device device;
        Room room;
        nlohmann::json event;
    };

    // Everything a request or a frame needs: storage modules, blob stores and the hub.
    // Ingest() is the single resolve -> ensure -> append -> broadcast path shared by
    // HTTP and the streaming endpoint.
    class ChatService {
    public:
        ChatService(const ServerConfig& config, Database& db, RoomHub& hub);

        /// Throws StorageError when persisting fails; nothing is broadcast in that case.
        IngestResult Ingest(const IngestRequest& req);

        /// Handles one inbound streaming frame for `room`. Returns false when the frame was
        /// dropped (not JSON, not a "msg", bad field types or content_type).
        bool IngestFrame(const std::string& room, const std::string& text);

        static nlohmann::json MessageEvent(const Room& room, const Device& device,
            const Message& message, const std::optional<std::string>& ip,
            const std::optional<std::string>& mime);

        const ServerConfig& Config() const { return m_Config; }
        IdentityResolver& Identity() { return m_Identity; }
        RoomDirectory& Rooms() { return m_Rooms; }
        MessageLog& Log() { return m_Log; }
        ContentStore& AudioStore() { return m_AudioStore; }
        ContentStore& BlobStore() { return m_BlobStore; }
        RoomHub& Hub() { return m_Hub; }

    private:
        const ServerConfig m_Config;
        IdentityResolver m_Identity;
        RoomDirectory m_Rooms;
        MessageLog m_Log;
        ContentStore m_AudioStore;
        ContentStore m_BlobStore;
        RoomHub& m_Hub;
    };

    /// Reads an optional string field; absent or null -> nullopt, any other non-string type throws SchemaError.
    std::optional<std::string> OptionalString(const nlohmann::json& j, const char* key);

} // namespace BlackRoom
