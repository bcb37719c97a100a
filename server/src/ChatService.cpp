#include "ChatService.h"
#include "Errors.h"
#include "Logger.h"
#include "RoomHub.h"

using json = nlohmann::json;

namespace BlackRoom {

    std::optional<std::string> OptionalString(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return std::nullopt;
        if (!it->is_string()) throw SchemaError(std::string("field '") + key + "' must be a string");
        return it->get<std::string>();
    }

    ChatService::ChatService(const ServerConfig& config, Database& db, RoomHub& hub)
        : m_Config(config)
        , m_Identity(db)
        , m_Rooms(db)
        , m_Log(db)
        , m_AudioStore(config.AudioDir(), StoreKind::Audio)
        , m_BlobStore(config.FilesDir(), StoreKind::Blob)
        , m_Hub(hub)
    {
    }

    json ChatService::MessageEvent(const Room& room, const Device& device,
        const Message& message, const std::optional<std::string>& ip,
        const std::optional<std::string>& mime)
    {
        json j;
        j["type"] = "msg";
        j["room"] = room.name;
        j["device"] = {
            { "id", device.id },
            { "label", device.label ? json(*device.label) : json(nullptr) },
            { "ip", ip ? json(*ip) : json(nullptr) },
        };
        j["content_type"] = ToString(message.kind);
        j["content"] = message.content ? json(*message.content) : json(nullptr);
        j["file_ref"] = message.fileRef ? json(*message.fileRef) : json(nullptr);
        if (mime) j["mime"] = *mime;
        j["ts"] = message.createdAt;
        j["id"] = message.id;
        return j;
    }

    IngestResult ChatService::Ingest(const IngestRequest& req) {
        IngestResult r;
        r.device = m_Identity.Resolve(req.fingerprint, req.label, req.sender);
        r.room = m_Rooms.Ensure(req.room);
        r.message = m_Log.Append(r.room, r.device.id, req.kind, req.content, req.fileRef, req.sender);
        r.event = MessageEvent(r.room, r.device, r.message, req.sender.ip, req.mime);
        m_Hub.Broadcast(r.room.name, r.event);
        return r;
    }

    bool ChatService::IngestFrame(const std::string& room, const std::string& text) {
        const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object()) return false;

        auto type = j.find("type");
        if (type == j.end() || !type->is_string() || type->get<std::string>() != "msg") return false;

        IngestRequest req;
        req.room = room;
        try {
            if (auto ct = OptionalString(j, "content_type")) {
                auto kind = ParseContentKind(*ct);
                if (!kind) return false;
                req.kind = *kind;
            }
            req.content = OptionalString(j, "content");
            req.fileRef = OptionalString(j, "file_ref");
            req.fingerprint = OptionalString(j, "fingerprint");
            req.label = OptionalString(j, "label");
        }
        catch (const SchemaError& e) {
            RelayTrace::log(std::string("step=frame_dropped room=") + room + " reason=" + e.what());
            return false;
        }

        // The streaming transport does not record network address or user agent.
        Ingest(req);
        return true;
    }

} // namespace BlackRoom
