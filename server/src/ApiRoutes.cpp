#include "ApiRoutes.h"
#include "ChatService.h"
#include "Errors.h"
#include "Logger.h"
#include "MimeTypes.h"
#include "Multipart.h"
#include "RoomHub.h"
#include "Version.h"
#include <boost/beast/core/file.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace {

    constexpr const char* kRoomsPrefix = "/rooms/";
    constexpr const char* kHistorySuffix = "/history";
    constexpr const char* kAudioPrefix = "/files/audio/";
    constexpr const char* kBlobPrefix = "/files/blob/";

    bool StartsWith(const std::string& s, const std::string& prefix) {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }

    bool EndsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::optional<std::string> QueryParam(const std::string& query, const std::string& key) {
        size_t pos = 0;
        while (pos <= query.size()) {
            size_t amp = query.find('&', pos);
            if (amp == std::string::npos) amp = query.size();
            const std::string pair = query.substr(pos, amp - pos);
            const auto eq = pair.find('=');
            const std::string k = BlackRoom::ApiRoutes::UrlDecode(pair.substr(0, eq));
            if (k == key)
                return eq == std::string::npos ? std::string() : BlackRoom::ApiRoutes::UrlDecode(pair.substr(eq + 1));
            pos = amp + 1;
        }
        return std::nullopt;
    }

    json ParseJsonBody(const std::string& body) {
        json j;
        try {
            j = json::parse(body);
        }
        catch (const json::exception& e) {
            throw BlackRoom::SchemaError(std::string("request body is not valid JSON: ") + e.what());
        }
        if (!j.is_object()) throw BlackRoom::SchemaError("request body must be a JSON object");
        return j;
    }

    json OptionalJson(const std::optional<std::string>& v) {
        return v ? json(*v) : json(nullptr);
    }

    std::optional<std::string> NonEmptyField(const BlackRoom::MultipartForm& form, const std::string& name) {
        auto v = form.Field(name);
        if (!v || v->empty()) return std::nullopt;
        return v;
    }

} // namespace

namespace BlackRoom {

    std::string ApiRoutes::UrlDecode(const std::string& in) {
        std::string out;
        out.reserve(in.size());
        for (size_t i = 0; i < in.size(); ++i) {
            const char c = in[i];
            if (c == '%' && i + 2 < in.size()
                && std::isxdigit(static_cast<unsigned char>(in[i + 1]))
                && std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
                out += static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16));
                i += 2;
            }
            else if (c == '+') {
                out += ' ';
            }
            else {
                out += c;
            }
        }
        return out;
    }

    void ApiRoutes::ApplyCors(http::fields& fields) const {
        fields.set(http::field::access_control_allow_origin, m_Chat.Config().corsAllowOrigin);
        fields.set(http::field::access_control_allow_methods, "*");
        fields.set(http::field::access_control_allow_headers, "*");
        if (m_Chat.Config().corsAllowOrigin != "*")
            fields.set(http::field::access_control_allow_credentials, "true");
    }

    StringResponse ApiRoutes::Json(const HttpRequest& req, http::status status, const json& body) const {
        StringResponse res{ status, req.version() };
        res.set(http::field::server, "BlackRoom");
        res.set(http::field::content_type, "application/json");
        res.keep_alive(req.keep_alive());
        ApplyCors(res.base());
        res.body() = body.dump();
        res.prepare_payload();
        return res;
    }

    StringResponse ApiRoutes::Error(const HttpRequest& req, http::status status, const std::string& detail) const {
        return Json(req, status, json{ { "detail", detail } });
    }

    HttpResponse ApiRoutes::Handle(const HttpRequest& req, const std::string& remoteAddress) {
        SenderInfo sender;
        if (!remoteAddress.empty()) sender.ip = remoteAddress;
        auto ua = req.find(http::field::user_agent);
        if (ua != req.end() && !ua->value().empty()) sender.userAgent = std::string(ua->value());

        try {
            return Route(req, sender);
        }
        catch (const InvalidObjectKey&) {
            return Error(req, http::status::bad_request, "invalid object_key");
        }
        catch (const ValidationError& e) {
            return Error(req, http::status::bad_request, e.what());
        }
        catch (const SchemaError& e) {
            return Error(req, http::status::unprocessable_entity, e.what());
        }
        catch (const StorageError& e) {
            LOG_ERROR(std::string("storage failure on ") + std::string(req.target()) + ": " + e.what());
            return Error(req, http::status::internal_server_error, "storage failure");
        }
        catch (const std::exception& e) {
            LOG_ERROR(std::string("request ") + std::string(req.target()) + " failed: " + e.what());
            return Error(req, http::status::internal_server_error, "internal error");
        }
    }

    HttpResponse ApiRoutes::Route(const HttpRequest& req, const SenderInfo& sender) {
        const std::string target(req.target());
        const auto q = target.find('?');
        const std::string path = target.substr(0, q);
        const std::string query = q == std::string::npos ? std::string() : target.substr(q + 1);
        const http::verb method = req.method();

        if (method == http::verb::options) {
            StringResponse res{ http::status::no_content, req.version() };
            res.keep_alive(req.keep_alive());
            ApplyCors(res.base());
            res.prepare_payload();
            return res;
        }

        auto expect = [&](http::verb allowed) { return method == allowed; };
        const auto notAllowed = [&]() { return Error(req, http::status::method_not_allowed, "Method Not Allowed"); };

        if (path == "/health")
            return expect(http::verb::get) ? Health(req) : notAllowed();
        if (path == "/device/upsert")
            return expect(http::verb::post) ? DeviceUpsert(req, sender) : notAllowed();
        if (path == "/messages")
            return expect(http::verb::post) ? PostMessage(req, sender) : notAllowed();
        if (path == "/upload/voice")
            return expect(http::verb::post) ? UploadVoice(req, sender) : notAllowed();
        if (path == "/upload/blob")
            return expect(http::verb::post) ? UploadBlob(req, sender) : notAllowed();

        if (StartsWith(path, kRoomsPrefix) && EndsWith(path, kHistorySuffix)) {
            const size_t begin = std::char_traits<char>::length(kRoomsPrefix);
            const size_t end = path.size() - std::char_traits<char>::length(kHistorySuffix);
            if (end > begin) {
                const std::string room = UrlDecode(path.substr(begin, end - begin));
                if (room.find('/') == std::string::npos)
                    return expect(http::verb::get) ? RoomHistory(req, room, query) : notAllowed();
            }
        }
        if (StartsWith(path, kAudioPrefix))
            return expect(http::verb::get)
                ? ServeFile(req, path.substr(std::char_traits<char>::length(kAudioPrefix)), true)
                : HttpResponse(notAllowed());
        if (StartsWith(path, kBlobPrefix))
            return expect(http::verb::get)
                ? ServeFile(req, path.substr(std::char_traits<char>::length(kBlobPrefix)), false)
                : HttpResponse(notAllowed());

        return Error(req, http::status::not_found, "Not Found");
    }

    StringResponse ApiRoutes::Health(const HttpRequest& req) {
        RoomHub& hub = m_Chat.Hub();
        return Json(req, http::status::ok, json{
            { "ok", true },
            { "rooms", hub.RoomCount() },
            { "connections", hub.ConnectionCount() },
            { "version", BLACKROOM_VERSION_STRING },
        });
    }

    StringResponse ApiRoutes::DeviceUpsert(const HttpRequest& req, const SenderInfo& sender) {
        const json body = ParseJsonBody(req.body());
        const Device dev = m_Chat.Identity().Resolve(
            OptionalString(body, "fingerprint"), OptionalString(body, "label"), sender);
        return Json(req, http::status::ok, json{
            { "ok", true },
            { "device_id", dev.id },
            { "label", OptionalJson(dev.label) },
            { "ip_last", OptionalJson(dev.ipLast) },
        });
    }

    StringResponse ApiRoutes::PostMessage(const HttpRequest& req, const SenderInfo& sender) {
        const json body = ParseJsonBody(req.body());

        IngestRequest in;
        const auto room = OptionalString(body, "room");
        if (!room || room->empty()) throw SchemaError("field 'room' is required");
        in.room = *room;

        const std::string contentType = OptionalString(body, "content_type").value_or("text");
        const auto kind = ParseContentKind(contentType);
        if (!kind || *kind == ContentKind::Image || *kind == ContentKind::Video)
            throw SchemaError("content_type must be one of text, voice, file, system");
        in.kind = *kind;
        in.content = OptionalString(body, "content");
        in.fileRef = OptionalString(body, "file_ref");
        in.fingerprint = OptionalString(body, "fingerprint");
        in.label = OptionalString(body, "label");
        in.sender = sender;

        const IngestResult r = m_Chat.Ingest(in);
        return Json(req, http::status::ok, json{ { "ok", true }, { "id", r.message.id } });
    }

    StringResponse ApiRoutes::RoomHistory(const HttpRequest& req, const std::string& room, const std::string& query) {
        const ServerConfig& cfg = m_Chat.Config();
        int limit = cfg.historyDefaultLimit;
        if (auto raw = QueryParam(query, "limit")) {
            try {
                size_t consumed = 0;
                limit = std::stoi(*raw, &consumed);
                if (consumed != raw->size()) throw SchemaError("limit must be an integer");
            }
            catch (const std::logic_error&) {
                throw SchemaError("limit must be an integer");
            }
        }
        limit = std::clamp(limit, 1, cfg.historyMaxLimit);

        json rows = json::array();
        for (const HistoryEntry& e : m_Chat.Log().History(room, limit)) {
            rows.push_back(json{
                { "id", e.message.id },
                { "room", e.room },
                { "device_label", OptionalJson(e.deviceLabel) },
                { "ip", OptionalJson(e.message.ipAtSend) },
                { "content_type", ToString(e.message.kind) },
                { "content", OptionalJson(e.message.content) },
                { "file_ref", OptionalJson(e.message.fileRef) },
                { "ts", e.message.createdAt },
            });
        }
        return Json(req, http::status::ok, rows);
    }

    StringResponse ApiRoutes::UploadVoice(const HttpRequest& req, const SenderInfo& sender) {
        const MultipartForm form = MultipartForm::Parse(std::string(req[http::field::content_type]), req.body());
        const FormPart* file = form.Find("file");
        if (!file) throw SchemaError("field 'file' is required");

        const PutResult stored = m_Chat.AudioStore().Put(file->body, file->contentType);

        IngestRequest in;
        in.room = NonEmptyField(form, "room").value_or(m_Chat.Config().defaultUploadRoom);
        in.kind = ContentKind::Voice;
        in.fileRef = stored.objectKey;
        in.fingerprint = NonEmptyField(form, "fingerprint");
        in.label = NonEmptyField(form, "label");
        in.sender = sender;

        const IngestResult r = m_Chat.Ingest(in);
        return Json(req, http::status::ok, json{
            { "ok", true },
            { "id", r.message.id },
            { "object_key", stored.objectKey },
        });
    }

    StringResponse ApiRoutes::UploadBlob(const HttpRequest& req, const SenderInfo& sender) {
        const MultipartForm form = MultipartForm::Parse(std::string(req[http::field::content_type]), req.body());
        const FormPart* file = form.Find("file");
        if (!file) throw SchemaError("field 'file' is required");

        const PutResult stored = m_Chat.BlobStore().Put(file->body, file->contentType, file->filename.value_or(""));

        IngestRequest in;
        in.room = NonEmptyField(form, "room").value_or(m_Chat.Config().defaultUploadRoom);
        in.kind = ClassifyMime(file->contentType);
        in.content = file->filename;
        in.fileRef = stored.objectKey;
        in.fingerprint = NonEmptyField(form, "fingerprint");
        in.label = NonEmptyField(form, "label");
        if (!file->contentType.empty()) in.mime = file->contentType;
        in.sender = sender;

        const IngestResult r = m_Chat.Ingest(in);
        return Json(req, http::status::ok, json{
            { "ok", true },
            { "id", r.message.id },
            { "object_key", stored.objectKey },
            { "category", ToString(in.kind) },
        });
    }

    HttpResponse ApiRoutes::ServeFile(const HttpRequest& req, const std::string& encodedKey, bool audio) {
        ContentStore& store = audio ? m_Chat.AudioStore() : m_Chat.BlobStore();
        const std::string key = ContentStore::ValidateKey(UrlDecode(encodedKey));
        const auto path = store.Locate(key);
        if (!path) return Error(req, http::status::not_found, "not found");

        http::file_body::value_type body;
        boost::beast::error_code ec;
        body.open(path->c_str(), boost::beast::file_mode::scan, ec);
        if (ec) return Error(req, http::status::not_found, "not found");

        const auto size = body.size();
        FileResponse res{ std::piecewise_construct,
            std::make_tuple(std::move(body)),
            std::make_tuple(http::status::ok, req.version()) };
        res.set(http::field::server, "BlackRoom");
        res.set(http::field::content_type, store.ContentTypeFor(key));
        res.set(http::field::content_disposition, "inline; filename=\"" + key + "\"");
        res.content_length(size);
        res.keep_alive(req.keep_alive());
        ApplyCors(res.base());
        return res;
    }

} // namespace BlackRoom
