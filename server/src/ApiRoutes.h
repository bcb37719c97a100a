#pragma once
#include "Models.h"
#include <boost/beast/http.hpp>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <variant>

namespace BlackRoom {

    namespace http = boost::beast::http;

    class ChatService;

    using HttpRequest = http::request<http::string_body>;
    using StringResponse = http::response<http::string_body>;
    using FileResponse = http::response<http::file_body>;
    using HttpResponse = std::variant<StringResponse, FileResponse>;

    // Request -> response for every HTTP endpoint. No socket work happens here.
    class ApiRoutes {
    public:
        explicit ApiRoutes(ChatService& chat) : m_Chat(chat) {}

        /// `remoteAddress` is the peer IP as seen by the socket.
        HttpResponse Handle(const HttpRequest& req, const std::string& remoteAddress);

        static std::string UrlDecode(const std::string& in);

    private:
        HttpResponse Route(const HttpRequest& req, const SenderInfo& sender);

        StringResponse DeviceUpsert(const HttpRequest& req, const SenderInfo& sender);
        StringResponse PostMessage(const HttpRequest& req, const SenderInfo& sender);
        StringResponse RoomHistory(const HttpRequest& req, const std::string& room, const std::string& query);
        StringResponse UploadVoice(const HttpRequest& req, const SenderInfo& sender);
        StringResponse UploadBlob(const HttpRequest& req, const SenderInfo& sender);
        HttpResponse ServeFile(const HttpRequest& req, const std::string& encodedKey, bool audio);
        StringResponse Health(const HttpRequest& req);

        StringResponse Json(const HttpRequest& req, http::status status, const nlohmann::json& body) const;
        StringResponse Error(const HttpRequest& req, http::status status, const std::string& detail) const;
        void ApplyCors(http::fields& fields) const;

        ChatService& m_Chat;
    };

} // namespace BlackRoom
