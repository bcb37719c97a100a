#pragma once
#include "ApiRoutes.h"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <optional>
#include <string>

namespace BlackRoom {

    namespace beast = boost::beast;

    class ChatService;

    // One keep-alive HTTP connection. Reads a request, answers it through ApiRoutes and
    // loops; a WebSocket upgrade on /ws/{room} hands the socket to a WebSocketSession.
    class HttpSession : public std::enable_shared_from_this<HttpSession> {
    public:
        HttpSession(boost::asio::ip::tcp::socket socket, ChatService& chat, ApiRoutes& routes, size_t maxBodyBytes);

        void Start();

    private:
        void DoRead();
        void OnRead(beast::error_code ec, std::size_t bytes);
        void Send(HttpResponse&& response);
        void OnWrite(bool close, beast::error_code ec, std::size_t bytes);
        void Disconnect();

        beast::tcp_stream m_Stream;
        beast::flat_buffer m_Buffer;
        ChatService& m_Chat;
        ApiRoutes& m_Routes;
        size_t m_MaxBodyBytes;
        std::string m_RemoteAddress;
        std::optional<http::request_parser<http::string_body>> m_Parser;
        std::shared_ptr<void> m_PendingResponse;   // keeps the response alive until written
    };

    /// Room name from a "/ws/{room}" target, URL-decoded; nullopt for any other target.
    std::optional<std::string> WebSocketRoomFromTarget(const std::string& target);

} // namespace BlackRoom
