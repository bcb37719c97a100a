#pragma once
#include "ApiRoutes.h"
#include "RoomHub.h"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <string>

namespace BlackRoom {

    namespace beast = boost::beast;
    namespace websocket = boost::beast::websocket;

    class ChatService;

    // A live /ws/{room} connection. Inbound text frames go through ChatService::IngestFrame;
    // outbound frames from the hub are queued and written one at a time on the socket's strand.
    class WebSocketSession : public Subscriber, public std::enable_shared_from_this<WebSocketSession> {
    public:
        static constexpr size_t kMaxPendingFrames = 256;

        WebSocketSession(boost::asio::ip::tcp::socket socket, ChatService& chat,
            std::string room, std::string remoteAddress);

        // Completes the handshake for an upgrade request already read by HttpSession.
        void Run(HttpRequest req);

        bool Deliver(std::shared_ptr<const std::string> frame) override;
        std::string Describe() const override;

    private:
        void OnAccept(beast::error_code ec);
        void DoRead();
        void OnRead(beast::error_code ec, std::size_t bytes);
        void DoWrite();
        void OnWrite(beast::error_code ec, std::size_t bytes);
        void Close();

        websocket::stream<beast::tcp_stream> m_Ws;
        beast::flat_buffer m_ReadBuffer;
        ChatService& m_Chat;
        const std::string m_Room;
        const std::string m_RemoteAddress;

        std::deque<std::shared_ptr<const std::string>> m_WriteQueue;
        std::atomic<size_t> m_Pending{ 0 };
        std::atomic<bool> m_IsHealthy{ true };
        std::atomic<bool> m_Closed{ false };
        bool m_Subscribed = false;
    };

} // namespace BlackRoom
