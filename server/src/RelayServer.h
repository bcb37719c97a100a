#pragma once
#include "ApiRoutes.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstddef>
#include <string>

namespace BlackRoom {

    namespace asio = boost::asio;

    class ChatService;

    // ---------------------------------------------------------------------------
    // RelayServer: accepts TCP connections and hands each to an HttpSession, which
    // either answers plain HTTP requests or upgrades /ws/{room} to a WebSocketSession.
    // ---------------------------------------------------------------------------
    class RelayServer {
    public:
        RelayServer(asio::io_context& io_context, ChatService& chat,
            const std::string& bindAddress, unsigned short port, size_t maxBodyBytes);

        void Stop();
        asio::ip::tcp::endpoint LocalEndpoint() const { return m_Acceptor.local_endpoint(); }

    private:
        void DoAccept();

        asio::io_context& m_IoContext;
        asio::ip::tcp::acceptor m_Acceptor;
        ChatService& m_Chat;
        ApiRoutes m_Routes;
        size_t m_MaxBodyBytes;
    };

} // namespace BlackRoom
