#include "RelayServer.h"
#include "HttpSession.h"
#include "Logger.h"
#include <boost/asio/strand.hpp>
#include <memory>

using boost::asio::ip::tcp;

namespace BlackRoom {

    RelayServer::RelayServer(asio::io_context& io_context, ChatService& chat,
        const std::string& bindAddress, unsigned short port, size_t maxBodyBytes)
        : m_IoContext(io_context)
        , m_Acceptor(io_context)
        , m_Chat(chat)
        , m_Routes(chat)
        , m_MaxBodyBytes(maxBodyBytes)
    {
        const tcp::endpoint endpoint(asio::ip::make_address(bindAddress), port);
        m_Acceptor.open(endpoint.protocol());
        m_Acceptor.set_option(asio::socket_base::reuse_address(true));
        m_Acceptor.bind(endpoint);
        m_Acceptor.listen(asio::socket_base::max_listen_connections);
        DoAccept();
    }

    void RelayServer::Stop() {
        boost::system::error_code ec;
        m_Acceptor.close(ec);
    }

    void RelayServer::DoAccept() {
        // Each connection gets its own strand; all of its handlers are serialized on it.
        m_Acceptor.async_accept(asio::make_strand(m_IoContext),
            [this](boost::system::error_code ec, tcp::socket socket) {
                if (ec == asio::error::operation_aborted) return;
                if (!ec) {
                    std::make_shared<HttpSession>(std::move(socket), m_Chat, m_Routes, m_MaxBodyBytes)->Start();
                }
                else {
                    LOG_NETWORK("accept error: " + ec.message());
                }
                DoAccept();
            });
    }

} // namespace BlackRoom
