#include "HttpSession.h"
#include "Logger.h"
#include "WebSocketSession.h"
#include <boost/asio/dispatch.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <type_traits>
#include <variant>

namespace asio = boost::asio;
namespace websocket = boost::beast::websocket;

namespace BlackRoom {

    std::optional<std::string> WebSocketRoomFromTarget(const std::string& target) {
        static const std::string kPrefix = "/ws/";
        const std::string path = target.substr(0, target.find('?'));
        if (path.compare(0, kPrefix.size(), kPrefix) != 0) return std::nullopt;
        // Same rule as /rooms/{room}/messages: one segment, also after decoding.
        std::string room = ApiRoutes::UrlDecode(path.substr(kPrefix.size()));
        if (room.empty() || room.find('/') != std::string::npos) return std::nullopt;
        return room;
    }

    HttpSession::HttpSession(asio::ip::tcp::socket socket, ChatService& chat, ApiRoutes& routes, size_t maxBodyBytes)
        : m_Stream(std::move(socket)), m_Chat(chat), m_Routes(routes), m_MaxBodyBytes(maxBodyBytes) {
        beast::error_code ec;
        const auto remote = m_Stream.socket().remote_endpoint(ec);
        if (!ec) m_RemoteAddress = remote.address().to_string();
    }

    void HttpSession::Start() {
        asio::dispatch(m_Stream.get_executor(),
            beast::bind_front_handler(&HttpSession::DoRead, shared_from_this()));
    }

    void HttpSession::DoRead() {
        m_Parser.emplace();
        m_Parser->body_limit(m_MaxBodyBytes);
        m_Stream.expires_after(std::chrono::seconds(30));
        http::async_read(m_Stream, m_Buffer, *m_Parser,
            beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
    }

    void HttpSession::OnRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            Disconnect();
            return;
        }
        if (ec == http::error::body_limit) {
            StringResponse res{ http::status::payload_too_large, 11 };
            res.set(http::field::content_type, "application/json");
            res.body() = R"({"detail":"request body too large"})";
            res.keep_alive(false);
            res.prepare_payload();
            Send(std::move(res));
            return;
        }
        if (ec) {
            if (ec != beast::error::timeout)
                LOG_NETWORK("http read error from " + m_RemoteAddress + ": " + ec.message());
            Disconnect();
            return;
        }

        HttpRequest req = m_Parser->release();

        if (websocket::is_upgrade(req)) {
            if (auto room = WebSocketRoomFromTarget(std::string(req.target()))) {
                m_Stream.expires_never();
                std::make_shared<WebSocketSession>(m_Stream.release_socket(), m_Chat, *room, m_RemoteAddress)
                    ->Run(std::move(req));
                return;
            }
        }

        Send(m_Routes.Handle(req, m_RemoteAddress));
    }

    void HttpSession::Send(HttpResponse&& response) {
        std::visit([this](auto&& res) {
            using Response = std::decay_t<decltype(res)>;
            auto sp = std::make_shared<Response>(std::move(res));
            m_PendingResponse = sp;
            const bool close = sp->need_eof();
            http::async_write(m_Stream, *sp,
                beast::bind_front_handler(&HttpSession::OnWrite, shared_from_this(), close));
            }, std::move(response));
    }

    void HttpSession::OnWrite(bool close, beast::error_code ec, std::size_t) {
        m_PendingResponse.reset();
        if (ec) {
            LOG_NETWORK("http write error to " + m_RemoteAddress + ": " + ec.message());
            Disconnect();
            return;
        }
        if (close) {
            Disconnect();
            return;
        }
        DoRead();
    }

    void HttpSession::Disconnect() {
        beast::error_code ec;
        m_Stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
    }

} // namespace BlackRoom
