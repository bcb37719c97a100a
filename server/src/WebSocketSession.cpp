#include "WebSocketSession.h"
#include "ChatService.h"
#include "Logger.h"
#include <boost/asio/post.hpp>

namespace asio = boost::asio;

namespace BlackRoom {

    WebSocketSession::WebSocketSession(asio::ip::tcp::socket socket, ChatService& chat,
        std::string room, std::string remoteAddress)
        : m_Ws(std::move(socket)), m_Chat(chat), m_Room(std::move(room)), m_RemoteAddress(std::move(remoteAddress)) {
    }

    void WebSocketSession::Run(HttpRequest req) {
        m_Ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        m_Ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(beast::http::field::server, "blackroom");
            }));
        m_Ws.async_accept(req,
            beast::bind_front_handler(&WebSocketSession::OnAccept, shared_from_this()));
    }

    void WebSocketSession::OnAccept(beast::error_code ec) {
        if (ec) {
            LOG_NETWORK("websocket handshake failed for " + Describe() + ": " + ec.message());
            m_Closed.store(true);
            return;
        }
        LOG_NETWORK("websocket open " + Describe());
        m_Subscribed = true;
        m_Chat.Hub().Subscribe(m_Room, shared_from_this());
        DoRead();
    }

    void WebSocketSession::DoRead() {
        m_Ws.async_read(m_ReadBuffer,
            beast::bind_front_handler(&WebSocketSession::OnRead, shared_from_this()));
    }

    void WebSocketSession::OnRead(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted)
                LOG_NETWORK("websocket read error from " + Describe() + ": " + ec.message());
            Close();
            return;
        }

        if (!m_Ws.got_text()) {
            m_ReadBuffer.consume(m_ReadBuffer.size());
            RelayTrace::log("step=frame_dropped room=" + m_Room + " reason=binary");
            DoRead();
            return;
        }

        const std::string text = beast::buffers_to_string(m_ReadBuffer.data());
        m_ReadBuffer.consume(m_ReadBuffer.size());

        // A bad frame or a storage failure drops the frame; the connection stays open.
        try {
            if (!m_Chat.IngestFrame(m_Room, text))
                RelayTrace::log("step=frame_dropped room=" + m_Room + " conn=" + Describe());
        }
        catch (const std::exception& e) {
            LOG_ERROR("frame from " + Describe() + " not stored: " + e.what());
        }
        DoRead();
    }

    bool WebSocketSession::Deliver(std::shared_ptr<const std::string> frame) {
        if (m_Closed.load() || !m_IsHealthy.load(std::memory_order_relaxed)) return false;

        if (m_Pending.fetch_add(1) >= kMaxPendingFrames) {
            m_Pending.fetch_sub(1);
            m_IsHealthy.store(false, std::memory_order_relaxed);
            LOG_NETWORK("dropping slow consumer " + Describe());
            asio::post(m_Ws.get_executor(), [self = shared_from_this()]() { self->Close(); });
            return false;
        }

        asio::post(m_Ws.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() {
            if (self->m_Closed.load()) {
                self->m_Pending.fetch_sub(1);
                return;
            }
            const bool writeInProgress = !self->m_WriteQueue.empty();
            self->m_WriteQueue.push_back(frame);
            if (!writeInProgress) self->DoWrite();
            });
        return true;
    }

    void WebSocketSession::DoWrite() {
        m_Ws.text(true);
        m_Ws.async_write(asio::buffer(*m_WriteQueue.front()),
            beast::bind_front_handler(&WebSocketSession::OnWrite, shared_from_this()));
    }

    void WebSocketSession::OnWrite(beast::error_code ec, std::size_t) {
        m_WriteQueue.pop_front();
        m_Pending.fetch_sub(1);
        if (ec) {
            m_IsHealthy.store(false, std::memory_order_relaxed);
            if (ec != asio::error::operation_aborted)
                LOG_NETWORK("websocket write error to " + Describe() + ": " + ec.message());
            Close();
            return;
        }
        if (!m_WriteQueue.empty() && !m_Closed.load()) DoWrite();
    }

    void WebSocketSession::Close() {
        if (m_Closed.exchange(true)) return;
        if (m_Subscribed) m_Chat.Hub().Unsubscribe(m_Room, shared_from_this());
        beast::error_code ec;
        beast::get_lowest_layer(m_Ws).socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        beast::get_lowest_layer(m_Ws).socket().close(ec);
        LOG_NETWORK("websocket closed " + Describe());
    }

    std::string WebSocketSession::Describe() const {
        return m_RemoteAddress + "/" + m_Room;
    }

} // namespace BlackRoom
