#include "ChatService.h"
#include "Database.h"
#include "HttpSession.h"
#include "RelayServer.h"
#include "RoomHub.h"
#include "WebSocketSession.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

    using namespace BlackRoom;
    using json = nlohmann::json;
    using tcp = boost::asio::ip::tcp;
    namespace asio = boost::asio;
    namespace beast = boost::beast;
    namespace http = boost::beast::http;
    namespace websocket = boost::beast::websocket;

    ServerConfig TestConfig(const std::string& test_name) {
        const auto dir = std::filesystem::temp_directory_path() / "blackroom_websocket_session_tests" / test_name;
        std::filesystem::remove_all(dir);
        ServerConfig cfg;
        cfg.databasePath = (dir / "relay.sqlite3").string();
        cfg.dataDir = (dir / "data").string();
        return cfg;
    }

    bool WaitFor(const std::function<bool()>& done) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline) {
            if (done()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return done();
    }

    // Blocking client for one /ws/{room} connection.
    class Client {
    public:
        Client(asio::io_context& ioc, const tcp::endpoint& server, const std::string& target)
            : m_Ws(ioc)
        {
            m_Ws.next_layer().connect(server);
            m_Ws.handshake("127.0.0.1:" + std::to_string(server.port()), target);
        }

        void Send(const std::string& text) {
            m_Ws.text(true);
            m_Ws.write(asio::buffer(text));
        }

        void SendBinary(const std::string& bytes) {
            m_Ws.binary(true);
            m_Ws.write(asio::buffer(bytes));
        }

        json Read() {
            beast::flat_buffer buffer;
            m_Ws.read(buffer);
            return json::parse(beast::buffers_to_string(buffer.data()));
        }

        void Close() {
            // The server tears the socket down right after its close frame.
            beast::error_code ec;
            m_Ws.close(websocket::close_code::normal, ec);
        }

    private:
        websocket::stream<tcp::socket> m_Ws;
    };

    bool IsPresence(const json& frame, const std::string& room, size_t count) {
        return frame.at("type") == "presence" && frame.at("room") == room && frame.at("count") == count;
    }

    void TestRoomFromTarget() {
        assert(WebSocketRoomFromTarget("/ws/lobby") == std::string("lobby"));
        assert(WebSocketRoomFromTarget("/ws/lobby?token=1&x=2") == std::string("lobby"));
        assert(WebSocketRoomFromTarget("/ws/night%20shift") == std::string("night shift"));
        assert(!WebSocketRoomFromTarget("/ws/"));
        assert(!WebSocketRoomFromTarget("/ws/?room=lobby"));
        assert(!WebSocketRoomFromTarget("/ws/a/b"));
        assert(!WebSocketRoomFromTarget("/ws/a%2Fb"));
        assert(!WebSocketRoomFromTarget("/ws"));
        assert(!WebSocketRoomFromTarget("/rooms/lobby/messages"));
    }

    void TestSlowConsumerIsCutOff() {
        const ServerConfig cfg = TestConfig("slow_consumer");
        Database db(cfg.databasePath);
        RoomHub hub;
        ChatService chat(cfg, db, hub);

        // Nothing runs the io_context, so no queued frame is ever written.
        asio::io_context ioc;
        auto session = std::make_shared<WebSocketSession>(tcp::socket(ioc), chat, "lobby", "10.0.0.9");
        assert(session->Describe() == "10.0.0.9/lobby");

        const auto frame = std::make_shared<const std::string>(R"({"type":"msg"})");
        for (size_t i = 0; i < WebSocketSession::kMaxPendingFrames; ++i)
            assert(session->Deliver(frame));
        assert(!session->Deliver(frame));
        assert(!session->Deliver(frame));

        // Draining runs the posted close; a closed session refuses everything.
        ioc.run();
        assert(!session->Deliver(frame));
    }

    void TestGatewayLifecycle() {
        const ServerConfig cfg = TestConfig("lifecycle");
        Database db(cfg.databasePath);
        RoomHub hub;
        ChatService chat(cfg, db, hub);

        asio::io_context serverIoc;
        RelayServer server(serverIoc, chat, "127.0.0.1", 0, cfg.maxBodyBytes);
        const tcp::endpoint endpoint = server.LocalEndpoint();
        std::vector<std::thread> threads;
        for (int i = 0; i < 2; ++i)
            threads.emplace_back([&serverIoc] { serverIoc.run(); });

        asio::io_context clientIoc;
        {
            Client a(clientIoc, endpoint, "/ws/lobby");
            assert(IsPresence(a.Read(), "lobby", 1));

            Client b(clientIoc, endpoint, "/ws/lobby");
            assert(IsPresence(b.Read(), "lobby", 2));
            assert(hub.SubscriberCount("lobby") == 2);

            // Bad frames are dropped without closing the connection.
            a.Send("not json");
            a.Send(R"({"type":"typing"})");
            a.SendBinary("\x01\x02");
            a.Send(R"({"type":"msg","content":"hello","fingerprint":"fp-a","label":"alice"})");

            const json atB = b.Read();
            const json atA = a.Read();
            assert(atA == atB);
            assert(atB.at("type") == "msg");
            assert(atB.at("room") == "lobby");
            assert(atB.at("content") == "hello");
            assert(atB.at("content_type") == "text");
            assert(atB.at("device").at("label") == "alice");
            assert(atB.at("device").at("ip").is_null());

            const auto history = chat.Log().History("lobby", 10);
            assert(history.size() == 1);
            assert(!history[0].message.ipAtSend);
            assert(!history[0].message.uaAtSend);

            b.Close();
            assert(IsPresence(a.Read(), "lobby", 1));
            assert(hub.SubscriberCount("lobby") == 1);

            a.Close();
            assert(WaitFor([&hub] { return hub.ChannelCount() == 0; }));
        }

        // A non-room upgrade target is answered as plain HTTP and the handshake fails.
        bool declined = false;
        try {
            Client bad(clientIoc, endpoint, "/ws/");
        }
        catch (const boost::system::system_error&) {
            declined = true;
        }
        assert(declined);

        // The same listener serves plain HTTP.
        {
            tcp::socket socket(clientIoc);
            socket.connect(endpoint);
            http::request<http::empty_body> req{ http::verb::get, "/health", 11 };
            req.set(http::field::host, "127.0.0.1");
            req.keep_alive(false);
            http::write(socket, req);

            beast::flat_buffer buffer;
            http::response<http::string_body> res;
            beast::error_code ec;
            http::read(socket, buffer, res, ec);
            assert(!ec);
            assert(res.result() == http::status::ok);
            const json body = json::parse(res.body());
            assert(body.at("ok") == true);
            assert(body.at("connections") == 0);
        }

        server.Stop();
        serverIoc.stop();
        for (auto& t : threads) t.join();
        hub.Clear();
    }

} // namespace

int main() {
    TestRoomFromTarget();
    TestSlowConsumerIsCutOff();
    TestGatewayLifecycle();

    std::cout << "blackroom_unit_websocket_session: pass\n";
    return 0;
}
