#include "ChatService.h"
#include "Config.h"
#include "Database.h"
#include "Errors.h"
#include "Logger.h"
#include "RelayServer.h"
#include "RoomHub.h"
#include "Version.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <vector>

namespace asio = boost::asio;

// Re-register the signal handler after each delivery so that a second Ctrl+C
// while the server drains is still caught instead of killing it mid-cleanup.
static void ArmSignals(asio::signal_set& signals, asio::io_context& io_context, BlackRoom::RelayServer& server) {
    signals.async_wait([&signals, &io_context, &server](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        BlackRoom::RelayTrace::log("step=server_shutdown status=graceful signal="
            + std::to_string(signo));
        LOG_INFO("shutting down on signal " + std::to_string(signo));
        server.Stop();
        io_context.stop();
        ArmSignals(signals, io_context, server);
        });
}

int main(int argc, char* argv[]) {
    std::string configPath;
    if (argc > 1) configPath = argv[1];
    else if (const char* env = std::getenv("BLACKROOM_CONFIG")) configPath = env;

    BlackRoom::ServerConfig config;
    try {
        config = BlackRoom::LoadConfig(configPath);
    }
    catch (const BlackRoom::ConfigError& e) {
        std::cerr << "blackroom: " << e.what() << "\n";
        return 1;
    }

    try {
        if (!config.logFile.empty() && !BlackRoom::Logger::Instance().Initialize(config.logFile))
            std::cerr << "blackroom: cannot open log file " << config.logFile << ", logging to stderr only\n";
        BlackRoom::RelayTrace::init(config.trace);

        BlackRoom::Database db(config.databasePath);
        BlackRoom::RoomHub hub;
        BlackRoom::ChatService chat(config, db, hub);
        for (const auto& room : config.seedRooms)
            chat.Rooms().Ensure(room);

        asio::io_context io_context;
        BlackRoom::RelayServer server(io_context, chat, config.bindAddress, config.port, config.maxBodyBytes);

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        ArmSignals(signals, io_context, server);

        const unsigned int thread_count = BlackRoom::ResolveThreadCount(config.threads);
        const auto endpoint = server.LocalEndpoint();
        LOG_INFO(std::string("BlackRoom ") + BLACKROOM_VERSION_STRING + " listening on "
            + endpoint.address().to_string() + ":" + std::to_string(endpoint.port())
            + " with " + std::to_string(thread_count) + " threads, db=" + db.Path());

        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (unsigned int i = 0; i < thread_count; ++i)
            threads.emplace_back([&io_context] { io_context.run(); });
        for (auto& t : threads) t.join();

        // Sessions must release their sockets while io_context is still alive.
        const size_t dropped = hub.Clear();
        LOG_INFO("stopped, closed " + std::to_string(dropped) + " live connections");
        BlackRoom::Logger::Instance().Shutdown();
    }
    catch (const std::exception& e) {
        std::cerr << "blackroom: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
