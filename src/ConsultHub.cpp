#include "auth/TokenVerifier.h"
#include "config/ServerConfig.h"
#include "hub/Hub.h"
#include "networking/WebSocketServer.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

int main(int argc, char** argv) {
    using namespace consulthub;

    config::CommandLine cl;
    try {
        cl = config::parse_command_line(argc, argv);
    } catch (const config::ConfigError& e) {
        std::cerr << "[ConsultHub] config: " << e.what() << "\n" << config::usage(argv[0]);
        return 2;
    }
    if (cl.help) {
        std::cout << config::usage(argv[0]);
        return 0;
    }
    const config::ServerConfig& cfg = cl.config;

    if (cfg.tokens.empty()) {
        std::cerr << "[ConsultHub] warning: no tokens configured, every upgrade will be rejected\n";
    }

    boost::asio::io_context ioc{static_cast<int>(cfg.threads)};

    auth::StaticTokenVerifier verifier(cfg.tokens);
    hub::Hub hub(ioc);

    try {
        networking::WebSocketServer server(ioc, cfg, hub, verifier);

        hub.start();
        server.start();

        // Graceful shutdown on Ctrl+C / SIGTERM
        boost::asio::steady_timer grace(ioc);
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            std::cout << "\n[ConsultHub] shutting down...\n";
            server.stop();
            hub.stop();
            // let close handshakes go out, then drop whatever is left
            grace.expires_after(std::chrono::seconds(1));
            grace.async_wait([&ioc](const boost::system::error_code&) { ioc.stop(); });
        });

        std::cout << "[ConsultHub] listening on " << cfg.bind_address << ":" << server.port()
                  << cfg.ws_path << " (" << cfg.threads << " thread(s))\n";

        std::vector<std::thread> workers;
        workers.reserve(cfg.threads - 1);
        for (std::size_t i = 1; i < cfg.threads; ++i) {
            workers.emplace_back([&ioc] { ioc.run(); });
        }
        ioc.run();
        for (auto& t : workers) t.join();
    } catch (const boost::system::system_error& e) {
        std::cerr << "[ConsultHub] " << e.what() << "\n";
        return 1;
    }

    std::cout << "[ConsultHub] exit.\n";
    return 0;
}
