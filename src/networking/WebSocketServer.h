#pragma once

#include <boost/asio/io_context.hpp>

#include <memory>

namespace consulthub {
namespace auth { class TokenVerifier; }
namespace config { struct ServerConfig; }
namespace hub { class Hub; }
}

namespace consulthub::networking {

// Upgrade endpoint plus one connection actor per accepted WebSocket.
// Authenticates the upgrade, hands the new connection to the hub, then
// pumps frames between the socket and the hub until something fails.
class WebSocketServer {
public:
    WebSocketServer(boost::asio::io_context& ioc,
                    const config::ServerConfig& cfg,
                    hub::Hub& hub,
                    const auth::TokenVerifier& verifier);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void start();  // start accepting
    void stop();   // stop accepting + close active sessions

    unsigned short port() const;  // bound port (config port 0 picks one)

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace consulthub::networking
