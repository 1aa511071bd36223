#include "networking/WebSocketServer.h"

#include "auth/TokenVerifier.h"
#include "config/ServerConfig.h"
#include "hub/Connection.h"
#include "hub/Envelope.h"
#include "hub/Hub.h"
#include "hub/IDGenerator.hpp"
#include "networking/OriginPolicy.h"
#include "networking/UpgradeRequest.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace consulthub::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace json = boost::json;
using tcp = asio::ip::tcp;

namespace {

constexpr auto kHandshakeTimeout = std::chrono::seconds(30);

using Response = http::response<http::string_body>;

std::string header_value(const Request& req, http::field f) {
    auto it = req.find(f);
    if (it == req.end()) return {};
    return std::string(it->value().data(), it->value().size());
}

std::shared_ptr<Response> json_response(const Request& req,
                                        http::status status,
                                        const json::object& body,
                                        const OriginPolicy& origins) {
    auto res = std::make_shared<Response>(status, req.version());
    res->set(http::field::server, "consulthub");
    res->set(http::field::content_type, "application/json");

    const std::string origin = header_value(req, http::field::origin);
    if (origins.listed(origin)) {
        res->set(http::field::access_control_allow_origin, origin);
        res->set(http::field::access_control_allow_credentials, "true");
    }

    res->keep_alive(false);
    res->body() = json::serialize(body);
    res->prepare_payload();
    return res;
}

json::object stats_json(const hub::HubStats& stats) {
    json::object participants;
    for (const auto& [id, n] : stats.participants) participants[id] = n;
    return {
        {"status", "ok"},
        {"connections", stats.connections},
        {"rooms", stats.rooms},
        {"participants", std::move(participants)},
    };
}

} // namespace

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc,
         const config::ServerConfig& cfg,
         hub::Hub& hub,
         const auth::TokenVerifier& verifier)
        : ioc_(ioc),
          cfg_(cfg),
          hub_(hub),
          verifier_(verifier),
          origins_(cfg.allowed_origins, cfg.allow_missing_origin),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(cfg.bind_address), cfg.port)) {}

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        std::vector<std::shared_ptr<WsSession>> live;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto& [id, s] : sessions_) live.push_back(s);
        }
        for (auto& s : live) s->close();
    }

    unsigned short port() const {
        beast::error_code ec;
        return acceptor_.local_endpoint(ec).port();
    }

private:
    // Connection actor: one read loop, and one write loop that multiplexes
    // the send queue with the liveness ping. Everything runs on strand_.
    class WsSession : public std::enable_shared_from_this<WsSession> {
    public:
        WsSession(Impl& server, tcp::socket socket, std::string user_id)
            : server_(server),
              ws_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)),
              ping_timer_(strand_),
              read_deadline_(strand_),
              write_deadline_(strand_),
              conn_(std::make_shared<hub::Connection>(server_.idgen_.connectionID(),
                                                      std::move(user_id),
                                                      server_.cfg_.queue_capacity)) {}

        const std::string& id() const { return conn_->id(); }

        void run(Request req) {
            beast::get_lowest_layer(ws_).expires_never();

            websocket::stream_base::timeout opt{
                kHandshakeTimeout,
                websocket::stream_base::none(),
                false};
            ws_.set_option(opt);
            ws_.set_option(websocket::stream_base::decorator(
                [](websocket::response_type& res) {
                    res.set(http::field::server, "consulthub");
                }));
            ws_.read_message_max(server_.cfg_.max_message_bytes);

            // req must outlive the handshake.
            auto upgrade = std::make_shared<Request>(std::move(req));
            ws_.async_accept(
                *upgrade,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this(), upgrade](beast::error_code ec) {
                        if (ec) return self->fail("accept", ec);
                        self->on_accept();
                    }));
        }

        void close() {
            asio::post(
                strand_,
                [self = shared_from_this()] { self->teardown("server stopping"); });
        }

    private:
        void on_accept() {
            server_.add_session(shared_from_this());

            std::weak_ptr<WsSession> weak = shared_from_this();
            conn_->queue().set_notify([weak] {
                if (auto s = weak.lock()) {
                    asio::post(s->strand_, [s] { s->pump(); });
                }
            });

            ws_.control_callback(
                [this](websocket::frame_type kind, beast::string_view) {
                    if (kind == websocket::frame_type::pong) arm_read_deadline();
                });

            server_.hub_.register_connection(conn_);

            arm_read_deadline();
            arm_ping_timer();
            do_read();
        }

        // ---- inbound ----

        void do_read() {
            ws_.async_read(
                buffer_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        self->on_read(ec);
                    }));
        }

        void on_read(beast::error_code ec) {
            if (ec) {
                if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                    fail("read", ec);
                }
                return teardown("read loop ended");
            }

            arm_read_deadline();

            std::string text = beast::buffers_to_string(buffer_.data());
            buffer_.consume(buffer_.size());

            try {
                hub::Envelope env = hub::Envelope::parse(text);
                server_.hub_.dispatch(env.with_user(conn_->user_id()));
            } catch (const hub::EnvelopeError& e) {
                std::cerr << "[Session " << id() << "] malformed envelope: " << e.what() << "\n";
                return teardown("malformed envelope");
            }

            do_read();
        }

        void arm_read_deadline() {
            read_deadline_.expires_after(server_.cfg_.read_timeout);
            read_deadline_.async_wait(
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec == asio::error::operation_aborted) return;
                        // Refreshed after this wait had already fired.
                        if (self->read_deadline_.expiry() > asio::steady_timer::clock_type::now()) return;
                        std::cerr << "[Session " << self->id() << "] read deadline exceeded\n";
                        self->teardown("heartbeat timeout");
                    }));
        }

        // ---- outbound ----

        void arm_ping_timer() {
            ping_timer_.expires_after(server_.cfg_.ping_interval);
            ping_timer_.async_wait(
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec || self->closing_) return;
                        self->ping_due_ = true;
                        self->pump();
                        self->arm_ping_timer();
                    }));
        }

        // One frame in flight at a time; a due ping goes ahead of queued
        // envelopes. A closed and drained queue ends the loop.
        void pump() {
            if (writing_ || closing_) return;

            if (ping_due_) {
                ping_due_ = false;
                writing_ = true;
                arm_write_deadline();
                ws_.async_ping(
                    {},
                    asio::bind_executor(
                        strand_,
                        [self = shared_from_this()](beast::error_code ec) {
                            self->on_write(ec, "ping");
                        }));
                return;
            }

            if (auto env = conn_->queue().try_pop()) {
                out_ = env->serialize();
                writing_ = true;
                arm_write_deadline();
                ws_.text(true);
                ws_.async_write(
                    asio::buffer(out_),
                    asio::bind_executor(
                        strand_,
                        [self = shared_from_this()](beast::error_code ec, std::size_t) {
                            self->on_write(ec, "write");
                        }));
                return;
            }

            if (conn_->queue().closed()) close_handshake();
        }

        void on_write(beast::error_code ec, const char* what) {
            writing_ = false;
            write_deadline_.cancel();
            if (ec) {
                if (ec != asio::error::operation_aborted) fail(what, ec);
                return teardown("write failed");
            }
            pump();
        }

        void arm_write_deadline() {
            write_deadline_.expires_after(server_.cfg_.write_timeout);
            write_deadline_.async_wait(
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec == asio::error::operation_aborted) return;
                        if (self->write_deadline_.expiry() > asio::steady_timer::clock_type::now()) return;
                        std::cerr << "[Session " << self->id() << "] write deadline exceeded\n";
                        self->teardown("write timeout");
                    }));
        }

        void close_handshake() {
            closing_ = true;
            writing_ = true;
            arm_write_deadline();
            ws_.async_close(
                websocket::close_code::normal,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code) {
                        self->write_deadline_.cancel();
                        self->teardown("send queue closed");
                    }));
        }

        // ---- teardown ----

        // Single exit for every failure path. Safe to call repeatedly.
        void teardown(const char* reason) {
            if (torn_down_) return;
            torn_down_ = true;
            closing_ = true;

            ping_timer_.cancel();
            read_deadline_.cancel();
            write_deadline_.cancel();

            conn_->queue().set_notify(nullptr);
            conn_->queue().close();
            server_.hub_.unregister_connection(conn_);

            beast::error_code ec;
            beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ec);
            beast::get_lowest_layer(ws_).close();

            server_.remove_session(id());
            std::cout << "[Session " << id() << "] closed: " << reason << "\n";
        }

        void fail(const char* what, beast::error_code ec) {
            std::cerr << "[Session " << id() << "] " << what << ": " << ec.message() << "\n";
        }

        Impl& server_;
        websocket::stream<beast::tcp_stream> ws_;
        asio::strand<asio::io_context::executor_type> strand_;

        asio::steady_timer ping_timer_;
        asio::steady_timer read_deadline_;
        asio::steady_timer write_deadline_;

        hub::ConnectionPtr conn_;

        beast::flat_buffer buffer_;
        std::string out_;

        bool writing_ = false;
        bool ping_due_ = false;
        bool closing_ = false;
        bool torn_down_ = false;
    };

    // Reads the one HTTP request a socket starts with, then either
    // upgrades it or answers it and closes.
    class HttpSession : public std::enable_shared_from_this<HttpSession> {
    public:
        HttpSession(Impl& server, tcp::socket socket)
            : server_(server),
              stream_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)) {}

        void run() {
            stream_.expires_after(kHandshakeTimeout);
            http::async_read(
                stream_, buffer_, req_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) {
                            if (ec != http::error::end_of_stream) self->fail("http read", ec);
                            return;
                        }
                        self->route();
                    }));
        }

    private:
        void route() {
            const std::string target(req_.target().data(), req_.target().size());
            const std::string_view path = target_path(target);

            if (websocket::is_upgrade(req_)) {
                if (path != server_.cfg_.ws_path) {
                    return reply(http::status::not_found, {{"error", "not found"}});
                }
                return upgrade();
            }

            if (req_.method() != http::verb::get) {
                return reply(http::status::method_not_allowed, {{"error", "method not allowed"}});
            }
            if (path == "/ws-test") {
                return reply(http::status::ok, {{"message", "WebSocket routing works"}});
            }
            if (path == "/health") {
                return health();
            }
            if (path == server_.cfg_.ws_path) {
                return reply(http::status::bad_request, {{"error", "WebSocket upgrade required"}});
            }
            reply(http::status::not_found, {{"error", "not found"}});
        }

        void upgrade() {
            std::optional<std::string> token = bearer_token(req_);
            if (!token) {
                std::cerr << "[Upgrade] " << remote() << " rejected: no authentication token\n";
                return reply(http::status::unauthorized, {{"error", "No authentication token provided"}});
            }

            std::optional<std::string> user_id = server_.verifier_.verify(*token);
            if (!user_id) {
                std::cerr << "[Upgrade] " << remote() << " rejected: invalid token\n";
                return reply(http::status::unauthorized, {{"error", "Invalid authentication token"}});
            }

            const std::string origin = header_value(req_, http::field::origin);
            if (!server_.origins_.allows(origin)) {
                std::cerr << "[Upgrade] " << remote() << " rejected: origin '" << origin << "'\n";
                return reply(http::status::forbidden, {{"error", "Origin not allowed"}});
            }

            std::cout << "[Upgrade] user " << *user_id << " authenticated from " << remote() << "\n";
            std::make_shared<WsSession>(server_, stream_.release_socket(), std::move(*user_id))
                ->run(std::move(req_));
        }

        void health() {
            server_.hub_.async_stats([self = shared_from_this()](hub::HubStats stats) {
                asio::post(self->strand_, [self, stats = std::move(stats)] {
                    self->reply(http::status::ok, stats_json(stats));
                });
            });
        }

        void reply(http::status status, const json::object& body) {
            res_ = json_response(req_, status, body, server_.origins_);
            http::async_write(
                stream_, *res_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) self->fail("http write", ec);
                        beast::error_code ignored;
                        self->stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
                    }));
        }

        std::string remote() const {
            beast::error_code ec;
            auto ep = stream_.socket().remote_endpoint(ec);
            if (ec) return "unknown peer";
            return ep.address().to_string() + ":" + std::to_string(ep.port());
        }

        void fail(const char* what, beast::error_code ec) {
            std::cerr << "[Http " << remote() << "] " << what << ": " << ec.message() << "\n";
        }

        Impl& server_;
        beast::tcp_stream stream_;
        asio::strand<asio::io_context::executor_type> strand_;
        beast::flat_buffer buffer_;
        Request req_;
        std::shared_ptr<Response> res_;
    };

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec == asio::error::operation_aborted) return;  // stop()
                if (ec) {
                    std::cerr << "[Server] accept: " << ec.message() << "\n";
                    return do_accept();
                }

                std::make_shared<HttpSession>(*this, std::move(socket))->run();
                do_accept();
            });
    }

    void add_session(const std::shared_ptr<WsSession>& s) {
        std::lock_guard<std::mutex> lk(mu_);
        sessions_[s->id()] = s;
    }

    void remove_session(const std::string& id) {
        std::lock_guard<std::mutex> lk(mu_);
        sessions_.erase(id);
    }

    asio::io_context& ioc_;
    const config::ServerConfig cfg_;
    hub::Hub& hub_;
    const auth::TokenVerifier& verifier_;
    OriginPolicy origins_;
    hub::IDGenerator idgen_;

    tcp::acceptor acceptor_;

    std::mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<WsSession>> sessions_;
};

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc,
                                 const config::ServerConfig& cfg,
                                 hub::Hub& hub,
                                 const auth::TokenVerifier& verifier)
    : impl_(new Impl(ioc, cfg, hub, verifier)) {}

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

unsigned short WebSocketServer::port() const { return impl_->port(); }

WebSocketServer::~WebSocketServer() = default;

} // namespace consulthub::networking
