#pragma once

#include "hub/Connection.h"
#include "hub/Envelope.h"
#include "hub/MessageRouter.h"
#include "hub/RoomTable.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace consulthub::hub {

struct HubStats {
    std::size_t connections = 0;
    std::size_t rooms = 0;
    std::map<std::string, std::size_t> participants;  // room id -> member count
};

// Sole owner of membership state. Every public operation is posted onto
// one strand, so registration, membership changes and broadcasts run one
// at a time and in submission order; per-connection tasks never touch the
// tables directly. The Hub must outlive the io_context's run loop.
class Hub {
public:
    using StatsHandler = std::function<void(HubStats)>;

    explicit Hub(boost::asio::io_context& ioc);

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;

    void start();  // open intake
    void stop();   // evict everyone, close intake

    void register_connection(ConnectionPtr conn);
    void unregister_connection(ConnectionPtr conn);  // idempotent
    void dispatch(Envelope env);

    void join_room(std::string user_id, std::string session_id);
    void leave_room(std::string user_id, std::string session_id);
    void broadcast_to_room(std::string session_id, Envelope env);
    void broadcast_to_user(std::string user_id, Envelope env);

    // handler runs on the hub strand.
    void async_stats(StatsHandler handler);

    // Unsynchronized views for code already running on the hub strand,
    // or for callers that know the io_context is idle.
    bool running() const noexcept { return running_; }
    std::size_t connection_count() const noexcept { return connections_.size(); }
    bool is_registered(const ConnectionPtr& conn) const { return connections_.count(conn) != 0; }
    const RoomTable& rooms() const noexcept { return rooms_; }

private:
    template <class F>
    void post(F&& f);

    void install_handlers();

    void do_register(const ConnectionPtr& conn);
    bool do_unregister(const ConnectionPtr& conn, const char* reason);
    void do_join_room(const std::string& user_id, const std::string& session_id);
    void do_leave_room(const std::string& user_id, const std::string& session_id);
    void do_broadcast_to_user(const std::string& user_id, const Envelope& env);

    void handle_join(const Envelope& env);
    void handle_leave(const Envelope& env);
    void handle_chat(const Envelope& env);
    void handle_typing(const Envelope& env);
    void handle_ping(const Envelope& env);

    // Enqueue or evict; never waits on the receiver.
    bool deliver(const ConnectionPtr& conn, const Envelope& env);
    void fan_out(const std::string& session_id, const Envelope& env, const std::string& skip_user = {});

    ConnectionPtr latest_connection(const std::string& user_id) const;
    bool user_in_room(const std::string& user_id, const std::string& session_id) const;

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;

    MessageRouter router_;
    RoomTable rooms_;
    std::set<ConnectionPtr> connections_;
    // Registration order per user; back() is the most recent connection.
    std::unordered_map<std::string, std::vector<ConnectionPtr>> by_user_;
    bool running_ = false;
};

} // namespace consulthub::hub
