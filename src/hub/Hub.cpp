#include "hub/Hub.h"
#include "hub/MessageTypes.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>
#include <utility>

namespace consulthub::hub {

namespace asio = boost::asio;
namespace json = boost::json;

namespace {

std::string session_or_log(const Envelope& env) {
    std::optional<std::string> sid = session_id_of(env.data());
    if (!sid) {
        std::cerr << "[Hub] " << env.type() << " from user " << env.user_id()
                  << " has no sessionId, dropped\n";
        return {};
    }
    return *sid;
}

} // namespace

Hub::Hub(asio::io_context& ioc)
    : strand_(asio::make_strand(ioc)) {
    install_handlers();
}

template <class F>
void Hub::post(F&& f) {
    asio::post(strand_, std::forward<F>(f));
}

void Hub::install_handlers() {
    router_.on(msg::kJoinConsultation,  [this](const Envelope& e) { handle_join(e); });
    router_.on(msg::kLeaveConsultation, [this](const Envelope& e) { handle_leave(e); });
    router_.on(msg::kChatMessage,       [this](const Envelope& e) { handle_chat(e); });
    router_.on(msg::kTypingStart,       [this](const Envelope& e) { handle_typing(e); });
    router_.on(msg::kTypingStop,        [this](const Envelope& e) { handle_typing(e); });
    router_.on(msg::kPing,              [this](const Envelope& e) { handle_ping(e); });
}

// ---- lifecycle ----

void Hub::start() {
    post([this] {
        if (running_) return;
        running_ = true;
        std::cout << "[Hub] started\n";
    });
}

void Hub::stop() {
    post([this] {
        if (!running_) return;

        std::vector<ConnectionPtr> all(connections_.begin(), connections_.end());
        for (const auto& conn : all) do_unregister(conn, "hub stopping");

        running_ = false;
        std::cout << "[Hub] stopped\n";
    });
}

// ---- intake ----

void Hub::register_connection(ConnectionPtr conn) {
    post([this, conn = std::move(conn)] { do_register(conn); });
}

void Hub::unregister_connection(ConnectionPtr conn) {
    post([this, conn = std::move(conn)] { do_unregister(conn, "disconnected"); });
}

void Hub::dispatch(Envelope env) {
    post([this, env = std::move(env)] {
        if (!running_) return;
        if (!router_.route(env)) {
            std::cerr << "[Hub] unknown message type: " << env.type()
                      << " (user " << env.user_id() << ")\n";
        }
    });
}

void Hub::join_room(std::string user_id, std::string session_id) {
    post([this, user_id = std::move(user_id), session_id = std::move(session_id)] {
        if (running_) do_join_room(user_id, session_id);
    });
}

void Hub::leave_room(std::string user_id, std::string session_id) {
    post([this, user_id = std::move(user_id), session_id = std::move(session_id)] {
        if (running_) do_leave_room(user_id, session_id);
    });
}

void Hub::broadcast_to_room(std::string session_id, Envelope env) {
    post([this, session_id = std::move(session_id), env = std::move(env)] {
        if (!running_) return;
        fan_out(session_id, env.with_timestamp(Envelope::now()).with_session(session_id));
    });
}

void Hub::broadcast_to_user(std::string user_id, Envelope env) {
    post([this, user_id = std::move(user_id), env = std::move(env)] {
        if (running_) do_broadcast_to_user(user_id, env.with_timestamp(Envelope::now()));
    });
}

void Hub::async_stats(StatsHandler handler) {
    post([this, handler = std::move(handler)] {
        HubStats stats;
        stats.connections = connections_.size();
        stats.rooms = rooms_.room_count();
        for (const auto& id : rooms_.room_ids()) {
            stats.participants[id] = rooms_.member_count(id);
        }
        handler(std::move(stats));
    });
}

// ---- state changes (strand only) ----

void Hub::do_register(const ConnectionPtr& conn) {
    if (!conn) return;

    if (!running_) {
        std::cerr << "[Hub] refusing " << conn->id() << ": hub not running\n";
        conn->queue().close();
        return;
    }
    if (!connections_.insert(conn).second) return;
    by_user_[conn->user_id()].push_back(conn);

    std::cout << "[Hub] client " << conn->id() << " connected (user " << conn->user_id() << ")\n";

    Envelope confirmed(std::string(msg::kConnectionConfirmed),
                       json::object{{"status", "connected"}, {"connectionId", conn->id()}},
                       Envelope::now());
    if (!conn->queue().try_push(std::move(confirmed))) {
        do_unregister(conn, "confirmation not deliverable");
    }
}

bool Hub::do_unregister(const ConnectionPtr& conn, const char* reason) {
    if (!conn || connections_.erase(conn) == 0) return false;

    conn->queue().close();
    rooms_.remove_everywhere(conn);

    auto it = by_user_.find(conn->user_id());
    if (it != by_user_.end()) {
        auto& list = it->second;
        list.erase(std::remove(list.begin(), list.end(), conn), list.end());
        if (list.empty()) by_user_.erase(it);
    }

    const auto lifetime = std::chrono::duration_cast<std::chrono::seconds>(
        Connection::Clock::now() - conn->connected_at());
    std::cout << "[Hub] client " << conn->id() << " disconnected (user " << conn->user_id()
              << ") after " << lifetime.count() << "s: " << reason << "\n";
    return true;
}

void Hub::do_join_room(const std::string& user_id, const std::string& session_id) {
    ConnectionPtr conn = latest_connection(user_id);
    if (!conn) {
        std::cerr << "[Hub] join " << session_id << ": no connection for user " << user_id << "\n";
        return;
    }
    if (rooms_.join(conn, session_id)) {
        std::cout << "[Hub] client " << conn->id() << " joined consultation " << session_id << "\n";
    }
}

void Hub::do_leave_room(const std::string& user_id, const std::string& session_id) {
    ConnectionPtr conn = latest_connection(user_id);
    if (!conn || !rooms_.is_member(conn, session_id)) {
        std::cerr << "[Hub] leave " << session_id << ": user " << user_id << " is not a member\n";
        return;
    }
    rooms_.leave(conn, session_id);
    std::cout << "[Hub] client " << conn->id() << " left consultation " << session_id << "\n";
}

void Hub::do_broadcast_to_user(const std::string& user_id, const Envelope& env) {
    auto it = by_user_.find(user_id);
    if (it == by_user_.end()) return;

    // deliver() may evict and so edit the list.
    std::vector<ConnectionPtr> targets = it->second;
    for (const auto& conn : targets) deliver(conn, env);
}

// ---- handlers ----

void Hub::handle_join(const Envelope& env) {
    std::string sid = session_or_log(env);
    if (!sid.empty()) do_join_room(env.user_id(), sid);
}

void Hub::handle_leave(const Envelope& env) {
    std::string sid = session_or_log(env);
    if (!sid.empty()) do_leave_room(env.user_id(), sid);
}

void Hub::handle_chat(const Envelope& env) {
    std::string sid = session_or_log(env);
    if (sid.empty()) return;
    if (!user_in_room(env.user_id(), sid)) {
        std::cerr << "[Hub] chat from user " << env.user_id() << " outside " << sid << ", dropped\n";
        return;
    }

    Envelope out(std::string(msg::kChatMessage), env.data(), Envelope::now(),
                 env.id(), env.user_id(), sid);
    fan_out(sid, out);
}

void Hub::handle_typing(const Envelope& env) {
    std::string sid = session_or_log(env);
    if (sid.empty() || !user_in_room(env.user_id(), sid)) return;

    Envelope out(env.type(), json::object{{"userId", env.user_id()}}, Envelope::now(),
                 {}, env.user_id(), sid);
    fan_out(sid, out, env.user_id());
}

void Hub::handle_ping(const Envelope& env) {
    ConnectionPtr conn = latest_connection(env.user_id());
    if (!conn) return;
    deliver(conn, Envelope(std::string(msg::kPong), nullptr, Envelope::now()));
}

// ---- delivery ----

bool Hub::deliver(const ConnectionPtr& conn, const Envelope& env) {
    if (conn->queue().try_push(env)) return true;
    do_unregister(conn, "send queue full");
    return false;
}

void Hub::fan_out(const std::string& session_id, const Envelope& env, const std::string& skip_user) {
    // Snapshot: evictions below edit the room.
    for (const auto& conn : rooms_.members(session_id)) {
        if (!skip_user.empty() && conn->user_id() == skip_user) continue;
        deliver(conn, env);
    }
}

ConnectionPtr Hub::latest_connection(const std::string& user_id) const {
    auto it = by_user_.find(user_id);
    if (it == by_user_.end() || it->second.empty()) return nullptr;
    return it->second.back();
}

bool Hub::user_in_room(const std::string& user_id, const std::string& session_id) const {
    auto it = by_user_.find(user_id);
    if (it == by_user_.end()) return false;
    return std::any_of(it->second.begin(), it->second.end(),
                       [&](const ConnectionPtr& c) { return c->in_room(session_id); });
}

} // namespace consulthub::hub
