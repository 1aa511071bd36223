#pragma once

#include "hub/OutboundQueue.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <set>
#include <string>

namespace consulthub::hub {

class RoomTable;

// One live duplex channel as the hub sees it: who owns it, where its
// outbound envelopes go, and which rooms it is in.
class Connection {
public:
    using Clock = std::chrono::steady_clock;

    Connection(std::string id, std::string user_id, std::size_t queue_capacity);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    const std::string& id() const noexcept { return id_; }
    const std::string& user_id() const noexcept { return user_id_; }
    Clock::time_point connected_at() const noexcept { return connected_at_; }

    OutboundQueue& queue() noexcept { return queue_; }
    const OutboundQueue& queue() const noexcept { return queue_; }

    // Written by RoomTable only, on the hub executor.
    const std::set<std::string>& rooms() const noexcept { return rooms_; }
    bool in_room(const std::string& session_id) const { return rooms_.count(session_id) != 0; }

private:
    friend class RoomTable;

    std::string id_;
    std::string user_id_;
    Clock::time_point connected_at_;
    OutboundQueue queue_;
    std::set<std::string> rooms_;
};

using ConnectionPtr = std::shared_ptr<Connection>;

} // namespace consulthub::hub
