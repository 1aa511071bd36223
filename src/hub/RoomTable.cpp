#include "hub/RoomTable.h"

namespace consulthub::hub {

bool RoomTable::join(const ConnectionPtr& conn, const std::string& session_id) {
    if (!conn || session_id.empty()) return false;

    bool inserted = rooms_[session_id].insert(conn).second;
    conn->rooms_.insert(session_id);
    return inserted;
}

bool RoomTable::leave(const ConnectionPtr& conn, const std::string& session_id) {
    if (!conn) return false;

    conn->rooms_.erase(session_id);

    auto it = rooms_.find(session_id);
    if (it == rooms_.end()) return false;

    bool erased = it->second.erase(conn) != 0;
    if (it->second.empty()) rooms_.erase(it);
    return erased;
}

std::size_t RoomTable::remove_everywhere(const ConnectionPtr& conn) {
    if (!conn) return 0;

    std::size_t removed = 0;
    for (const auto& session_id : conn->rooms_) {
        auto it = rooms_.find(session_id);
        if (it == rooms_.end()) continue;
        removed += it->second.erase(conn);
        if (it->second.empty()) rooms_.erase(it);
    }
    conn->rooms_.clear();
    return removed;
}

std::vector<ConnectionPtr> RoomTable::members(const std::string& session_id) const {
    auto it = rooms_.find(session_id);
    if (it == rooms_.end()) return {};
    return {it->second.begin(), it->second.end()};
}

bool RoomTable::is_member(const ConnectionPtr& conn, const std::string& session_id) const {
    auto it = rooms_.find(session_id);
    return it != rooms_.end() && it->second.count(conn) != 0;
}

bool RoomTable::contains(const std::string& session_id) const {
    return rooms_.find(session_id) != rooms_.end();
}

std::size_t RoomTable::member_count(const std::string& session_id) const {
    auto it = rooms_.find(session_id);
    return it == rooms_.end() ? 0 : it->second.size();
}

std::vector<std::string> RoomTable::room_ids() const {
    std::vector<std::string> out;
    out.reserve(rooms_.size());
    for (const auto& [id, members] : rooms_) out.push_back(id);
    return out;
}

} // namespace consulthub::hub
