#pragma once

#include "hub/Connection.h"

#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace consulthub::hub {

// Room id -> member set. Every mutation updates the member's own
// joined-rooms set in the same call, and a room that loses its last
// member is erased. Not synchronized: owned by the hub executor.
class RoomTable {
public:
    // Both return false when nothing changed.
    bool join(const ConnectionPtr& conn, const std::string& session_id);
    bool leave(const ConnectionPtr& conn, const std::string& session_id);

    // Drops conn from every room it joined; returns how many.
    std::size_t remove_everywhere(const ConnectionPtr& conn);

    std::vector<ConnectionPtr> members(const std::string& session_id) const;
    bool is_member(const ConnectionPtr& conn, const std::string& session_id) const;
    bool contains(const std::string& session_id) const;
    std::size_t member_count(const std::string& session_id) const;
    std::size_t room_count() const noexcept { return rooms_.size(); }

    std::vector<std::string> room_ids() const;

private:
    std::unordered_map<std::string, std::set<ConnectionPtr>> rooms_;
};

} // namespace consulthub::hub
