#include "hub/Connection.h"

#include <utility>

namespace consulthub::hub {

Connection::Connection(std::string id, std::string user_id, std::size_t queue_capacity)
    : id_(std::move(id)),
      user_id_(std::move(user_id)),
      connected_at_(Clock::now()),
      queue_(queue_capacity) {}

} // namespace consulthub::hub
