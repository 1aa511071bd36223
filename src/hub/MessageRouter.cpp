#include "hub/MessageRouter.h"

#include <utility>

namespace consulthub::hub {

void MessageRouter::on(std::string_view type, Handler handler) {
    handlers_[std::string(type)] = std::move(handler);
}

bool MessageRouter::route(const Envelope& env) const {
    auto it = handlers_.find(env.type());
    if (it == handlers_.end() || !it->second) return false;
    it->second(env);
    return true;
}

bool MessageRouter::handles(const std::string& type) const {
    return handlers_.find(type) != handlers_.end();
}

} // namespace consulthub::hub
