#pragma once

#include "hub/Envelope.h"

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace consulthub::hub {

// Flat type-tag -> handler table. No state beyond the table itself.
class MessageRouter {
public:
    using Handler = std::function<void(const Envelope&)>;

    void on(std::string_view type, Handler handler);

    // False when no handler is registered for env.type().
    bool route(const Envelope& env) const;

    bool handles(const std::string& type) const;

private:
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace consulthub::hub
