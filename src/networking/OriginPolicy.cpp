#include "networking/OriginPolicy.h"

#include <algorithm>
#include <utility>

namespace consulthub::networking {

OriginPolicy::OriginPolicy(std::vector<std::string> allowed, bool allow_missing)
    : allowed_(std::move(allowed)), allow_missing_(allow_missing) {
    allow_any_ = std::find(allowed_.begin(), allowed_.end(), "*") != allowed_.end();
}

bool OriginPolicy::allows(std::string_view origin) const {
    if (origin.empty()) return allow_missing_;
    return allow_any_ || listed(origin);
}

bool OriginPolicy::listed(std::string_view origin) const {
    if (origin.empty() || origin == "*") return false;
    return std::find(allowed_.begin(), allowed_.end(), origin) != allowed_.end();
}

} // namespace consulthub::networking
