#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace consulthub::networking {

// Decides, once per upgrade attempt, whether the browser origin may open a
// connection. Entries match exactly; "*" matches any origin.
class OriginPolicy {
public:
    OriginPolicy() = default;
    OriginPolicy(std::vector<std::string> allowed, bool allow_missing);

    // An empty origin means the request carried no Origin header.
    bool allows(std::string_view origin) const;

    // True when origin is listed explicitly (CORS echo), never for "*" or "".
    bool listed(std::string_view origin) const;

private:
    std::vector<std::string> allowed_;
    bool allow_any_ = false;
    bool allow_missing_ = true;
};

} // namespace consulthub::networking
