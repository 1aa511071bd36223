#pragma once

#include <boost/beast/http.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace consulthub::networking {

using Request = boost::beast::http::request<boost::beast::http::string_body>;

// Percent-decoded value of ?name=... in a request target, if present.
std::optional<std::string> query_param(std::string_view target, std::string_view name);

// Target without its query string.
std::string_view target_path(std::string_view target);

// Bearer credential from ?token=..., falling back to "Authorization: Bearer ...".
std::optional<std::string> bearer_token(const Request& req);

} // namespace consulthub::networking
