#include "auth/TokenVerifier.h"

#include <utility>

namespace consulthub::auth {

StaticTokenVerifier::StaticTokenVerifier(std::unordered_map<std::string, std::string> tokens)
    : tokens_(std::move(tokens)) {}

void StaticTokenVerifier::add(std::string token, std::string user_id) {
    tokens_[std::move(token)] = std::move(user_id);
}

std::optional<std::string> StaticTokenVerifier::verify(const std::string& token) const {
    if (token.empty()) return std::nullopt;
    auto it = tokens_.find(token);
    if (it == tokens_.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

} // namespace consulthub::auth
