#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace consulthub::auth {

// Boundary to the identity service: a bearer token in, a validated user id
// out (nullopt when the token is rejected).
class TokenVerifier {
public:
    virtual ~TokenVerifier() = default;
    virtual std::optional<std::string> verify(const std::string& token) const = 0;
};

// Fixed token -> user table, filled from configuration.
class StaticTokenVerifier : public TokenVerifier {
public:
    StaticTokenVerifier() = default;
    explicit StaticTokenVerifier(std::unordered_map<std::string, std::string> tokens);

    void add(std::string token, std::string user_id);
    std::size_t size() const noexcept { return tokens_.size(); }

    std::optional<std::string> verify(const std::string& token) const override;

private:
    std::unordered_map<std::string, std::string> tokens_;
};

} // namespace consulthub::auth
