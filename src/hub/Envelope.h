#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace consulthub::hub {

class EnvelopeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One typed message exchanged between a connection and the hub.
// Wire shape:
//   {"type": str, "data": obj|null, "timestamp": int64,
//    "id"?: str, "user_id"?: str, "session_id"?: str}
class Envelope {
public:
    using Clock = std::chrono::system_clock;

    Envelope() = default;
    Envelope(std::string type,
             boost::json::value data,
             std::int64_t timestamp = 0,
             std::string id = {},
             std::string user_id = {},
             std::string session_id = {});

    // Throws EnvelopeError on anything that is not a well-formed envelope.
    static Envelope parse(std::string_view text);

    std::string serialize() const;
    boost::json::object to_json() const;

    const std::string& type() const noexcept { return type_; }
    const boost::json::value& data() const noexcept { return data_; }
    std::int64_t timestamp() const noexcept { return timestamp_; }
    const std::string& id() const noexcept { return id_; }
    const std::string& user_id() const noexcept { return user_id_; }
    const std::string& session_id() const noexcept { return session_id_; }

    Envelope with_user(std::string user_id) const;
    Envelope with_session(std::string session_id) const;
    Envelope with_timestamp(std::int64_t timestamp) const;

    static std::int64_t now() noexcept;

private:
    std::string type_;
    boost::json::value data_;
    std::int64_t timestamp_ = 0;
    std::string id_;
    std::string user_id_;
    std::string session_id_;
};

// Room id named by a room-scoped payload ("sessionId", or the older "consultationId").
std::optional<std::string> session_id_of(const boost::json::value& data);

} // namespace consulthub::hub
