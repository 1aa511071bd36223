#include "hub/Envelope.h"

#include <cstdint>
#include <limits>
#include <utility>

namespace consulthub::hub {

namespace json = boost::json;

namespace {

std::string optional_string(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return {};
    if (!v->is_string()) {
        throw EnvelopeError("field '" + std::string(key) + "' must be a string");
    }
    const json::string& s = v->get_string();
    return std::string(s.data(), s.size());
}

std::int64_t optional_int(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return 0;
    if (v->is_int64()) return v->get_int64();
    if (v->is_uint64()) {
        if (v->get_uint64() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw EnvelopeError("field '" + std::string(key) + "' is out of range");
        }
        return static_cast<std::int64_t>(v->get_uint64());
    }
    if (v->is_double()) {
        // [-2^63, 2^63); fractions are truncated.
        const double d = v->get_double();
        if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) {
            throw EnvelopeError("field '" + std::string(key) + "' is out of range");
        }
        return static_cast<std::int64_t>(d);
    }
    throw EnvelopeError("field '" + std::string(key) + "' must be a number");
}

} // namespace

Envelope::Envelope(std::string type,
                   json::value data,
                   std::int64_t timestamp,
                   std::string id,
                   std::string user_id,
                   std::string session_id)
    : type_(std::move(type)),
      data_(std::move(data)),
      timestamp_(timestamp),
      id_(std::move(id)),
      user_id_(std::move(user_id)),
      session_id_(std::move(session_id)) {}

Envelope Envelope::parse(std::string_view text) {
    boost::system::error_code ec;
    json::value v = json::parse(json::string_view(text.data(), text.size()), ec);
    if (ec) throw EnvelopeError("invalid json: " + ec.message());

    const json::object* obj = v.if_object();
    if (!obj) throw EnvelopeError("envelope must be a json object");

    const json::value* type = obj->if_contains("type");
    if (!type || !type->is_string()) throw EnvelopeError("missing type");

    json::value data;
    if (const json::value* d = obj->if_contains("data")) data = *d;

    const json::string& t = type->get_string();
    return Envelope(std::string(t.data(), t.size()),
                    std::move(data),
                    optional_int(*obj, "timestamp"),
                    optional_string(*obj, "id"),
                    optional_string(*obj, "user_id"),
                    optional_string(*obj, "session_id"));
}

json::object Envelope::to_json() const {
    json::object obj;
    obj["type"] = type_;
    obj["data"] = data_;
    obj["timestamp"] = timestamp_;
    if (!id_.empty()) obj["id"] = id_;
    if (!user_id_.empty()) obj["user_id"] = user_id_;
    if (!session_id_.empty()) obj["session_id"] = session_id_;
    return obj;
}

std::string Envelope::serialize() const {
    return json::serialize(to_json());
}

Envelope Envelope::with_user(std::string user_id) const {
    Envelope e = *this;
    e.user_id_ = std::move(user_id);
    return e;
}

Envelope Envelope::with_session(std::string session_id) const {
    Envelope e = *this;
    e.session_id_ = std::move(session_id);
    return e;
}

Envelope Envelope::with_timestamp(std::int64_t timestamp) const {
    Envelope e = *this;
    e.timestamp_ = timestamp;
    return e;
}

std::int64_t Envelope::now() noexcept {
    using namespace std::chrono;
    return duration_cast<seconds>(Clock::now().time_since_epoch()).count();
}

std::optional<std::string> session_id_of(const json::value& data) {
    const json::object* obj = data.if_object();
    if (!obj) return std::nullopt;

    for (const char* key : {"sessionId", "consultationId"}) {
        const json::value* v = obj->if_contains(key);
        if (v && v->is_string() && !v->get_string().empty()) {
            const json::string& s = v->get_string();
            return std::string(s.data(), s.size());
        }
    }
    return std::nullopt;
}

} // namespace consulthub::hub
