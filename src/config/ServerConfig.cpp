#include "config/ServerConfig.h"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace consulthub::config {

namespace json = boost::json;

namespace {

std::string to_std(const json::string& s) {
    return std::string(s.data(), s.size());
}

const json::string& as_string(const json::value& v, const char* key) {
    if (!v.is_string()) throw ConfigError(std::string("'") + key + "' must be a string");
    return v.get_string();
}

std::uint64_t as_unsigned(const json::value& v, const char* key) {
    if (v.is_uint64()) return v.get_uint64();
    if (v.is_int64() && v.get_int64() >= 0) return static_cast<std::uint64_t>(v.get_int64());
    throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
}

std::uint64_t parse_unsigned(const std::string& flag, const std::string& text) {
    try {
        std::size_t used = 0;
        unsigned long long n = std::stoull(text, &used);
        if (used != text.size() || text.front() == '-') throw std::invalid_argument(text);
        return n;
    } catch (const std::exception&) {
        throw ConfigError(flag + ": expected a non-negative integer, got '" + text + "'");
    }
}

unsigned short to_port(std::uint64_t n, const std::string& where) {
    if (n > std::numeric_limits<unsigned short>::max()) {
        throw ConfigError(where + ": port out of range");
    }
    return static_cast<unsigned short>(n);
}

} // namespace

void ServerConfig::validate() const {
    if (port == 0) throw ConfigError("port must be non-zero");
    if (bind_address.empty()) throw ConfigError("bind address must not be empty");
    if (ws_path.empty() || ws_path.front() != '/') throw ConfigError("path must start with '/'");
    if (threads == 0) throw ConfigError("threads must be at least 1");
    if (queue_capacity == 0) throw ConfigError("queue capacity must be at least 1");
    if (max_message_bytes == 0) throw ConfigError("max message size must be positive");
    if (ping_interval.count() <= 0 || read_timeout.count() <= 0 || write_timeout.count() <= 0) {
        throw ConfigError("timeouts must be positive");
    }
    if (ping_interval >= read_timeout) {
        throw ConfigError("ping interval must be shorter than the read timeout");
    }
}

ServerConfig config_from_json(const json::value& doc, ServerConfig cfg) {
    const json::object* obj = doc.if_object();
    if (!obj) throw ConfigError("config root must be a json object");

    for (const auto& kv : *obj) {
        const std::string key(kv.key().data(), kv.key().size());
        const json::value& v = kv.value();

        if (key == "bind") {
            cfg.bind_address = to_std(as_string(v, "bind"));
        } else if (key == "port") {
            cfg.port = to_port(as_unsigned(v, "port"), "port");
        } else if (key == "path") {
            cfg.ws_path = to_std(as_string(v, "path"));
        } else if (key == "threads") {
            cfg.threads = as_unsigned(v, "threads");
        } else if (key == "queue_capacity") {
            cfg.queue_capacity = as_unsigned(v, "queue_capacity");
        } else if (key == "ping_interval_ms") {
            cfg.ping_interval = std::chrono::milliseconds(as_unsigned(v, "ping_interval_ms"));
        } else if (key == "read_timeout_ms") {
            cfg.read_timeout = std::chrono::milliseconds(as_unsigned(v, "read_timeout_ms"));
        } else if (key == "write_timeout_ms") {
            cfg.write_timeout = std::chrono::milliseconds(as_unsigned(v, "write_timeout_ms"));
        } else if (key == "max_message_bytes") {
            cfg.max_message_bytes = as_unsigned(v, "max_message_bytes");
        } else if (key == "allow_missing_origin") {
            if (!v.is_bool()) throw ConfigError("'allow_missing_origin' must be a boolean");
            cfg.allow_missing_origin = v.get_bool();
        } else if (key == "allowed_origins") {
            const json::array* arr = v.if_array();
            if (!arr) throw ConfigError("'allowed_origins' must be an array");
            cfg.allowed_origins.clear();
            for (const auto& o : *arr) cfg.allowed_origins.push_back(to_std(as_string(o, "allowed_origins")));
        } else if (key == "tokens") {
            const json::object* tokens = v.if_object();
            if (!tokens) throw ConfigError("'tokens' must be an object of token -> user id");
            for (const auto& t : *tokens) {
                cfg.tokens[std::string(t.key().data(), t.key().size())] = to_std(as_string(t.value(), "tokens"));
            }
        } else {
            throw ConfigError("unknown config key '" + key + "'");
        }
    }
    return cfg;
}

ServerConfig load_config_file(const std::string& path, ServerConfig base) {
    std::ifstream f(path);
    if (!f) throw ConfigError("cannot open config file " + path);
    std::ostringstream ss;
    ss << f.rdbuf();

    boost::system::error_code ec;
    json::value doc = json::parse(ss.str(), ec);
    if (ec) throw ConfigError(path + ": " + ec.message());
    return config_from_json(doc, std::move(base));
}

CommandLine parse_command_line(int argc, const char* const argv[]) {
    CommandLine cl;

    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) throw ConfigError("--config needs a value");
            cl.config = load_config_file(argv[i + 1]);
            break;
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            cl.help = true;
            return cl;
        }
        if (i + 1 >= argc) throw ConfigError("unknown or incomplete option '" + a + "'");
        const std::string v = argv[++i];

        if (a == "--config") {
            // already applied
        } else if (a == "--bind") {
            cl.config.bind_address = v;
        } else if (a == "--port") {
            cl.config.port = to_port(parse_unsigned(a, v), a);
        } else if (a == "--path") {
            cl.config.ws_path = v;
        } else if (a == "--threads") {
            cl.config.threads = parse_unsigned(a, v);
        } else if (a == "--queue") {
            cl.config.queue_capacity = parse_unsigned(a, v);
        } else if (a == "--origin") {
            cl.config.allowed_origins.push_back(v);
        } else if (a == "--token") {
            auto eq = v.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == v.size()) {
                throw ConfigError("--token expects TOKEN=USER, got '" + v + "'");
            }
            cl.config.tokens[v.substr(0, eq)] = v.substr(eq + 1);
        } else {
            throw ConfigError("unknown option '" + a + "'");
        }
    }

    cl.config.validate();
    return cl;
}

std::string usage(const std::string& prog) {
    return "usage: " + prog + " [options]\n"
           "  --config FILE      json config file\n"
           "  --bind ADDR        listen address (default 0.0.0.0)\n"
           "  --port N           listen port (default 8080)\n"
           "  --path P           upgrade path (default /ws)\n"
           "  --threads N        io threads (default 1)\n"
           "  --queue N          per-connection send queue capacity (default 256)\n"
           "  --origin O         add an allowed origin (repeatable, '*' allows any)\n"
           "  --token T=USER     accept bearer token T as USER (repeatable)\n"
           "  --help             show this message\n";
}

} // namespace consulthub::config
