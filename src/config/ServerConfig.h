#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace consulthub::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    unsigned short port = 8080;
    std::string ws_path = "/ws";
    std::size_t threads = 1;

    std::size_t queue_capacity = 256;
    std::chrono::milliseconds ping_interval{54000};
    std::chrono::milliseconds read_timeout{60000};
    std::chrono::milliseconds write_timeout{10000};
    std::size_t max_message_bytes = 64 * 1024;

    std::vector<std::string> allowed_origins{
        "http://localhost:3000",  "https://localhost:3000",
        "http://localhost:8080",  "https://localhost:8080",
        "http://127.0.0.1:3000",  "https://127.0.0.1:3000",
        "http://127.0.0.1:8080",  "https://127.0.0.1:8080",
    };
    bool allow_missing_origin = true;

    // bearer token -> user id
    std::unordered_map<std::string, std::string> tokens;

    // Throws ConfigError.
    void validate() const;
};

// Keys absent from the document keep their defaults. Throws ConfigError.
ServerConfig config_from_json(const boost::json::value& doc, ServerConfig base = {});
ServerConfig load_config_file(const std::string& path, ServerConfig base = {});

struct CommandLine {
    ServerConfig config;
    bool help = false;
};

// --config is applied first, then the remaining flags in order.
// The result is validated unless help was requested. Throws ConfigError.
CommandLine parse_command_line(int argc, const char* const argv[]);

std::string usage(const std::string& prog);

} // namespace consulthub::config
