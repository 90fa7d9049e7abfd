#pragma once

#include <cstdint>
#include <string>

namespace config {

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    uint16_t port = 5000;
    std::string bind_address = "0.0.0.0";
    LogLevel log_level = LogLevel::INFO;
    bool metrics_enabled = true;
    bool access_log = true;
    int io_threads = 1;

    // upstream scheduling API
    std::string api_key;
    std::string upstream_base_url = "https://hourglass-qa.shieldfoundry.com";
    int upstream_timeout_sec = 30;
    int upstream_pool_size = 16;
    int upstream_idle_ttl_sec = 15;
    bool upstream_tls_verify = true;

    std::string cors_allow_origin = "http://localhost:5173";

    // Environment wins over the .env file; --port wins over both.
    static Config from_env(int argc, char** argv);
};

// Loads KEY=VALUE lines into the process environment without overriding
// variables that are already set. Returns the number of variables applied,
// or -1 when the file cannot be opened.
int load_dotenv(const std::string& path);

}
