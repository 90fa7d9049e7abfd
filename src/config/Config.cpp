#include "Config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include <thread>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

static std::optional<int> getenv_int(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        if (v[used] != '\0') return std::nullopt;
        return n;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static Config::LogLevel parse_level(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "DEBUG") return Config::LogLevel::DEBUG;
    if (u == "WARN") return Config::LogLevel::WARN;
    if (u == "ERROR") return Config::LogLevel::ERROR;
    return Config::LogLevel::INFO;
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

int load_dotenv(const std::string& path) {
    std::ifstream in(path);
    if (!in) return -1;
    int applied = 0;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));
        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front()) {
            val = val.substr(1, val.size() - 2);
        }
        if (std::getenv(key.c_str())) continue;
        if (setenv(key.c_str(), val.c_str(), 0) == 0) ++applied;
    }
    return applied;
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    std::string env_file = ".env";
    std::optional<int> cli_port;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i+1 < argc) {
            try { cli_port = std::stoi(argv[++i]); } catch (const std::exception&) {}
        } else if (a == "--env-file" && i+1 < argc) {
            env_file = argv[++i];
        }
    }
    load_dotenv(env_file);

    if (auto p = getenv_int("PORT"); p && *p > 0 && *p <= 65535) c.port = static_cast<uint16_t>(*p);
    if (cli_port && *cli_port > 0 && *cli_port <= 65535) c.port = static_cast<uint16_t>(*cli_port);
    c.bind_address = getenv_or("BIND_ADDRESS", "0.0.0.0");
    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_or("METRICS_ENABLED", "1") != "0";
    c.access_log = getenv_or("ACCESS_LOG", "1") != "0";

    int hw = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    c.io_threads = std::clamp(getenv_int("IO_THREADS").value_or(hw), 1, 64);

    c.api_key = getenv_or("API_KEY", "");
    c.upstream_base_url = getenv_or("UPSTREAM_BASE_URL", "https://hourglass-qa.shieldfoundry.com");
    if (auto t = getenv_int("UPSTREAM_TIMEOUT_SEC"); t && *t > 0) c.upstream_timeout_sec = *t;
    c.upstream_pool_size = std::clamp(getenv_int("UPSTREAM_POOL_SIZE").value_or(16), 1, 256);
    if (auto t = getenv_int("UPSTREAM_IDLE_TTL_SEC"); t && *t >= 0) c.upstream_idle_ttl_sec = *t;
    c.upstream_tls_verify = getenv_or("UPSTREAM_TLS_VERIFY", "1") != "0";

    c.cors_allow_origin = getenv_or("CORS_ALLOW_ORIGIN", "http://localhost:5173");
    return c;
}

}
