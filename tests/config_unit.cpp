#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include "config/Config.h"

static const char* kVars[] = {
    "PORT", "BIND_ADDRESS", "LOG_LEVEL", "METRICS_ENABLED", "ACCESS_LOG", "IO_THREADS", "API_KEY",
    "UPSTREAM_BASE_URL", "UPSTREAM_TIMEOUT_SEC", "UPSTREAM_POOL_SIZE", "UPSTREAM_IDLE_TTL_SEC",
    "UPSTREAM_TLS_VERIFY", "CORS_ALLOW_ORIGIN", "DOTENV_ONLY",
};

static void clear_env() {
    for (const char* v : kVars) unsetenv(v);
}

static config::Config load(const std::string& env_file) {
    std::string flag = "--env-file";
    std::string prog = "scheduling_gateway";
    char* argv[] = {prog.data(), flag.data(), const_cast<char*>(env_file.c_str()), nullptr};
    return config::Config::from_env(3, argv);
}

int main() {
    clear_env();
    const std::string missing = "/tmp/config_unit_missing.env";
    std::remove(missing.c_str());

    {
        auto c = load(missing);
        if (c.port != 5000) { std::cerr << "default port mismatch: " << c.port << "\n"; return 1; }
        if (c.bind_address != "0.0.0.0") { std::cerr << "default bind address mismatch\n"; return 1; }
        if (c.log_level != config::Config::LogLevel::INFO) { std::cerr << "default log level mismatch\n"; return 1; }
        if (!c.api_key.empty()) { std::cerr << "api key should default to empty\n"; return 1; }
        if (c.upstream_base_url != "https://hourglass-qa.shieldfoundry.com") { std::cerr << "default upstream mismatch: " << c.upstream_base_url << "\n"; return 1; }
        if (c.upstream_timeout_sec != 30) { std::cerr << "default timeout mismatch\n"; return 1; }
        if (c.upstream_pool_size != 16) { std::cerr << "default pool size mismatch\n"; return 1; }
        if (!c.upstream_tls_verify) { std::cerr << "tls verify should default on\n"; return 1; }
        if (c.cors_allow_origin != "http://localhost:5173") { std::cerr << "default cors origin mismatch\n"; return 1; }
        if (c.io_threads < 1 || c.io_threads > 64) { std::cerr << "io_threads out of range: " << c.io_threads << "\n"; return 1; }
    }

    setenv("PORT", "9090", 1);
    setenv("LOG_LEVEL", "debug", 1);
    setenv("API_KEY", "from-env", 1);
    setenv("UPSTREAM_BASE_URL", "http://127.0.0.1:8081", 1);
    setenv("UPSTREAM_POOL_SIZE", "1000", 1);
    setenv("UPSTREAM_TLS_VERIFY", "0", 1);
    setenv("METRICS_ENABLED", "0", 1);
    {
        auto c = load(missing);
        if (c.port != 9090) { std::cerr << "env PORT not applied: " << c.port << "\n"; return 1; }
        if (c.log_level != config::Config::LogLevel::DEBUG) { std::cerr << "env LOG_LEVEL not applied\n"; return 1; }
        if (c.api_key != "from-env") { std::cerr << "env API_KEY not applied\n"; return 1; }
        if (c.upstream_base_url != "http://127.0.0.1:8081") { std::cerr << "env UPSTREAM_BASE_URL not applied\n"; return 1; }
        if (c.upstream_pool_size != 256) { std::cerr << "pool size not clamped: " << c.upstream_pool_size << "\n"; return 1; }
        if (c.upstream_tls_verify) { std::cerr << "UPSTREAM_TLS_VERIFY=0 ignored\n"; return 1; }
        if (c.metrics_enabled) { std::cerr << "METRICS_ENABLED=0 ignored\n"; return 1; }
    }

    setenv("PORT", "notanumber", 1);
    setenv("UPSTREAM_TIMEOUT_SEC", "-3", 1);
    {
        auto c = load(missing);
        if (c.port != 5000) { std::cerr << "malformed PORT should keep default, got " << c.port << "\n"; return 1; }
        if (c.upstream_timeout_sec != 30) { std::cerr << "negative timeout should keep default\n"; return 1; }
    }

    // .env fills gaps but never overrides the environment
    clear_env();
    const std::string env_path = "/tmp/config_unit.env";
    {
        std::ofstream out(env_path);
        out << "# comment\n";
        out << "API_KEY=\"dotenv-key-1234567890\"\n";
        out << "export DOTENV_ONLY=yes\n";
        out << "PORT=7000\n";
        out << "not a pair\n";
    }
    setenv("PORT", "7100", 1);
    {
        auto c = load(env_path);
        if (c.api_key != "dotenv-key-1234567890") { std::cerr << ".env API_KEY not loaded: " << c.api_key << "\n"; return 1; }
        if (c.port != 7100) { std::cerr << "environment should win over .env, got " << c.port << "\n"; return 1; }
        const char* only = std::getenv("DOTENV_ONLY");
        if (!only || std::string(only) != "yes") { std::cerr << "export prefix not handled\n"; return 1; }
    }

    {
        std::string prog = "scheduling_gateway";
        std::string f1 = "--port", v1 = "6123", f2 = "--env-file";
        char* argv[] = {prog.data(), f1.data(), v1.data(), f2.data(), const_cast<char*>(missing.c_str()), nullptr};
        auto c = config::Config::from_env(5, argv);
        if (c.port != 6123) { std::cerr << "--port should win over environment, got " << c.port << "\n"; return 1; }
    }

    if (config::load_dotenv(missing) != -1) { std::cerr << "missing .env should return -1\n"; return 1; }

    clear_env();
    std::remove(env_path.c_str());
    std::cout << "config_unit ok\n";
    return 0;
}
