#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string v = util::to_upper(util::trim(val));
    if (v == "1" || v == "TRUE" || v == "YES") return true;
    if (v == "0" || v == "FALSE" || v == "NO") return false;
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

Config Config::from_env() {
    Config cfg;

    cfg.pg_dsn = get_env("PG_DSN");
    cfg.fetch_timeout_ms = get_env_int("FETCH_TIMEOUT_MS", 30000);

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_quality = get_env("STREAM_QUALITY", "ticklens.quality.reports");

    cfg.default_frequency_seconds = get_env_int("DEFAULT_FREQUENCY_SECONDS", 1);
    cfg.strict_ticks = get_env_bool("STRICT_TICKS", false);
    cfg.bhavcopy_dir = get_env("BHAVCOPY_DIR", "data/bhavcopy");
    cfg.max_placed_orders = get_env_int("MAX_PLACED_ORDERS", 1000);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8000);

    cfg.service_name = get_env("SERVICE_NAME", "ticklens");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (default_frequency_seconds <= 0) {
        throw std::runtime_error("DEFAULT_FREQUENCY_SECONDS must be > 0");
    }
    if (fetch_timeout_ms <= 0) {
        throw std::runtime_error("FETCH_TIMEOUT_MS must be > 0");
    }
    if (max_placed_orders <= 0) {
        throw std::runtime_error("MAX_PLACED_ORDERS must be > 0");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT out of range");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Postgres: {}", util::redact_dsn(pg_dsn));
    spdlog::info("  Default frequency: {}s, strict ticks: {}", default_frequency_seconds, strict_ticks);
    spdlog::info("  Bhavcopy dir: {}", bhavcopy_dir);
}
