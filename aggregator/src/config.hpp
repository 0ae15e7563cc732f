#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Postgres
    std::string pg_dsn;
    int fetch_timeout_ms;

    // Redis
    std::string redis_url;
    std::string stream_quality;

    // Engine
    int default_frequency_seconds;
    bool strict_ticks;
    std::string bhavcopy_dir;
    int max_placed_orders;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
