#include "redis_bus.hpp"
#include <unordered_map>
#include <spdlog/spdlog.h>

RedisBus::RedisBus(const std::string& redis_url) {
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Connected to Redis: {}", redis_url);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

bool RedisBus::publish_quality_report(const std::string& stream, const std::string& trade_date,
                                      const nlohmann::json& report) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["tdate"] = trade_date;
        fields["data"] = report.dump();

        redis_->xadd(stream, "*", fields.begin(), fields.end());
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Failed to publish quality report: {}", e.what());
        return false;
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        return false;
    }
}
