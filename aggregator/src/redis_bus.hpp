#pragma once

#include <string>
#include <memory>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

class RedisBus {
public:
    explicit RedisBus(const std::string& redis_url);

    bool publish_quality_report(const std::string& stream, const std::string& trade_date,
                                const nlohmann::json& report);
    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};
