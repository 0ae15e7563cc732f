#pragma once

#include "redis_bus.hpp"
#include "tick_store.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <memory>
#include <string>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<RedisBus> redis,
                std::shared_ptr<TickStore> store);

    nlohmann::json get_status();

    void record_quality_check(const std::string& trade_date, bool clean);

private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<TickStore> store_;
    std::mutex mtx_;
    std::string last_quality_date_;
    bool last_quality_clean_ = true;
};
