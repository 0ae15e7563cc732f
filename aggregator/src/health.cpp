#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<TickStore> store)
    : redis_(redis), store_(store) {}

void HealthCheck::record_quality_check(const std::string& trade_date, bool clean) {
    std::lock_guard<std::mutex> lk(mtx_);
    last_quality_date_ = trade_date;
    last_quality_clean_ = clean;
}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = redis_->ping();
    bool pg_ok = store_->ping();

    nlohmann::json quality = nullptr;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!last_quality_date_.empty()) {
            quality = {{"tdate", last_quality_date_}, {"clean", last_quality_clean_}};
        }
    }

    return {
        {"ok", redis_ok && pg_ok},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"last_quality_check", quality},
        {"ts", util::current_iso8601()}
    };
}
