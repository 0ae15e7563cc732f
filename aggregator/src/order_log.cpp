#include "order_log.hpp"
#include "util.hpp"
#include <cmath>
#include <stdexcept>

nlohmann::json PlacedOrder::to_json() const {
    return {
        {"placed_at", util::format_timestamp(placed_at_ms)},
        {"symbol", symbol},
        {"price", price},
        {"qty", qty}
    };
}

OrderLog::OrderLog(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("order log capacity must be > 0");
    }
}

PlacedOrder OrderLog::record(const std::string& symbol, double price, int64_t qty) {
    if (util::trim(symbol).empty()) {
        throw std::invalid_argument("symbol is required");
    }
    if (!std::isfinite(price) || price <= 0.0) {
        throw std::invalid_argument("price must be > 0");
    }
    if (qty <= 0) {
        throw std::invalid_argument("qty must be > 0");
    }

    PlacedOrder order{util::current_timestamp_ms(), util::trim(symbol), price, qty};

    std::lock_guard<std::mutex> lk(mtx_);
    if (orders_.size() == capacity_) {
        orders_.pop_front();
    }
    orders_.push_back(order);
    return order;
}

std::vector<PlacedOrder> OrderLog::list() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return {orders_.begin(), orders_.end()};
}

size_t OrderLog::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return orders_.size();
}
