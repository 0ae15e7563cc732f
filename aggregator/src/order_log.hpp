#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct PlacedOrder {
    int64_t placed_at_ms;
    std::string symbol;
    double price;
    int64_t qty;

    nlohmann::json to_json() const;
};

// Bounded record of accepted orders; the oldest entry is evicted when full.
class OrderLog {
public:
    explicit OrderLog(size_t capacity);

    PlacedOrder record(const std::string& symbol, double price, int64_t qty);
    std::vector<PlacedOrder> list() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    mutable std::mutex mtx_;
    std::deque<PlacedOrder> orders_;
};
