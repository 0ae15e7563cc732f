#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

struct Tick {
    int64_t timestamp_ms;
    std::string instrument_id;
    std::optional<double> last_price;
    std::optional<int64_t> last_qty;
    std::optional<double> buy_price;
    std::optional<int64_t> buy_qty;
    std::optional<double> sell_price;
    std::optional<int64_t> sell_qty;
    std::optional<int64_t> open_interest; // derivatives only

    // Trade side usable for OHLCV: positive finite price, non-negative quantity
    bool has_trade_fields() const;

    // {"timestamp": "YYYY-MM-DD HH:MM:SS", "instrument_id": ..., "last_price": ...}
    // Absent or null numeric fields stay empty. Throws MalformedTickError.
    static Tick from_json(const nlohmann::json& j);
};

struct ResampledSnapshot {
    std::string instrument_id;
    int64_t interval_start_ms;
    double last_price;
    int64_t last_qty_total;
    double buy_price;
    int64_t buy_qty;
    double sell_price;
    int64_t sell_qty;
    int64_t open_interest;
};

struct Bar {
    std::string instrument_id;
    int64_t interval_start_ms;
    double open;
    double high;
    double low;
    double close;
    int64_t volume;
};

enum class MalformedPolicy {
    DropRow,
    FailFast
};

struct AggregationStats {
    size_t ticks_in = 0;
    size_t rows_out = 0;
    size_t malformed_ticks = 0;   // ticks that could not be grouped at all
    size_t dropped_rows = 0;      // buckets dropped as incomplete
};
