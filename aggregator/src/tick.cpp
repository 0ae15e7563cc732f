#include "tick.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cmath>
#include <limits>

namespace {

std::optional<double> optional_price(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_number()) {
        throw MalformedTickError(std::string("field '") + key + "' is not numeric");
    }
    return j[key].get<double>();
}

// Quantities and open interest: non-negative JSON integers that fit in int64
std::optional<int64_t> optional_count(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    const auto& v = j[key];
    if (v.is_number_unsigned()) {
        auto u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw MalformedTickError(std::string("field '") + key + "' is out of range");
        }
        return static_cast<int64_t>(u);
    }
    if (!v.is_number_integer()) {
        throw MalformedTickError(std::string("field '") + key + "' is not an integer");
    }
    auto n = v.get<int64_t>();
    if (n < 0) {
        throw MalformedTickError(std::string("field '") + key + "' is negative");
    }
    return n;
}

} // namespace

bool Tick::has_trade_fields() const {
    return last_price.has_value() && std::isfinite(*last_price) && *last_price > 0.0 &&
           last_qty.has_value() && *last_qty >= 0;
}

Tick Tick::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw MalformedTickError("tick must be a JSON object");
    }
    if (!j.contains("timestamp") || !j["timestamp"].is_string()) {
        throw MalformedTickError("tick requires a timestamp string");
    }
    if (!j.contains("instrument_id") || !j["instrument_id"].is_string()) {
        throw MalformedTickError("tick requires an instrument_id string");
    }

    Tick t;
    try {
        t.timestamp_ms = util::parse_timestamp(j["timestamp"].get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw MalformedTickError(e.what());
    }
    t.instrument_id = util::trim(j["instrument_id"].get<std::string>());
    if (t.instrument_id.empty()) {
        throw MalformedTickError("tick instrument_id is empty");
    }
    t.last_price = optional_price(j, "last_price");
    t.last_qty = optional_count(j, "last_qty");
    t.buy_price = optional_price(j, "buy_price");
    t.buy_qty = optional_count(j, "buy_qty");
    t.sell_price = optional_price(j, "sell_price");
    t.sell_qty = optional_count(j, "sell_qty");
    t.open_interest = optional_count(j, "open_interest");
    return t;
}
