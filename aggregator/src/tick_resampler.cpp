#include "tick_resampler.hpp"
#include "errors.hpp"
#include "group_by.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <string_view>
#include <utility>
#include <spdlog/spdlog.h>

namespace {

std::optional<double> usable(const std::optional<double>& v) {
    if (v && std::isfinite(*v)) return v;
    return std::nullopt;
}

std::optional<int64_t> usable(const std::optional<int64_t>& v) {
    if (v && *v >= 0) return v;
    return std::nullopt;
}

} // namespace

TickResampler::TickResampler(int64_t frequency_seconds, MalformedPolicy policy)
    : bucketer_(frequency_seconds), policy_(policy) {}

std::vector<ResampledSnapshot> TickResampler::resample(const std::vector<Tick>& ticks) const {
    std::vector<ResampledSnapshot> out;
    resample(ticks, [&out](const ResampledSnapshot& s) { out.push_back(s); });
    return out;
}

AggregationStats TickResampler::resample(const std::vector<Tick>& ticks, const Sink& sink) const {
    AggregationStats stats;
    stats.ticks_in = ticks.size();

    std::vector<const Tick*> sorted;
    sorted.reserve(ticks.size());
    for (const auto& t : ticks) {
        if (t.instrument_id.empty()) {
            if (policy_ == MalformedPolicy::FailFast) {
                throw MalformedTickError("tick at " + util::format_timestamp(t.timestamp_ms) +
                                         " has no instrument_id");
            }
            stats.malformed_ticks++;
            continue;
        }
        sorted.push_back(&t);
    }

    std::stable_sort(sorted.begin(), sorted.end(), [](const Tick* a, const Tick* b) {
        if (a->instrument_id != b->instrument_id) return a->instrument_id < b->instrument_id;
        return a->timestamp_ms < b->timestamp_ms;
    });

    auto key_of = [this](const Tick* t) {
        return std::make_pair(std::string_view(t->instrument_id), bucketer_.bucket_start(t->timestamp_ms));
    };

    for_each_run(sorted, key_of, [&](const auto& key, size_t first, size_t last) {
        auto snapshot = reduce_bucket(sorted, first, last, key.second);
        if (!snapshot) {
            if (policy_ == MalformedPolicy::FailFast) {
                throw MalformedTickError("incomplete or malformed snapshot for " + sorted[first]->instrument_id +
                                         " at " + util::format_timestamp(key.second));
            }
            spdlog::debug("Dropping incomplete snapshot {} @ {}",
                          sorted[first]->instrument_id, util::format_timestamp(key.second));
            stats.dropped_rows++;
            return;
        }
        sink(*snapshot);
        stats.rows_out++;
    });

    if (stats.malformed_ticks > 0 || stats.dropped_rows > 0) {
        spdlog::warn("Resample: {} ticks, {} rows, {} malformed ticks, {} rows dropped",
                     stats.ticks_in, stats.rows_out, stats.malformed_ticks, stats.dropped_rows);
    }
    return stats;
}

std::optional<ResampledSnapshot> TickResampler::reduce_bucket(const std::vector<const Tick*>& sorted,
                                                              size_t first, size_t last,
                                                              int64_t interval_start_ms) const {
    const Tick& tail = *sorted[last - 1];

    // Sum skips missing quantities; a bucket with none at all has no total.
    // A negative quantity or an overflowing sum makes the row malformed.
    std::optional<int64_t> qty_total;
    for (size_t i = first; i < last; ++i) {
        const auto& q = sorted[i]->last_qty;
        if (!q) continue;
        if (*q < 0) return std::nullopt;
        qty_total = util::checked_add(qty_total.value_or(0), *q);
        if (!qty_total) return std::nullopt;
    }

    auto last_price = usable(tail.last_price);
    auto buy_price = usable(tail.buy_price);
    auto sell_price = usable(tail.sell_price);
    auto buy_qty = usable(tail.buy_qty);
    auto sell_qty = usable(tail.sell_qty);
    auto open_interest = usable(tail.open_interest);
    if (!last_price || !qty_total || !buy_price || !buy_qty ||
        !sell_price || !sell_qty || !open_interest) {
        return std::nullopt;
    }

    ResampledSnapshot s;
    s.instrument_id = tail.instrument_id;
    s.interval_start_ms = interval_start_ms;
    s.last_price = *last_price;
    s.last_qty_total = *qty_total;
    s.buy_price = *buy_price;
    s.buy_qty = *buy_qty;
    s.sell_price = *sell_price;
    s.sell_qty = *sell_qty;
    s.open_interest = *open_interest;
    return s;
}
