#include "bar_builder.hpp"
#include "errors.hpp"
#include "group_by.hpp"
#include "util.hpp"
#include <algorithm>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace {

// Groups records by instrument_id, keeping the order in which instruments
// first appear.
template <typename Record, typename IdFn>
std::vector<std::vector<Record>> group_by_instrument(const std::vector<Record>& records, IdFn id_of) {
    std::vector<std::vector<Record>> groups;
    std::unordered_map<std::string, size_t> index;
    for (const auto& r : records) {
        auto [it, inserted] = index.emplace(id_of(r), groups.size());
        if (inserted) {
            groups.emplace_back();
        }
        groups[it->second].push_back(r);
    }
    return groups;
}

} // namespace

BarBuilder::BarBuilder(int64_t frequency_seconds, MalformedPolicy policy)
    : bucketer_(frequency_seconds), policy_(policy) {}

std::vector<Bar> BarBuilder::build_bars(const std::vector<Tick>& ticks) const {
    std::vector<Bar> bars;
    build_bars(ticks, [&bars](const Bar& b) { bars.push_back(b); });
    return bars;
}

AggregationStats BarBuilder::build_bars(const std::vector<Tick>& ticks, const Sink& sink) const {
    AggregationStats stats;
    stats.ticks_in = ticks.size();

    std::vector<const Tick*> usable;
    usable.reserve(ticks.size());
    for (const auto& t : ticks) {
        if (t.instrument_id.empty()) {
            if (policy_ == MalformedPolicy::FailFast) {
                throw MalformedTickError("tick at " + util::format_timestamp(t.timestamp_ms) +
                                         " has no instrument_id");
            }
            stats.malformed_ticks++;
            continue;
        }
        // A bad tick is left out; the rest of its bucket still forms a bar
        if (!t.has_trade_fields()) {
            if (policy_ == MalformedPolicy::FailFast) {
                throw MalformedTickError("non-numeric price or quantity for " + t.instrument_id +
                                         " at " + util::format_timestamp(t.timestamp_ms));
            }
            spdlog::debug("Skipping malformed tick {} @ {}",
                          t.instrument_id, util::format_timestamp(t.timestamp_ms));
            stats.malformed_ticks++;
            continue;
        }
        usable.push_back(&t);
    }

    auto groups = group_by_instrument(usable, [](const Tick* t) { return t->instrument_id; });

    for (auto& group : groups) {
        std::stable_sort(group.begin(), group.end(), [](const Tick* a, const Tick* b) {
            return a->timestamp_ms < b->timestamp_ms;
        });

        auto bucket_of = [this](const Tick* t) { return bucketer_.bucket_start(t->timestamp_ms); };

        for_each_run(group, bucket_of, [&](int64_t start_ms, size_t first, size_t last) {
            auto bar = synthesize_bar(start_ms, group, first, last);
            if (!bar) {
                if (policy_ == MalformedPolicy::FailFast) {
                    throw MalformedTickError("volume overflow for " + group[first]->instrument_id +
                                             " at " + util::format_timestamp(start_ms));
                }
                spdlog::warn("Dropping bar {} @ {}: volume overflow",
                             group[first]->instrument_id, util::format_timestamp(start_ms));
                stats.dropped_rows++;
                return;
            }
            sink(*bar);
            stats.rows_out++;
        });
    }

    if (stats.malformed_ticks > 0 || stats.dropped_rows > 0) {
        spdlog::warn("Bars: {} ticks, {} bars, {} malformed ticks, {} bars dropped",
                     stats.ticks_in, stats.rows_out, stats.malformed_ticks, stats.dropped_rows);
    }
    return stats;
}

std::optional<Bar> BarBuilder::synthesize_bar(int64_t start_ms, const std::vector<const Tick*>& ticks,
                                              size_t first, size_t last) const {
    Bar bar;
    bar.instrument_id = ticks[first]->instrument_id;
    bar.interval_start_ms = start_ms;
    bar.open = *ticks[first]->last_price;
    bar.close = *ticks[last - 1]->last_price;
    bar.high = bar.open;
    bar.low = bar.open;
    bar.volume = 0;

    for (size_t i = first; i < last; ++i) {
        double price = *ticks[i]->last_price;
        bar.high = std::max(bar.high, price);
        bar.low = std::min(bar.low, price);
        auto volume = util::checked_add(bar.volume, *ticks[i]->last_qty);
        if (!volume) return std::nullopt;
        bar.volume = *volume;
    }

    return bar;
}

std::vector<Bar> BarBuilder::resample_bars(const std::vector<Bar>& bars) const {
    std::vector<Bar> out;
    auto groups = group_by_instrument(bars, [](const Bar& b) { return b.instrument_id; });

    for (auto& group : groups) {
        std::stable_sort(group.begin(), group.end(), [](const Bar& a, const Bar& b) {
            return a.interval_start_ms < b.interval_start_ms;
        });

        auto bucket_of = [this](const Bar& b) { return bucketer_.bucket_start(b.interval_start_ms); };

        for_each_run(group, bucket_of, [&](int64_t start_ms, size_t first, size_t last) {
            Bar merged = group[first];
            merged.interval_start_ms = start_ms;
            merged.close = group[last - 1].close;
            for (size_t i = first + 1; i < last; ++i) {
                merged.high = std::max(merged.high, group[i].high);
                merged.low = std::min(merged.low, group[i].low);
                auto volume = util::checked_add(merged.volume, group[i].volume);
                if (!volume) {
                    if (policy_ == MalformedPolicy::FailFast) {
                        throw MalformedTickError("volume overflow for " + merged.instrument_id +
                                                 " at " + util::format_timestamp(start_ms));
                    }
                    spdlog::warn("Dropping bar {} @ {}: volume overflow",
                                 merged.instrument_id, util::format_timestamp(start_ms));
                    return;
                }
                merged.volume = *volume;
            }
            out.push_back(std::move(merged));
        });
    }

    return out;
}
