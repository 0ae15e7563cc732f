#pragma once

#include "tick.hpp"
#include "time_bucket.hpp"
#include <functional>
#include <optional>
#include <vector>

class BarBuilder {
public:
    using Sink = std::function<void(const Bar&)>;

    explicit BarBuilder(int64_t frequency_seconds,
                        MalformedPolicy policy = MalformedPolicy::DropRow);

    // Instruments come out in first-seen order, buckets ascending within each.
    std::vector<Bar> build_bars(const std::vector<Tick>& ticks) const;
    AggregationStats build_bars(const std::vector<Tick>& ticks, const Sink& sink) const;

    // Coarsen bars to this builder's frequency. Bars already aligned to it pass
    // through unchanged.
    std::vector<Bar> resample_bars(const std::vector<Bar>& bars) const;

    int64_t frequency_seconds() const { return bucketer_.frequency_seconds(); }

private:
    TimeBucketer bucketer_;
    MalformedPolicy policy_;

    // Empty when the bucket's volume overflows
    std::optional<Bar> synthesize_bar(int64_t start_ms, const std::vector<const Tick*>& ticks,
                                      size_t first, size_t last) const;
};
