#pragma once

#include "tick.hpp"
#include "time_bucket.hpp"
#include <functional>
#include <optional>
#include <vector>

class TickResampler {
public:
    using Sink = std::function<void(const ResampledSnapshot&)>;

    explicit TickResampler(int64_t frequency_seconds,
                           MalformedPolicy policy = MalformedPolicy::DropRow);

    // Sparse: buckets without ticks are never emitted. Output is ordered by
    // (instrument_id, interval_start).
    std::vector<ResampledSnapshot> resample(const std::vector<Tick>& ticks) const;
    AggregationStats resample(const std::vector<Tick>& ticks, const Sink& sink) const;

private:
    TimeBucketer bucketer_;
    MalformedPolicy policy_;

    std::optional<ResampledSnapshot> reduce_bucket(const std::vector<const Tick*>& sorted,
                                                   size_t first, size_t last,
                                                   int64_t interval_start_ms) const;
};
