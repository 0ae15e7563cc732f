#pragma once

#include <cstdint>

// Maps timestamps onto fixed-width intervals anchored at the Unix epoch, so
// buckets line up across instruments within one run.
class TimeBucketer {
public:
    explicit TimeBucketer(int64_t frequency_seconds);

    int64_t bucket_start(int64_t timestamp_ms) const;
    int64_t width_ms() const { return width_ms_; }
    int64_t frequency_seconds() const { return width_ms_ / 1000; }

private:
    int64_t width_ms_;
};
