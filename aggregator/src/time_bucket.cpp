#include "time_bucket.hpp"
#include "errors.hpp"
#include <limits>
#include <string>

TimeBucketer::TimeBucketer(int64_t frequency_seconds) {
    if (frequency_seconds <= 0) {
        throw InvalidFrequencyError("frequency must be > 0 seconds, got " +
                                    std::to_string(frequency_seconds));
    }
    if (frequency_seconds > std::numeric_limits<int64_t>::max() / 1000) {
        throw InvalidFrequencyError("frequency too large: " + std::to_string(frequency_seconds));
    }
    width_ms_ = frequency_seconds * 1000;
}

int64_t TimeBucketer::bucket_start(int64_t timestamp_ms) const {
    // Floor division; plain '/' truncates toward zero for pre-epoch times
    int64_t q = timestamp_ms / width_ms_;
    if (timestamp_ms % width_ms_ != 0 && timestamp_ms < 0) {
        --q;
    }
    return q * width_ms_;
}
