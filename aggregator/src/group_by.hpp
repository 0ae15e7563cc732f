#pragma once

#include <cstddef>
#include <vector>

// Walks a key-sorted sequence and hands each run of equal keys to the reducer
// as a half-open index range [first, last).
template <typename Record, typename KeyFn, typename Reducer>
void for_each_run(const std::vector<Record>& sorted, KeyFn key_of, Reducer reduce) {
    size_t first = 0;
    while (first < sorted.size()) {
        auto key = key_of(sorted[first]);
        size_t last = first + 1;
        while (last < sorted.size() && key_of(sorted[last]) == key) {
            ++last;
        }
        reduce(key, first, last);
        first = last;
    }
}
