#include "memory_store.hpp"
#include <algorithm>

size_t MemoryTickStore::insert_ticks(const std::vector<Tick>& ticks) {
    std::lock_guard<std::mutex> lk(mtx_);
    ticks_.insert(ticks_.end(), ticks.begin(), ticks.end());
    return ticks.size();
}

std::vector<Tick> MemoryTickStore::fetch_ticks_in_range(const TickQuery& query) {
    std::vector<Tick> out;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto& t : ticks_) {
            if (!query.instrument_id.empty() && t.instrument_id != query.instrument_id) continue;
            if (!query.range.contains(t.timestamp_ms)) continue;
            out.push_back(t);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const Tick& a, const Tick& b) {
        return a.timestamp_ms < b.timestamp_ms;
    });
    return out;
}

size_t MemoryTickStore::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ticks_.size();
}
