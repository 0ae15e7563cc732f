#pragma once

#include "tick.hpp"
#include "util.hpp"
#include <string>
#include <vector>

struct TickQuery {
    std::string instrument_id; // empty selects every instrument
    util::DateRange range;
};

// Storage capability the service needs. Implementations own their
// connections; callers never see them.
class TickStore {
public:
    virtual ~TickStore() = default;

    virtual void ensure_schema() = 0;
    virtual size_t insert_ticks(const std::vector<Tick>& ticks) = 0;
    // Ordered by timestamp. Throws StoreError when the backend is unreachable.
    virtual std::vector<Tick> fetch_ticks_in_range(const TickQuery& query) = 0;
    virtual bool ping() = 0;
};
