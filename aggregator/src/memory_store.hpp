#pragma once

#include "tick_store.hpp"
#include <mutex>

class MemoryTickStore final : public TickStore {
public:
    void ensure_schema() override {}
    size_t insert_ticks(const std::vector<Tick>& ticks) override;
    std::vector<Tick> fetch_ticks_in_range(const TickQuery& query) override;
    bool ping() override { return true; }

    size_t size() const;

private:
    mutable std::mutex mtx_;
    std::vector<Tick> ticks_;
};
