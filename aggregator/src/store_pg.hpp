#pragma once

#include "tick_store.hpp"
#include <pqxx/pqxx>
#include <string>
#include <vector>

class PostgresTickStore final : public TickStore {
public:
    PostgresTickStore(const std::string& dsn, int statement_timeout_ms);

    void ensure_schema() override;
    size_t insert_ticks(const std::vector<Tick>& ticks) override;
    std::vector<Tick> fetch_ticks_in_range(const TickQuery& query) override;
    bool ping() override;

private:
    std::string dsn_;
    int statement_timeout_ms_;

    // One connection per operation, closed when it goes out of scope
    pqxx::connection make_connection();
};
