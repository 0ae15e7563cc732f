#include "store_pg.hpp"
#include "errors.hpp"
#include <optional>
#include <spdlog/spdlog.h>

PostgresTickStore::PostgresTickStore(const std::string& dsn, int statement_timeout_ms)
    : dsn_(dsn), statement_timeout_ms_(statement_timeout_ms) {
    spdlog::info("PostgresTickStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresTickStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresTickStore::ensure_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS tbt (
                "ID"            BIGSERIAL PRIMARY KEY,
                "Datetime"      TIMESTAMP NOT NULL,
                "Ticker"        VARCHAR(20) NOT NULL,
                "LTP"           DOUBLE PRECISION,
                "BuyPrice"      DOUBLE PRECISION,
                "BuyQty"        BIGINT,
                "SellPrice"     DOUBLE PRECISION,
                "SellQty"       BIGINT,
                "LTQ"           BIGINT,
                "OpenInterest"  BIGINT
            )
        )");

        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS tbt_ticker_datetime_idx ON tbt ("Ticker", "Datetime")
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw StoreError(std::string("schema initialization failed: ") + e.what());
    }
}

size_t PostgresTickStore::insert_ticks(const std::vector<Tick>& ticks) {
    if (ticks.empty()) return 0;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        // COPY into the table; timestamps are stored naive, as exchange
        // wall-clock read as UTC
        auto stream = pqxx::stream_to::table(txn, {"tbt"},
            {"Datetime", "Ticker", "LTP", "BuyPrice", "BuyQty",
             "SellPrice", "SellQty", "LTQ", "OpenInterest"});
        for (const auto& t : ticks) {
            stream.write_values(util::format_timestamp_millis(t.timestamp_ms), t.instrument_id,
                                t.last_price, t.buy_price, t.buy_qty, t.sell_price, t.sell_qty,
                                t.last_qty, t.open_interest);
        }
        stream.complete();

        // Nothing is written unless every row made it
        txn.commit();
        spdlog::info("Inserted {} ticks", ticks.size());
        return ticks.size();

    } catch (const std::exception& e) {
        spdlog::error("Tick insertion failed, rolled back: {}", e.what());
        throw StoreError(std::string("tick insertion failed: ") + e.what());
    }
}

std::vector<Tick> PostgresTickStore::fetch_ticks_in_range(const TickQuery& query) {
    std::vector<Tick> ticks;

    std::optional<std::string> first_day;
    std::optional<std::string> last_day;
    if (query.range.first_day_ms) first_day = util::format_date(*query.range.first_day_ms);
    if (query.range.last_day_ms) last_day = util::format_date(*query.range.last_day_ms);

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec("SET LOCAL statement_timeout = " + std::to_string(statement_timeout_ms_));

        auto result = txn.exec_params(
            "SELECT (EXTRACT(EPOCH FROM \"Datetime\") * 1000)::BIGINT, \"Ticker\", "
            "\"LTP\", \"LTQ\", \"BuyPrice\", \"BuyQty\", \"SellPrice\", \"SellQty\", \"OpenInterest\" "
            "FROM tbt "
            "WHERE ($1::date IS NULL OR \"Datetime\"::date >= $1::date) "
            "AND ($2::date IS NULL OR \"Datetime\"::date <= $2::date) "
            "AND ($3 = '' OR \"Ticker\" = $3) "
            "ORDER BY \"Datetime\", \"ID\"",
            first_day, last_day, query.instrument_id
        );

        ticks.reserve(result.size());
        for (const auto& row : result) {
            Tick t;
            t.timestamp_ms = row[0].as<int64_t>();
            t.instrument_id = row[1].as<std::string>();
            t.last_price = row[2].get<double>();
            t.last_qty = row[3].get<int64_t>();
            t.buy_price = row[4].get<double>();
            t.buy_qty = row[5].get<int64_t>();
            t.sell_price = row[6].get<double>();
            t.sell_qty = row[7].get<int64_t>();
            t.open_interest = row[8].get<int64_t>();
            ticks.push_back(std::move(t));
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to fetch ticks: {}", e.what());
        throw StoreError(std::string("tick fetch failed: ") + e.what());
    }

    spdlog::debug("Fetched {} ticks for '{}'", ticks.size(), query.instrument_id);
    return ticks;
}

bool PostgresTickStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}
