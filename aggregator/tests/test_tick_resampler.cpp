#include <catch2/catch.hpp>
#include "../src/tick_resampler.hpp"
#include "../src/errors.hpp"
#include "../src/util.hpp"
#include <algorithm>
#include <random>

namespace {

const int64_t kOpen = util::parse_timestamp("2022-04-04 09:15:00");

Tick quote(const std::string& id, int64_t offset_s, double ltp, int64_t ltq, int64_t oi = 0) {
    Tick t;
    t.timestamp_ms = kOpen + offset_s * 1000;
    t.instrument_id = id;
    t.last_price = ltp;
    t.last_qty = ltq;
    t.buy_price = ltp - 0.05;
    t.buy_qty = 100;
    t.sell_price = ltp + 0.05;
    t.sell_qty = 200;
    t.open_interest = oi;
    return t;
}

} // namespace

TEST_CASE("Tick resampling", "[resampler]") {
    TickResampler resampler(5);

    SECTION("Empty input yields no snapshots") {
        REQUIRE(resampler.resample({}).empty());
    }

    SECTION("Last values and summed quantity per bucket") {
        std::vector<Tick> ticks = {
            quote("X", 0, 100.0, 10, 1),
            quote("X", 3, 102.0, 5, 2),
            quote("X", 7, 101.0, 8, 3)
        };

        auto rows = resampler.resample(ticks);
        REQUIRE(rows.size() == 2);

        REQUIRE(rows[0].instrument_id == "X");
        REQUIRE(rows[0].interval_start_ms == kOpen);
        REQUIRE(rows[0].last_price == 102.0);
        REQUIRE(rows[0].last_qty_total == 15);
        REQUIRE(rows[0].open_interest == 2);
        REQUIRE(rows[0].sell_qty == 200);

        REQUIRE(rows[1].interval_start_ms == kOpen + 5000);
        REQUIRE(rows[1].last_price == 101.0);
        REQUIRE(rows[1].last_qty_total == 8);
        REQUIRE(rows[1].open_interest == 3);
    }

    SECTION("Gaps are not filled") {
        std::vector<Tick> ticks = {quote("X", 0, 100.0, 1), quote("X", 60, 101.0, 1)};
        auto rows = resampler.resample(ticks);
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[1].interval_start_ms - rows[0].interval_start_ms == 60000);
    }

    SECTION("Output ordered by instrument then interval") {
        std::vector<Tick> ticks = {
            quote("ZEE", 0, 10.0, 1),
            quote("ABB", 6, 20.0, 1),
            quote("ABB", 1, 19.0, 1)
        };
        auto rows = resampler.resample(ticks);
        REQUIRE(rows.size() == 3);
        REQUIRE(rows[0].instrument_id == "ABB");
        REQUIRE(rows[0].interval_start_ms == kOpen);
        REQUIRE(rows[1].instrument_id == "ABB");
        REQUIRE(rows[1].interval_start_ms == kOpen + 5000);
        REQUIRE(rows[2].instrument_id == "ZEE");
    }

    SECTION("Timestamp ties resolve to arrival order") {
        std::vector<Tick> ticks = {quote("X", 1, 100.0, 1), quote("X", 1, 99.0, 1)};
        auto rows = resampler.resample(ticks);
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].last_price == 99.0);
        REQUIRE(rows[0].last_qty_total == 2);
    }

    SECTION("Shuffled input gives identical output") {
        std::vector<Tick> ticks;
        for (int i = 0; i < 40; ++i) {
            ticks.push_back(quote(i % 3 == 0 ? "A" : "B", i * 2, 100.0 + i, i));
        }
        auto expected = resampler.resample(ticks);

        std::mt19937 gen(42);
        std::shuffle(ticks.begin(), ticks.end(), gen);
        auto shuffled = resampler.resample(ticks);

        REQUIRE(shuffled.size() == expected.size());
        for (size_t i = 0; i < expected.size(); ++i) {
            REQUIRE(shuffled[i].instrument_id == expected[i].instrument_id);
            REQUIRE(shuffled[i].interval_start_ms == expected[i].interval_start_ms);
            REQUIRE(shuffled[i].last_price == expected[i].last_price);
            REQUIRE(shuffled[i].last_qty_total == expected[i].last_qty_total);
        }
    }

    SECTION("Incomplete rows are dropped") {
        auto partial = quote("X", 6, 101.0, 4);
        partial.open_interest.reset();

        std::vector<Tick> ticks = {quote("X", 0, 100.0, 1), partial};
        std::vector<ResampledSnapshot> rows;
        auto stats = resampler.resample(ticks, [&rows](const ResampledSnapshot& s) { rows.push_back(s); });

        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].interval_start_ms == kOpen);
        REQUIRE(stats.dropped_rows == 1);
        REQUIRE(stats.rows_out == 1);
    }

    SECTION("Missing quantity is skipped in the sum") {
        auto no_qty = quote("X", 2, 101.0, 0);
        no_qty.last_qty.reset();
        std::vector<Tick> ticks = {quote("X", 0, 100.0, 7), no_qty};
        auto rows = resampler.resample(ticks);
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].last_qty_total == 7);
    }

    SECTION("Strict mode fails on incomplete rows") {
        TickResampler strict(5, MalformedPolicy::FailFast);
        auto partial = quote("X", 0, 100.0, 1);
        partial.buy_price.reset();
        REQUIRE_THROWS_AS(strict.resample({partial}), MalformedTickError);
    }

    SECTION("Ticks without an instrument are counted as malformed") {
        auto orphan = quote("", 0, 100.0, 1);
        std::vector<Tick> ticks = {orphan, quote("X", 0, 100.0, 1)};
        auto stats = resampler.resample(ticks, [](const ResampledSnapshot&) {});
        REQUIRE(stats.malformed_ticks == 1);
        REQUIRE(stats.rows_out == 1);
    }

    SECTION("Negative quantity makes the row malformed") {
        auto negative = quote("X", 1, 100.0, -3);
        std::vector<Tick> ticks = {quote("X", 0, 100.0, 5), negative, quote("X", 6, 101.0, 2)};

        std::vector<ResampledSnapshot> rows;
        auto stats = resampler.resample(ticks, [&rows](const ResampledSnapshot& s) { rows.push_back(s); });
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].interval_start_ms == kOpen + 5000);
        REQUIRE(stats.dropped_rows == 1);

        auto negative_oi = quote("X", 0, 100.0, 1, -1);
        REQUIRE(resampler.resample({negative_oi}).empty());
    }

    SECTION("Quantity overflow makes the row malformed") {
        const int64_t huge = 6000000000000000000LL;
        std::vector<Tick> ticks = {quote("X", 0, 100.0, huge), quote("X", 1, 100.0, huge)};
        REQUIRE(resampler.resample(ticks).empty());

        TickResampler strict(5, MalformedPolicy::FailFast);
        REQUIRE_THROWS_AS(strict.resample(ticks), MalformedTickError);
    }

    SECTION("Quote fields come from the last tick only") {
        auto tail = quote("X", 2, 101.0, 1);
        tail.sell_price.reset();
        std::vector<Tick> ticks = {quote("X", 0, 100.0, 1), tail};

        std::vector<ResampledSnapshot> rows;
        auto stats = resampler.resample(ticks, [&rows](const ResampledSnapshot& s) { rows.push_back(s); });
        REQUIRE(rows.empty());
        REQUIRE(stats.dropped_rows == 1);
    }

    SECTION("Strict mode fails on ticks without an instrument") {
        TickResampler strict(5, MalformedPolicy::FailFast);
        auto orphan = quote("", 0, 100.0, 1);
        REQUIRE_THROWS_AS(strict.resample({orphan}), MalformedTickError);
    }
}
