#include <catch2/catch.hpp>
#include "../src/bar_builder.hpp"
#include "../src/errors.hpp"
#include "../src/util.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace {

const int64_t kOpen = util::parse_timestamp("2022-04-04 09:15:00");

Tick trade(const std::string& id, int64_t offset_s, double ltp, int64_t ltq) {
    Tick t;
    t.timestamp_ms = kOpen + offset_s * 1000;
    t.instrument_id = id;
    t.last_price = ltp;
    t.last_qty = ltq;
    return t;
}

} // namespace

TEST_CASE("Bar building", "[bar_builder]") {
    BarBuilder builder(5);

    SECTION("Worked example") {
        std::vector<Tick> ticks = {
            trade("X", 0, 100.0, 10),
            trade("X", 3, 102.0, 5),
            trade("X", 7, 101.0, 8)
        };

        auto bars = builder.build_bars(ticks);
        REQUIRE(bars.size() == 2);

        REQUIRE(bars[0].interval_start_ms == kOpen);
        REQUIRE(bars[0].open == 100.0);
        REQUIRE(bars[0].high == 102.0);
        REQUIRE(bars[0].low == 100.0);
        REQUIRE(bars[0].close == 102.0);
        REQUIRE(bars[0].volume == 15);

        REQUIRE(bars[1].interval_start_ms == kOpen + 5000);
        REQUIRE(bars[1].open == 101.0);
        REQUIRE(bars[1].high == 101.0);
        REQUIRE(bars[1].low == 101.0);
        REQUIRE(bars[1].close == 101.0);
        REQUIRE(bars[1].volume == 8);
    }

    SECTION("Instrument groups keep first-seen order") {
        std::vector<Tick> ticks = {
            trade("ZEE", 0, 10.0, 1),
            trade("ABB", 1, 20.0, 1),
            trade("ZEE", 6, 11.0, 1)
        };
        auto bars = builder.build_bars(ticks);
        REQUIRE(bars.size() == 3);
        REQUIRE(bars[0].instrument_id == "ZEE");
        REQUIRE(bars[1].instrument_id == "ZEE");
        REQUIRE(bars[1].interval_start_ms == kOpen + 5000);
        REQUIRE(bars[2].instrument_id == "ABB");
    }

    SECTION("Empty buckets produce no bars") {
        std::vector<Tick> ticks = {trade("X", 0, 100.0, 1), trade("X", 3600, 105.0, 2)};
        auto bars = builder.build_bars(ticks);
        REQUIRE(bars.size() == 2);
        for (const auto& b : bars) {
            REQUIRE(b.volume > 0);
        }
    }

    SECTION("Open and close lie within high and low") {
        std::mt19937 gen(7);
        std::uniform_real_distribution<double> price(90.0, 110.0);
        std::uniform_int_distribution<int> offset(0, 600);

        std::vector<Tick> ticks;
        for (int i = 0; i < 500; ++i) {
            ticks.push_back(trade(i % 2 ? "A" : "B", offset(gen), price(gen), i % 13));
        }

        for (const auto& b : builder.build_bars(ticks)) {
            REQUIRE(b.low <= b.open);
            REQUIRE(b.open <= b.high);
            REQUIRE(b.low <= b.close);
            REQUIRE(b.close <= b.high);
        }
    }

    SECTION("Unordered input is sorted before aggregation") {
        std::vector<Tick> ticks = {
            trade("X", 7, 101.0, 8),
            trade("X", 3, 102.0, 5),
            trade("X", 0, 100.0, 10)
        };
        auto bars = builder.build_bars(ticks);
        REQUIRE(bars.size() == 2);
        REQUIRE(bars[0].open == 100.0);
        REQUIRE(bars[0].close == 102.0);
    }

    SECTION("Malformed ticks are skipped without losing their bucket") {
        auto no_qty = trade("X", 1, 103.0, 0);
        no_qty.last_qty.reset();
        auto nan_price = trade("X", 3, 0.0, 4);
        nan_price.last_price = std::nan("");
        std::vector<Tick> ticks = {trade("X", 0, 100.0, 10), no_qty, nan_price, trade("X", 2, 101.0, 5)};

        std::vector<Bar> bars;
        auto stats = builder.build_bars(ticks, [&bars](const Bar& b) { bars.push_back(b); });
        REQUIRE(bars.size() == 1);
        REQUIRE(bars[0].open == 100.0);
        REQUIRE(bars[0].high == 101.0);
        REQUIRE(bars[0].close == 101.0);
        REQUIRE(bars[0].volume == 15);
        REQUIRE(stats.malformed_ticks == 2);
        REQUIRE(stats.dropped_rows == 0);
        REQUIRE(stats.rows_out == 1);
    }

    SECTION("Bucket with only malformed ticks produces no bar") {
        auto bad = trade("X", 0, -1.0, 5);
        std::vector<Tick> ticks = {bad, trade("X", 6, 101.0, 1)};
        auto bars = builder.build_bars(ticks);
        REQUIRE(bars.size() == 1);
        REQUIRE(bars[0].interval_start_ms == kOpen + 5000);
    }

    SECTION("Timestamp ties resolve open and close in arrival order") {
        std::vector<Tick> ticks = {trade("X", 1, 100.0, 1), trade("X", 1, 99.0, 1), trade("X", 1, 98.0, 1)};
        auto bars = builder.build_bars(ticks);
        REQUIRE(bars.size() == 1);
        REQUIRE(bars[0].open == 100.0);
        REQUIRE(bars[0].close == 98.0);
        REQUIRE(bars[0].volume == 3);
    }

    SECTION("Shuffled input gives identical bars") {
        std::vector<Tick> ticks;
        for (int i = 0; i < 60; ++i) {
            ticks.push_back(trade("X", i, 100.0 + (i % 7), 1 + i % 3));
        }
        auto expected = builder.build_bars(ticks);

        std::mt19937 gen(11);
        std::shuffle(ticks.begin(), ticks.end(), gen);
        auto shuffled = builder.build_bars(ticks);

        REQUIRE(shuffled.size() == expected.size());
        for (size_t i = 0; i < expected.size(); ++i) {
            REQUIRE(shuffled[i].interval_start_ms == expected[i].interval_start_ms);
            REQUIRE(shuffled[i].open == expected[i].open);
            REQUIRE(shuffled[i].high == expected[i].high);
            REQUIRE(shuffled[i].low == expected[i].low);
            REQUIRE(shuffled[i].close == expected[i].close);
            REQUIRE(shuffled[i].volume == expected[i].volume);
        }
    }

    SECTION("Volume overflow drops the bar") {
        const int64_t huge = 6000000000000000000LL;
        std::vector<Tick> ticks = {trade("X", 0, 100.0, huge), trade("X", 1, 101.0, huge),
                                   trade("X", 6, 102.0, 1)};

        std::vector<Bar> bars;
        auto stats = builder.build_bars(ticks, [&bars](const Bar& b) { bars.push_back(b); });
        REQUIRE(bars.size() == 1);
        REQUIRE(bars[0].volume == 1);
        REQUIRE(stats.dropped_rows == 1);

        BarBuilder strict(5, MalformedPolicy::FailFast);
        REQUIRE_THROWS_AS(strict.build_bars(ticks), MalformedTickError);
    }

    SECTION("Strict mode fails on malformed ticks") {
        BarBuilder strict(5, MalformedPolicy::FailFast);
        auto bad = trade("X", 0, 100.0, 1);
        bad.last_qty.reset();
        REQUIRE_THROWS_AS(strict.build_bars({bad}), MalformedTickError);

        auto orphan = trade("", 0, 100.0, 1);
        REQUIRE_THROWS_AS(strict.build_bars({orphan}), MalformedTickError);
    }
}

TEST_CASE("Bar re-bucketing", "[bar_builder]") {
    std::vector<Tick> ticks;
    for (int i = 0; i < 120; ++i) {
        ticks.push_back(trade(i % 4 ? "INFY" : "TCS", i, 1000.0 + (i % 17), 1 + i % 5));
    }

    SECTION("Aligned bars are unchanged") {
        BarBuilder minute(60);
        auto bars = minute.build_bars(ticks);
        auto again = minute.resample_bars(bars);

        REQUIRE(again.size() == bars.size());
        for (size_t i = 0; i < bars.size(); ++i) {
            REQUIRE(again[i].instrument_id == bars[i].instrument_id);
            REQUIRE(again[i].interval_start_ms == bars[i].interval_start_ms);
            REQUIRE(again[i].open == bars[i].open);
            REQUIRE(again[i].high == bars[i].high);
            REQUIRE(again[i].low == bars[i].low);
            REQUIRE(again[i].close == bars[i].close);
            REQUIRE(again[i].volume == bars[i].volume);
        }
    }

    SECTION("Coarsening matches building directly") {
        auto fine = BarBuilder(5).build_bars(ticks);
        auto coarse = BarBuilder(60).resample_bars(fine);
        auto direct = BarBuilder(60).build_bars(ticks);

        REQUIRE(coarse.size() == direct.size());
        for (size_t i = 0; i < direct.size(); ++i) {
            REQUIRE(coarse[i].instrument_id == direct[i].instrument_id);
            REQUIRE(coarse[i].interval_start_ms == direct[i].interval_start_ms);
            REQUIRE(coarse[i].open == direct[i].open);
            REQUIRE(coarse[i].high == direct[i].high);
            REQUIRE(coarse[i].low == direct[i].low);
            REQUIRE(coarse[i].close == direct[i].close);
            REQUIRE(coarse[i].volume == direct[i].volume);
        }
    }

    SECTION("Merged volume overflow drops the coarse bar") {
        const int64_t huge = 6000000000000000000LL;
        std::vector<Bar> fine = {
            {"X", kOpen, 100.0, 100.0, 100.0, 100.0, huge},
            {"X", kOpen + 5000, 101.0, 101.0, 101.0, 101.0, huge}
        };
        REQUIRE(BarBuilder(60).resample_bars(fine).empty());
        REQUIRE_THROWS_AS(BarBuilder(60, MalformedPolicy::FailFast).resample_bars(fine), MalformedTickError);
    }
}
