#include "quality_check.hpp"
#include "bar_builder.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

QualityCheck::QualityCheck(TickStore& store, ReferenceSource& reference, MalformedPolicy policy)
    : store_(store), reference_(reference), policy_(policy) {}

MismatchReport QualityCheck::run(int64_t trade_date_ms) const {
    const auto day = util::format_date(trade_date_ms);

    auto reference_rows = reference_.load(trade_date_ms);

    std::vector<Tick> ticks;
    try {
        TickQuery query;
        query.range.first_day_ms = trade_date_ms;
        query.range.last_day_ms = trade_date_ms;
        ticks = store_.fetch_ticks_in_range(query);
    } catch (const StoreError& e) {
        throw ReconciliationSourceUnavailable("computed bars unavailable for " + day + ": " + e.what());
    }

    BarBuilder daily(86400, policy_);
    auto bars = daily.build_bars(ticks);

    auto report = Reconciler::reconcile(reference_rows, bars);
    spdlog::info("Quality check {}: {} reference rows, {} bars, row diff {}, clean={}",
                 day, reference_rows.size(), bars.size(), report.row_count_difference, report.clean());
    return report;
}
