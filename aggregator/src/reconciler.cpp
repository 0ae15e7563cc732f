#include "reconciler.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <utility>
#include <spdlog/spdlog.h>

namespace {

struct JoinedRow {
    int64_t interval_start_ms;
    std::string instrument_id;
    std::optional<double> high_ref;
    std::optional<double> high_computed;
    std::optional<double> low_ref;
    std::optional<double> low_computed;
    std::optional<int64_t> volume_ref;
    std::optional<int64_t> volume_computed;
};

struct NormalizedRef {
    std::string instrument_id;
    const ReferenceRow* row;
};

using JoinKey = std::pair<int64_t, std::string>;

// Full outer join; duplicate keys on either side produce the cross product.
std::vector<JoinedRow> outer_join(const std::vector<NormalizedRef>& reference,
                                  const std::vector<Bar>& computed) {
    std::map<JoinKey, std::pair<std::vector<const ReferenceRow*>, std::vector<const Bar*>>> sides;
    for (const auto& r : reference) {
        sides[{r.row->interval_start_ms, r.instrument_id}].first.push_back(r.row);
    }
    for (const auto& b : computed) {
        sides[{b.interval_start_ms, b.instrument_id}].second.push_back(&b);
    }

    std::vector<JoinedRow> joined;
    for (const auto& entry : sides) {
        const JoinKey& key = entry.first;
        const auto& refs = entry.second.first;
        const auto& bars = entry.second.second;
        auto emit = [&](const ReferenceRow* r, const Bar* b) {
            JoinedRow j;
            j.interval_start_ms = key.first;
            j.instrument_id = key.second;
            if (r) {
                j.high_ref = r->high;
                j.low_ref = r->low;
                j.volume_ref = r->volume;
            }
            if (b) {
                j.high_computed = b->high;
                j.low_computed = b->low;
                j.volume_computed = b->volume;
            }
            joined.push_back(std::move(j));
        };

        if (refs.empty()) {
            for (const auto* b : bars) emit(nullptr, b);
        } else if (bars.empty()) {
            for (const auto* r : refs) emit(r, nullptr);
        } else {
            for (const auto* r : refs) {
                for (const auto* b : bars) emit(r, b);
            }
        }
    }
    return joined;
}

template <typename T>
std::optional<MismatchTable<T>> finish(MismatchTable<T> table) {
    if (table.rows.empty()) return std::nullopt;
    return table;
}

} // namespace

std::string Reconciler::normalize_instrument_id(const std::string& symbol, const std::string& series) {
    if (symbol.empty()) {
        throw IdentityNormalizationError("reference row has no symbol");
    }
    if (series.empty()) {
        throw IdentityNormalizationError("reference row for " + symbol + " has no series");
    }
    if (series == "EQ") {
        return symbol;
    }
    std::string suffix = series.substr(0, 2);
    std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return symbol + "." + suffix;
}

MismatchReport Reconciler::reconcile(const std::vector<ReferenceRow>& reference,
                                     const std::vector<Bar>& computed) {
    MismatchReport report;

    std::vector<NormalizedRef> mapped;
    mapped.reserve(reference.size());
    for (const auto& row : reference) {
        try {
            mapped.push_back({normalize_instrument_id(row.symbol, row.series), &row});
        } catch (const IdentityNormalizationError& e) {
            spdlog::warn("Excluding reference row: {}", e.what());
            report.unmapped_reference_rows++;
        }
    }

    report.row_count_difference =
        static_cast<int64_t>(mapped.size()) - static_cast<int64_t>(computed.size());

    MismatchTable<int64_t> volume{"reference_volume", "computed_volume", {}};
    MismatchTable<double> high{"reference_high", "computed_high", {}};
    MismatchTable<double> low{"reference_low", "computed_low", {}};

    // Joined rows come out of the ordered map already sorted by
    // (interval_start, instrument_id)
    for (const auto& j : outer_join(mapped, computed)) {
        // null vs null is not a mismatch, null vs value is
        if (j.volume_ref != j.volume_computed) {
            volume.rows.push_back({j.interval_start_ms, j.instrument_id, j.volume_ref, j.volume_computed});
        }
        if (j.high_ref && j.high_computed && *j.high_ref < *j.high_computed) {
            high.rows.push_back({j.interval_start_ms, j.instrument_id, j.high_ref, j.high_computed});
        }
        if (j.low_ref && j.low_computed && *j.low_ref > *j.low_computed) {
            low.rows.push_back({j.interval_start_ms, j.instrument_id, j.low_ref, j.low_computed});
        }
    }

    report.volume_mismatch = finish(std::move(volume));
    report.high_mismatch = finish(std::move(high));
    report.low_mismatch = finish(std::move(low));
    return report;
}

bool MismatchReport::clean() const {
    return row_count_difference == 0 && unmapped_reference_rows == 0 &&
           !volume_mismatch && !high_mismatch && !low_mismatch;
}

nlohmann::json MismatchReport::to_json() const {
    auto table = [](const auto& t) -> nlohmann::json {
        if (!t) return nullptr;
        return t->to_json();
    };
    return {
        {"row_count_difference", row_count_difference},
        {"unmapped_reference_rows", unmapped_reference_rows},
        {"volume_mismatch", table(volume_mismatch)},
        {"high_mismatch", table(high_mismatch)},
        {"low_mismatch", table(low_mismatch)}
    };
}
