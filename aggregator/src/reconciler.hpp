#pragma once

#include "tick.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// One row of the authoritative end-of-day snapshot, before identity
// normalization.
struct ReferenceRow {
    int64_t interval_start_ms;
    std::string symbol;
    std::string series;
    std::optional<double> open;
    std::optional<double> high;
    std::optional<double> low;
    std::optional<double> close;
    std::optional<int64_t> volume;
};

// Volumes compare as integers, prices as doubles
template <typename T>
struct MismatchRow {
    int64_t interval_start_ms;
    std::string instrument_id;
    std::optional<T> reference_value;
    std::optional<T> computed_value;
};

template <typename T>
struct MismatchTable {
    std::string reference_column;
    std::string computed_column;
    std::vector<MismatchRow<T>> rows;

    // [header, row...] with nulls for absent sides
    nlohmann::json to_json() const {
        auto nullable = [](const std::optional<T>& v) -> nlohmann::json {
            if (!v) return nullptr;
            return *v;
        };
        nlohmann::json rows_json = nlohmann::json::array();
        rows_json.push_back({"interval_start", "instrument_id", reference_column, computed_column});
        for (const auto& r : rows) {
            rows_json.push_back({util::format_timestamp(r.interval_start_ms), r.instrument_id,
                                 nullable(r.reference_value), nullable(r.computed_value)});
        }
        return rows_json;
    }
};

struct MismatchReport {
    int64_t row_count_difference = 0;
    size_t unmapped_reference_rows = 0;
    std::optional<MismatchTable<int64_t>> volume_mismatch;
    std::optional<MismatchTable<double>> high_mismatch;
    std::optional<MismatchTable<double>> low_mismatch;

    bool clean() const;
    nlohmann::json to_json() const;
};

class Reconciler {
public:
    // "EQ" keeps the bare symbol, any other series gets a two letter suffix:
    // ("TCS", "FUTIDX") -> "TCS.FU". Throws IdentityNormalizationError.
    static std::string normalize_instrument_id(const std::string& symbol, const std::string& series);

    static MismatchReport reconcile(const std::vector<ReferenceRow>& reference,
                                    const std::vector<Bar>& computed);
};
