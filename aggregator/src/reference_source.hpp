#pragma once

#include "reconciler.hpp"
#include <istream>
#include <string>
#include <vector>

class ReferenceSource {
public:
    virtual ~ReferenceSource() = default;

    // All reference rows for one trading day. Throws
    // ReconciliationSourceUnavailable when the day's snapshot cannot be read.
    virtual std::vector<ReferenceRow> load(int64_t trade_date_ms) = 0;
};

// Reads the exchange end-of-day snapshot, already extracted to
// <dir>/EODSNAPSHOT_<DDMONYYYY>bhav.csv
class BhavcopySource final : public ReferenceSource {
public:
    explicit BhavcopySource(std::string directory);

    std::vector<ReferenceRow> load(int64_t trade_date_ms) override;

    static std::string file_name_for(int64_t trade_date_ms);
    static std::vector<ReferenceRow> parse_csv(std::istream& in, size_t* skipped_rows = nullptr);

private:
    std::string directory_;
};
