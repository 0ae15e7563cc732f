#include "reference_source.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <utility>
#include <spdlog/spdlog.h>

BhavcopySource::BhavcopySource(std::string directory) : directory_(std::move(directory)) {}

std::string BhavcopySource::file_name_for(int64_t trade_date_ms) {
    return "EODSNAPSHOT_" + util::format_compact_date(trade_date_ms) + "bhav.csv";
}

std::vector<ReferenceRow> BhavcopySource::load(int64_t trade_date_ms) {
    auto path = std::filesystem::path(directory_) / file_name_for(trade_date_ms);
    std::ifstream in(path);
    if (!in) {
        throw ReconciliationSourceUnavailable("bhavcopy not found: " + path.string());
    }

    size_t skipped = 0;
    auto rows = parse_csv(in, &skipped);
    spdlog::info("Loaded {} bhavcopy rows from {} ({} skipped)", rows.size(), path.string(), skipped);
    return rows;
}

std::vector<ReferenceRow> BhavcopySource::parse_csv(std::istream& in, size_t* skipped_rows) {
    std::string line;
    if (!std::getline(in, line)) {
        throw ReconciliationSourceUnavailable("bhavcopy is empty");
    }

    std::map<std::string, size_t> columns;
    auto header = util::split_fields(line, ',');
    for (size_t i = 0; i < header.size(); ++i) {
        columns[util::to_upper(header[i])] = i;
    }

    for (const char* required : {"SYMBOL", "SERIES", "HIGH", "LOW", "TOTTRDQTY", "TIMESTAMP"}) {
        if (columns.find(required) == columns.end()) {
            throw ReconciliationSourceUnavailable(std::string("bhavcopy missing column ") + required);
        }
    }

    auto field = [&columns](const std::vector<std::string>& fields, const char* name) -> std::string {
        auto it = columns.find(name);
        if (it == columns.end() || it->second >= fields.size()) return "";
        return fields[it->second];
    };

    std::vector<ReferenceRow> rows;
    size_t skipped = 0;
    while (std::getline(in, line)) {
        if (util::trim(line).empty()) continue;
        auto fields = util::split_fields(line, ',');

        ReferenceRow row;
        try {
            row.interval_start_ms = util::parse_dmy_date(field(fields, "TIMESTAMP"));
        } catch (const std::invalid_argument& e) {
            spdlog::warn("Skipping bhavcopy row: {}", e.what());
            skipped++;
            continue;
        }
        row.symbol = field(fields, "SYMBOL");
        row.series = field(fields, "SERIES");
        row.open = util::parse_double(field(fields, "OPEN"));
        row.high = util::parse_double(field(fields, "HIGH"));
        row.low = util::parse_double(field(fields, "LOW"));
        row.close = util::parse_double(field(fields, "CLOSE"));
        row.volume = util::parse_int64(field(fields, "TOTTRDQTY"));
        rows.push_back(std::move(row));
    }

    if (skipped_rows) *skipped_rows = skipped;
    return rows;
}
