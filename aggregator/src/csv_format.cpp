#include "csv_format.hpp"
#include "util.hpp"
#include <fmt/format.h>

std::string CsvFormat::snapshot_header() {
    return "instrument_id,interval_start,last_price,last_qty_total,"
           "buy_price,buy_qty,sell_price,sell_qty,open_interest\n";
}

std::string CsvFormat::snapshot_row(const ResampledSnapshot& s) {
    return fmt::format("{},{},{},{},{},{},{},{},{}\n",
                       s.instrument_id, util::format_timestamp(s.interval_start_ms),
                       s.last_price, s.last_qty_total,
                       s.buy_price, s.buy_qty, s.sell_price, s.sell_qty,
                       s.open_interest);
}

std::string CsvFormat::bar_header() {
    return "instrument_id,interval_start,open,high,low,close,volume\n";
}

std::string CsvFormat::bar_row(const Bar& b) {
    return fmt::format("{},{},{},{},{},{},{}\n",
                       b.instrument_id, util::format_timestamp(b.interval_start_ms),
                       b.open, b.high, b.low, b.close, b.volume);
}

std::string CsvFormat::render(const std::vector<ResampledSnapshot>& rows) {
    std::string out = snapshot_header();
    for (const auto& s : rows) {
        out += snapshot_row(s);
    }
    return out;
}

std::string CsvFormat::render(const std::vector<Bar>& rows) {
    std::string out = bar_header();
    for (const auto& b : rows) {
        out += bar_row(b);
    }
    return out;
}
