#pragma once

#include "tick.hpp"
#include <string>
#include <vector>

// Row renderers for the streaming endpoints. Column order is part of the
// external contract.
class CsvFormat {
public:
    static std::string snapshot_header();
    static std::string snapshot_row(const ResampledSnapshot& s);

    static std::string bar_header();
    static std::string bar_row(const Bar& b);

    // Whole document, header included
    static std::string render(const std::vector<ResampledSnapshot>& rows);
    static std::string render(const std::vector<Bar>& rows);
};
