#pragma once

// Graph Explorer - Point Table
// Free-text (x, y) rows as typed into a point-entry editor.

#include "types.h"

#include <string>
#include <vector>

namespace gex {

struct point_row_t
{
    std::string x;
    std::string y;
};

// Rows with both fields blank are skipped. Throws Input_error for a row with
// only one field filled or a non-numeric field, Empty_data_error when no
// row carries data.
Sample_set parse_point_rows(const std::vector<point_row_t>& rows);

// y = x^2 for x in -2..2, followed by one blank row.
std::vector<point_row_t> sample_point_rows();

} // namespace gex
