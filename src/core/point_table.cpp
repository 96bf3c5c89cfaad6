#include <gex/core/point_table.h>

#include <gex/core/errors.h>

#include "text_utils.h"

#include <optional>
#include <string_view>

namespace gex {

Sample_set parse_point_rows(const std::vector<point_row_t>& rows)
{
    Sample_set out;
    out.reserve(rows.size());

    for (const auto& row : rows) {
        const std::string_view sx = trim(row.x);
        const std::string_view sy = trim(row.y);

        if (sx.empty() && sy.empty()) {
            continue;
        }
        if (sx.empty() || sy.empty()) {
            throw Input_error("Each row must have both x and y values.");
        }

        const std::optional<double> xv = parse_double(sx);
        const std::optional<double> yv = parse_double(sy);
        if (!xv || !yv) {
            throw Input_error(
                "Invalid number: x='" + std::string(sx) + "', y='" + std::string(sy) + "'");
        }
        out.push_back(sample_t(*xv, *yv));
    }

    if (out.empty()) {
        throw Empty_data_error("Please enter at least one (x, y) pair.");
    }
    return out;
}

std::vector<point_row_t> sample_point_rows()
{
    std::vector<point_row_t> rows;
    for (int x = -2; x <= 2; ++x) {
        rows.push_back({std::to_string(x), std::to_string(x * x)});
    }
    rows.push_back({"", ""});
    return rows;
}

} // namespace gex
