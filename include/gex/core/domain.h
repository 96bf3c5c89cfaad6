#pragma once

// Graph Explorer - Domain
// The x range an equation is sampled over.

#include <string_view>
#include <vector>

namespace gex {

constexpr int k_min_point_count = 10;
constexpr int k_max_point_count = 1000000;

// -----------------------------------------------------------------------------
// Domain_spec: [x_min, x_max] sampled at point_count evenly spaced x values
// -----------------------------------------------------------------------------
struct Domain_spec
{
    double x_min       = -10.0;
    double x_max       = 10.0;
    int    point_count = 400;

    // Throws Domain_error when the range is empty or not finite, or when the
    // point count is outside [min_point_count, k_max_point_count].
    void validate(int min_point_count = k_min_point_count) const;

    // Evenly spaced values from x_min to x_max inclusive. Validates first.
    std::vector<double> linspace(int min_point_count = k_min_point_count) const;
};

// Parses the three free-text range fields. The point count is read as a
// number and truncated toward zero ("400.7" is 400). Throws Domain_error on
// non-numeric text or an invalid result.
Domain_spec parse_domain(
    std::string_view x_min_text,
    std::string_view x_max_text,
    std::string_view point_count_text,
    int min_point_count = k_min_point_count);

} // namespace gex
