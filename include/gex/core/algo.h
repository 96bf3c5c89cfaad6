#pragma once

// Graph Explorer - Algorithm Utilities
// Small, header-only helpers for sample ordering, lookup and formatting.
// Pure C++ with no framework dependencies.
//
// Public API (gex):
//   - format_significant: "%g"-style number formatting for labels
//   - format_point: "(x, y)" with a given number of significant digits
//
// Internal API (gex::detail):
//   - Stable argsort and permutation
//   - Nearest-sample search on ascending data
//   - Distinct value counting, mean

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <numeric>
#include <string>
#include <vector>

namespace gex {

// =============================================================================
// Public API
// =============================================================================

// Format a value with at most `digits` significant digits, trailing zeros
// dropped, switching to exponent notation for very large or small magnitudes.
inline std::string format_significant(double v, int digits)
{
    const int precision = std::max(1, digits);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
    return buf;
}

inline std::string format_point(double x, double y, int digits)
{
    return "(" + format_significant(x, digits) + ", " + format_significant(y, digits) + ")";
}

// =============================================================================
// Internal Implementation Details
// =============================================================================

namespace detail {

// -----------------------------------------------------------------------------
// Ordering
// -----------------------------------------------------------------------------

// Indices that sort `values` ascending. Ties keep their original order.
inline std::vector<std::size_t> stable_argsort(const std::vector<double>& values)
{
    std::vector<std::size_t> order(values.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
        [&values](std::size_t a, std::size_t b) { return values[a] < values[b]; });
    return order;
}

inline std::vector<double> permute(const std::vector<double>& values, const std::vector<std::size_t>& order)
{
    std::vector<double> out;
    out.reserve(order.size());
    for (std::size_t i : order) {
        out.push_back(values[i]);
    }
    return out;
}

// -----------------------------------------------------------------------------
// Nearest Sample Search
// -----------------------------------------------------------------------------
// Assumes ascending order. Returns the index of the value closest to `target`;
// among equally close values the first one wins.
inline std::size_t nearest_index(const std::vector<double>& sorted, double target)
{
    if (sorted.empty()) {
        return 0;
    }

    const auto it = std::lower_bound(sorted.begin(), sorted.end(), target);
    std::size_t idx = static_cast<std::size_t>(it - sorted.begin());

    if (idx == sorted.size()) {
        idx = sorted.size() - 1;
    }
    else if (idx > 0 && std::abs(sorted[idx - 1] - target) <= std::abs(sorted[idx] - target)) {
        --idx;
    }

    // Walk back to the first of a run of equal values.
    while (idx > 0 && sorted[idx - 1] == sorted[idx]) {
        --idx;
    }
    return idx;
}

// -----------------------------------------------------------------------------
// Statistics
// -----------------------------------------------------------------------------

// Number of distinct values in [first, last). Works on unsorted input.
template<typename It>
std::size_t count_distinct(It first, It last)
{
    std::vector<double> values(first, last);
    std::sort(values.begin(), values.end());
    return static_cast<std::size_t>(std::unique(values.begin(), values.end()) - values.begin());
}

inline std::size_t count_distinct(const std::vector<double>& values)
{
    return count_distinct(values.begin(), values.end());
}

inline double mean(const std::vector<double>& values)
{
    if (values.empty()) {
        return std::nan("");
    }
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

} // namespace detail
} // namespace gex
