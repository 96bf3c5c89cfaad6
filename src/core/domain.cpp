#include <gex/core/domain.h>

#include <gex/core/errors.h>

#include "text_utils.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

namespace gex {

void Domain_spec::validate(int min_point_count) const
{
    if (!std::isfinite(x_min) || !std::isfinite(x_max)) {
        throw Domain_error("x min and x max must be finite.");
    }
    if (!(x_max > x_min)) {
        throw Domain_error("x max must be greater than x min.");
    }
    // Two points are the least a range can be sampled with.
    const int required = std::max(2, min_point_count);
    if (point_count < required) {
        throw Domain_error("Use at least " + std::to_string(required) +
                           " points for a meaningful curve.");
    }
    if (point_count > k_max_point_count) {
        throw Domain_error("Use at most " + std::to_string(k_max_point_count) + " points.");
    }
}

std::vector<double> Domain_spec::linspace(int min_point_count) const
{
    validate(min_point_count);

    const auto n = static_cast<std::size_t>(point_count);
    std::vector<double> xs;
    xs.reserve(n);

    const double step = (x_max - x_min) / static_cast<double>(n - 1);
    for (std::size_t i = 0; i < n; ++i) {
        xs.push_back(x_min + static_cast<double>(i) * step);
    }
    // Accumulated rounding must not move the end point.
    xs.back() = x_max;
    return xs;
}

Domain_spec parse_domain(
    std::string_view x_min_text,
    std::string_view x_max_text,
    std::string_view point_count_text,
    int min_point_count)
{
    const std::optional<double> x_min = parse_double(x_min_text);
    const std::optional<double> x_max = parse_double(x_max_text);
    const std::optional<double> count = parse_double(point_count_text);

    if (!x_min || !x_max || !count || !std::isfinite(*count)) {
        throw Domain_error("x-range and points must be numeric.");
    }

    // Reject before the int conversion can overflow.
    const double truncated = std::trunc(*count);
    if (truncated > static_cast<double>(k_max_point_count)) {
        throw Domain_error("Use at most " + std::to_string(k_max_point_count) + " points.");
    }

    Domain_spec domain;
    domain.x_min = *x_min;
    domain.x_max = *x_max;
    domain.point_count = static_cast<int>(std::max(truncated, -1.0));
    domain.validate(min_point_count);
    return domain;
}

} // namespace gex
