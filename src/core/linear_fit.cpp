#include <gex/core/linear_fit.h>

#include <gex/core/algo.h>

#include <cmath>
#include <cstddef>

namespace gex {

std::optional<line_fit_t> fit_line(std::span<const double> x, std::span<const double> y)
{
    const std::size_t n = x.size();
    if (n < 2 || y.size() != n) {
        return std::nullopt;
    }
    if (detail::count_distinct(x.begin(), x.end()) < 2) {
        return std::nullopt;
    }

    // Centered sums keep the normal equations well conditioned when x sits
    // far from the origin.
    double x_mean = 0.0;
    double y_mean = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        x_mean += x[i];
        y_mean += y[i];
    }
    x_mean /= static_cast<double>(n);
    y_mean /= static_cast<double>(n);

    double sxx = 0.0;
    double sxy = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double dx = x[i] - x_mean;
        sxx += dx * dx;
        sxy += dx * (y[i] - y_mean);
    }

    if (!(sxx > 0.0) || !std::isfinite(sxx)) {
        return std::nullopt;
    }

    line_fit_t fit;
    fit.slope = sxy / sxx;
    fit.intercept = y_mean - fit.slope * x_mean;

    if (!std::isfinite(fit.slope) || !std::isfinite(fit.intercept)) {
        return std::nullopt;
    }
    return fit;
}

std::vector<double> polyval(const line_fit_t& fit, std::span<const double> x)
{
    std::vector<double> out;
    out.reserve(x.size());
    for (double v : x) {
        out.push_back(fit.at(v));
    }
    return out;
}

} // namespace gex
