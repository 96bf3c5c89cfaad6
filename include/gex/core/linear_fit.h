#pragma once

// Graph Explorer - Linear Fit
// Ordinary least squares fit of a degree-1 polynomial.

#include "types.h"

#include <optional>
#include <span>
#include <vector>

namespace gex {

// Fits y = slope * x + intercept. Returns nullopt when the fit is undefined:
// fewer than 2 points, mismatched lengths, fewer than 2 distinct x values,
// or a non-finite result.
std::optional<line_fit_t> fit_line(std::span<const double> x, std::span<const double> y);

// Evaluates the line at every x.
std::vector<double> polyval(const line_fit_t& fit, std::span<const double> x);

} // namespace gex
