#pragma once
// Graph Explorer - Core Types
// Renderer-neutral types shared by the evaluator, analyzer and chart builder.
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <glm/vec2.hpp>

namespace gex {

// -----------------------------------------------------------------------------
// Input Mode
// -----------------------------------------------------------------------------
// The two mutually exclusive input shapes a draw request can carry.
enum class Input_mode
{
    // Discrete (x, y) samples entered by the user; a global regression line
    // is fitted.
    POINTS,
    // y = f(x) evaluated over a generated domain; no global fit is assumed.
    EQUATION
};

inline const char* to_string(Input_mode mode)
{
    return mode == Input_mode::POINTS ? "points" : "equation";
}

// -----------------------------------------------------------------------------
// sample_t: one (x, y) pair
// -----------------------------------------------------------------------------
struct sample_t
{
    double x = 0.0;
    double y = 0.0;

    sample_t() = default;
    sample_t(double x_, double y_) : x(x_), y(y_) {}

    bool is_finite() const { return std::isfinite(x) && std::isfinite(y); }

    glm::dvec2 to_vec2() const { return glm::dvec2(x, y); }
};

// -----------------------------------------------------------------------------
// Sample_set: x and y as parallel arrays
// -----------------------------------------------------------------------------
// Kept column-wise since the evaluator produces y for a whole x vector at once.
struct Sample_set
{
    std::vector<double> x;
    std::vector<double> y;

    Sample_set() = default;
    Sample_set(std::vector<double> xs, std::vector<double> ys)
        : x(std::move(xs))
        , y(std::move(ys))
    {}

    std::size_t size() const { return x.size(); }
    bool empty() const { return x.empty(); }

    sample_t at(std::size_t i) const { return sample_t(x[i], y[i]); }

    void push_back(const sample_t& s)
    {
        x.push_back(s.x);
        y.push_back(s.y);
    }

    void reserve(std::size_t n)
    {
        x.reserve(n);
        y.reserve(n);
    }
};

// -----------------------------------------------------------------------------
// line_fit_t: y = slope * x + intercept
// -----------------------------------------------------------------------------
struct line_fit_t
{
    double slope     = 0.0;
    double intercept = 0.0;

    double at(double x) const { return slope * x + intercept; }
};

// -----------------------------------------------------------------------------
// Analysis_result
// -----------------------------------------------------------------------------
// Produced fresh for every draw request and consumed once by the chart builder.
struct Analysis_result
{
    Input_mode mode = Input_mode::POINTS;

    // Finite samples sorted by ascending x (stable).
    Sample_set samples;

    glm::dvec2 centroid{0.0, 0.0};

    // Regression slope when a global fit was computed, else the windowed local
    // estimate. NaN when undefined.
    double slope_at_centroid = std::nan("");

    std::optional<line_fit_t> fit;

    // Fit evaluated at samples.x; empty when there is no fit.
    std::vector<double> fitted_y;

    std::vector<std::size_t> highlighted_indices;
    std::vector<sample_t>    highlighted;

    bool has_slope() const { return !std::isnan(slope_at_centroid); }
};

} // namespace gex
