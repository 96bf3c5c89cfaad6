#pragma once

// Graph Explorer - Curve Analyzer
// Centroid, regression fit, windowed local slope and highlighted samples for
// one draw request.

#include "analysis_config.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace gex {

// -----------------------------------------------------------------------------
// Sample_picker: uniform choice of distinct indices
// -----------------------------------------------------------------------------
class Sample_picker
{
public:
    // Seeded from std::random_device; reruns differ.
    Sample_picker();
    explicit Sample_picker(std::uint64_t seed);

    // min(count, n) distinct indices in [0, n), uniformly without replacement,
    // in the order they were drawn.
    std::vector<std::size_t> pick(std::size_t n, std::size_t count);

private:
    std::mt19937_64 m_rng;
};

// -----------------------------------------------------------------------------
// Curve_analyzer
// -----------------------------------------------------------------------------
// Apart from the highlighted samples every field of the result is a pure
// function of the input.
class Curve_analyzer
{
public:
    Curve_analyzer();
    explicit Curve_analyzer(Analysis_config config);

    // Throws Shape_mismatch_error when x and y differ in length and
    // Empty_data_error when no finite (x, y) pair remains.
    Analysis_result analyze(
        const std::vector<double>& x,
        const std::vector<double>& y,
        Input_mode mode);

    Analysis_result analyze(const Sample_set& samples, Input_mode mode)
    {
        return analyze(samples.x, samples.y, mode);
    }

    const Analysis_config& config() const { return m_config; }

private:
    Analysis_config m_config;
    Sample_picker   m_picker;
};

// Keeps the pairs where both x and y are finite, in their original order.
Sample_set filter_finite(const std::vector<double>& x, const std::vector<double>& y);

// Stable sort of the pairs by ascending x.
Sample_set sort_by_x(const Sample_set& samples);

// Slope of a least-squares line through the samples around x0: `window`
// neighbors on each side of the sample nearest to x0, the whole set when that
// window has fewer than 2 distinct x values. NaN when the slope is undefined.
// Input need not be sorted; non-finite pairs are ignored.
double slope_at_point(
    const std::vector<double>& x,
    const std::vector<double>& y,
    double x0,
    std::size_t window = 3);

} // namespace gex
