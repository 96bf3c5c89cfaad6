#include <gex/core/curve_analyzer.h>

#include <gex/core/algo.h>
#include <gex/core/errors.h>
#include <gex/core/linear_fit.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <span>
#include <string>
#include <utility>

namespace gex {
namespace {

// Which samples the local slope is fitted to.
enum class Slope_window
{
    EXACT,      // window around the nearest sample
    FULL,       // the window was degenerate, widen to every sample
    UNDEFINED   // fewer than 2 distinct x values overall
};

double undefined_slope()
{
    return std::numeric_limits<double>::quiet_NaN();
}

std::uint64_t nondeterministic_seed()
{
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
}

} // namespace

// =============================================================================
// Sample_picker
// =============================================================================

Sample_picker::Sample_picker()
:
    m_rng(nondeterministic_seed())
{}

Sample_picker::Sample_picker(std::uint64_t seed)
:
    m_rng(seed)
{}

std::vector<std::size_t> Sample_picker::pick(std::size_t n, std::size_t count)
{
    const std::size_t k = std::min(n, count);

    std::vector<std::size_t> pool(n);
    std::iota(pool.begin(), pool.end(), std::size_t{0});

    // Partial Fisher-Yates: the first k slots end up as the draw.
    for (std::size_t i = 0; i < k; ++i) {
        std::uniform_int_distribution<std::size_t> dist(i, n - 1);
        std::swap(pool[i], pool[dist(m_rng)]);
    }
    pool.resize(k);
    return pool;
}

// =============================================================================
// Free functions
// =============================================================================

Sample_set filter_finite(const std::vector<double>& x, const std::vector<double>& y)
{
    const std::size_t n = std::min(x.size(), y.size());

    Sample_set out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (std::isfinite(x[i]) && std::isfinite(y[i])) {
            out.push_back(sample_t(x[i], y[i]));
        }
    }
    return out;
}

Sample_set sort_by_x(const Sample_set& samples)
{
    const auto order = detail::stable_argsort(samples.x);
    return Sample_set(detail::permute(samples.x, order), detail::permute(samples.y, order));
}

double slope_at_point(
    const std::vector<double>& x,
    const std::vector<double>& y,
    double x0,
    std::size_t window)
{
    if (x.size() != y.size() || !std::isfinite(x0)) {
        return undefined_slope();
    }

    const Sample_set sorted = sort_by_x(filter_finite(x, y));
    const std::size_t n = sorted.size();
    if (n < 2) {
        return undefined_slope();
    }

    const std::size_t idx = detail::nearest_index(sorted.x, x0);
    std::size_t lo = idx >= window ? idx - window : 0;
    std::size_t hi = std::min(n, idx + window + 1);

    Slope_window stage = Slope_window::EXACT;
    if (detail::count_distinct(sorted.x.begin() + lo, sorted.x.begin() + hi) < 2) {
        stage = detail::count_distinct(sorted.x) >= 2 ? Slope_window::FULL : Slope_window::UNDEFINED;
    }

    switch (stage) {
        case Slope_window::EXACT:
            break;
        case Slope_window::FULL:
            lo = 0;
            hi = n;
            break;
        case Slope_window::UNDEFINED:
            return undefined_slope();
    }

    const std::span<const double> xs(sorted.x.data() + lo, hi - lo);
    const std::span<const double> ys(sorted.y.data() + lo, hi - lo);
    const auto fit = fit_line(xs, ys);
    return fit ? fit->slope : undefined_slope();
}

// =============================================================================
// Curve_analyzer
// =============================================================================

Curve_analyzer::Curve_analyzer()
:
    Curve_analyzer(Analysis_config::make_default())
{}

Curve_analyzer::Curve_analyzer(Analysis_config config)
:
    m_config(std::move(config)),
    m_picker(m_config.seed ? Sample_picker(*m_config.seed) : Sample_picker())
{}

Analysis_result Curve_analyzer::analyze(
    const std::vector<double>& x,
    const std::vector<double>& y,
    Input_mode mode)
{
    GEX_PROFILE_SCOPE(m_config.profiler.get(), "Curve_analyzer::analyze");

    if (x.size() != y.size()) {
        throw Shape_mismatch_error(
            "x and y must have the same length (" + std::to_string(x.size()) +
            " vs " + std::to_string(y.size()) + ").");
    }

    Analysis_result result;
    result.mode = mode;
    result.samples = sort_by_x(filter_finite(x, y));

    const std::size_t n = result.samples.size();
    if (n == 0) {
        throw Empty_data_error("No valid finite data to plot.");
    }
    if (n != x.size()) {
        m_config.debug("analyze: dropped " + std::to_string(x.size() - n) + " non-finite samples");
    }

    const std::vector<double>& xs = result.samples.x;
    const std::vector<double>& ys = result.samples.y;

    if (mode == Input_mode::POINTS && n >= 2) {
        result.fit = fit_line(xs, ys);
        if (result.fit) {
            result.fitted_y = polyval(*result.fit, xs);
        }
        else {
            m_config.debug("analyze: regression line undefined, using local slope");
        }
    }

    result.centroid = glm::dvec2(detail::mean(xs), detail::mean(ys));

    // Slope at G: the line's own slope when a global fit exists.
    if (result.fit) {
        result.slope_at_centroid = result.fit->slope;
    }
    else {
        result.slope_at_centroid = slope_at_point(xs, ys, result.centroid.x, m_config.slope_window);
    }

    if (n >= 2) {
        result.highlighted_indices = m_picker.pick(n, m_config.highlight_count);
        for (std::size_t i : result.highlighted_indices) {
            result.highlighted.push_back(result.samples.at(i));
        }
    }

    m_config.debug(
        "analyze: mode=" + std::string(to_string(mode)) +
        " n=" + std::to_string(n) +
        " G=" + format_point(result.centroid.x, result.centroid.y, 6) +
        " slope=" + format_significant(result.slope_at_centroid, 6));

    return result;
}

} // namespace gex
