#pragma once

// Graph Explorer - Chart Request
// Renderer-neutral description of one chart: what to draw, in which style and
// color, with which labels. A presentation layer draws it as is.

#include "color_palette.h"
#include "types.h"

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gex {

// How a series is drawn.
enum class Series_style : int
{
    DOTS,
    LINE,
    MARKER  // single emphasized "X" marker
};

// -----------------------------------------------------------------------------
// chart_series_t
// -----------------------------------------------------------------------------
struct chart_series_t
{
    std::string  label;
    Series_style style = Series_style::DOTS;
    glm::vec4    color = glm::vec4(0.12f, 0.47f, 0.71f, 1.0f);
    float        size  = 50.0f;  ///< marker area for DOTS and MARKER, width for LINE

    std::vector<glm::dvec2>  points;
    std::vector<std::string> annotations;  ///< empty, or one per point
};

// -----------------------------------------------------------------------------
// chart_request_t
// -----------------------------------------------------------------------------
struct chart_request_t
{
    std::string title;
    std::string subtitle;
    std::string status;
    std::string x_label = "x";
    std::string y_label = "y";

    std::vector<chart_series_t> series;

    // Null when no series carries the label.
    const chart_series_t* find(std::string_view label) const
    {
        for (const auto& s : series) {
            if (s.label == label) {
                return &s;
            }
        }
        return nullptr;
    }
};

// -----------------------------------------------------------------------------
// Series_builder: named-parameter helper for chart_series_t
// -----------------------------------------------------------------------------
class Series_builder
{
public:
    explicit Series_builder(std::string label)
    {
        m_series.label = std::move(label);
    }

    Series_builder& style(Series_style s)
    {
        m_series.style = s;
        return *this;
    }

    Series_builder& color(const glm::vec4& c)
    {
        m_series.color = c;
        return *this;
    }

    Series_builder& size(float v)
    {
        m_series.size = v;
        return *this;
    }

    Series_builder& point(const glm::dvec2& p)
    {
        m_series.points.push_back(p);
        return *this;
    }

    Series_builder& points(const std::vector<double>& x, const std::vector<double>& y)
    {
        const std::size_t n = std::min(x.size(), y.size());
        m_series.points.reserve(m_series.points.size() + n);
        for (std::size_t i = 0; i < n; ++i) {
            m_series.points.emplace_back(x[i], y[i]);
        }
        return *this;
    }

    Series_builder& annotation(std::string text)
    {
        m_series.annotations.push_back(std::move(text));
        return *this;
    }

    chart_series_t build() const { return m_series; }

private:
    chart_series_t m_series;
};

// Labels used for the series of an analyzed chart.
constexpr const char* k_label_data_points   = "Data points";
constexpr const char* k_label_fit_line      = "Best fit line";
constexpr const char* k_label_g_point       = "G Point";
constexpr const char* k_label_random_points = "Random points";

// Status line shown before the first chart.
constexpr const char* k_initial_status = "G Point: —    |    Slope at G: —";

// "G=(Gx, Gy)   |   slope at G=m", 4 significant digits; the slope part is
// omitted when it is NaN.
std::string format_subtitle(const Analysis_result& result);

// "G Point: (Gx, Gy)    |    Slope at G: m", 6 significant digits.
std::string format_status(const Analysis_result& result);

// Scatter of the samples, best fit line (when fitted), G marker, annotated
// random points (when any).
chart_request_t build_chart(
    const Analysis_result& result,
    std::string_view title_info,
    const Chart_palette& palette = Chart_palette::make_default());

} // namespace gex
