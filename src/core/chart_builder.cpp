#include <gex/core/chart.h>

#include <gex/core/algo.h>

#include <cstddef>

namespace gex {
namespace {

constexpr int k_title_digits      = 4;
constexpr int k_status_digits     = 6;
constexpr int k_annotation_digits = 3;

constexpr float k_data_point_size   = 50.0f;
constexpr float k_fit_line_width    = 2.0f;
constexpr float k_g_point_size      = 90.0f;
constexpr float k_random_point_size = 60.0f;

} // namespace

std::string format_subtitle(const Analysis_result& result)
{
    std::string s = "G=" + format_point(result.centroid.x, result.centroid.y, k_title_digits);
    if (result.has_slope()) {
        s += "   |   slope at G=" + format_significant(result.slope_at_centroid, k_title_digits);
    }
    return s;
}

std::string format_status(const Analysis_result& result)
{
    const std::string slope = result.has_slope()
        ? format_significant(result.slope_at_centroid, k_status_digits)
        : std::string("—");

    return "G Point: " + format_point(result.centroid.x, result.centroid.y, k_status_digits) +
           "    |    Slope at G: " + slope;
}

chart_request_t build_chart(
    const Analysis_result& result,
    std::string_view title_info,
    const Chart_palette& palette)
{
    chart_request_t chart;
    chart.subtitle = format_subtitle(result);
    chart.title = title_info.empty()
        ? chart.subtitle
        : std::string(title_info) + "\n" + chart.subtitle;
    chart.status = format_status(result);

    chart.series.push_back(
        Series_builder(k_label_data_points)
            .style(Series_style::DOTS)
            .color(palette.data_points)
            .size(k_data_point_size)
            .points(result.samples.x, result.samples.y)
            .build());

    if (result.fit && !result.fitted_y.empty()) {
        chart.series.push_back(
            Series_builder(k_label_fit_line)
                .style(Series_style::LINE)
                .color(palette.fit_line)
                .size(k_fit_line_width)
                .points(result.samples.x, result.fitted_y)
                .build());
    }

    chart.series.push_back(
        Series_builder(k_label_g_point)
            .style(Series_style::MARKER)
            .color(palette.g_point)
            .size(k_g_point_size)
            .point(result.centroid)
            .build());

    if (!result.highlighted.empty()) {
        Series_builder random(k_label_random_points);
        random.style(Series_style::DOTS)
            .color(palette.random_points)
            .size(k_random_point_size);
        for (const auto& s : result.highlighted) {
            random.point(s.to_vec2())
                .annotation(format_point(s.x, s.y, k_annotation_digits));
        }
        chart.series.push_back(random.build());
    }

    return chart;
}

} // namespace gex
