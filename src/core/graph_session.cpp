#include <gex/core/graph_session.h>

#include <gex/core/domain.h>
#include <gex/core/errors.h>

#include "text_utils.h"

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace gex {

Graph_session::Graph_session()
:
    Graph_session(Analysis_config::make_default())
{}

Graph_session::Graph_session(Analysis_config config, Chart_palette palette)
:
    m_config(std::move(config)),
    m_palette(palette),
    m_analyzer(m_config)
{}

template<typename Fn>
draw_result_t Graph_session::run(const char* what, Fn&& draw)
{
    GEX_PROFILE_SCOPE(m_config.profiler.get(), what);

    draw_result_t out;
    try {
        drawn_t drawn = draw();
        m_result = std::move(drawn.result);
        m_chart = std::move(drawn.chart);
        out.ok = true;
    }
    catch (const Graph_error& e) {
        m_config.error(std::string(what) + ": " + e.what());
        out.message = e.what();
    }
    catch (const std::exception& e) {
        m_config.error(std::string(what) + ": unexpected failure: " + e.what());
        out.message = e.what();
    }
    return out;
}

draw_result_t Graph_session::draw_points(const std::vector<point_row_t>& rows)
{
    return run("Graph_session::draw_points", [&] {
        return analyze_points(parse_point_rows(rows));
    });
}

draw_result_t Graph_session::draw_samples(const Sample_set& samples)
{
    return run("Graph_session::draw_samples", [&] {
        return analyze_points(samples);
    });
}

draw_result_t Graph_session::draw_equation(const equation_input_t& input)
{
    return run("Graph_session::draw_equation", [&] {
        if (is_blank(input.expression)) {
            throw Expression_error("Please enter an equation for y in terms of x.");
        }
        const Domain_spec domain = parse_domain(
            input.x_min, input.x_max, input.points, m_config.min_point_count);
        return analyze_equation(input.expression, domain);
    });
}

draw_result_t Graph_session::draw_equation(const std::string& expression, const Domain_spec& domain)
{
    return run("Graph_session::draw_equation", [&] {
        if (is_blank(expression)) {
            throw Expression_error("Please enter an equation for y in terms of x.");
        }
        return analyze_equation(expression, domain);
    });
}

std::string Graph_session::status() const
{
    return m_chart ? m_chart->status : std::string(k_initial_status);
}

Graph_session::drawn_t Graph_session::analyze_points(const Sample_set& samples)
{
    if (samples.x.size() != samples.y.size()) {
        throw Shape_mismatch_error("x and y must have the same length.");
    }
    if (samples.size() < m_config.min_draw_points) {
        throw Empty_data_error("Please enter at least two points to draw a chart.");
    }
    m_config.debug("draw: points mode with " + std::to_string(samples.size()) + " samples");

    // Sorted for a sensible path through the points.
    const Sample_set sorted = sort_by_x(samples);

    drawn_t drawn;
    drawn.result = m_analyzer.analyze(sorted, Input_mode::POINTS);
    drawn.chart = build_chart(drawn.result, "From x, y values", m_palette);
    return drawn;
}

Graph_session::drawn_t Graph_session::analyze_equation(const std::string& expression, const Domain_spec& domain)
{
    // The domain is checked before anything is evaluated.
    const std::vector<double> x = domain.linspace(m_config.min_point_count);

    m_config.debug("draw: equation mode, '" + expression + "' over " +
                   std::to_string(domain.point_count) + " points");

    std::vector<double> y;
    {
        GEX_PROFILE_SCOPE(m_config.profiler.get(), "Expression_evaluator::evaluate");
        m_evaluator.set_expression(expression);
        y = m_evaluator.evaluate(x);
    }

    drawn_t drawn;
    drawn.result = m_analyzer.analyze(x, y, Input_mode::EQUATION);
    drawn.chart = build_chart(drawn.result, "y = " + m_evaluator.expression(), m_palette);
    return drawn;
}

} // namespace gex
