#pragma once

// Graph Explorer - Graph Session
// The boundary a presentation layer talks to. Each draw request runs the
// whole evaluate -> analyze -> build pipeline synchronously. Failures are
// reported as a single message and leave the previous chart in place.

#include "analysis_config.h"
#include "chart.h"
#include "color_palette.h"
#include "curve_analyzer.h"
#include "domain.h"
#include "expression.h"
#include "point_table.h"
#include "types.h"

#include <optional>
#include <string>
#include <vector>

namespace gex {

struct draw_result_t
{
    bool        ok = false;
    std::string message;  ///< user-facing error text, empty on success

    explicit operator bool() const { return ok; }
};

// Free-text fields of the equation form.
struct equation_input_t
{
    std::string expression = "sin(x) + 0.5*x";
    std::string x_min      = "-10";
    std::string x_max      = "10";
    std::string points     = "400";
};

class Graph_session
{
public:
    Graph_session();
    explicit Graph_session(Analysis_config config, Chart_palette palette = Chart_palette::make_default());

    // Point mode from editor rows.
    draw_result_t draw_points(const std::vector<point_row_t>& rows);

    // Point mode from numeric samples.
    draw_result_t draw_samples(const Sample_set& samples);

    // Equation mode from the form fields.
    draw_result_t draw_equation(const equation_input_t& input);

    // Equation mode from an already parsed domain.
    draw_result_t draw_equation(const std::string& expression, const Domain_spec& domain);

    const std::optional<chart_request_t>& last_chart()  const { return m_chart;  }
    const std::optional<Analysis_result>& last_result() const { return m_result; }

    // Status line of the current chart, or the placeholder before the first.
    std::string status() const;

    const Analysis_config& config() const { return m_config; }

private:
    struct drawn_t
    {
        Analysis_result result;
        chart_request_t chart;
    };

    template<typename Fn>
    draw_result_t run(const char* what, Fn&& draw);

    drawn_t analyze_points(const Sample_set& samples);
    drawn_t analyze_equation(const std::string& expression, const Domain_spec& domain);

    Analysis_config      m_config;
    Chart_palette        m_palette;
    Curve_analyzer       m_analyzer;
    Expression_evaluator m_evaluator;

    std::optional<chart_request_t> m_chart;
    std::optional<Analysis_result> m_result;
};

} // namespace gex
