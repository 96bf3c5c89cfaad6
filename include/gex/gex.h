#pragma once
// Graph Explorer - Main Header
// Analysis core of a chart explorer: samples or a formula in, annotated chart
// description out.
//
// This library provides:
// - A sandboxed, vectorized expression evaluator (Expression_evaluator)
// - Least-squares line fitting and windowed local slope estimation
// - Centroid ("G Point") analysis of a sample set (Curve_analyzer)
// - A renderer-neutral chart description (chart_request_t)
// - A draw-request boundary with one error channel (Graph_session)
//
// Usage:
//   gex::Graph_session session;
//   gex::equation_input_t form;
//   form.expression = "sin(x) + 0.5*x";
//   if (auto r = session.draw_equation(form); !r) {
//       show_error(r.message);
//   }
//   draw(*session.last_chart());
#include <gex/core/types.h>
#include <gex/core/errors.h>
#include <gex/core/analysis_config.h>
#include <gex/core/algo.h>
#include <gex/core/expression.h>
#include <gex/core/domain.h>
#include <gex/core/linear_fit.h>
#include <gex/core/curve_analyzer.h>
#include <gex/core/point_table.h>
#include <gex/core/color_palette.h>
#include <gex/core/chart.h>
#include <gex/core/graph_session.h>

namespace gex {

// Library version
constexpr int k_version_major = 0;
constexpr int k_version_minor = 1;
constexpr int k_version_patch = 0;

constexpr const char* k_version_string = "0.1.0";

} // namespace gex
