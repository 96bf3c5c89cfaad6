// gex curve analyzer tests

#include <gex/core/curve_analyzer.h>
#include <gex/core/errors.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " (line " << __LINE__ << ")" << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_fn) \
    do { \
        std::cout << "Running " << #test_fn << "... "; \
        if (test_fn()) { \
            std::cout << "OK" << std::endl; \
            ++passed; \
        } else { \
            std::cout << "FAIL" << std::endl; \
            ++failed; \
        } \
    } while (0)

template<typename Error, typename Fn>
bool throws(Fn&& fn)
{
    try {
        fn();
    }
    catch (const Error&) {
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "  unexpected exception: " << e.what() << std::endl;
        return false;
    }
    return false;
}

const double k_nan = std::numeric_limits<double>::quiet_NaN();
const double k_inf = std::numeric_limits<double>::infinity();

const std::vector<double> k_px = {-2.0, -1.0, 0.0, 1.0, 2.0};
const std::vector<double> k_py = {4.0, 1.0, 0.0, 1.0, 4.0};

gex::Analysis_config seeded(std::uint64_t seed)
{
    auto cfg = gex::Analysis_config::make_default();
    cfg.seed = seed;
    return cfg;
}

bool test_centroid_of_parabola_sample()
{
    gex::Curve_analyzer analyzer(seeded(1));
    const auto r = analyzer.analyze(k_px, k_py, gex::Input_mode::POINTS);
    TEST_ASSERT(r.centroid.x == 0.0, "Gx should be 0, got " << r.centroid.x);
    TEST_ASSERT(r.centroid.y == 2.0, "Gy should be 2, got " << r.centroid.y);
    return true;
}

bool test_points_mode_uses_regression_slope()
{
    gex::Curve_analyzer analyzer(seeded(2));
    const std::vector<double> x = {0.0, 1.0, 2.0, 3.0, 4.0};
    const std::vector<double> y = {1.0, 3.1, 4.9, 7.2, 8.8};
    const auto r = analyzer.analyze(x, y, gex::Input_mode::POINTS);

    TEST_ASSERT(r.fit.has_value(), "points mode with >= 2 points fits a line");
    TEST_ASSERT(r.slope_at_centroid == r.fit->slope, "slope at G is the regression slope");
    TEST_ASSERT(r.fitted_y.size() == x.size(), "fitted y per analyzed x");
    for (std::size_t i = 0; i < x.size(); ++i) {
        TEST_ASSERT(std::abs(r.fitted_y[i] - r.fit->at(r.samples.x[i])) < 1e-12, "fitted_y follows the line");
    }
    return true;
}

bool test_equation_mode_uses_local_slope()
{
    gex::Curve_analyzer analyzer(seeded(3));
    std::vector<double> x;
    std::vector<double> y;
    for (int i = 0; i <= 100; ++i) {
        const double v = -1.0 + 0.03 * i;  // mean is 0.5
        x.push_back(v);
        y.push_back(v * v);
    }
    const auto r = analyzer.analyze(x, y, gex::Input_mode::EQUATION);

    TEST_ASSERT(!r.fit.has_value(), "equation mode computes no global fit");
    TEST_ASSERT(r.fitted_y.empty(), "no fitted values without a fit");
    TEST_ASSERT(std::abs(r.centroid.x - 0.5) < 1e-12, "Gx of the domain");
    // Symmetric 7-point window around x = 0.5 on y = x^2: slope 2 * 0.5.
    TEST_ASSERT(std::abs(r.slope_at_centroid - 1.0) < 1e-9, "local slope of x^2 at 0.5, got " << r.slope_at_centroid);
    return true;
}

bool test_non_finite_rows_are_dropped_and_sorted()
{
    gex::Curve_analyzer analyzer(seeded(4));
    const std::vector<double> x = {3.0, k_nan, 1.0, 2.0, 5.0, 1.0};
    const std::vector<double> y = {30.0, 0.0, 10.0, k_inf, 50.0, 11.0};
    const auto r = analyzer.analyze(x, y, gex::Input_mode::POINTS);

    const std::vector<double> ex = {1.0, 1.0, 3.0, 5.0};
    const std::vector<double> ey = {10.0, 11.0, 30.0, 50.0};
    TEST_ASSERT(r.samples.x == ex, "finite samples sorted by x");
    TEST_ASSERT(r.samples.y == ey, "ties keep their original order");
    return true;
}

bool test_all_non_finite_raises_empty_data()
{
    gex::Curve_analyzer analyzer(seeded(5));
    const std::vector<double> y = {k_nan, k_inf, -k_inf, k_nan, k_nan};
    TEST_ASSERT(throws<gex::Empty_data_error>([&] { analyzer.analyze(k_px, y, gex::Input_mode::POINTS); }),
        "all non-finite y must raise Empty_data_error");
    TEST_ASSERT(throws<gex::Empty_data_error>([&] { analyzer.analyze(k_px, y, gex::Input_mode::EQUATION); }),
        "same in equation mode");
    TEST_ASSERT(throws<gex::Empty_data_error>([&] { analyzer.analyze({}, {}, gex::Input_mode::EQUATION); }),
        "empty input");
    TEST_ASSERT(throws<gex::Shape_mismatch_error>([&] { analyzer.analyze({1.0, 2.0}, {1.0}, gex::Input_mode::POINTS); }),
        "x and y must agree in length");
    return true;
}

bool test_local_slope_degenerate_inputs_are_nan()
{
    TEST_ASSERT(std::isnan(gex::slope_at_point({1.0, 1.0, 1.0}, {1.0, 2.0, 3.0}, 1.0)),
        "one distinct x gives NaN");
    TEST_ASSERT(std::isnan(gex::slope_at_point({2.0}, {1.0}, 2.0)), "one point gives NaN");
    TEST_ASSERT(std::isnan(gex::slope_at_point({}, {}, 0.0)), "no points give NaN");
    TEST_ASSERT(std::isnan(gex::slope_at_point({0.0, 1.0}, {0.0, 1.0}, k_nan)), "NaN target gives NaN");

    gex::Curve_analyzer analyzer(seeded(6));
    const auto r = analyzer.analyze({4.0, 4.0, 4.0}, {1.0, 2.0, 6.0}, gex::Input_mode::POINTS);
    TEST_ASSERT(!r.fit.has_value(), "no regression line through a single x");
    TEST_ASSERT(std::isnan(r.slope_at_centroid), "slope at G is NaN");
    TEST_ASSERT(!r.has_slope(), "has_slope reflects NaN");
    return true;
}

bool test_local_slope_widens_on_duplicate_window()
{
    // Nine copies of x = 0 and one distinct x far out.
    std::vector<double> x(9, 0.0);
    std::vector<double> y = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    x.push_back(10.0);
    y.push_back(20.0);
    const double s = gex::slope_at_point(x, y, 0.0, 3);
    const double expected = 2.0;  // exact line through (0, 0) and (10, 20)
    TEST_ASSERT(std::abs(s - expected) < 1e-12, "full-array fallback slope, got " << s);
    return true;
}

bool test_local_slope_window_is_clamped()
{
    // Nearest sample is the first one; window covers indices 0..3 only.
    const std::vector<double> x = {0.0, 1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
    const std::vector<double> y = {0.0, 1.0, 2.0, 3.0, 100.0, 200.0, 300.0};
    const double s = gex::slope_at_point(x, y, -5.0, 3);
    TEST_ASSERT(std::abs(s - 1.0) < 1e-12, "window clamped at the lower bound, got " << s);

    // Unsorted input is sorted before the window is taken.
    const std::vector<double> ux = {6.0, 0.0, 5.0, 1.0, 4.0, 2.0, 3.0};
    const std::vector<double> uy = {300.0, 0.0, 200.0, 1.0, 100.0, 2.0, 3.0};
    TEST_ASSERT(std::abs(gex::slope_at_point(ux, uy, -5.0, 3) - 1.0) < 1e-12, "unsorted input");
    return true;
}

bool test_nearest_index_tie_picks_first()
{
    // x0 = 1.5 is equidistant from 1 and 2; the window around index 1 with
    // window = 1 spans x = 0, 1, 2 (slope 1), around index 2 it would span
    // x = 1, 2, 3 (slope 10).
    const std::vector<double> x = {0.0, 1.0, 2.0, 3.0};
    const std::vector<double> y = {0.0, 1.0, 2.0, 21.0};
    const double s = gex::slope_at_point(x, y, 1.5, 1);
    TEST_ASSERT(std::abs(s - 1.0) < 1e-12, "tie should resolve to the first nearest sample, got " << s);
    return true;
}

bool test_analyze_is_idempotent()
{
    gex::Curve_analyzer analyzer;  // unseeded
    for (auto mode : {gex::Input_mode::POINTS, gex::Input_mode::EQUATION}) {
        const auto a = analyzer.analyze(k_px, k_py, mode);
        const auto b = analyzer.analyze(k_px, k_py, mode);
        TEST_ASSERT(a.centroid == b.centroid, "centroid differs between runs");
        TEST_ASSERT(a.slope_at_centroid == b.slope_at_centroid, "slope differs between runs");
        TEST_ASSERT(a.fit.has_value() == b.fit.has_value(), "fit presence differs");
        if (a.fit) {
            TEST_ASSERT(a.fit->slope == b.fit->slope && a.fit->intercept == b.fit->intercept, "fit differs");
        }
        TEST_ASSERT(a.samples.x == b.samples.x && a.samples.y == b.samples.y, "samples differ");
    }
    return true;
}

bool test_highlights_are_distinct_samples()
{
    gex::Curve_analyzer analyzer(seeded(7));
    for (int run = 0; run < 50; ++run) {
        const auto r = analyzer.analyze(k_px, k_py, gex::Input_mode::POINTS);
        TEST_ASSERT(r.highlighted.size() == 2, "two highlights for five samples");
        TEST_ASSERT(r.highlighted_indices[0] != r.highlighted_indices[1], "drawn without replacement");
        for (std::size_t k = 0; k < 2; ++k) {
            const std::size_t i = r.highlighted_indices[k];
            TEST_ASSERT(i < r.samples.size(), "index in range");
            TEST_ASSERT(r.highlighted[k].x == r.samples.x[i] && r.highlighted[k].y == r.samples.y[i],
                "highlight matches its sample");
        }
    }

    const auto single = analyzer.analyze({1.0}, {2.0}, gex::Input_mode::EQUATION);
    TEST_ASSERT(single.highlighted.empty(), "a single sample gets no highlight");

    const auto pair = analyzer.analyze({1.0, 2.0}, {2.0, 3.0}, gex::Input_mode::POINTS);
    TEST_ASSERT(pair.highlighted.size() == 2, "both samples of a pair are highlighted");
    return true;
}

bool test_seeded_highlights_are_reproducible()
{
    gex::Curve_analyzer a(seeded(42));
    gex::Curve_analyzer b(seeded(42));
    for (int run = 0; run < 10; ++run) {
        const auto ra = a.analyze(k_px, k_py, gex::Input_mode::POINTS);
        const auto rb = b.analyze(k_px, k_py, gex::Input_mode::POINTS);
        TEST_ASSERT(ra.highlighted_indices == rb.highlighted_indices, "same seed, same picks");
    }
    return true;
}

bool test_sample_picker_covers_every_index()
{
    gex::Sample_picker picker(11);
    std::set<std::size_t> seen;
    for (int run = 0; run < 500; ++run) {
        for (std::size_t i : picker.pick(6, 2)) {
            seen.insert(i);
        }
    }
    TEST_ASSERT(seen.size() == 6, "every index should be drawn eventually");
    TEST_ASSERT(picker.pick(3, 5).size() == 3, "never more than n");
    TEST_ASSERT(picker.pick(0, 2).empty(), "nothing from nothing");
    return true;
}

bool test_debug_log_reports_dropped_samples()
{
    std::vector<std::string> lines;
    auto cfg = seeded(8);
    cfg.log_debug = [&lines](const std::string& s) { lines.push_back(s); };

    gex::Curve_analyzer analyzer(cfg);
    analyzer.analyze({0.0, 1.0, 2.0}, {0.0, k_nan, 2.0}, gex::Input_mode::EQUATION);

    const bool found = std::any_of(lines.begin(), lines.end(), [](const std::string& s) {
        return s.find("dropped 1 non-finite") != std::string::npos;
    });
    TEST_ASSERT(found, "expected a debug line about the dropped sample");
    return true;
}

} // namespace

int main()
{
    std::cout << "Curve analyzer tests" << std::endl;

    int passed = 0;
    int failed = 0;

    RUN_TEST(test_centroid_of_parabola_sample);
    RUN_TEST(test_points_mode_uses_regression_slope);
    RUN_TEST(test_equation_mode_uses_local_slope);
    RUN_TEST(test_non_finite_rows_are_dropped_and_sorted);
    RUN_TEST(test_all_non_finite_raises_empty_data);
    RUN_TEST(test_local_slope_degenerate_inputs_are_nan);
    RUN_TEST(test_local_slope_widens_on_duplicate_window);
    RUN_TEST(test_local_slope_window_is_clamped);
    RUN_TEST(test_nearest_index_tie_picks_first);
    RUN_TEST(test_analyze_is_idempotent);
    RUN_TEST(test_highlights_are_distinct_samples);
    RUN_TEST(test_seeded_highlights_are_reproducible);
    RUN_TEST(test_sample_picker_covers_every_index);
    RUN_TEST(test_debug_log_reports_dropped_samples);

    std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;
    return failed > 0 ? 1 : 0;
}
