#pragma once

// Graph Explorer - Expression Evaluator
// Compiles a user formula in the single variable x against a closed symbol
// table and evaluates it over a whole vector of x at once.
//
// Syntax:
//   numbers (2, 2.5, .5, 1e-3), the variable x, context names, np.<name>,
//   + - * / % and ** (or ^), unary + and -, parentheses, calls f(a, b).
//   '%' follows fmod (sign of the dividend); np.mod floors.
// Names are resolved against the context before the text reaches the exprtk
// parser, which only ever sees generated symbols and arithmetic.
//
// Usage:
//   gex::Expression_evaluator ev;
//   ev.set_expression("sin(x) + 0.5*x^2");   // throws gex::Expression_error
//   std::vector<double> y = ev.evaluate(xs); // same length as xs

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gex {

constexpr const char* k_variable_name = "x";
constexpr const char* k_numeric_library_name = "np";

enum class Symbol_kind
{
    CONSTANT,
    UNARY_FUNCTION,
    BINARY_FUNCTION,
    NAMESPACE
};

// -----------------------------------------------------------------------------
// Evaluation_context: the closed set of names an expression may use
// -----------------------------------------------------------------------------
class Evaluation_context
{
public:
    using Unary_function  = std::function<double(double)>;
    using Binary_function = std::function<double(double, double)>;

    struct symbol_t
    {
        Symbol_kind     kind = Symbol_kind::CONSTANT;
        double          value = 0.0;
        Unary_function  unary;
        Binary_function binary;
        std::shared_ptr<const Evaluation_context> members;  ///< NAMESPACE only
    };

    Evaluation_context& constant(const std::string& name, double value);
    Evaluation_context& unary(const std::string& name, Unary_function fn);
    Evaluation_context& binary(const std::string& name, Binary_function fn);
    Evaluation_context& add_namespace(const std::string& name, Evaluation_context members);

    // Null when the name is not declared.
    const symbol_t* find(std::string_view name) const;

    std::vector<std::string> names() const;
    std::size_t size() const { return m_symbols.size(); }

    // pi, e, the elementary functions, pow, atan2 and the `np` handle.
    static Evaluation_context make_default();

    // The attribute table reachable through `np.`.
    static Evaluation_context make_numeric_library();

private:
    std::map<std::string, symbol_t, std::less<>> m_symbols;
};

// -----------------------------------------------------------------------------
// Shape policy for results that do not depend on x
// -----------------------------------------------------------------------------
enum class Shape_policy
{
    // A scalar result raises Shape_mismatch_error.
    STRICT,
    // A scalar result is repeated to the length of x.
    BROADCAST
};

// -----------------------------------------------------------------------------
// Expression_evaluator
// -----------------------------------------------------------------------------
// The expression is compiled once by set_expression() and can then be
// evaluated any number of times. Evaluation is pure: identical input gives
// bit-identical output.
class Expression_evaluator
{
public:
    Expression_evaluator();
    explicit Expression_evaluator(Evaluation_context context);
    ~Expression_evaluator();

    Expression_evaluator(Expression_evaluator&& other) noexcept;
    Expression_evaluator& operator=(Expression_evaluator&& other) noexcept;

    Expression_evaluator(const Expression_evaluator&) = delete;
    Expression_evaluator& operator=(const Expression_evaluator&) = delete;

    // Throws Expression_error on empty text, syntax errors, names outside the
    // context and expressions nested deeper than 200 levels or longer than
    // 8192 tokens. The previous expression is kept on failure.
    void set_expression(std::string_view text);

    bool has_expression() const;
    const std::string& expression() const;

    // Throws Expression_error if no expression is set, Shape_mismatch_error
    // if the result length differs from x (see Shape_policy).
    std::vector<double> evaluate(
        const std::vector<double>& x,
        Shape_policy policy = Shape_policy::STRICT) const;

    const Evaluation_context& context() const;

private:
    struct impl_t;
    std::unique_ptr<impl_t> m_impl;
};

// One-shot convenience: compile with the default context and evaluate.
std::vector<double> evaluate(
    std::string_view expression,
    const std::vector<double>& x,
    Shape_policy policy = Shape_policy::STRICT);

// Rewrites '^' to '**'.
std::string normalize_expression(std::string_view text);

} // namespace gex
