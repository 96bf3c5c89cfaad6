#include <gex/core/expression.h>

#include <gex/core/errors.h>

#include "text_utils.h"

// Only arithmetic is ever handed to the parser.
#define exprtk_disable_comments
#define exprtk_disable_string_capabilities
#define exprtk_disable_break_continue
#define exprtk_disable_return_statement
#define exprtk_disable_rtl_io
#define exprtk_disable_rtl_io_file
#define exprtk_disable_rtl_vecops
#define exprtk_disable_caseinsensitivity
#include <exprtk.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <numbers>
#include <system_error>
#include <utility>

namespace gex {
namespace {

constexpr int         k_max_nesting_depth = 200;
constexpr std::size_t k_max_token_count   = 8192;

const char* const k_shape_message = "The expression did not evaluate to a vector of y values.";

using symbol_table_t = exprtk::symbol_table<double>;
using expression_t   = exprtk::expression<double>;
using parser_t       = exprtk::parser<double>;

[[noreturn]] void fail(const std::string& message)
{
    throw Expression_error("Invalid expression: " + message);
}

double nan_value()
{
    return std::numeric_limits<double>::quiet_NaN();
}

// Modulo with the sign of the divisor.
double floored_mod(double a, double b)
{
    if (b == 0.0) {
        return nan_value();
    }
    double r = std::fmod(a, b);
    if (r != 0.0 && ((r < 0.0) != (b < 0.0))) {
        r += b;
    }
    return r;
}

double sign_of(double v)
{
    if (v > 0.0) { return 1.0;  }
    if (v < 0.0) { return -1.0; }
    return v;  // keeps 0, -0 and NaN
}

double nan_min(double a, double b)
{
    if (std::isnan(a) || std::isnan(b)) {
        return nan_value();
    }
    return std::min(a, b);
}

double nan_max(double a, double b)
{
    if (std::isnan(a) || std::isnan(b)) {
        return nan_value();
    }
    return std::max(a, b);
}

// The elementary functions shared by the top level and the `np` table.
void add_elementary_functions(Evaluation_context& ctx)
{
    ctx.unary("sin",   [](double v) { return std::sin(v);   });
    ctx.unary("cos",   [](double v) { return std::cos(v);   });
    ctx.unary("tan",   [](double v) { return std::tan(v);   });
    ctx.unary("sinh",  [](double v) { return std::sinh(v);  });
    ctx.unary("cosh",  [](double v) { return std::cosh(v);  });
    ctx.unary("tanh",  [](double v) { return std::tanh(v);  });
    ctx.unary("exp",   [](double v) { return std::exp(v);   });
    ctx.unary("log",   [](double v) { return std::log(v);   });
    ctx.unary("log10", [](double v) { return std::log10(v); });
    ctx.unary("sqrt",  [](double v) { return std::sqrt(v);  });
    ctx.unary("abs",   [](double v) { return std::fabs(v);  });
    ctx.unary("floor", [](double v) { return std::floor(v); });
    ctx.unary("ceil",  [](double v) { return std::ceil(v);  });
}

// -----------------------------------------------------------------------------
// exprtk adapters for context functions
// -----------------------------------------------------------------------------

class Unary_adapter : public exprtk::ifunction<double>
{
public:
    explicit Unary_adapter(Evaluation_context::Unary_function fn)
    :
        exprtk::ifunction<double>(1),
        m_fn(std::move(fn))
    {}

    double operator()(const double& v) override
    {
        return m_fn(v);
    }

private:
    Evaluation_context::Unary_function m_fn;
};

class Binary_adapter : public exprtk::ifunction<double>
{
public:
    explicit Binary_adapter(Evaluation_context::Binary_function fn)
    :
        exprtk::ifunction<double>(2),
        m_fn(std::move(fn))
    {}

    double operator()(const double& a, const double& b) override
    {
        return m_fn(a, b);
    }

private:
    Evaluation_context::Binary_function m_fn;
};

// -----------------------------------------------------------------------------
// Tokenizer
// -----------------------------------------------------------------------------

enum class Token_kind
{
    NUMBER,
    NAME,
    OPERATOR,
    END
};

struct token_t
{
    Token_kind  kind = Token_kind::END;
    std::string text;
    double      number = 0.0;
    std::size_t pos = 0;
};

bool is_name_start(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_name_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string describe(const token_t& tok)
{
    switch (tok.kind) {
        case Token_kind::NUMBER:   return "number '" + tok.text + "'";
        case Token_kind::NAME:     return "name '" + tok.text + "'";
        case Token_kind::OPERATOR: return "'" + tok.text + "'";
        case Token_kind::END:      return "end of expression";
    }
    return "token";
}

[[noreturn]] void unexpected(const token_t& tok)
{
    if (tok.kind == Token_kind::END) {
        fail("unexpected end of expression");
    }
    fail("unexpected " + describe(tok) + " at position " + std::to_string(tok.pos));
}

// Overflow reads as inf, underflow as 0.
double out_of_range_value(const std::string& literal)
{
    const std::size_t e = literal.find_first_of("eE");
    if (e != std::string::npos) {
        return literal[e + 1] == '-' ? 0.0 : std::numeric_limits<double>::infinity();
    }
    return literal.find_first_of("123456789") < literal.find('.')
        ? std::numeric_limits<double>::infinity()
        : 0.0;
}

std::vector<token_t> tokenize(const std::string& s)
{
    std::vector<token_t> tokens;
    std::size_t i = 0;
    const std::size_t n = s.size();

    while (i < n) {
        const char c = s[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        if (is_digit(c) || (c == '.' && i + 1 < n && is_digit(s[i + 1]))) {
            const std::size_t start = i;
            while (i < n && is_digit(s[i])) {
                ++i;
            }
            if (i < n && s[i] == '.') {
                ++i;
                while (i < n && is_digit(s[i])) {
                    ++i;
                }
            }
            if (i < n && (s[i] == 'e' || s[i] == 'E')) {
                std::size_t j = i + 1;
                if (j < n && (s[j] == '+' || s[j] == '-')) {
                    ++j;
                }
                if (j < n && is_digit(s[j])) {
                    i = j;
                    while (i < n && is_digit(s[i])) {
                        ++i;
                    }
                }
            }

            token_t tok;
            tok.kind = Token_kind::NUMBER;
            tok.text = s.substr(start, i - start);
            tok.pos = start;
            const char* first = tok.text.data();
            const char* last = first + tok.text.size();
            const auto [ptr, ec] = std::from_chars(first, last, tok.number);
            if (ec == std::errc::result_out_of_range) {
                tok.number = out_of_range_value(tok.text);
            }
            else if (ec != std::errc() || ptr != last) {
                fail("malformed number '" + tok.text + "' at position " + std::to_string(start));
            }
            tokens.push_back(std::move(tok));
        }
        else if (is_name_start(c)) {
            const std::size_t start = i;
            while (i < n && is_name_char(s[i])) {
                ++i;
            }
            token_t tok;
            tok.kind = Token_kind::NAME;
            tok.text = s.substr(start, i - start);
            tok.pos = start;
            tokens.push_back(std::move(tok));
        }
        else {
            token_t tok;
            tok.kind = Token_kind::OPERATOR;
            tok.pos = i;
            if (c == '*' && i + 1 < n && s[i + 1] == '*') {
                tok.text = "**";
                i += 2;
            }
            else if (c == '/' && i + 1 < n && s[i + 1] == '/') {
                fail("'//' is not supported at position " + std::to_string(i) + ", use floor(a / b)");
            }
            else if (c == '+' || c == '-' || c == '*' || c == '/' || c == '%' ||
                     c == '(' || c == ')' || c == ',' || c == '.')
            {
                tok.text = std::string(1, c);
                ++i;
            }
            else {
                fail("unexpected character '" + std::string(1, c) + "' at position " + std::to_string(i));
            }
            tokens.push_back(std::move(tok));
        }

        if (tokens.size() > k_max_token_count) {
            fail("expression is too long (more than " + std::to_string(k_max_token_count) + " tokens)");
        }
    }

    token_t end;
    end.kind = Token_kind::END;
    end.pos = n;
    tokens.push_back(end);
    return tokens;
}

// -----------------------------------------------------------------------------
// Translator
// -----------------------------------------------------------------------------
// Checks the token stream against the context and rewrites it into exprtk
// syntax. Every number and every context name becomes a generated symbol, so
// the arithmetic parser never sees a name the context did not declare.

struct translation_t
{
    struct function_t
    {
        std::string                     symbol;
        const Evaluation_context::symbol_t* target = nullptr;
    };

    std::string source;
    bool        uses_variable = false;

    std::vector<std::pair<std::string, double>> constants;
    std::vector<function_t>                      functions;

    // generated symbol -> name as written, for error messages
    std::vector<std::pair<std::string, std::string>> spellings;
};

class Translator
{
public:
    Translator(const std::vector<token_t>& tokens, const Evaluation_context& context)
    :
        m_tokens(tokens),
        m_context(context)
    {}

    translation_t run()
    {
        while (peek().kind != Token_kind::END) {
            step();
        }

        if (m_expect_operand) {
            unexpected(peek());
        }
        if (!m_frames.empty()) {
            fail("'(' at position " + std::to_string(m_frames.back().pos) + " was never closed");
        }
        return std::move(m_out);
    }

private:
    struct frame_t
    {
        std::size_t pos = 0;
        bool        call = false;
        std::string name;
        std::size_t arity = 0;
        std::size_t commas = 0;
        bool        empty = true;
    };

    const token_t& peek(std::size_t ahead = 0) const
    {
        const std::size_t i = std::min(m_pos + ahead, m_tokens.size() - 1);
        return m_tokens[i];
    }

    const token_t& next()
    {
        const token_t& tok = m_tokens[m_pos];
        if (m_pos + 1 < m_tokens.size()) {
            ++m_pos;
        }
        return tok;
    }

    void emit(const std::string& text)
    {
        if (!m_out.source.empty()) {
            m_out.source += ' ';
        }
        m_out.source += text;
    }

    void begin_operand(const token_t& tok)
    {
        if (!m_expect_operand) {
            unexpected(tok);
        }
        if (!m_frames.empty()) {
            m_frames.back().empty = false;
        }
    }

    void open_frame(const token_t& tok, bool call, const std::string& name, std::size_t arity)
    {
        if (m_frames.size() >= static_cast<std::size_t>(k_max_nesting_depth)) {
            fail("expression is nested too deeply");
        }
        frame_t f;
        f.pos = tok.pos;
        f.call = call;
        f.name = name;
        f.arity = arity;
        m_frames.push_back(std::move(f));
        emit("(");
        m_expect_operand = true;
        m_sign_run = 0;
    }

    void step()
    {
        const token_t& tok = next();
        switch (tok.kind) {
            case Token_kind::NUMBER:
                begin_operand(tok);
                emit(add_constant(tok.number, tok.text));
                m_expect_operand = false;
                m_sign_run = 0;
                return;
            case Token_kind::NAME:
                begin_operand(tok);
                name(tok);
                return;
            case Token_kind::OPERATOR:
                op(tok);
                return;
            case Token_kind::END:
                unexpected(tok);
        }
    }

    void name(const token_t& tok)
    {
        m_sign_run = 0;

        if (tok.text == k_variable_name) {
            no_attribute(tok.text);
            if (peek().text == "(") {
                fail("'" + tok.text + "' is not callable");
            }
            emit(k_variable_name);
            m_out.uses_variable = true;
            m_expect_operand = false;
            return;
        }

        const Evaluation_context::symbol_t* sym = m_context.find(tok.text);
        if (!sym) {
            fail("name '" + tok.text + "' is not defined");
        }

        std::string spelled = tok.text;
        if (sym->kind == Symbol_kind::NAMESPACE) {
            if (peek().text != ".") {
                fail("'" + tok.text + "' cannot be used as a value");
            }
            next();
            const token_t& attr = next();
            if (attr.kind != Token_kind::NAME) {
                fail("expected attribute name after '.' at position " + std::to_string(attr.pos));
            }
            const Evaluation_context::symbol_t* member = sym->members->find(attr.text);
            if (!member || member->kind == Symbol_kind::NAMESPACE) {
                fail("'" + tok.text + "' has no attribute '" + attr.text + "'");
            }
            sym = member;
            spelled += "." + attr.text;
        }
        no_attribute(spelled);

        if (sym->kind == Symbol_kind::CONSTANT) {
            if (peek().text == "(") {
                fail("'" + spelled + "' is not callable");
            }
            emit(add_constant(sym->value, spelled));
            m_expect_operand = false;
            return;
        }

        const token_t& paren = peek();
        if (paren.text != "(") {
            fail("'" + spelled + "' is a function and must be called");
        }
        next();

        const std::size_t arity = sym->kind == Symbol_kind::UNARY_FUNCTION ? 1 : 2;
        emit(add_function(sym, spelled));
        open_frame(paren, true, spelled, arity);
    }

    void no_attribute(const std::string& spelled)
    {
        if (peek().text == ".") {
            fail("attribute access is not allowed on '" + spelled + "'");
        }
    }

    void op(const token_t& tok)
    {
        const std::string& t = tok.text;

        if (t == "(") {
            begin_operand(tok);
            open_frame(tok, false, std::string(), 0);
            return;
        }

        if (t == ")") {
            if (m_frames.empty()) {
                fail("unmatched ')' at position " + std::to_string(tok.pos));
            }
            frame_t& f = m_frames.back();
            if (m_expect_operand && !(f.call && f.empty)) {
                unexpected(tok);
            }
            if (f.call) {
                const std::size_t given = f.empty ? 0 : f.commas + 1;
                if (given != f.arity) {
                    fail(f.name + "() takes exactly " + std::to_string(f.arity) +
                         (f.arity == 1 ? " argument (" : " arguments (") +
                         std::to_string(given) + " given)");
                }
            }
            m_frames.pop_back();
            emit(")");
            m_expect_operand = false;
            return;
        }

        if (t == ",") {
            if (m_expect_operand || m_frames.empty() || !m_frames.back().call) {
                unexpected(tok);
            }
            ++m_frames.back().commas;
            emit(",");
            m_expect_operand = true;
            return;
        }

        if ((t == "+" || t == "-") && m_expect_operand) {
            if (++m_sign_run > k_max_nesting_depth) {
                fail("expression is nested too deeply");
            }
            if (!m_frames.empty()) {
                m_frames.back().empty = false;
            }
            emit(t);
            return;
        }

        if (t == "+" || t == "-" || t == "*" || t == "/" || t == "%" || t == "**") {
            if (m_expect_operand) {
                unexpected(tok);
            }
            emit(t == "**" ? "^" : t);
            m_expect_operand = true;
            m_sign_run = 0;
            return;
        }

        unexpected(tok);
    }

    std::string add_constant(double value, const std::string& spelled)
    {
        std::string symbol = "gex_k" + std::to_string(m_out.constants.size());
        m_out.constants.emplace_back(symbol, value);
        m_out.spellings.emplace_back(symbol, spelled);
        return symbol;
    }

    std::string add_function(const Evaluation_context::symbol_t* sym, const std::string& spelled)
    {
        for (const auto& f : m_out.functions) {
            if (f.target == sym) {
                return f.symbol;
            }
        }
        translation_t::function_t f;
        f.symbol = "gex_f" + std::to_string(m_out.functions.size());
        f.target = sym;
        m_out.functions.push_back(f);
        m_out.spellings.emplace_back(f.symbol, spelled);
        return f.symbol;
    }

    const std::vector<token_t>& m_tokens;
    const Evaluation_context&   m_context;

    std::size_t          m_pos = 0;
    bool                 m_expect_operand = true;
    int                  m_sign_run = 0;
    std::vector<frame_t> m_frames;
    translation_t        m_out;
};

// Parser messages name generated symbols; put the written names back.
std::string respell(std::string message, const translation_t& t)
{
    auto spellings = t.spellings;
    std::sort(spellings.begin(), spellings.end(), [](const auto& a, const auto& b) {
        return a.first.size() > b.first.size();
    });
    for (const auto& [symbol, spelled] : spellings) {
        std::size_t at = 0;
        while ((at = message.find(symbol, at)) != std::string::npos) {
            message.replace(at, symbol.size(), spelled);
            at += spelled.size();
        }
    }
    return message;
}

parser_t::settings_t make_parser_settings()
{
    using settings_t = parser_t::settings_t;

    // No implicit multiplication and no symbol replacement.
    settings_t settings(
        settings_t::e_joiner          |
        settings_t::e_numeric_check   |
        settings_t::e_bracket_check   |
        settings_t::e_sequence_check  |
        settings_t::e_strength_reduction);

    settings.disable_all_base_functions();
    settings.disable_all_control_structures();
    settings.disable_all_logic_ops();
    settings.disable_all_assignment_ops();
    settings.disable_all_inequality_ops();
    settings.disable_local_vardef();
    return settings;
}

} // namespace

// =============================================================================
// Evaluation_context
// =============================================================================

Evaluation_context& Evaluation_context::constant(const std::string& name, double value)
{
    symbol_t sym;
    sym.kind = Symbol_kind::CONSTANT;
    sym.value = value;
    m_symbols[name] = std::move(sym);
    return *this;
}

Evaluation_context& Evaluation_context::unary(const std::string& name, Unary_function fn)
{
    symbol_t sym;
    sym.kind = Symbol_kind::UNARY_FUNCTION;
    sym.unary = std::move(fn);
    m_symbols[name] = std::move(sym);
    return *this;
}

Evaluation_context& Evaluation_context::binary(const std::string& name, Binary_function fn)
{
    symbol_t sym;
    sym.kind = Symbol_kind::BINARY_FUNCTION;
    sym.binary = std::move(fn);
    m_symbols[name] = std::move(sym);
    return *this;
}

Evaluation_context& Evaluation_context::add_namespace(const std::string& name, Evaluation_context members)
{
    symbol_t sym;
    sym.kind = Symbol_kind::NAMESPACE;
    sym.members = std::make_shared<const Evaluation_context>(std::move(members));
    m_symbols[name] = std::move(sym);
    return *this;
}

const Evaluation_context::symbol_t* Evaluation_context::find(std::string_view name) const
{
    const auto it = m_symbols.find(name);
    return it == m_symbols.end() ? nullptr : &it->second;
}

std::vector<std::string> Evaluation_context::names() const
{
    std::vector<std::string> out;
    out.reserve(m_symbols.size());
    for (const auto& entry : m_symbols) {
        out.push_back(entry.first);
    }
    return out;
}

Evaluation_context Evaluation_context::make_default()
{
    Evaluation_context ctx;
    ctx.constant("pi", std::numbers::pi);
    ctx.constant("e",  std::numbers::e);

    add_elementary_functions(ctx);
    ctx.unary("asin", [](double v) { return std::asin(v); });
    ctx.unary("acos", [](double v) { return std::acos(v); });
    ctx.unary("atan", [](double v) { return std::atan(v); });

    ctx.binary("pow",     [](double a, double b) { return std::pow(a, b);   });
    ctx.binary("atan2",   [](double a, double b) { return std::atan2(a, b); });
    ctx.binary("arctan2", [](double a, double b) { return std::atan2(a, b); });

    ctx.add_namespace(k_numeric_library_name, make_numeric_library());
    return ctx;
}

Evaluation_context Evaluation_context::make_numeric_library()
{
    Evaluation_context np;
    np.constant("pi",  std::numbers::pi);
    np.constant("e",   std::numbers::e);
    np.constant("inf", std::numeric_limits<double>::infinity());
    np.constant("nan", nan_value());

    add_elementary_functions(np);
    np.unary("arcsin",   [](double v) { return std::asin(v);  });
    np.unary("arccos",   [](double v) { return std::acos(v);  });
    np.unary("arctan",   [](double v) { return std::atan(v);  });
    np.unary("absolute", [](double v) { return std::fabs(v);  });
    np.unary("log2",     [](double v) { return std::log2(v);  });
    np.unary("log1p",    [](double v) { return std::log1p(v); });
    np.unary("expm1",    [](double v) { return std::expm1(v); });
    np.unary("cbrt",     [](double v) { return std::cbrt(v);  });
    np.unary("square",   [](double v) { return v * v;         });
    np.unary("sign",     sign_of);

    np.binary("arctan2", [](double a, double b) { return std::atan2(a, b); });
    np.binary("power",   [](double a, double b) { return std::pow(a, b);   });
    np.binary("hypot",   [](double a, double b) { return std::hypot(a, b); });
    np.binary("minimum", nan_min);
    np.binary("maximum", nan_max);
    np.binary("mod",     floored_mod);
    return np;
}

// =============================================================================
// Expression_evaluator
// =============================================================================

// One compiled expression. The symbol table holds references to `x` and the
// adapters, so a compiled_t never moves once built.
struct compiled_t
{
    double          x = 0.0;
    bool            uses_variable = false;
    symbol_table_t  symbols;
    expression_t    expression;

    std::vector<std::unique_ptr<exprtk::ifunction<double>>> functions;
};

struct Expression_evaluator::impl_t
{
    Evaluation_context          context;
    std::string                 text;
    std::unique_ptr<compiled_t> compiled;
};

namespace {

std::unique_ptr<compiled_t> compile(const std::string& text, const Evaluation_context& context)
{
    const translation_t t = Translator(tokenize(normalize_expression(text)), context).run();

    auto c = std::make_unique<compiled_t>();
    c->uses_variable = t.uses_variable;
    c->symbols.add_variable(k_variable_name, c->x);
    for (const auto& [symbol, value] : t.constants) {
        c->symbols.add_constant(symbol, value);
    }
    for (const auto& f : t.functions) {
        if (f.target->kind == Symbol_kind::UNARY_FUNCTION) {
            c->functions.push_back(std::make_unique<Unary_adapter>(f.target->unary));
        }
        else {
            c->functions.push_back(std::make_unique<Binary_adapter>(f.target->binary));
        }
        c->symbols.add_function(f.symbol, *c->functions.back());
    }
    c->expression.register_symbol_table(c->symbols);

    parser_t parser(make_parser_settings());
    if (!parser.compile(t.source, c->expression)) {
        fail(respell(parser.error(), t));
    }
    return c;
}

} // namespace

Expression_evaluator::Expression_evaluator()
:
    Expression_evaluator(Evaluation_context::make_default())
{}

Expression_evaluator::Expression_evaluator(Evaluation_context context)
:
    m_impl(std::make_unique<impl_t>())
{
    m_impl->context = std::move(context);
}

Expression_evaluator::~Expression_evaluator() = default;

Expression_evaluator::Expression_evaluator(Expression_evaluator&& other) noexcept = default;

Expression_evaluator& Expression_evaluator::operator=(Expression_evaluator&& other) noexcept = default;

void Expression_evaluator::set_expression(std::string_view text)
{
    if (!m_impl) {
        m_impl = std::make_unique<impl_t>();
        m_impl->context = Evaluation_context::make_default();
    }

    const std::string trimmed(trim(text));
    if (trimmed.empty()) {
        fail("expression is empty");
    }

    std::unique_ptr<compiled_t> compiled;
    try {
        compiled = compile(trimmed, m_impl->context);
    }
    catch (const Graph_error&) {
        throw;
    }
    catch (const std::exception& e) {
        fail(e.what());
    }

    m_impl->compiled = std::move(compiled);
    m_impl->text = trimmed;
}

bool Expression_evaluator::has_expression() const
{
    return m_impl && m_impl->compiled;
}

const std::string& Expression_evaluator::expression() const
{
    static const std::string k_empty;
    return m_impl ? m_impl->text : k_empty;
}

const Evaluation_context& Expression_evaluator::context() const
{
    static const Evaluation_context k_default = Evaluation_context::make_default();
    return m_impl ? m_impl->context : k_default;
}

std::vector<double> Expression_evaluator::evaluate(const std::vector<double>& x, Shape_policy policy) const
{
    if (!has_expression()) {
        fail("no expression set");
    }

    compiled_t& c = *m_impl->compiled;
    if (!c.uses_variable && policy == Shape_policy::STRICT) {
        throw Shape_mismatch_error(k_shape_message);
    }

    std::vector<double> y;
    try {
        if (!c.uses_variable) {
            c.x = 0.0;
            y.assign(x.size(), c.expression.value());
        }
        else {
            y.reserve(x.size());
            for (double v : x) {
                c.x = v;
                y.push_back(c.expression.value());
            }
        }
    }
    catch (const Graph_error&) {
        throw;
    }
    catch (const std::exception& e) {
        // Functions injected through a custom context may throw.
        fail(e.what());
    }
    return y;
}

// =============================================================================
// Free functions
// =============================================================================

std::vector<double> evaluate(std::string_view expression, const std::vector<double>& x, Shape_policy policy)
{
    Expression_evaluator evaluator;
    evaluator.set_expression(expression);
    return evaluator.evaluate(x, policy);
}

std::string normalize_expression(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        if (c == '^') {
            out += "**";
        }
        else {
            out += c;
        }
    }
    return out;
}

} // namespace gex
