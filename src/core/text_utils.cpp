#include "text_utils.h"

#include <cctype>
#include <charconv>
#include <limits>
#include <system_error>

namespace gex {

namespace {

bool is_space(char c) noexcept
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

std::string_view trim(std::string_view str) noexcept
{
    std::size_t begin = 0;
    std::size_t end = str.size();

    while (begin < end && is_space(str[begin])) {
        ++begin;
    }
    while (end > begin && is_space(str[end - 1])) {
        --end;
    }
    return str.substr(begin, end - begin);
}

std::optional<double> parse_double(std::string_view str)
{
    std::string_view t = trim(str);
    if (!t.empty() && t.front() == '+') {
        t.remove_prefix(1);
        if (!t.empty() && (t.front() == '+' || t.front() == '-')) {
            return std::nullopt;
        }
    }
    if (t.empty()) {
        return std::nullopt;
    }

    // Decimal only, independent of the locale; "0x10" stops at the 'x'.
    double v = 0.0;
    const char* first = t.data();
    const char* last = first + t.size();
    const auto [ptr, ec] = std::from_chars(first, last, v, std::chars_format::general);
    if (ptr != last) {
        return std::nullopt;
    }
    if (ec == std::errc::result_out_of_range) {
        // Magnitude beyond double: keep the IEEE reading.
        const bool negative = t.front() == '-';
        const std::size_t e = t.find_first_of("eE");
        if (e != std::string_view::npos && e + 1 < t.size() && t[e + 1] == '-') {
            return negative ? -0.0 : 0.0;
        }
        return negative ? -std::numeric_limits<double>::infinity()
                        : std::numeric_limits<double>::infinity();
    }
    if (ec != std::errc()) {
        return std::nullopt;
    }
    return v;
}

} // namespace gex
