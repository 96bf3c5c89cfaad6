#pragma once

// Graph Explorer - Text Utilities
// Parsing helpers for the free-text fields of point rows and domain ranges.

#include <optional>
#include <string_view>

namespace gex {

// Trim ASCII whitespace from both ends.
[[nodiscard]]
std::string_view trim(std::string_view str) noexcept;

[[nodiscard]]
inline bool is_blank(std::string_view str) noexcept
{
    return trim(str).empty();
}

// Parse the whole (trimmed) field as a double. Accepts an optional sign,
// decimal and exponent forms as well as "inf" and "nan". Empty fields, hex
// and trailing garbage fail. The locale is not consulted.
[[nodiscard]]
std::optional<double> parse_double(std::string_view str);

} // namespace gex
