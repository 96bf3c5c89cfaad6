#pragma once

// Graph Explorer - Chart Colors
// Colors for the series of an analyzed chart.

#include <glm/vec4.hpp>

namespace gex {

// -----------------------------------------------------------------------------
// Color Utilities
// -----------------------------------------------------------------------------

constexpr int hex_char_to_int(char c)
{
    if (c >= '0' && c <= '9') { return c - '0';      }
    if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
    if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
    return 0;
}

constexpr float hex2f(const char* str)
{
    return static_cast<float>(hex_char_to_int(str[0]) * 16 + hex_char_to_int(str[1])) / 255.0f;
}

// Converts "aarrggbb" hex string to glm::vec4(r, g, b, a)
constexpr glm::vec4 hex_to_vec4(const char* str)
{
    return glm::vec4(hex2f(str + 2), hex2f(str + 4), hex2f(str + 6), hex2f(str));
}

// -----------------------------------------------------------------------------
// Chart Palette
// -----------------------------------------------------------------------------
struct Chart_palette
{
    glm::vec4 data_points   = hex_to_vec4("ff1f77b4");
    glm::vec4 fit_line      = hex_to_vec4("ffff7f0e");
    glm::vec4 g_point       = hex_to_vec4("ffd62728");
    glm::vec4 random_points = hex_to_vec4("ff2ca02c");

    static Chart_palette make_default()
    {
        return Chart_palette();
    }
};

} // namespace gex
