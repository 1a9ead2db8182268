#pragma once

#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include <optional>
#include <string>
#include <string_view>

// Parse "#RRGGBB" or "RRGGBB" into linear 0..1 RGB. Returns std::nullopt on malformed input.
std::optional<glm::vec3> parse_hex_color(std::string_view hex);

// Inverse of parse_hex_color, always "#RRGGBB" (upper case).
std::string to_hex_color(const glm::vec3 &rgb);

inline glm::vec4 with_alpha(const glm::vec3 &rgb, float alpha)
{
    return glm::vec4(rgb, alpha);
}
