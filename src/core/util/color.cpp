#include "color.h"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>

namespace
{
    int hex_digit(char c)
    {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    int to_byte(float channel)
    {
        return static_cast<int>(std::lround(std::clamp(channel, 0.0f, 1.0f) * 255.0f));
    }
} // namespace

std::optional<glm::vec3> parse_hex_color(std::string_view hex)
{
    if (!hex.empty() && hex.front() == '#')
    {
        hex.remove_prefix(1);
    }
    if (hex.size() != 6)
    {
        return std::nullopt;
    }

    float channels[3]{};
    for (size_t i = 0; i < 3; ++i)
    {
        const int hi = hex_digit(hex[i * 2]);
        const int lo = hex_digit(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0)
        {
            return std::nullopt;
        }
        channels[i] = static_cast<float>(hi * 16 + lo) / 255.0f;
    }
    return glm::vec3(channels[0], channels[1], channels[2]);
}

std::string to_hex_color(const glm::vec3 &rgb)
{
    return fmt::format("#{:02X}{:02X}{:02X}", to_byte(rgb.r), to_byte(rgb.g), to_byte(rgb.b));
}
