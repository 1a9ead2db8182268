#include "info_metrics.h"
#include "physics/body.h"
#include <core/config.h>

#include <fmt/core.h>

#include <cmath>

namespace OrbitView
{
    InfoMetrics compute_info_metrics(const Body &body, double simulation_time_s)
    {
        InfoMetrics m{};
        m.distance_au = magnitude(body.position_m) / kMetersPerAU;
        m.speed_kmps = magnitude(body.velocity_mps) / kMetersPerKilometer;
        m.elapsed_days = simulation_time_s / kSecondsPerDay;
        return m;
    }

    std::string format_distance_au(double distance_au)
    {
        return fmt::format("{:.3f}", distance_au);
    }

    std::string format_speed_kmps(double speed_kmps)
    {
        return fmt::format("{:.2f}", speed_kmps);
    }

    std::string format_elapsed_days(double elapsed_days)
    {
        return group_thousands(static_cast<int64_t>(std::floor(elapsed_days)));
    }

    std::string group_thousands(int64_t value)
    {
        const bool negative = value < 0;
        // Work on the unsigned magnitude so INT64_MIN does not overflow.
        uint64_t magnitude_u = negative ? 0ull - static_cast<uint64_t>(value) : static_cast<uint64_t>(value);

        const std::string digits = fmt::format("{}", magnitude_u);
        std::string out;
        out.reserve(digits.size() + digits.size() / 3 + 1);

        if (negative)
        {
            out.push_back('-');
        }
        for (size_t i = 0; i < digits.size(); ++i)
        {
            if (i > 0 && (digits.size() - i) % 3 == 0)
            {
                out.push_back(',');
            }
            out.push_back(digits[i]);
        }
        return out;
    }
} // namespace OrbitView
