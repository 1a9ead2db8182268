#pragma once

// Info panel values for the tracked body, derived after each physics step.

#include <cstdint>
#include <string>

namespace OrbitView
{
    struct Body;

    struct InfoMetrics
    {
        double distance_au{0.0};   // |position| / AU
        double speed_kmps{0.0};    // |velocity| / 1000
        double elapsed_days{0.0};  // simulated days, not truncated
    };

    InfoMetrics compute_info_metrics(const Body &body, double simulation_time_s);

    // "1.524"
    std::string format_distance_au(double distance_au);

    // "24.10"
    std::string format_speed_kmps(double speed_kmps);

    // Whole days with thousands separators: "1,234"
    std::string format_elapsed_days(double elapsed_days);

    // 1234567 -> "1,234,567"
    std::string group_thousands(int64_t value);
} // namespace OrbitView
