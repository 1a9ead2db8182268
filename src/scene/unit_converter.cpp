#include "unit_converter.h"

#include <fmt/core.h>

#include <cmath>
#include <stdexcept>

namespace OrbitView
{
    UnitConverter::UnitConverter(double scale_factor)
        : _scale_factor(scale_factor)
    {
        if (!std::isfinite(scale_factor) || !(scale_factor > 0.0))
        {
            throw std::invalid_argument(fmt::format("scene scale factor must be positive, got {}", scale_factor));
        }
    }
} // namespace OrbitView
