#pragma once

#include "geom/GeometryTypes.h"

#include <glm/vec3.hpp>

namespace est
{

// Raw blank the part is machined from.
struct Stock
{
    enum class Shape
    {
        Bar,
        Block
    };

    Shape shape{Shape::Block};
    double diameter_mm{0.0};
    double length_mm{0.0};
    glm::dvec3 sizeXYZ_mm{0.0};

    [[nodiscard]] double volume_mm3() const;
};

struct StockAllowance
{
    double barDiameter_mm{3.0};
    double barLength_mm{5.0};
    double blockPerSide_mm{5.0};
    double blockHeight_mm{5.0};
};

// Round bar for rotational parts, rectangular block (Z up) otherwise.
[[nodiscard]] Stock makeStock(const geom::GeometrySummary& summary, const StockAllowance& allowance = {});

} // namespace est
