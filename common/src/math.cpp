#include "common/math.h"

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace common
{

int dominantAxis(const glm::dvec3& v)
{
    int axis = 0;
    double best = std::abs(v.x);
    if (std::abs(v.y) > best)
    {
        axis = 1;
        best = std::abs(v.y);
    }
    if (std::abs(v.z) > best)
    {
        axis = 2;
    }
    return axis;
}

double lineAngleDeg(const glm::dvec3& a, const glm::dvec3& b)
{
    const double la = glm::length(a);
    const double lb = glm::length(b);
    if (la <= 0.0 || lb <= 0.0)
    {
        return 90.0;
    }
    const double cosine = std::clamp(std::abs(glm::dot(a, b)) / (la * lb), 0.0, 1.0);
    return std::acos(cosine) * 180.0 / std::numbers::pi;
}

glm::dvec3 canonicalDirection(const glm::dvec3& v)
{
    const double length = glm::length(v);
    if (length <= 0.0)
    {
        return glm::dvec3(0.0, 0.0, 1.0);
    }
    glm::dvec3 unit = v / length;
    if (unit[dominantAxis(unit)] < 0.0)
    {
        unit = -unit;
    }
    return unit;
}

} // namespace common
