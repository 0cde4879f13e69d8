#pragma once

#include <glm/vec3.hpp>

namespace common
{

struct Bounds
{
    glm::dvec3 min{0.0};
    glm::dvec3 max{0.0};

    [[nodiscard]] glm::dvec3 center() const
    {
        return (min + max) * 0.5;
    }

    [[nodiscard]] glm::dvec3 size() const
    {
        return max - min;
    }
};

// Index (0 = X, 1 = Y, 2 = Z) of the largest component; earlier axes win ties.
int dominantAxis(const glm::dvec3& v);

// Angle in degrees between two lines (direction sign ignored), in [0, 90].
double lineAngleDeg(const glm::dvec3& a, const glm::dvec3& b);

// Flips the vector so its dominant component is positive, making parallel and
// antiparallel axes compare equal.
glm::dvec3 canonicalDirection(const glm::dvec3& v);

} // namespace common
