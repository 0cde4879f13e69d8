#include "geom/GeometrySummarizer.h"

#include "common/Errors.h"
#include "common/log.h"

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace geom
{

namespace
{

struct AxisGroup
{
    glm::dvec3 direction{0.0};
    double area{0.0};
};

glm::dvec3 unitAxis(int index)
{
    glm::dvec3 axis(0.0);
    axis[index] = 1.0;
    return axis;
}

glm::dvec3 findPrincipalAxis(const RawSolid& solid, double toleranceDeg)
{
    std::vector<AxisGroup> groups;
    for (const RawFace& face : solid.faces)
    {
        const bool round = face.surfaceType == SurfaceType::Cylindrical || face.surfaceType == SurfaceType::Conical
                           || face.surfaceType == SurfaceType::Toroidal;
        if (!round || glm::length(face.axis) <= 0.0 || face.area_mm2 <= 0.0)
        {
            continue;
        }

        const glm::dvec3 direction = common::canonicalDirection(face.axis);
        auto it = std::find_if(groups.begin(), groups.end(), [&](const AxisGroup& group) {
            return common::lineAngleDeg(group.direction, direction) <= toleranceDeg;
        });
        if (it == groups.end())
        {
            groups.push_back({direction, face.area_mm2});
        }
        else
        {
            it->area += face.area_mm2;
        }
    }

    if (groups.empty())
    {
        return unitAxis(common::dominantAxis(solid.bounds.size()));
    }

    // Strict comparison keeps the earliest group on ties so enumeration order decides.
    const AxisGroup* best = &groups.front();
    for (const AxisGroup& group : groups)
    {
        if (group.area > best->area)
        {
            best = &group;
        }
    }
    return best->direction;
}

double adjustedArea(const GeometrySummary& summary, double axisToleranceDeg)
{
    double stockFormedArea = 0.0;
    if (summary.partType == PartType::Rotational)
    {
        for (const GeometryFace& face : summary.faces)
        {
            if (isStockFormed(face, summary, axisToleranceDeg))
            {
                stockFormedArea += face.area_mm2;
            }
        }
    }
    return std::max(0.0, summary.surfaceAreaRaw_mm2 - stockFormedArea);
}

} // namespace

std::pair<double, double> projectBounds(const common::Bounds& bounds, const glm::dvec3& direction)
{
    double lo = std::numeric_limits<double>::max();
    double hi = std::numeric_limits<double>::lowest();
    for (int corner = 0; corner < 8; ++corner)
    {
        const glm::dvec3 point((corner & 1) ? bounds.max.x : bounds.min.x,
                               (corner & 2) ? bounds.max.y : bounds.min.y,
                               (corner & 4) ? bounds.max.z : bounds.min.z);
        const double t = glm::dot(point, direction);
        lo = std::min(lo, t);
        hi = std::max(hi, t);
    }
    return {lo, hi};
}

GeometrySummary summarize(const QString& sourceId, const RawSolid& solid, const SummaryOptions& options)
{
    if (solid.faces.empty())
    {
        throw common::ExtractionError(QStringLiteral("Solid for %1 has no faces.").arg(sourceId));
    }

    double totalArea = 0.0;
    for (const RawFace& face : solid.faces)
    {
        totalArea += std::max(face.area_mm2, 0.0);
    }
    if (!(totalArea > 0.0))
    {
        throw common::ExtractionError(QStringLiteral("Solid for %1 has no measurable surface area.").arg(sourceId));
    }

    GeometrySummary summary;
    summary.sourceId = sourceId;
    summary.bounds = solid.bounds;
    summary.volume_mm3 = solid.volume_mm3;
    summary.principalAxis = findPrincipalAxis(solid, options.axisToleranceDeg);
    summary.faceCount = static_cast<int>(solid.faces.size());
    summary.surfaceAreaRaw_mm2 = totalArea;

    const double partStart = projectBounds(solid.bounds, summary.principalAxis).first;

    double alignedRoundArea = 0.0;
    summary.faces.reserve(solid.faces.size());
    for (std::size_t i = 0; i < solid.faces.size(); ++i)
    {
        const RawFace& raw = solid.faces[i];
        GeometryFace face;
        face.id = static_cast<int>(i);
        face.surfaceType = raw.surfaceType;
        face.bounds = raw.bounds;
        face.orientation = raw.reversed ? FaceOrientation::Inner : FaceOrientation::Outer;
        face.area_mm2 = std::max(raw.area_mm2, 0.0);

        const auto [lo, hi] = projectBounds(raw.bounds, summary.principalAxis);
        face.axialMin_mm = lo - partStart;
        face.axialMax_mm = hi - partStart;

        if (face.isRound())
        {
            face.diameter_mm = raw.diameter_mm;
            face.axis = common::canonicalDirection(raw.axis);
            face.axisOrigin = raw.axisOrigin;
            if (common::lineAngleDeg(face.axis, summary.principalAxis) <= options.axisToleranceDeg)
            {
                alignedRoundArea += face.area_mm2;
            }
        }
        summary.faces.push_back(face);
    }

    summary.rotationalScore = std::clamp(alignedRoundArea / totalArea, 0.0, 1.0);
    summary.partType = summary.rotationalScore > options.rotationalThreshold ? PartType::Rotational
                                                                             : PartType::Prismatic;

    summary.surfaceAreaAdjusted_mm2 = adjustedArea(summary, options.axisToleranceDeg);

    LOG_INFO(Geom,
             QStringLiteral("%1: %2 faces, rotational score %3 -> %4, area %5/%6 mm2")
                 .arg(sourceId)
                 .arg(summary.faceCount)
                 .arg(summary.rotationalScore, 0, 'f', 3)
                 .arg(toString(summary.partType))
                 .arg(summary.surfaceAreaAdjusted_mm2, 0, 'f', 1)
                 .arg(summary.surfaceAreaRaw_mm2, 0, 'f', 1));
    return summary;
}

void overridePartType(GeometrySummary& summary, PartType type, const SummaryOptions& options)
{
    if (summary.partType == type)
    {
        return;
    }
    LOG_WARN(Geom,
             QStringLiteral("%1: part type overridden %2 -> %3 by exception list")
                 .arg(summary.sourceId, toString(summary.partType), toString(type)));
    summary.partType = type;
    // Synthetic summaries carry no faces, so their adjusted area stays equal to raw.
    summary.surfaceAreaAdjusted_mm2 = adjustedArea(summary, options.axisToleranceDeg);
}

bool isStockFormed(const GeometryFace& face, const GeometrySummary& summary, double axisToleranceDeg)
{
    return summary.partType == PartType::Rotational && face.surfaceType == SurfaceType::Cylindrical
           && face.orientation == FaceOrientation::Outer
           && common::lineAngleDeg(face.axis, summary.principalAxis) <= axisToleranceDeg;
}

double axialLength(const GeometrySummary& summary)
{
    const auto [lo, hi] = projectBounds(summary.bounds, summary.principalAxis);
    return hi - lo;
}

double maxCrossSection(const GeometrySummary& summary, double axisToleranceDeg)
{
    double diameter = 0.0;
    for (const GeometryFace& face : summary.faces)
    {
        if (face.orientation == FaceOrientation::Outer && face.diameter_mm
            && common::lineAngleDeg(face.axis, summary.principalAxis) <= axisToleranceDeg)
        {
            diameter = std::max(diameter, *face.diameter_mm);
        }
    }
    if (diameter > 0.0)
    {
        return diameter;
    }

    const glm::dvec3 extent = summary.bounds.size();
    const int axis = common::dominantAxis(summary.principalAxis);
    double perpendicular = 0.0;
    for (int i = 0; i < 3; ++i)
    {
        if (i != axis)
        {
            perpendicular = std::max(perpendicular, extent[i]);
        }
    }
    return perpendicular;
}

} // namespace geom
