#pragma once

#include "geom/GeometryTypes.h"

#include <utility>

namespace geom
{

struct SummaryOptions
{
    // Parts whose aligned round-face area fraction exceeds this are classified rotational.
    double rotationalThreshold{0.6};
    // Round faces whose axis lies within this angle of the principal axis count as aligned.
    double axisToleranceDeg{15.0};
};

// Classifies raw kernel faces against the part's principal axis and derives the
// rotational score, part type and adjusted surface area. Throws common::ExtractionError
// for a solid without measurable faces.
[[nodiscard]] GeometrySummary summarize(const QString& sourceId,
                                        const RawSolid& solid,
                                        const SummaryOptions& options = {});

// Forces the part type from an external exception list and recomputes the
// adjusted surface area to match.
void overridePartType(GeometrySummary& summary, PartType type, const SummaryOptions& options = {});

// True for an outer cylindrical face aligned with the rotation axis of a rotational part;
// the bar stock already provides such faces, so they are not finished.
[[nodiscard]] bool isStockFormed(const GeometryFace& face,
                                 const GeometrySummary& summary,
                                 double axisToleranceDeg = 15.0);

// Min/max of the bounds corners projected on a unit direction.
[[nodiscard]] std::pair<double, double> projectBounds(const common::Bounds& bounds, const glm::dvec3& direction);

[[nodiscard]] double axialLength(const GeometrySummary& summary);

// Largest outer diameter turned about the principal axis; falls back to the largest
// bbox extent perpendicular to the axis when no such face exists.
[[nodiscard]] double maxCrossSection(const GeometrySummary& summary, double axisToleranceDeg = 15.0);

} // namespace geom
