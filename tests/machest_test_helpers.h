#pragma once

#include "est/MaterialTable.h"
#include "est/ThreadTable.h"
#include "geom/GeometrySummarizer.h"
#include "geom/GeometryTypes.h"
#include "vision/DrawingAnnotation.h"

#include <QtCore/QDir>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <glm/vec3.hpp>

#include <numbers>
#include <optional>
#include <stdexcept>

#ifndef MACHEST_SOURCE_DIR
#    error "MACHEST_SOURCE_DIR must be defined"
#endif

namespace test_helpers
{

inline QString sourcePath(const QString& relative)
{
    return QDir(QStringLiteral(MACHEST_SOURCE_DIR)).filePath(relative);
}

inline common::Bounds box(const glm::dvec3& min, const glm::dvec3& max)
{
    common::Bounds bounds;
    bounds.min = min;
    bounds.max = max;
    return bounds;
}

// Cylinder around the Z axis between z0 and z1; `inner` marks a bore wall.
inline geom::RawFace zCylinder(double diameter, double z0, double z1, bool inner)
{
    const double r = diameter * 0.5;
    geom::RawFace face;
    face.surfaceType = geom::SurfaceType::Cylindrical;
    face.diameter_mm = diameter;
    face.axis = {0.0, 0.0, 1.0};
    face.axisOrigin = {0.0, 0.0, 0.0};
    face.bounds = box({-r, -r, z0}, {r, r, z1});
    face.reversed = inner;
    face.area_mm2 = std::numbers::pi * diameter * (z1 - z0);
    return face;
}

inline geom::RawFace zDisc(double diameter, double z)
{
    const double r = diameter * 0.5;
    geom::RawFace face;
    face.surfaceType = geom::SurfaceType::Planar;
    face.bounds = box({-r, -r, z}, {r, r, z});
    face.area_mm2 = std::numbers::pi * r * r;
    return face;
}

// Ø40 x 100 shaft along Z with a Ø12 blind bore 30 deep from z = 0.
inline geom::RawSolid makeShaftSolid()
{
    geom::RawSolid solid;
    solid.bounds = box({-20.0, -20.0, 0.0}, {20.0, 20.0, 100.0});
    solid.volume_mm3 = std::numbers::pi * (20.0 * 20.0 * 100.0 - 6.0 * 6.0 * 30.0);
    solid.faces.push_back(zCylinder(40.0, 0.0, 100.0, false));
    solid.faces.push_back(zCylinder(12.0, 0.0, 30.0, true));
    solid.faces.push_back(zDisc(40.0, 0.0));
    solid.faces.push_back(zDisc(40.0, 100.0));
    solid.faces.push_back(zDisc(12.0, 30.0));
    return solid;
}

inline geom::GeometrySummary makeShaft()
{
    return geom::summarize(QStringLiteral("shaft_16MnCr5.step"), makeShaftSolid());
}

// Faceless prismatic block, the way a synthetic summary looks to downstream stages.
inline geom::GeometrySummary makeBlock(const glm::dvec3& size, double volume_mm3)
{
    geom::GeometrySummary summary;
    summary.sourceId = QStringLiteral("block_C45.step");
    summary.extractor = QStringLiteral("test");
    summary.bounds = box({0.0, 0.0, 0.0}, size);
    summary.volume_mm3 = volume_mm3;
    summary.faceCount = 6;
    summary.principalAxis = {1.0, 0.0, 0.0};
    summary.partType = geom::PartType::Prismatic;
    return summary;
}

inline vision::DrawingAnnotation annotation(vision::AnnotationKind kind,
                                            const QString& text,
                                            std::optional<double> nominal,
                                            double confidence = 0.97)
{
    vision::DrawingAnnotation result;
    result.label = vision::toString(kind);
    result.kind = kind;
    result.text = text;
    result.nominal_mm = nominal;
    result.confidence = confidence;
    result.region = QStringLiteral("view");
    return result;
}

inline vision::PositionHint axialHint(double start, double end)
{
    vision::PositionHint hint;
    hint.type = vision::PositionHint::Type::Axial;
    hint.axialStart_mm = start;
    hint.axialEnd_mm = end;
    return hint;
}

inline est::MaterialTable loadMaterials()
{
    est::MaterialTable table;
    QStringList warnings;
    if (!table.loadFromFile(sourcePath(QStringLiteral("data/materials.json")), warnings))
    {
        throw std::runtime_error(warnings.join(QStringLiteral("; ")).toStdString());
    }
    return table;
}

inline est::ThreadTable loadThreads()
{
    est::ThreadTable table;
    QStringList warnings;
    if (!table.loadFromFile(sourcePath(QStringLiteral("data/threads.json")), warnings))
    {
        throw std::runtime_error(warnings.join(QStringLiteral("; ")).toStdString());
    }
    return table;
}

} // namespace test_helpers
