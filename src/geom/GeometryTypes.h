#pragma once

#include "common/math.h"

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include <glm/vec3.hpp>

#include <optional>
#include <vector>

namespace geom
{

enum class SurfaceType
{
    Planar,
    Cylindrical,
    Conical,
    Toroidal,
    Freeform
};

enum class FaceOrientation
{
    Outer,
    Inner
};

enum class PartType
{
    Rotational,
    Prismatic
};

struct GeometryFace
{
    int id{0};
    SurfaceType surfaceType{SurfaceType::Planar};
    std::optional<double> diameter_mm;
    glm::dvec3 axis{0.0};
    glm::dvec3 axisOrigin{0.0};
    // Extent along the principal axis, measured from the part's first axial face.
    double axialMin_mm{0.0};
    double axialMax_mm{0.0};
    common::Bounds bounds;
    FaceOrientation orientation{FaceOrientation::Outer};
    double area_mm2{0.0};

    [[nodiscard]] bool isRound() const noexcept
    {
        return surfaceType == SurfaceType::Cylindrical || surfaceType == SurfaceType::Conical
               || surfaceType == SurfaceType::Toroidal;
    }

    [[nodiscard]] double axialLength_mm() const noexcept { return axialMax_mm - axialMin_mm; }
};

struct GeometrySummary
{
    QString sourceId;
    int version{0};
    QString extractor;
    common::Bounds bounds;
    double volume_mm3{0.0};
    std::vector<GeometryFace> faces;
    int faceCount{0};
    glm::dvec3 principalAxis{0.0, 0.0, 1.0};
    double rotationalScore{0.0};
    PartType partType{PartType::Prismatic};
    double surfaceAreaRaw_mm2{0.0};
    double surfaceAreaAdjusted_mm2{0.0};
    bool synthetic{false};
};

// One face as reported by a kernel, before classification against the part axis.
struct RawFace
{
    SurfaceType surfaceType{SurfaceType::Planar};
    std::optional<double> diameter_mm;
    glm::dvec3 axis{0.0};
    glm::dvec3 axisOrigin{0.0};
    common::Bounds bounds;
    bool reversed{false};
    double area_mm2{0.0};
};

struct RawSolid
{
    common::Bounds bounds;
    double volume_mm3{0.0};
    std::vector<RawFace> faces;
};

struct CadInput
{
    QString sourceId;
    QByteArray bytes;
    QString format{QStringLiteral("step")};
};

QString toString(SurfaceType type);
QString toString(FaceOrientation orientation);
QString toString(PartType type);

std::optional<SurfaceType> surfaceTypeFromString(const QString& text);
std::optional<PartType> partTypeFromString(const QString& text);

} // namespace geom
