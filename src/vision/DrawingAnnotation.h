#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include <glm/vec2.hpp>

#include <optional>
#include <vector>

namespace vision
{

enum class AnnotationKind
{
    OuterDiameter,
    Bore,
    Hole,
    Thread,
    Length,
    Chamfer,
    SurfaceFinish,
    Other
};

// Confidence rubric bands shared by the prompt and the contract checks.
enum class ConfidenceBand
{
    Printed,          // 0.95 - 1.00
    MinorAmbiguity,   // 0.80 - 0.94
    SpatialInference, // 0.50 - 0.79
    Guess             // below 0.50
};

// Where on the part the callout applies: an axial range along the turning axis
// (start == end for a point) or a 2D coordinate on the drawing's main view.
struct PositionHint
{
    enum class Type
    {
        Axial,
        Planar
    };

    Type type{Type::Axial};
    double axialStart_mm{0.0};
    double axialEnd_mm{0.0};
    glm::dvec2 xy_mm{0.0};
};

struct DrawingAnnotation
{
    QString label;
    AnnotationKind kind{AnnotationKind::Other};
    QString text;
    std::optional<double> nominal_mm;
    std::optional<QString> toleranceClass;
    std::optional<QString> designation;
    std::optional<PositionHint> position;
    // Feature length or depth when the callout states one ("ø60 h9 x28").
    std::optional<double> length_mm;
    double confidence{0.0};
    QString region;
    QString provenance;

    [[nodiscard]] bool hasPosition() const noexcept { return position.has_value(); }
};

// One interpretation pass; re-running produces a new batch with a higher version.
struct AnnotationBatch
{
    QString sourceId;
    int drawingVersion{0};
    QString interpreter;
    std::vector<DrawingAnnotation> annotations;
};

// A rendered drawing page handed over by the rendering collaborator.
struct DrawingPage
{
    QString sourceId;
    int pageIndex{0};
    QByteArray pngBytes;
};

struct ThreadDesignation
{
    double nominal_mm{0.0};
    std::optional<double> pitch_mm;
};

QString toString(AnnotationKind kind);
AnnotationKind annotationKindFromString(const QString& text);

ConfidenceBand confidenceBand(double confidence);
QString toString(ConfidenceBand band);

// Finds an ISO metric designation ("M30x2", "M30×2", "M8-6H") inside a callout.
std::optional<ThreadDesignation> parseThreadDesignation(const QString& text);

// Diameter-type kinds are matched against round faces; the rest never are.
bool isDiameterKind(AnnotationKind kind);

} // namespace vision
