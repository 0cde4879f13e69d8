#pragma once

#include "geom/GeometryTypes.h"
#include "vision/DrawingAnnotation.h"

#include <QtCore/QString>

#include <optional>
#include <vector>

namespace recon
{

enum class ValueSource
{
    Geometry,
    Drawing,
    DrawingOnly,
    Inferred
};

enum class MatchConfidence
{
    High,
    Medium,
    Low
};

struct ReconciledFeature
{
    std::optional<int> faceId;
    std::optional<int> annotationIndex;
    vision::AnnotationKind kind{vision::AnnotationKind::Other};
    QString label;
    std::optional<double> geometryValue_mm;
    std::optional<double> drawingValue_mm;
    double authoritativeValue_mm{0.0};
    ValueSource valueSource{ValueSource::Geometry};
    // Relative difference |geometry - drawing| / drawing in percent; set only when both exist.
    std::optional<double> deltaPct;
    MatchConfidence matchConfidence{MatchConfidence::Low};
    // Length machined for this feature, used by the time model.
    double axialLength_mm{0.0};
    std::optional<QString> toleranceClass;
    std::optional<QString> designation;
};

// A drawing value and a measured face disagree by at least the match tolerance.
struct ReconciliationWarning
{
    std::optional<int> annotationIndex;
    std::optional<int> faceId;
    double drawingValue_mm{0.0};
    double geometryValue_mm{0.0};
    double deltaPct{0.0};
    QString message;
};

struct ReconciliationResult
{
    std::vector<ReconciledFeature> features;
    std::vector<ReconciliationWarning> warnings;
};

struct ReconcileOptions
{
    double matchTolerancePct{5.0};
    // Faces at the hinted position whose diameter is off by up to this much are kept as discrepancies.
    double discrepancyWindowPct{25.0};
    double positionSlack_mm{0.5};
    double axisToleranceDeg{15.0};
};

// Merges measured faces and drawing annotations into per-feature values. The drawing
// nominal is authoritative whenever an annotation exists; disagreements are reported,
// never averaged.
[[nodiscard]] ReconciliationResult reconcile(const geom::GeometrySummary& summary,
                                             const std::vector<vision::DrawingAnnotation>& annotations,
                                             const ReconcileOptions& options = {});

QString toString(ValueSource source);
QString toString(MatchConfidence confidence);
std::optional<ValueSource> valueSourceFromString(const QString& text);
std::optional<MatchConfidence> matchConfidenceFromString(const QString& text);

} // namespace recon
