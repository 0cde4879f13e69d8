#include "recon/Reconciler.h"

#include "common/Enforce.h"
#include "common/log.h"
#include "geom/GeometrySummarizer.h"

#include <glm/common.hpp>
#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>
#include <utility>

namespace recon
{

namespace
{

using vision::AnnotationKind;
using vision::DrawingAnnotation;
using vision::PositionHint;

struct Candidate
{
    const geom::GeometryFace* face{nullptr};
    double dimensionalDeltaPct{0.0};
    double positionalDelta_mm{0.0};

    bool operator<(const Candidate& other) const
    {
        return std::tie(dimensionalDeltaPct, positionalDelta_mm, face->id)
               < std::tie(other.dimensionalDeltaPct, other.positionalDelta_mm, other.face->id);
    }
};

double deltaPercent(double geometryValue, double drawingValue)
{
    return std::abs(geometryValue - drawingValue) / drawingValue * 100.0;
}

bool orientationCompatible(AnnotationKind kind, geom::FaceOrientation orientation)
{
    switch (kind)
    {
    case AnnotationKind::OuterDiameter:
        return orientation == geom::FaceOrientation::Outer;
    case AnnotationKind::Bore:
    case AnnotationKind::Hole:
        return orientation == geom::FaceOrientation::Inner;
    case AnnotationKind::Thread:
        return true;
    default:
        return false;
    }
}

bool matchable(const geom::GeometryFace& face, AnnotationKind kind)
{
    return face.isRound() && face.diameter_mm && *face.diameter_mm > 0.0
           && orientationCompatible(kind, face.orientation);
}

// Length of the face measured along its own axis.
double lengthAlongAxis(const geom::GeometryFace& face)
{
    if (glm::length(face.axis) <= 0.0)
    {
        return face.axialLength_mm();
    }
    const auto [lo, hi] = geom::projectBounds(face.bounds, glm::normalize(face.axis));
    return hi - lo;
}

// Positional delta between the hint and the face, or nullopt when they do not overlap.
std::optional<double> positionalDelta(const PositionHint& hint,
                                      const geom::GeometryFace& face,
                                      const geom::GeometrySummary& summary,
                                      double slack)
{
    if (hint.type == PositionHint::Type::Axial)
    {
        if (hint.axialEnd_mm + slack < face.axialMin_mm || hint.axialStart_mm - slack > face.axialMax_mm)
        {
            return std::nullopt;
        }
        const double hintMid = 0.5 * (hint.axialStart_mm + hint.axialEnd_mm);
        const double faceMid = 0.5 * (face.axialMin_mm + face.axialMax_mm);
        return std::abs(hintMid - faceMid);
    }

    const glm::dvec3 center = face.bounds.center() - summary.bounds.min;
    const glm::dvec3 half = face.bounds.size() * 0.5;
    const double dx = std::abs(hint.xy_mm.x - center.x);
    const double dy = std::abs(hint.xy_mm.y - center.y);
    if (dx > half.x + slack || dy > half.y + slack)
    {
        return std::nullopt;
    }
    return std::hypot(dx, dy);
}

class Reconciliation
{
public:
    Reconciliation(const geom::GeometrySummary& summary, const ReconcileOptions& options)
        : m_summary(summary)
        , m_options(options)
        , m_partLength(geom::axialLength(summary))
    {
    }

    void addAnnotation(int index, const DrawingAnnotation& annotation)
    {
        ReconciledFeature feature;
        feature.annotationIndex = index;
        feature.kind = annotation.kind;
        feature.label = annotation.label;
        feature.drawingValue_mm = annotation.nominal_mm;
        feature.authoritativeValue_mm = annotation.nominal_mm.value_or(0.0);
        feature.toleranceClass = annotation.toleranceClass;
        feature.designation = annotation.designation;

        const bool canMatch = vision::isDiameterKind(annotation.kind) && annotation.nominal_mm
                              && *annotation.nominal_mm > 0.0;
        if (canMatch && annotation.position)
        {
            matchByPosition(feature, annotation);
        }
        else if (canMatch)
        {
            matchByDimension(feature, annotation);
        }
        else
        {
            markDrawingOnly(feature, annotation);
        }
        m_result.features.push_back(std::move(feature));
    }

    void addUnreferencedFaces()
    {
        std::vector<const geom::GeometryFace*> pending;
        for (const geom::GeometryFace& face : m_summary.faces)
        {
            if (m_referenced.count(face.id) || face.surfaceType != geom::SurfaceType::Cylindrical || !face.diameter_mm)
            {
                continue;
            }
            // Outer round faces on prismatic parts are edge fillets; aligned ones on rotational parts come from the bar.
            if (face.orientation == geom::FaceOrientation::Outer
                && (m_summary.partType == geom::PartType::Prismatic || geom::isStockFormed(face, m_summary, m_options.axisToleranceDeg)))
            {
                continue;
            }
            pending.push_back(&face);
        }

        // Split cylinders (two half faces sharing one axis line) collapse into one feature.
        std::vector<bool> consumed(pending.size(), false);
        for (std::size_t i = 0; i < pending.size(); ++i)
        {
            if (consumed[i])
            {
                continue;
            }
            const geom::GeometryFace& face = *pending[i];
            common::Bounds merged = face.bounds;
            for (std::size_t j = i + 1; j < pending.size(); ++j)
            {
                if (!consumed[j] && sameCylinder(face, *pending[j]))
                {
                    consumed[j] = true;
                    merged.min = glm::min(merged.min, pending[j]->bounds.min);
                    merged.max = glm::max(merged.max, pending[j]->bounds.max);
                }
            }

            geom::GeometryFace combined = face;
            combined.bounds = merged;

            ReconciledFeature feature;
            feature.faceId = face.id;
            feature.kind = geometryKind(face);
            feature.label = QStringLiteral("face %1").arg(face.id);
            feature.geometryValue_mm = face.diameter_mm;
            feature.authoritativeValue_mm = *face.diameter_mm;
            feature.valueSource = ValueSource::Geometry;
            feature.matchConfidence = MatchConfidence::Low;
            feature.axialLength_mm = lengthAlongAxis(combined);
            m_result.features.push_back(std::move(feature));
        }
    }

    ReconciliationResult take() { return std::move(m_result); }

private:
    std::vector<Candidate> candidates(const DrawingAnnotation& annotation, double maxDeltaPct) const
    {
        std::vector<Candidate> found;
        const double nominal = *annotation.nominal_mm;
        for (const geom::GeometryFace& face : m_summary.faces)
        {
            if (!matchable(face, annotation.kind))
            {
                continue;
            }
            const double delta = deltaPercent(*face.diameter_mm, nominal);
            if (delta > maxDeltaPct)
            {
                continue;
            }
            Candidate candidate{&face, delta, 0.0};
            if (annotation.position)
            {
                const auto position = positionalDelta(*annotation.position, face, m_summary, m_options.positionSlack_mm);
                if (!position)
                {
                    continue;
                }
                candidate.positionalDelta_mm = *position;
            }
            found.push_back(candidate);
        }
        std::sort(found.begin(), found.end());
        return found;
    }

    void matchByPosition(ReconciledFeature& feature, const DrawingAnnotation& annotation)
    {
        std::vector<Candidate> found = candidates(annotation, m_options.discrepancyWindowPct);
        if (found.empty())
        {
            markDrawingOnly(feature, annotation);
            return;
        }

        const Candidate& best = found.front();
        attachFace(feature, annotation, *best.face, best.dimensionalDeltaPct);
        feature.valueSource = ValueSource::Drawing;
        if (best.dimensionalDeltaPct < m_options.matchTolerancePct)
        {
            feature.matchConfidence = MatchConfidence::High;
            return;
        }

        feature.matchConfidence = MatchConfidence::Medium;
        ReconciliationWarning warning;
        warning.annotationIndex = feature.annotationIndex;
        warning.faceId = best.face->id;
        warning.drawingValue_mm = *annotation.nominal_mm;
        warning.geometryValue_mm = *best.face->diameter_mm;
        warning.deltaPct = best.dimensionalDeltaPct;
        warning.message = QStringLiteral("%1: drawing %2 mm vs face %3 measured %4 mm (%5 %)")
                              .arg(annotation.text.isEmpty() ? annotation.label : annotation.text)
                              .arg(warning.drawingValue_mm, 0, 'f', 3)
                              .arg(best.face->id)
                              .arg(warning.geometryValue_mm, 0, 'f', 3)
                              .arg(warning.deltaPct, 0, 'f', 2);
        LOG_WARN(Recon, warning.message);
        m_result.warnings.push_back(std::move(warning));
    }

    void matchByDimension(ReconciledFeature& feature, const DrawingAnnotation& annotation)
    {
        std::vector<Candidate> found = candidates(annotation, m_options.matchTolerancePct);
        found.erase(std::remove_if(found.begin(), found.end(),
                                   [this](const Candidate& c) { return m_referenced.count(c.face->id) > 0; }),
                    found.end());
        if (found.size() != 1)
        {
            markDrawingOnly(feature, annotation);
            return;
        }

        attachFace(feature, annotation, *found.front().face, found.front().dimensionalDeltaPct);
        feature.valueSource = ValueSource::Inferred;
        feature.matchConfidence = MatchConfidence::Low;
    }

    void attachFace(ReconciledFeature& feature,
                    const DrawingAnnotation& annotation,
                    const geom::GeometryFace& face,
                    double deltaPct)
    {
        ENFORCE(annotation.nominal_mm.has_value(), "Matched annotation must carry a nominal value.");
        m_referenced.insert(face.id);
        feature.faceId = face.id;
        feature.geometryValue_mm = face.diameter_mm;
        feature.deltaPct = deltaPct;
        feature.authoritativeValue_mm = *annotation.nominal_mm;
        feature.axialLength_mm = annotation.length_mm.value_or(lengthAlongAxis(face));
    }

    void markDrawingOnly(ReconciledFeature& feature, const DrawingAnnotation& annotation)
    {
        feature.valueSource = ValueSource::DrawingOnly;
        feature.matchConfidence = vision::confidenceBand(annotation.confidence) == vision::ConfidenceBand::Guess
                                      ? MatchConfidence::Low
                                      : MatchConfidence::Medium;
        feature.axialLength_mm = drawingOnlyLength(annotation);
    }

    // Without a face the length comes from the callout, then from the hinted range,
    // and finally from the part itself (a through feature).
    double drawingOnlyLength(const DrawingAnnotation& annotation) const
    {
        if (annotation.length_mm && *annotation.length_mm > 0.0)
        {
            return *annotation.length_mm;
        }
        if (annotation.position && annotation.position->type == PositionHint::Type::Axial)
        {
            const double span = annotation.position->axialEnd_mm - annotation.position->axialStart_mm;
            if (span > 0.0)
            {
                return span;
            }
        }
        return m_partLength;
    }

    vision::AnnotationKind geometryKind(const geom::GeometryFace& face) const
    {
        if (face.orientation == geom::FaceOrientation::Outer)
        {
            return AnnotationKind::OuterDiameter;
        }
        const bool onAxis = common::lineAngleDeg(face.axis, m_summary.principalAxis) <= m_options.axisToleranceDeg;
        return m_summary.partType == geom::PartType::Rotational && onAxis ? AnnotationKind::Bore : AnnotationKind::Hole;
    }

    bool sameCylinder(const geom::GeometryFace& a, const geom::GeometryFace& b) const
    {
        constexpr double kCoaxialTolerance_mm = 1e-3;
        if (a.orientation != b.orientation || !b.diameter_mm
            || std::abs(*a.diameter_mm - *b.diameter_mm) > kCoaxialTolerance_mm
            || common::lineAngleDeg(a.axis, b.axis) > 0.01)
        {
            return false;
        }
        const glm::dvec3 direction = glm::normalize(a.axis);
        const glm::dvec3 offset = b.axisOrigin - a.axisOrigin;
        return glm::length(offset - glm::dot(offset, direction) * direction) <= kCoaxialTolerance_mm;
    }

    const geom::GeometrySummary& m_summary;
    const ReconcileOptions& m_options;
    const double m_partLength;
    std::set<int> m_referenced;
    ReconciliationResult m_result;
};

} // namespace

ReconciliationResult reconcile(const geom::GeometrySummary& summary,
                               const std::vector<vision::DrawingAnnotation>& annotations,
                               const ReconcileOptions& options)
{
    Reconciliation reconciliation(summary, options);
    for (std::size_t i = 0; i < annotations.size(); ++i)
    {
        reconciliation.addAnnotation(static_cast<int>(i), annotations[i]);
    }
    reconciliation.addUnreferencedFaces();

    ReconciliationResult result = reconciliation.take();
    for (const ReconciledFeature& feature : result.features)
    {
        ENFORCE(feature.faceId || feature.annotationIndex, "Reconciled feature without face or annotation.");
    }
    LOG_INFO(Recon,
             QStringLiteral("%1: %2 features, %3 discrepancies")
                 .arg(summary.sourceId)
                 .arg(result.features.size())
                 .arg(result.warnings.size()));
    return result;
}

QString toString(ValueSource source)
{
    switch (source)
    {
    case ValueSource::Geometry: return QStringLiteral("geometry");
    case ValueSource::Drawing: return QStringLiteral("drawing");
    case ValueSource::DrawingOnly: return QStringLiteral("drawing-only");
    case ValueSource::Inferred: return QStringLiteral("inferred");
    }
    return QStringLiteral("geometry");
}

QString toString(MatchConfidence confidence)
{
    switch (confidence)
    {
    case MatchConfidence::High: return QStringLiteral("high");
    case MatchConfidence::Medium: return QStringLiteral("medium");
    case MatchConfidence::Low: return QStringLiteral("low");
    }
    return QStringLiteral("low");
}

std::optional<ValueSource> valueSourceFromString(const QString& text)
{
    for (ValueSource source : {ValueSource::Geometry, ValueSource::Drawing, ValueSource::DrawingOnly, ValueSource::Inferred})
    {
        if (toString(source) == text)
        {
            return source;
        }
    }
    return std::nullopt;
}

std::optional<MatchConfidence> matchConfidenceFromString(const QString& text)
{
    for (MatchConfidence confidence : {MatchConfidence::High, MatchConfidence::Medium, MatchConfidence::Low})
    {
        if (toString(confidence) == text)
        {
            return confidence;
        }
    }
    return std::nullopt;
}

} // namespace recon
