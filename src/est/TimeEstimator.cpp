#include "est/TimeEstimator.h"

#include "common/Enforce.h"
#include "common/log.h"
#include "est/EstimationSerialization.h"
#include "est/Stock.h"
#include "est/ToleranceGrade.h"

#include <algorithm>
#include <numbers>
#include <set>
#include <utility>

namespace est
{

namespace
{

using recon::ReconciledFeature;
using vision::AnnotationKind;

constexpr double kMm3PerCm3 = 1000.0;
constexpr double kMm2PerCm2 = 100.0;

class OperationPlanner
{
public:
    explicit OperationPlanner(const EstimationInputs& inputs)
        : m_in(inputs)
        , m_rotational(inputs.summary->partType == geom::PartType::Rotational)
    {
    }

    void planWholePart()
    {
        const OperationCategory category = m_rotational ? OperationCategory::Turning : OperationCategory::Milling;
        const Stock& stock = m_in.flags.stock;

        const double removal_cm3 = std::max(0.0, stock.volume_mm3() - m_in.summary->volume_mm3) / kMm3PerCm3;
        if (removal_cm3 > 0.0)
        {
            OperationEstimate bulk;
            bulk.category = category;
            bulk.label = QStringLiteral("bulk removal");
            bulk.keyDimension_mm = stock.shape == Stock::Shape::Bar
                                       ? stock.diameter_mm
                                       : std::max({stock.sizeXYZ_mm.x, stock.sizeXYZ_mm.y, stock.sizeXYZ_mm.z});
            bulk.time_min = removal_cm3 * m_in.material->mrr_min_per_cm3;
            m_operations.push_back(bulk);
        }

        const double area_cm2 = m_in.summary->surfaceAreaAdjusted_mm2 / kMm2PerCm2;
        if (area_cm2 > 0.0)
        {
            OperationEstimate finishing;
            finishing.category = category;
            finishing.label = QStringLiteral("surface finishing");
            finishing.time_min = area_cm2 / m_in.material->finishingRate_cm2_min;
            m_operations.push_back(finishing);
        }
    }

    void planFeature(int index, const ReconciledFeature& feature)
    {
        switch (feature.kind)
        {
        case AnnotationKind::OuterDiameter:
            planContour(index, feature, m_rotational ? OperationCategory::Turning : OperationCategory::Milling);
            break;
        case AnnotationKind::Bore:
            planContour(index, feature, OperationCategory::Boring);
            break;
        case AnnotationKind::Hole:
            planDrilling(index, feature);
            break;
        case AnnotationKind::Thread:
            planThreading(index, feature);
            break;
        default:
            break;
        }
    }

    std::vector<OperationEstimate> takeOperations() { return std::move(m_operations); }
    QStringList takeWarnings() { return std::move(m_warnings); }

private:
    bool usable(const ReconciledFeature& feature)
    {
        if (feature.authoritativeValue_mm > 0.0 && feature.axialLength_mm > 0.0)
        {
            return true;
        }
        m_warnings.push_back(QStringLiteral("%1: no usable diameter or length, operation omitted").arg(describe(feature)));
        return false;
    }

    int passesFor(const ReconciledFeature& feature) const
    {
        if (feature.toleranceClass)
        {
            const auto grade = itGrade(*feature.toleranceClass, feature.authoritativeValue_mm);
            if (grade && *grade <= m_in.cutting.precisionGradeLimit)
            {
                return m_in.cutting.precisionPasses;
            }
        }
        return m_in.cutting.standardPasses;
    }

    void planContour(int index, const ReconciledFeature& feature, OperationCategory category)
    {
        if (!usable(feature))
        {
            return;
        }
        OperationEstimate op;
        op.category = category;
        op.label = describe(feature);
        op.keyDimension_mm = feature.authoritativeValue_mm;
        op.feed_mm_per_rev = m_in.cutting.feed_mm_per_rev;
        op.rpm = spindleRpm(m_in.material->cuttingSpeed_m_min, op.keyDimension_mm, m_in.machine.maxSpindleRPM);
        op.passes = passesFor(feature);
        op.time_min = feature.axialLength_mm * op.passes / (op.feed_mm_per_rev * op.rpm);
        op.featureIndex = index;
        m_operations.push_back(op);
    }

    void planDrilling(int index, const ReconciledFeature& feature)
    {
        if (!usable(feature))
        {
            return;
        }
        OperationEstimate op;
        op.category = OperationCategory::Drilling;
        op.label = describe(feature);
        op.keyDimension_mm = feature.authoritativeValue_mm;
        op.feed_mm_per_rev = m_in.cutting.feed_mm_per_rev;
        op.rpm = spindleRpm(m_in.material->cuttingSpeed_m_min * m_in.cutting.drillingSpeedFactor,
                            op.keyDimension_mm,
                            m_in.machine.maxSpindleRPM);
        op.passes = 1;
        op.time_min = feature.axialLength_mm / (op.feed_mm_per_rev * op.rpm);
        op.featureIndex = index;
        m_operations.push_back(op);
    }

    void planThreading(int index, const ReconciledFeature& feature)
    {
        const QString designationText = feature.designation.value_or(feature.label);
        const auto designation = vision::parseThreadDesignation(designationText);
        const std::optional<double> pitch = designation ? m_in.threads->resolvePitch(*designation) : std::nullopt;
        if (!pitch)
        {
            m_warnings.push_back(
                QStringLiteral("Unknown thread designation \"%1\", threading omitted").arg(designationText));
            return;
        }
        if (!usable(feature))
        {
            return;
        }

        OperationEstimate op;
        op.category = OperationCategory::Threading;
        op.label = describe(feature);
        op.keyDimension_mm = designation->nominal_mm;
        op.feed_mm_per_rev = *pitch;
        op.rpm = spindleRpm(m_in.cutting.threadingSpeed_m_min, op.keyDimension_mm, m_in.machine.maxSpindleRPM);
        op.passes = m_in.cutting.threadingPasses;
        op.time_min = (feature.axialLength_mm / *pitch / op.rpm) * op.passes;
        op.featureIndex = index;
        m_operations.push_back(op);
    }

    static QString describe(const ReconciledFeature& feature)
    {
        if (feature.designation)
        {
            return *feature.designation;
        }
        QString text = QStringLiteral("%1 %2").arg(vision::toString(feature.kind),
                                                   QString::number(feature.authoritativeValue_mm, 'f', 3));
        if (feature.toleranceClass)
        {
            text += QLatin1Char(' ') + *feature.toleranceClass;
        }
        return text;
    }

    const EstimationInputs& m_in;
    const bool m_rotational;
    std::vector<OperationEstimate> m_operations;
    QStringList m_warnings;
};

Confidence overallConfidence(const EstimationInputs& inputs)
{
    if (inputs.summary->synthetic || !inputs.drawingAvailable)
    {
        return Confidence::Low;
    }
    const auto& reconciliation = *inputs.reconciliation;
    const bool drawingOnly = std::any_of(reconciliation.features.begin(), reconciliation.features.end(),
                                         [](const ReconciledFeature& feature) {
                                             return feature.valueSource == recon::ValueSource::DrawingOnly
                                                    && vision::isDiameterKind(feature.kind);
                                         });
    return drawingOnly || !reconciliation.warnings.empty() ? Confidence::Medium : Confidence::High;
}

} // namespace

double spindleRpm(double cuttingSpeed_m_min, double diameter_mm, double rpmCap)
{
    ENFORCE(diameter_mm > 0.0, "Spindle speed needs a positive diameter.");
    return std::min(cuttingSpeed_m_min * 1000.0 / (std::numbers::pi * diameter_mm), rpmCap);
}

EstimationResult estimateTime(const EstimationInputs& inputs)
{
    ENFORCE(inputs.summary && inputs.reconciliation && inputs.material && inputs.threads,
            "estimateTime requires summary, reconciliation, material and thread table.");

    OperationPlanner planner(inputs);
    planner.planWholePart();
    const auto& features = inputs.reconciliation->features;
    for (std::size_t i = 0; i < features.size(); ++i)
    {
        planner.planFeature(static_cast<int>(i), features[i]);
    }

    EstimationResult result;
    result.sourceId = inputs.summary->sourceId;
    result.geometryVersion = inputs.geometryVersion;
    result.drawingVersion = inputs.drawingVersion;
    result.materialCode = inputs.material->code;
    result.operations = planner.takeOperations();
    result.features = features;
    result.warnings = inputs.upstreamWarnings + planner.takeWarnings();
    result.discrepancies = inputs.reconciliation->warnings;
    result.synthetic = inputs.summary->synthetic;
    result.drawingAvailable = inputs.drawingAvailable;
    result.constraintMultiplier = inputs.flags.compoundedMultiplier();

    double cutting = 0.0;
    std::set<OperationCategory> categories;
    for (const OperationEstimate& op : result.operations)
    {
        cutting += op.time_min;
        categories.insert(op.category);
    }
    result.machiningTime_min = cutting * result.constraintMultiplier;
    result.setupTime_min = inputs.material->setup_min * static_cast<double>(categories.size());
    result.totalTime_min = result.machiningTime_min + result.setupTime_min;
    result.confidence = overallConfidence(inputs);
    if (result.synthetic)
    {
        result.warnings.push_back(QStringLiteral("Geometry is synthetic (fallback); times are indicative only."));
    }
    if (!result.drawingAvailable)
    {
        result.warnings.push_back(QStringLiteral("No drawing annotations; geometry-only estimate."));
    }
    result.determinismHash = determinismHash(result);

    LOG_INFO(Estimate,
             QStringLiteral("%1 [%2]: %3 operations, %4 min machining + %5 min setup, confidence %6")
                 .arg(result.sourceId, result.materialCode)
                 .arg(result.operations.size())
                 .arg(result.machiningTime_min, 0, 'f', 2)
                 .arg(result.setupTime_min, 0, 'f', 2)
                 .arg(toString(result.confidence)));
    return result;
}

QString toString(OperationCategory category)
{
    switch (category)
    {
    case OperationCategory::Turning: return QStringLiteral("turning");
    case OperationCategory::Boring: return QStringLiteral("boring");
    case OperationCategory::Drilling: return QStringLiteral("drilling");
    case OperationCategory::Threading: return QStringLiteral("threading");
    case OperationCategory::Milling: return QStringLiteral("milling");
    }
    return QStringLiteral("milling");
}

std::optional<OperationCategory> operationCategoryFromString(const QString& text)
{
    for (OperationCategory category : {OperationCategory::Turning, OperationCategory::Boring, OperationCategory::Drilling,
                                       OperationCategory::Threading, OperationCategory::Milling})
    {
        if (toString(category) == text)
        {
            return category;
        }
    }
    return std::nullopt;
}

QString toString(Confidence confidence)
{
    switch (confidence)
    {
    case Confidence::High: return QStringLiteral("high");
    case Confidence::Medium: return QStringLiteral("medium");
    case Confidence::Low: return QStringLiteral("low");
    }
    return QStringLiteral("low");
}

std::optional<Confidence> confidenceFromString(const QString& text)
{
    for (Confidence confidence : {Confidence::High, Confidence::Medium, Confidence::Low})
    {
        if (toString(confidence) == text)
        {
            return confidence;
        }
    }
    return std::nullopt;
}

} // namespace est
