#include "est/ConstraintClassifier.h"

#include "common/log.h"
#include "est/ToleranceGrade.h"
#include "geom/GeometrySummarizer.h"

#include <algorithm>
#include <limits>

namespace est
{

double ConstraintFlags::compoundedMultiplier() const noexcept
{
    return aspectRatio.effectiveMultiplier() * roughBlank.effectiveMultiplier() * tightTolerance.effectiveMultiplier()
           * stockRemoval.effectiveMultiplier();
}

double aspectRatio(const geom::GeometrySummary& summary)
{
    if (summary.partType == geom::PartType::Rotational)
    {
        const double diameter = geom::maxCrossSection(summary);
        return diameter > 0.0 ? geom::axialLength(summary) / diameter : 0.0;
    }

    const glm::dvec3 size = summary.bounds.size();
    const double longest = std::max({size.x, size.y, size.z});
    const double shortest = std::min({size.x, size.y, size.z});
    return shortest > 0.0 ? longest / shortest : 0.0;
}

ConstraintFlags classifyConstraints(const geom::GeometrySummary& summary,
                                    const std::vector<DeclaredTolerance>& tolerances,
                                    const ConstraintRules& rules)
{
    ConstraintFlags flags;

    flags.aspectRatio.basis = aspectRatio(summary);
    flags.aspectRatio.threshold = rules.aspectRatioLimit;
    flags.aspectRatio.multiplier = rules.aspectRatioMultiplier;
    flags.aspectRatio.triggered = flags.aspectRatio.basis > rules.aspectRatioLimit;

    flags.stock = makeStock(summary, rules.allowance);
    const double stockVolume = flags.stock.volume_mm3();
    flags.stockRemovalRatio =
        stockVolume > 0.0 ? std::clamp((stockVolume - summary.volume_mm3) / stockVolume, 0.0, 1.0) : 0.0;

    flags.roughBlank.basis = flags.stockRemovalRatio;
    flags.roughBlank.threshold = rules.roughBlankRatio;
    flags.roughBlank.multiplier = rules.roughBlankMultiplier;
    flags.roughBlank.triggered = flags.stockRemovalRatio > rules.roughBlankRatio;

    flags.stockRemoval.basis = flags.stockRemovalRatio;
    flags.stockRemoval.threshold = rules.nearNetRatio;
    flags.stockRemoval.multiplier = rules.nearNetMultiplier;
    flags.stockRemoval.triggered = stockVolume > 0.0 && flags.stockRemovalRatio < rules.nearNetRatio;

    int finest = std::numeric_limits<int>::max();
    for (const DeclaredTolerance& declared : tolerances)
    {
        if (const auto grade = itGrade(declared.tolerance, declared.nominal_mm))
        {
            finest = std::min(finest, *grade);
        }
        else
        {
            LOG_WARN(Estimate, QStringLiteral("Unreadable tolerance \"%1\" ignored").arg(declared.tolerance));
        }
    }
    flags.tightTolerance.threshold = rules.referenceGrade;
    flags.tightTolerance.multiplier = rules.tightToleranceMultiplier;
    if (finest != std::numeric_limits<int>::max())
    {
        flags.tightTolerance.basis = finest;
        flags.tightTolerance.triggered = finest < rules.referenceGrade;
    }

    LOG_INFO(Estimate,
             QStringLiteral("%1: aspect %2, removal %3, finest IT %4 -> x%5")
                 .arg(summary.sourceId)
                 .arg(flags.aspectRatio.basis, 0, 'f', 3)
                 .arg(flags.stockRemovalRatio, 0, 'f', 3)
                 .arg(flags.tightTolerance.basis)
                 .arg(flags.compoundedMultiplier(), 0, 'f', 4));
    return flags;
}

} // namespace est
