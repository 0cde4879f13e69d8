#pragma once

#include "est/Stock.h"
#include "geom/GeometryTypes.h"

#include <QtCore/QString>

#include <vector>

namespace est
{

struct ConstraintFlag
{
    bool triggered{false};
    // Measured value the rule compared against its threshold.
    double basis{0.0};
    double threshold{0.0};
    double multiplier{1.0};

    [[nodiscard]] double effectiveMultiplier() const noexcept { return triggered ? multiplier : 1.0; }
};

struct ConstraintFlags
{
    ConstraintFlag aspectRatio;
    ConstraintFlag stockRemoval;
    ConstraintFlag tightTolerance;
    ConstraintFlag roughBlank;
    Stock stock;
    double stockRemovalRatio{0.0};

    // Product of the triggered multipliers, always taken in declaration order.
    [[nodiscard]] double compoundedMultiplier() const noexcept;
};

struct DeclaredTolerance
{
    QString tolerance;
    double nominal_mm{0.0};
};

struct ConstraintRules
{
    double aspectRatioLimit{4.0};
    double aspectRatioMultiplier{1.20};
    double roughBlankRatio{0.70};
    double roughBlankMultiplier{1.05};
    // Removal below this ratio means a near-net blank that still needs a full setup of cuts.
    double nearNetRatio{0.05};
    double nearNetMultiplier{1.10};
    // Reference grade; anything strictly finer triggers the tight-tolerance flag.
    int referenceGrade{7};
    double tightToleranceMultiplier{1.10};
    StockAllowance allowance;
};

[[nodiscard]] double aspectRatio(const geom::GeometrySummary& summary);

[[nodiscard]] ConstraintFlags classifyConstraints(const geom::GeometrySummary& summary,
                                                  const std::vector<DeclaredTolerance>& tolerances,
                                                  const ConstraintRules& rules = {});

} // namespace est
