#pragma once

#include "est/ConstraintClassifier.h"
#include "est/EstimationResult.h"
#include "est/Machine.h"
#include "est/MaterialTable.h"
#include "est/ThreadTable.h"
#include "geom/GeometryTypes.h"
#include "recon/Reconciler.h"

#include <QtCore/QStringList>

namespace est
{

struct CuttingParameters
{
    double feed_mm_per_rev{0.15};
    int precisionPasses{3};
    int standardPasses{2};
    // Fits at or finer than this grade get the precision pass count.
    int precisionGradeLimit{7};
    double drillingSpeedFactor{0.7};
    double threadingSpeed_m_min{30.0};
    int threadingPasses{3};
};

struct EstimationInputs
{
    const geom::GeometrySummary* summary{nullptr};
    const recon::ReconciliationResult* reconciliation{nullptr};
    ConstraintFlags flags;
    const Material* material{nullptr};
    const ThreadTable* threads{nullptr};
    Machine machine;
    CuttingParameters cutting;
    bool drawingAvailable{false};
    int geometryVersion{0};
    int drawingVersion{0};
    // Warnings raised before estimation (e.g. a failed interpretation), reported first.
    QStringList upstreamWarnings;
};

// Pure: identical inputs always give an identical result and hash.
[[nodiscard]] EstimationResult estimateTime(const EstimationInputs& inputs);

// Spindle speed for a cut at `diameter_mm`, capped by the machine.
[[nodiscard]] double spindleRpm(double cuttingSpeed_m_min, double diameter_mm, double rpmCap);

} // namespace est
