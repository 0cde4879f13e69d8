#pragma once

#include "recon/Reconciler.h"

#include <QtCore/QString>
#include <QtCore/QStringList>

#include <optional>
#include <vector>

namespace est
{

enum class OperationCategory
{
    Turning,
    Boring,
    Drilling,
    Threading,
    Milling
};

enum class Confidence
{
    High,
    Medium,
    Low
};

struct OperationEstimate
{
    OperationCategory category{OperationCategory::Turning};
    QString label;
    double keyDimension_mm{0.0};
    double feed_mm_per_rev{0.0};
    double rpm{0.0};
    int passes{1};
    double time_min{0.0};
    // Index into EstimationResult::features; empty for whole-part operations.
    std::optional<int> featureIndex;
};

struct EstimationResult
{
    QString sourceId;
    int geometryVersion{0};
    int drawingVersion{0};
    QString materialCode;
    std::vector<OperationEstimate> operations;
    std::vector<recon::ReconciledFeature> features;
    // Sum of operation times times the constraint multiplier, before setup.
    double machiningTime_min{0.0};
    double setupTime_min{0.0};
    double totalTime_min{0.0};
    double constraintMultiplier{1.0};
    QString determinismHash;
    Confidence confidence{Confidence::Low};
    bool synthetic{false};
    bool drawingAvailable{false};
    QStringList warnings;
    std::vector<recon::ReconciliationWarning> discrepancies;
};

QString toString(OperationCategory category);
std::optional<OperationCategory> operationCategoryFromString(const QString& text);
QString toString(Confidence confidence);
std::optional<Confidence> confidenceFromString(const QString& text);

} // namespace est
