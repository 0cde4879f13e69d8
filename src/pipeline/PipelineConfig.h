#pragma once

#include "est/ConstraintClassifier.h"
#include "est/Machine.h"
#include "est/TimeEstimator.h"
#include "geom/GeometrySummarizer.h"
#include "recon/Reconciler.h"
#include "vision/HttpVisionClient.h"
#include "vision/RetryPolicy.h"

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include <map>

namespace pipeline
{

struct PipelineConfig
{
    vision::VisionSettings vision;
    vision::RetryPolicy retry;
    est::Machine machine{est::makeDefaultMachine()};
    est::CuttingParameters cutting;
    est::ConstraintRules rules;
    geom::SummaryOptions summary;
    recon::ReconcileOptions reconcile;

    QString materialTablePath{QStringLiteral("data/materials.json")};
    QString threadTablePath{QStringLiteral("data/threads.json")};
    // Append-only JSON-lines journal of stored summaries, batches and results; empty disables it.
    QString journalPath;

    // Known misclassifications keyed by source id, applied after extraction.
    std::map<QString, geom::PartType> partTypeOverrides;

    // 0 means one worker per CPU core.
    int geometryWorkers{0};
    int ioWorkers{4};
    // Concurrent submitted runs; 0 means one per CPU core plus the I/O workers.
    int runWorkers{0};

    // Missing file -> defaults. Unreadable or malformed JSON -> common::ConfigError.
    static PipelineConfig load(const QString& filePath);

    // Relative table and journal paths resolve against `baseDir`.
    static PipelineConfig fromJson(const QByteArray& data, const QString& baseDir);
};

} // namespace pipeline
