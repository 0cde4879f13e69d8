#pragma once

#include "common/Cancellation.h"
#include "est/EstimationResult.h"
#include "est/MaterialTable.h"
#include "est/ThreadTable.h"
#include "geom/IGeometrySource.h"
#include "pipeline/PipelineConfig.h"
#include "pipeline/ResultStore.h"
#include "vision/DrawingInterpreter.h"
#include "vision/IVisionClient.h"

#include <QtCore/QFuture>
#include <QtCore/QMutex>
#include <QtCore/QThreadPool>

#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace pipeline
{

struct EstimationRequest
{
    geom::CadInput cad;
    std::optional<vision::DrawingPage> drawing;
    int drawingVersion{0};
    // Empty means "detect from the source id"; an undetectable code is an error.
    QString materialCode;
    // Reuse a stored geometry version instead of extracting again.
    std::optional<int> geometryVersion;
};

struct PipelineDependencies
{
    std::shared_ptr<const est::MaterialTable> materials;
    std::shared_ptr<const est::ThreadTable> threads;
    std::shared_ptr<geom::IGeometrySource> geometrySource;
    std::shared_ptr<geom::IGeometrySource> fallbackSource;
    std::shared_ptr<vision::IVisionClient> visionClient;
    std::shared_ptr<ResultStore> store;
};

// Runs extraction and interpretation concurrently, then reconciles, classifies and
// estimates. Per-part state lives in the run; only the lookup tables are shared.
class EstimationPipeline
{
public:
    EstimationPipeline(PipelineConfig config, PipelineDependencies dependencies);
    ~EstimationPipeline();

    EstimationPipeline(const EstimationPipeline&) = delete;
    EstimationPipeline& operator=(const EstimationPipeline&) = delete;

    // Loads the lookup tables and wires the OpenCASCADE source, the deterministic
    // fallback, the HTTP vision client and a journaled store. Throws common::TableLoadError.
    static std::unique_ptr<EstimationPipeline> create(const PipelineConfig& config);

    // Blocks until the run finishes. Returns std::nullopt when the run was cancelled.
    // Throws common::MaterialNotFoundError for an unknown material.
    std::optional<est::EstimationResult> run(const EstimationRequest& request);

    // Validates the material and registers the run before queueing, so an unknown code throws
    // here rather than in the future and cancel() reaches the run even before it starts.
    QFuture<std::optional<est::EstimationResult>> submit(EstimationRequest request);

    // Cancels every in-flight run for (sourceId, drawingVersion).
    void cancel(const QString& sourceId, int drawingVersion);

    [[nodiscard]] ResultStore& store() { return *m_deps.store; }
    [[nodiscard]] const PipelineConfig& config() const noexcept { return m_config; }

    // Blocks until all queued runs have finished.
    void waitForDone();

private:
    using RunKey = std::pair<QString, int>;

    const est::Material& resolveMaterial(const EstimationRequest& request) const;
    common::CancellationTokenPtr registerRun(const RunKey& key);
    void unregisterRun(const RunKey& key, const common::CancellationTokenPtr& token);
    std::optional<est::EstimationResult> runRegistered(const EstimationRequest& request,
                                                       const est::Material& material,
                                                       const common::CancellationTokenPtr& token);
    geom::GeometrySummary extractGeometry(const geom::CadInput& input) const;

    PipelineConfig m_config;
    PipelineDependencies m_deps;
    std::unique_ptr<vision::DrawingInterpreter> m_interpreter;

    QThreadPool m_geometryPool;
    QThreadPool m_ioPool;
    QThreadPool m_runPool;

    QMutex m_runsMutex;
    std::map<RunKey, std::vector<common::CancellationTokenPtr>> m_runs;
};

} // namespace pipeline
