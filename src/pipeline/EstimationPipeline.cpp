#include "pipeline/EstimationPipeline.h"

#include "common/Errors.h"
#include "common/log.h"
#include "est/ConstraintClassifier.h"
#include "est/TimeEstimator.h"
#include "geom/FallbackGeometrySource.h"
#include "geom/GeometrySummarizer.h"
#include "geom/OcctGeometrySource.h"
#include "recon/Reconciler.h"
#include "vision/HttpVisionClient.h"

#include <QtConcurrent/QtConcurrentRun>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFileInfo>
#include <QtCore/QMutexLocker>
#include <QtCore/QThread>

#include <algorithm>
#include <exception>
#include <functional>

namespace pipeline
{

namespace
{

struct GeometryOutcome
{
    geom::GeometrySummary summary;
    bool reused{false};
    std::exception_ptr error;
};

struct InterpretationOutcome
{
    std::optional<std::vector<vision::DrawingAnnotation>> annotations;
    QString failure;
    bool cancelled{false};
    std::exception_ptr error;
};

// Unregisters the run's cancellation token however run() exits.
class RunRegistration
{
public:
    using Release = std::function<void()>;

    explicit RunRegistration(Release release)
        : m_release(std::move(release))
    {
    }

    ~RunRegistration() { m_release(); }

    RunRegistration(const RunRegistration&) = delete;
    RunRegistration& operator=(const RunRegistration&) = delete;

private:
    Release m_release;
};

std::vector<est::DeclaredTolerance> declaredTolerances(const std::vector<vision::DrawingAnnotation>& annotations)
{
    std::vector<est::DeclaredTolerance> tolerances;
    for (const vision::DrawingAnnotation& annotation : annotations)
    {
        if (annotation.toleranceClass && annotation.nominal_mm)
        {
            tolerances.push_back({*annotation.toleranceClass, *annotation.nominal_mm});
        }
    }
    return tolerances;
}

template <typename Table>
std::shared_ptr<const Table> loadTable(const QString& path, const char* what)
{
    auto table = std::make_shared<Table>();
    QStringList warnings;
    const bool ok = table->loadFromFile(path, warnings);
    for (const QString& warning : warnings)
    {
        LOG_WARN(Pipeline, warning);
    }
    if (!ok)
    {
        throw common::TableLoadError(
            QStringLiteral("Failed to load %1 table %2: %3").arg(QLatin1String(what), path, warnings.join(QStringLiteral("; "))));
    }
    return table;
}

} // namespace

EstimationPipeline::EstimationPipeline(PipelineConfig config, PipelineDependencies dependencies)
    : m_config(std::move(config))
    , m_deps(std::move(dependencies))
{
    if (!m_deps.materials || !m_deps.threads || !m_deps.fallbackSource || !m_deps.store)
    {
        throw common::ConfigError(QStringLiteral("Pipeline needs material and thread tables, a fallback source and a store."));
    }
    if (m_deps.visionClient)
    {
        m_interpreter = std::make_unique<vision::DrawingInterpreter>(m_deps.visionClient, m_config.retry);
    }

    const int cores = std::max(1, QThread::idealThreadCount());
    m_geometryPool.setMaxThreadCount(m_config.geometryWorkers > 0 ? m_config.geometryWorkers : cores);
    m_ioPool.setMaxThreadCount(std::max(1, m_config.ioWorkers));
    m_runPool.setMaxThreadCount(m_config.runWorkers > 0 ? m_config.runWorkers : cores + std::max(1, m_config.ioWorkers));
}

EstimationPipeline::~EstimationPipeline()
{
    {
        QMutexLocker locker(&m_runsMutex);
        for (auto& [key, tokens] : m_runs)
        {
            for (const common::CancellationTokenPtr& token : tokens)
            {
                token->cancel();
            }
        }
    }
    waitForDone();
}

std::unique_ptr<EstimationPipeline> EstimationPipeline::create(const PipelineConfig& config)
{
    PipelineDependencies deps;
    deps.materials = loadTable<est::MaterialTable>(config.materialTablePath, "material");
    deps.threads = loadTable<est::ThreadTable>(config.threadTablePath, "thread");
    deps.geometrySource = std::make_shared<geom::OcctGeometrySource>(config.summary);
    deps.fallbackSource = std::make_shared<geom::FallbackGeometrySource>();
    deps.visionClient = std::make_shared<vision::HttpVisionClient>(config.vision);
    deps.store = std::make_shared<ResultStore>(config.journalPath);

    if (!config.journalPath.isEmpty() && QFileInfo::exists(config.journalPath))
    {
        QStringList warnings;
        deps.store->replayJournal(warnings);
        for (const QString& warning : warnings)
        {
            LOG_WARN(Store, warning);
        }
    }
    return std::make_unique<EstimationPipeline>(config, std::move(deps));
}

const est::Material& EstimationPipeline::resolveMaterial(const EstimationRequest& request) const
{
    if (!request.materialCode.trimmed().isEmpty())
    {
        return m_deps.materials->require(request.materialCode);
    }
    const auto detected = m_deps.materials->detectCode(request.cad.sourceId);
    if (!detected)
    {
        throw common::MaterialNotFoundError(QString());
    }
    LOG_INFO(Pipeline, QStringLiteral("%1: material %2 detected from the identifier").arg(request.cad.sourceId, *detected));
    return m_deps.materials->require(*detected);
}

common::CancellationTokenPtr EstimationPipeline::registerRun(const RunKey& key)
{
    common::CancellationTokenPtr token = common::makeCancellationToken();
    QMutexLocker locker(&m_runsMutex);
    for (auto& [other, tokens] : m_runs)
    {
        if (other.first != key.first || other.second == key.second)
        {
            continue;
        }
        if (other.second < key.second)
        {
            LOG_WARN(Pipeline,
                     QStringLiteral("%1: drawing v%2 supersedes v%3, cancelling older run")
                         .arg(key.first)
                         .arg(key.second)
                         .arg(other.second));
            for (const common::CancellationTokenPtr& stale : tokens)
            {
                stale->cancel();
            }
        }
        else
        {
            LOG_WARN(Pipeline,
                     QStringLiteral("%1: drawing v%2 is older than in-flight v%3, not running")
                         .arg(key.first)
                         .arg(key.second)
                         .arg(other.second));
            token->cancel();
        }
    }
    m_runs[key].push_back(token);
    return token;
}

void EstimationPipeline::unregisterRun(const RunKey& key, const common::CancellationTokenPtr& token)
{
    QMutexLocker locker(&m_runsMutex);
    const auto it = m_runs.find(key);
    if (it == m_runs.end())
    {
        return;
    }
    auto& tokens = it->second;
    tokens.erase(std::remove(tokens.begin(), tokens.end(), token), tokens.end());
    if (tokens.empty())
    {
        m_runs.erase(it);
    }
}

void EstimationPipeline::cancel(const QString& sourceId, int drawingVersion)
{
    QMutexLocker locker(&m_runsMutex);
    const auto it = m_runs.find({sourceId, drawingVersion});
    if (it == m_runs.end())
    {
        return;
    }
    LOG_WARN(Pipeline, QStringLiteral("%1: cancelling drawing v%2").arg(sourceId).arg(drawingVersion));
    for (const common::CancellationTokenPtr& token : it->second)
    {
        token->cancel();
    }
}

geom::GeometrySummary EstimationPipeline::extractGeometry(const geom::CadInput& input) const
{
    if (m_deps.geometrySource && m_deps.geometrySource->isAvailable())
    {
        try
        {
            return m_deps.geometrySource->extract(input);
        }
        catch (const common::ExtractionError& error)
        {
            LOG_WARN(Geom,
                     QStringLiteral("%1: %2 failed (%3); using %4")
                         .arg(input.sourceId, m_deps.geometrySource->name(), error.message(), m_deps.fallbackSource->name()));
        }
    }
    else
    {
        LOG_WARN(Geom, QStringLiteral("%1: no geometry kernel available; using %2").arg(input.sourceId, m_deps.fallbackSource->name()));
    }
    return m_deps.fallbackSource->extract(input);
}

std::optional<est::EstimationResult> EstimationPipeline::run(const EstimationRequest& request)
{
    const est::Material& material = resolveMaterial(request);
    return runRegistered(request, material, registerRun({request.cad.sourceId, request.drawingVersion}));
}

std::optional<est::EstimationResult> EstimationPipeline::runRegistered(const EstimationRequest& request,
                                                                       const est::Material& material,
                                                                       const common::CancellationTokenPtr& token)
{
    const QString& sourceId = request.cad.sourceId;
    const RunKey key{sourceId, request.drawingVersion};
    const RunRegistration registration([this, &key, &token]() { unregisterRun(key, token); });

    if (token->isCancelled())
    {
        LOG_WARN(Pipeline, QStringLiteral("%1: drawing v%2 cancelled before it started").arg(sourceId).arg(request.drawingVersion));
        return std::nullopt;
    }

    std::optional<geom::GeometrySummary> stored;
    if (request.geometryVersion)
    {
        if (auto cached = m_deps.store->result({sourceId, *request.geometryVersion, request.drawingVersion}))
        {
            LOG_INFO(Pipeline,
                     QStringLiteral("%1: cached result for geometry v%2, drawing v%3")
                         .arg(sourceId)
                         .arg(*request.geometryVersion)
                         .arg(request.drawingVersion));
            return cached;
        }
        stored = m_deps.store->geometry(sourceId, *request.geometryVersion);
        if (!stored)
        {
            LOG_WARN(Pipeline, QStringLiteral("%1: geometry v%2 not stored, extracting").arg(sourceId).arg(*request.geometryVersion));
        }
    }

    QElapsedTimer timer;
    timer.start();

    QFuture<GeometryOutcome> geometryFuture = QtConcurrent::run(&m_geometryPool, [this, &request, &stored]() {
        GeometryOutcome outcome;
        try
        {
            outcome.reused = stored.has_value();
            outcome.summary = stored ? *stored : extractGeometry(request.cad);
            const auto forced = m_config.partTypeOverrides.find(request.cad.sourceId);
            if (forced != m_config.partTypeOverrides.end())
            {
                geom::overridePartType(outcome.summary, forced->second, m_config.summary);
            }
        }
        catch (const std::exception&)
        {
            outcome.error = std::current_exception();
        }
        return outcome;
    });

    QFuture<InterpretationOutcome> drawingFuture = QtConcurrent::run(&m_ioPool, [this, &request, &stored, &token]() {
        InterpretationOutcome outcome;
        if (!request.drawing)
        {
            return outcome;
        }
        if (!m_interpreter)
        {
            outcome.failure = QStringLiteral("no vision client configured");
            return outcome;
        }
        try
        {
            outcome.annotations = m_interpreter->interpret(*request.drawing, stored ? &*stored : nullptr, *token);
        }
        catch (const common::CancelledError&)
        {
            outcome.cancelled = true;
        }
        catch (const common::InterpretationError& error)
        {
            outcome.failure = error.message();
        }
        catch (const std::exception&)
        {
            outcome.error = std::current_exception();
        }
        return outcome;
    });

    GeometryOutcome geometry = geometryFuture.result();
    InterpretationOutcome drawing = drawingFuture.result();
    if (geometry.error)
    {
        std::rethrow_exception(geometry.error);
    }
    if (drawing.error)
    {
        std::rethrow_exception(drawing.error);
    }
    if (drawing.cancelled || token->isCancelled())
    {
        LOG_WARN(Pipeline, QStringLiteral("%1: drawing v%2 cancelled").arg(sourceId).arg(request.drawingVersion));
        return std::nullopt;
    }

    if (!drawing.failure.isEmpty())
    {
        LOG_WARN(Pipeline, QStringLiteral("%1: drawing interpretation failed, geometry-only estimate (%2)").arg(sourceId, drawing.failure));
    }

    const std::vector<vision::DrawingAnnotation> annotations = drawing.annotations.value_or(std::vector<vision::DrawingAnnotation>{});
    const recon::ReconciliationResult reconciliation = recon::reconcile(geometry.summary, annotations, m_config.reconcile);

    est::EstimationInputs inputs;
    inputs.summary = &geometry.summary;
    inputs.reconciliation = &reconciliation;
    inputs.flags = est::classifyConstraints(geometry.summary, declaredTolerances(annotations), m_config.rules);
    inputs.material = &material;
    inputs.threads = m_deps.threads.get();
    inputs.machine = m_config.machine;
    inputs.cutting = m_config.cutting;
    inputs.drawingAvailable = drawing.annotations.has_value();
    inputs.geometryVersion = geometry.reused ? geometry.summary.version : 0;
    inputs.drawingVersion = request.drawingVersion;
    if (!drawing.failure.isEmpty())
    {
        inputs.upstreamWarnings.push_back(QStringLiteral("Drawing interpretation failed: %1").arg(drawing.failure));
    }

    RunRecord record;
    record.result = est::estimateTime(inputs);
    if (!geometry.reused)
    {
        record.geometry = geometry.summary;
    }
    if (drawing.annotations)
    {
        record.annotations = vision::AnnotationBatch{sourceId, request.drawingVersion, m_interpreter->name(), annotations};
    }

    if (!m_deps.store->commit(record, *token))
    {
        if (token->isCancelled())
        {
            return std::nullopt;
        }
        LOG_INFO(Pipeline, QStringLiteral("%1: result already stored for this version pair").arg(sourceId));
        return m_deps.store->result({sourceId, record.result.geometryVersion, record.result.drawingVersion});
    }

    LOG_INFO(Pipeline,
             QStringLiteral("%1: geometry v%2, drawing v%3 estimated in %4 ms (total %5 min)")
                 .arg(sourceId)
                 .arg(record.result.geometryVersion)
                 .arg(record.result.drawingVersion)
                 .arg(timer.elapsed())
                 .arg(record.result.totalTime_min, 0, 'f', 2));
    return record.result;
}

QFuture<std::optional<est::EstimationResult>> EstimationPipeline::submit(EstimationRequest request)
{
    const est::Material* material = &resolveMaterial(request);
    common::CancellationTokenPtr token = registerRun({request.cad.sourceId, request.drawingVersion});
    return QtConcurrent::run(&m_runPool, [this, request = std::move(request), material, token = std::move(token)]() {
        return runRegistered(request, *material, token);
    });
}

void EstimationPipeline::waitForDone()
{
    m_runPool.waitForDone();
    m_geometryPool.waitForDone();
    m_ioPool.waitForDone();
}

} // namespace pipeline
