#define DOCTEST_CONFIG_IMPLEMENT

#include <doctest/doctest.h>

#include "common/Errors.h"
#include "common/logging.h"
#include "geom/FallbackGeometrySource.h"
#include "pipeline/EstimationPipeline.h"

#include "machest_test_helpers.h"

#include <QtCore/QSemaphore>
#include <QtCore/QThread>

#include <atomic>
#include <memory>

namespace
{

const char* const kBoreResponse = R"({"units": "mm", "annotations": [
    {"label": "bore", "kind": "bore", "text": "D12 H7", "nominal_mm": 12, "tolerance": "H7",
     "position": {"axial_start_mm": 0, "axial_end_mm": 30}, "confidence": 0.98, "region": "section"}
]})";

// Measures every input as the test shaft and counts the extractions.
class ShaftGeometrySource : public geom::IGeometrySource
{
public:
    QString name() const override { return QStringLiteral("shaft"); }
    bool isAvailable() const override { return true; }

    geom::GeometrySummary extract(const geom::CadInput& input) override
    {
        ++m_calls;
        return geom::summarize(input.sourceId, test_helpers::makeShaftSolid());
    }

    int calls() const { return m_calls.load(); }

private:
    std::atomic<int> m_calls{0};
};

class BrokenGeometrySource : public geom::IGeometrySource
{
public:
    QString name() const override { return QStringLiteral("broken"); }
    bool isAvailable() const override { return true; }

    geom::GeometrySummary extract(const geom::CadInput& input) override
    {
        throw common::ExtractionError(QStringLiteral("%1: no solids in file").arg(input.sourceId));
    }
};

class FixedVisionClient : public vision::IVisionClient
{
public:
    explicit FixedVisionClient(QByteArray response)
        : m_response(std::move(response))
    {
    }

    QString name() const override { return QStringLiteral("fixed"); }

    QByteArray complete(const vision::VisionRequest&, const common::CancellationToken&) override
    {
        return m_response;
    }

private:
    QByteArray m_response;
};

// The first call blocks until its run is cancelled; later calls answer immediately.
class StallingVisionClient : public vision::IVisionClient
{
public:
    QString name() const override { return QStringLiteral("stalling"); }

    QByteArray complete(const vision::VisionRequest&, const common::CancellationToken& cancel) override
    {
        if (m_calls.fetch_add(1) == 0)
        {
            m_entered.release();
            while (!cancel.isCancelled())
            {
                QThread::msleep(5);
            }
            throw common::CancelledError(QStringLiteral("stalled call cancelled"));
        }
        return QByteArray(kBoreResponse);
    }

    bool waitUntilStalled() { return m_entered.tryAcquire(1, 10000); }

private:
    std::atomic<int> m_calls{0};
    QSemaphore m_entered;
};

pipeline::PipelineConfig testConfig()
{
    pipeline::PipelineConfig config;
    config.retry.maxAttempts = 2;
    config.retry.initialBackoffMs = 1;
    config.retry.maxBackoffMs = 2;
    config.geometryWorkers = 2;
    config.ioWorkers = 2;
    return config;
}

std::unique_ptr<pipeline::EstimationPipeline> makePipeline(std::shared_ptr<geom::IGeometrySource> geometry,
                                                           std::shared_ptr<vision::IVisionClient> client,
                                                           pipeline::PipelineConfig config = testConfig())
{
    pipeline::PipelineDependencies deps;
    deps.materials = std::make_shared<const est::MaterialTable>(test_helpers::loadMaterials());
    deps.threads = std::make_shared<const est::ThreadTable>(test_helpers::loadThreads());
    deps.geometrySource = std::move(geometry);
    deps.fallbackSource = std::make_shared<geom::FallbackGeometrySource>();
    deps.visionClient = std::move(client);
    deps.store = std::make_shared<pipeline::ResultStore>();
    return std::make_unique<pipeline::EstimationPipeline>(std::move(config), std::move(deps));
}

pipeline::EstimationRequest request(const QString& sourceId, int drawingVersion, bool withDrawing)
{
    pipeline::EstimationRequest req;
    req.cad.sourceId = sourceId;
    req.cad.bytes = QByteArray("ISO-10303-21;");
    req.drawingVersion = drawingVersion;
    req.materialCode = QStringLiteral("16MnCr5");
    if (withDrawing)
    {
        vision::DrawingPage page;
        page.sourceId = sourceId;
        page.pngBytes = QByteArray("\x89PNG drawing", 12);
        req.drawing = page;
    }
    return req;
}

const QString kShaftId = QStringLiteral("shaft_16MnCr5.step");

} // namespace

TEST_CASE("geometry and drawing reconcile into a high-confidence estimate")
{
    auto geometry = std::make_shared<ShaftGeometrySource>();
    auto estimator = makePipeline(geometry, std::make_shared<FixedVisionClient>(kBoreResponse));

    const auto result = estimator->run(request(kShaftId, 1, true));
    REQUIRE(result.has_value());
    CHECK_FALSE(result->synthetic);
    CHECK(result->drawingAvailable);
    CHECK(result->confidence == est::Confidence::High);
    CHECK(result->geometryVersion == 1);
    CHECK(result->drawingVersion == 1);
    CHECK(result->determinismHash.size() == 64);

    pipeline::ResultStore& store = estimator->store();
    CHECK(store.geometryVersionCount(kShaftId) == 1);
    CHECK(store.annotationBatches(kShaftId).size() == 1);
    CHECK(store.annotationBatches(kShaftId).front().interpreter == QStringLiteral("fixed"));
    REQUIRE(store.result({kShaftId, 1, 1}).has_value());
    CHECK(store.result({kShaftId, 1, 1})->determinismHash == result->determinismHash);
}

TEST_CASE("extraction failure falls back to synthetic geometry")
{
    auto estimator = makePipeline(std::make_shared<BrokenGeometrySource>(), nullptr);

    const QString sourceId = QStringLiteral("JR_810686_16MnCr5.step");
    const auto result = estimator->run(request(sourceId, 0, false));
    REQUIRE(result.has_value());
    CHECK(result->synthetic);
    CHECK(result->confidence == est::Confidence::Low);
    CHECK(result->totalTime_min > 0.0);

    const auto stored = estimator->store().latestGeometry(sourceId);
    REQUIRE(stored.has_value());
    CHECK(stored->synthetic);
    CHECK(stored->faceCount == 25);
}

TEST_CASE("synthetic part types ignore the configured rotational threshold")
{
    pipeline::PipelineConfig config = testConfig();
    config.summary.rotationalThreshold = 0.9;
    auto estimator = makePipeline(std::make_shared<BrokenGeometrySource>(), nullptr, config);

    const QString sourceId = QStringLiteral("bracket.stp");
    REQUIRE(estimator->run(request(sourceId, 0, false)).has_value());

    const auto stored = estimator->store().latestGeometry(sourceId);
    REQUIRE(stored.has_value());
    CHECK(stored->rotationalScore == doctest::Approx(0.657));
    CHECK(stored->partType == geom::PartType::Rotational);
    CHECK(stored->partType == geom::FallbackGeometrySource().generate(sourceId).partType);
}

TEST_CASE("failed interpretation degrades to a geometry-only estimate")
{
    auto estimator = makePipeline(std::make_shared<ShaftGeometrySource>(),
                                  std::make_shared<FixedVisionClient>("Sorry, I cannot help with that."));

    const auto result = estimator->run(request(kShaftId, 1, true));
    REQUIRE(result.has_value());
    CHECK_FALSE(result->drawingAvailable);
    CHECK(result->confidence == est::Confidence::Low);
    REQUIRE_FALSE(result->warnings.isEmpty());
    CHECK(result->warnings.front().startsWith(QStringLiteral("Drawing interpretation failed")));
    CHECK(estimator->store().annotationBatches(kShaftId).empty());
    CHECK(estimator->store().resultCount() == 1);
}

TEST_CASE("an identical version pair returns the stored result")
{
    auto geometry = std::make_shared<ShaftGeometrySource>();
    auto estimator = makePipeline(geometry, std::make_shared<FixedVisionClient>(kBoreResponse));

    const auto first = estimator->run(request(kShaftId, 1, true));
    REQUIRE(first.has_value());

    pipeline::EstimationRequest again = request(kShaftId, 1, true);
    again.geometryVersion = first->geometryVersion;
    const auto cached = estimator->run(again);
    REQUIRE(cached.has_value());
    CHECK(cached->determinismHash == first->determinismHash);
    CHECK(estimator->store().resultCount() == 1);

    pipeline::EstimationRequest revised = request(kShaftId, 2, true);
    revised.geometryVersion = first->geometryVersion;
    const auto second = estimator->run(revised);
    REQUIRE(second.has_value());
    CHECK(second->geometryVersion == 1);
    CHECK(second->drawingVersion == 2);
    CHECK(second->determinismHash == first->determinismHash);
    CHECK(estimator->store().resultCount() == 2);
    CHECK(estimator->store().geometryVersionCount(kShaftId) == 1);
    CHECK(geometry->calls() == 1);
}

TEST_CASE("unknown materials are rejected before queueing")
{
    auto estimator = makePipeline(std::make_shared<ShaftGeometrySource>(), nullptr);

    pipeline::EstimationRequest unknown = request(kShaftId, 0, false);
    unknown.materialCode = QStringLiteral("Unobtainium");
    CHECK_THROWS_AS(estimator->submit(unknown), common::MaterialNotFoundError);

    pipeline::EstimationRequest undetectable = request(QStringLiteral("bracket.stp"), 0, false);
    undetectable.materialCode.clear();
    CHECK_THROWS_AS(estimator->submit(undetectable), common::MaterialNotFoundError);

    pipeline::EstimationRequest detected = request(kShaftId, 0, false);
    detected.materialCode.clear();
    const auto result = estimator->submit(detected).result();
    REQUIRE(result.has_value());
    CHECK(result->materialCode == QStringLiteral("16MnCr5"));
    CHECK(estimator->store().resultCount() == 1);
}

TEST_CASE("a cancelled run stores nothing")
{
    auto client = std::make_shared<StallingVisionClient>();
    auto estimator = makePipeline(std::make_shared<ShaftGeometrySource>(), client);

    auto future = estimator->submit(request(kShaftId, 1, true));
    REQUIRE(client->waitUntilStalled());
    estimator->cancel(kShaftId, 1);

    CHECK_FALSE(future.result().has_value());
    CHECK(estimator->store().resultCount() == 0);
    CHECK(estimator->store().geometryVersionCount(kShaftId) == 0);
}

TEST_CASE("cancelling a queued run before it starts stores nothing")
{
    pipeline::PipelineConfig config = testConfig();
    config.runWorkers = 1;
    auto client = std::make_shared<StallingVisionClient>();
    auto estimator = makePipeline(std::make_shared<ShaftGeometrySource>(), client, config);

    // The only run worker stays busy until this run is cancelled.
    const QString busyId = QStringLiteral("busy_16MnCr5.step");
    auto busy = estimator->submit(request(busyId, 1, true));
    REQUIRE(client->waitUntilStalled());

    auto queued = estimator->submit(request(kShaftId, 1, true));
    estimator->cancel(kShaftId, 1);
    estimator->cancel(busyId, 1);

    CHECK_FALSE(busy.result().has_value());
    CHECK_FALSE(queued.result().has_value());
    CHECK(estimator->store().resultCount() == 0);
    CHECK(estimator->store().geometryVersionCount(kShaftId) == 0);
}

TEST_CASE("a newer drawing version supersedes the running one")
{
    auto client = std::make_shared<StallingVisionClient>();
    auto estimator = makePipeline(std::make_shared<ShaftGeometrySource>(), client);

    auto older = estimator->submit(request(kShaftId, 1, true));
    REQUIRE(client->waitUntilStalled());

    const auto newer = estimator->run(request(kShaftId, 2, true));
    REQUIRE(newer.has_value());
    CHECK(newer->drawingVersion == 2);

    CHECK_FALSE(older.result().has_value());
    CHECK(estimator->store().resultCount() == 1);
    CHECK(estimator->store().results(kShaftId).front().drawingVersion == 2);
}

TEST_CASE("configured part-type overrides reach the stored geometry")
{
    pipeline::PipelineConfig config = testConfig();
    config.partTypeOverrides[kShaftId] = geom::PartType::Prismatic;
    auto estimator = makePipeline(std::make_shared<ShaftGeometrySource>(), nullptr, config);

    const auto result = estimator->run(request(kShaftId, 0, false));
    REQUIRE(result.has_value());
    const auto stored = estimator->store().latestGeometry(kShaftId);
    REQUIRE(stored.has_value());
    CHECK(stored->partType == geom::PartType::Prismatic);
    CHECK(stored->surfaceAreaAdjusted_mm2 == doctest::Approx(stored->surfaceAreaRaw_mm2));
    for (const est::OperationEstimate& op : result->operations)
    {
        CHECK(op.category != est::OperationCategory::Turning);
    }
}

TEST_CASE("create reports unreadable lookup tables")
{
    pipeline::PipelineConfig config = testConfig();
    config.materialTablePath = QStringLiteral("/nonexistent/materials.json");
    config.threadTablePath = test_helpers::sourcePath(QStringLiteral("data/threads.json"));
    CHECK_THROWS_AS(pipeline::EstimationPipeline::create(config), common::TableLoadError);
}

int main(int argc, char** argv)
{
    common::initLogging();
    doctest::Context context(argc, argv);
    return context.run();
}
