#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>

#include "geom/FallbackGeometrySource.h"
#include "pipeline/ResultStore.h"

#include "machest_test_helpers.h"

#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>

using doctest::Approx;

namespace
{

est::EstimationResult resultFor(const QString& sourceId, int geometryVersion, int drawingVersion, double total)
{
    est::EstimationResult result;
    result.sourceId = sourceId;
    result.geometryVersion = geometryVersion;
    result.drawingVersion = drawingVersion;
    result.materialCode = QStringLiteral("16MnCr5");
    result.totalTime_min = total;
    result.confidence = est::Confidence::Medium;
    return result;
}

vision::AnnotationBatch batchFor(const QString& sourceId, int drawingVersion)
{
    vision::AnnotationBatch batch;
    batch.sourceId = sourceId;
    batch.drawingVersion = drawingVersion;
    batch.interpreter = QStringLiteral("scripted");
    batch.annotations.push_back(
        test_helpers::annotation(vision::AnnotationKind::Bore, QStringLiteral("D12 H7"), 12.0));
    return batch;
}

} // namespace

TEST_CASE("re-ingesting a source creates a new geometry version")
{
    pipeline::ResultStore store;
    geom::GeometrySummary shaft = test_helpers::makeShaft();

    CHECK(store.appendGeometry(shaft) == 1);
    shaft.volume_mm3 += 100.0;
    CHECK(store.appendGeometry(shaft) == 2);

    CHECK(store.geometryVersionCount(shaft.sourceId) == 2);
    REQUIRE(store.geometry(shaft.sourceId, 1).has_value());
    CHECK(store.geometry(shaft.sourceId, 1)->volume_mm3 == Approx(shaft.volume_mm3 - 100.0));
    CHECK(store.latestGeometry(shaft.sourceId)->version == 2);
    CHECK_FALSE(store.geometry(shaft.sourceId, 3).has_value());
    CHECK_FALSE(store.latestGeometry(QStringLiteral("unknown.step")).has_value());
}

TEST_CASE("results are never overwritten")
{
    pipeline::ResultStore store;
    CHECK(store.appendResult(resultFor(QStringLiteral("a.step"), 1, 1, 10.0)));
    CHECK_FALSE(store.appendResult(resultFor(QStringLiteral("a.step"), 1, 1, 99.0)));
    CHECK(store.appendResult(resultFor(QStringLiteral("a.step"), 1, 2, 12.0)));

    CHECK(store.resultCount() == 2);
    CHECK(store.result({QStringLiteral("a.step"), 1, 1})->totalTime_min == Approx(10.0));
    CHECK(store.results(QStringLiteral("a.step")).size() == 2);
}

TEST_CASE("annotation batches are versioned per drawing")
{
    pipeline::ResultStore store;
    store.appendAnnotations(batchFor(QStringLiteral("a.step"), 1));
    store.appendAnnotations(batchFor(QStringLiteral("a.step"), 2));

    CHECK(store.annotationBatches(QStringLiteral("a.step")).size() == 2);
    REQUIRE(store.latestAnnotations(QStringLiteral("a.step"), 2).has_value());
    CHECK(store.latestAnnotations(QStringLiteral("a.step"), 2)->drawingVersion == 2);
    CHECK_FALSE(store.latestAnnotations(QStringLiteral("a.step"), 3).has_value());
}

TEST_CASE("commit assigns the geometry version to the result")
{
    pipeline::ResultStore store;
    common::CancellationToken token;

    pipeline::RunRecord record;
    record.geometry = test_helpers::makeShaft();
    record.annotations = batchFor(record.geometry->sourceId, 1);
    record.result = resultFor(record.geometry->sourceId, 0, 1, 20.0);

    REQUIRE(store.commit(record, token));
    CHECK(record.result.geometryVersion == 1);
    CHECK(record.geometry->version == 1);
    CHECK(store.result({record.geometry->sourceId, 1, 1}).has_value());
    CHECK(store.annotationBatches(record.geometry->sourceId).size() == 1);
}

TEST_CASE("a cancelled commit writes nothing and leaves prior results alone")
{
    pipeline::ResultStore store;
    REQUIRE(store.appendResult(resultFor(QStringLiteral("a.step"), 1, 1, 10.0)));

    common::CancellationToken token;
    token.cancel();
    pipeline::RunRecord record;
    record.geometry = geom::FallbackGeometrySource().generate(QStringLiteral("a.step"));
    record.annotations = batchFor(QStringLiteral("a.step"), 2);
    record.result = resultFor(QStringLiteral("a.step"), 0, 2, 30.0);

    CHECK_FALSE(store.commit(record, token));
    CHECK(store.resultCount() == 1);
    CHECK(store.geometryVersionCount(QStringLiteral("a.step")) == 0);
    CHECK(store.annotationBatches(QStringLiteral("a.step")).empty());
    CHECK(store.result({QStringLiteral("a.step"), 1, 1})->totalTime_min == Approx(10.0));
}

TEST_CASE("a duplicate commit on reused geometry writes nothing")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString journal = dir.filePath(QStringLiteral("journal.jsonl"));

    pipeline::ResultStore store(journal);
    common::CancellationToken token;
    const QString sourceId = test_helpers::makeShaft().sourceId;
    REQUIRE(store.appendGeometry(test_helpers::makeShaft()) == 1);

    pipeline::RunRecord record;
    record.annotations = batchFor(sourceId, 1);
    record.result = resultFor(sourceId, 1, 1, 20.0);
    pipeline::RunRecord repeat = record;
    repeat.result.totalTime_min = 25.0;

    REQUIRE(store.commit(record, token));
    CHECK_FALSE(store.commit(repeat, token));

    CHECK(store.annotationBatches(sourceId).size() == 1);
    CHECK(store.resultCount() == 1);
    CHECK(store.result({sourceId, 1, 1})->totalTime_min == Approx(20.0));

    pipeline::ResultStore replayed(journal);
    QStringList warnings;
    REQUIRE(replayed.replayJournal(warnings));
    CHECK(warnings.isEmpty());
    CHECK(replayed.annotationBatches(sourceId).size() == 1);
}

TEST_CASE("the journal replays into an identical store")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString journal = dir.filePath(QStringLiteral("journal.jsonl"));

    {
        pipeline::ResultStore store(journal);
        common::CancellationToken token;
        pipeline::RunRecord record;
        record.geometry = test_helpers::makeShaft();
        record.annotations = batchFor(record.geometry->sourceId, 1);
        record.result = resultFor(record.geometry->sourceId, 0, 1, 20.0);
        REQUIRE(store.commit(record, token));
        CHECK(store.appendGeometry(test_helpers::makeShaft()) == 2);
    }
    {
        QFile file(journal);
        REQUIRE(file.open(QIODevice::WriteOnly | QIODevice::Append));
        file.write("{not json}\n");
    }

    pipeline::ResultStore replayed(journal);
    QStringList warnings;
    REQUIRE(replayed.replayJournal(warnings));
    CHECK(warnings.size() == 1);

    const QString sourceId = test_helpers::makeShaft().sourceId;
    CHECK(replayed.geometryVersionCount(sourceId) == 2);
    CHECK(replayed.latestGeometry(sourceId)->version == 2);
    CHECK(replayed.annotationBatches(sourceId).size() == 1);
    REQUIRE(replayed.result({sourceId, 1, 1}).has_value());
    CHECK(replayed.result({sourceId, 1, 1})->totalTime_min == Approx(20.0));

    // New ingestions continue after the replayed versions.
    CHECK(replayed.appendGeometry(test_helpers::makeShaft()) == 3);
}

TEST_CASE("replaying a missing journal reports it")
{
    pipeline::ResultStore store(QStringLiteral("/nonexistent/journal.jsonl"));
    QStringList warnings;
    CHECK_FALSE(store.replayJournal(warnings));
    CHECK(warnings.size() == 1);
}
