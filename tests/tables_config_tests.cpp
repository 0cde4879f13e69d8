#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>

#include "common/Errors.h"
#include "est/MaterialTable.h"
#include "est/ThreadTable.h"
#include "pipeline/PipelineConfig.h"

#include "machest_test_helpers.h"

#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QTemporaryDir>

using doctest::Approx;

namespace
{

QString writeFile(const QTemporaryDir& dir, const QString& name, const QByteArray& contents)
{
    const QString path = dir.filePath(name);
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(contents);
    return path;
}

} // namespace

TEST_CASE("shipped material table loads with its aliases")
{
    const est::MaterialTable table = test_helpers::loadMaterials();
    CHECK(table.materials().size() == 5);

    const est::Material& steel = table.require(QStringLiteral("16mncr5"));
    CHECK(steel.code == QStringLiteral("16MnCr5"));
    CHECK(steel.isoGroup == QStringLiteral("P"));
    CHECK(steel.mrr_min_per_cm3 == Approx(0.45));
    CHECK(steel.setup_min == Approx(15.0));

    CHECK(table.detectCode(QStringLiteral("JR_810686_16MnCr5.step")) == QStringLiteral("16MnCr5"));
    CHECK(table.detectCode(QStringLiteral("housing-ck45-rev2.stp")) == QStringLiteral("C45"));
    CHECK(table.detectCode(QStringLiteral("cover_aluminum.step")) == QStringLiteral("AlMgSi1"));
    CHECK_FALSE(table.detectCode(QStringLiteral("bracket.stp")).has_value());
}

TEST_CASE("unknown material codes are fatal")
{
    const est::MaterialTable table = test_helpers::loadMaterials();
    try
    {
        (void)table.require(QStringLiteral("Unobtainium"));
        FAIL("expected MaterialNotFoundError");
    }
    catch (const common::MaterialNotFoundError& error)
    {
        CHECK(error.code() == QStringLiteral("Unobtainium"));
    }
}

TEST_CASE("material table reports bad entries and rejects malformed files")
{
    est::MaterialTable table;
    QStringList warnings;

    CHECK_FALSE(table.loadFromJson("{\"materials\": [", warnings));
    CHECK_FALSE(warnings.isEmpty());

    const QByteArray mixed = R"({"materials": [
        {"code": "C45", "iso_group": "P", "mrr_min_per_cm3": 0.35, "setup_min": 12, "cutting_speed_m_min": 220},
        {"code": "C45", "iso_group": "P", "mrr_min_per_cm3": 0.5, "setup_min": 12, "cutting_speed_m_min": 220},
        {"code": "broken", "mrr_min_per_cm3": -1},
        "not an object"
    ]})";
    CHECK(table.loadFromJson(mixed, warnings));
    CHECK(table.materials().size() == 1);
    CHECK(warnings.size() == 3);
    CHECK(table.require(QStringLiteral("C45")).mrr_min_per_cm3 == Approx(0.35));

    CHECK_FALSE(table.loadFromFile(QStringLiteral("/nonexistent/materials.json"), warnings));
}

TEST_CASE("thread table resolves coarse and explicit pitches")
{
    const est::ThreadTable table = test_helpers::loadThreads();
    CHECK(*table.coarsePitch(8.0) == Approx(1.25));
    CHECK(*table.coarsePitch(12.0) == Approx(1.75));
    CHECK(*table.coarsePitch(30.0) == Approx(3.5));
    CHECK_FALSE(table.coarsePitch(7.5).has_value());

    vision::ThreadDesignation fine;
    fine.nominal_mm = 30.0;
    fine.pitch_mm = 2.0;
    CHECK(*table.resolvePitch(fine) == Approx(2.0));

    vision::ThreadDesignation unknown;
    unknown.nominal_mm = 31.0;
    CHECK_FALSE(table.resolvePitch(unknown).has_value());

    est::ThreadTable empty;
    QStringList warnings;
    CHECK_FALSE(empty.loadFromJson(R"({"metric_coarse": []})", warnings));
}

TEST_CASE("shipped config resolves table paths against its directory")
{
    const pipeline::PipelineConfig config =
        pipeline::PipelineConfig::load(test_helpers::sourcePath(QStringLiteral("config/machest.json")));

    CHECK(QFileInfo(config.materialTablePath).canonicalFilePath()
          == QFileInfo(test_helpers::sourcePath(QStringLiteral("data/materials.json"))).canonicalFilePath());
    CHECK(QFileInfo::exists(config.threadTablePath));
    CHECK(config.machine.maxSpindleRPM == Approx(4000.0));
    CHECK(config.vision.model == QStringLiteral("gpt-4o"));
    CHECK(config.vision.apiKeyEnv == QStringLiteral("MACHEST_VISION_API_KEY"));
    CHECK(config.retry.maxAttempts == 3);
    CHECK(config.summary.rotationalThreshold == Approx(0.6));
    CHECK(config.rules.referenceGrade == 7);
    CHECK(config.partTypeOverrides.empty());
    CHECK(config.ioWorkers == 4);
    CHECK(config.runWorkers == 0);
    CHECK(config.journalPath.isEmpty());
}

TEST_CASE("missing config falls back to defaults")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const pipeline::PipelineConfig config = pipeline::PipelineConfig::load(dir.filePath(QStringLiteral("absent.json")));
    CHECK(config.geometryWorkers == 0);
    CHECK(config.cutting.feed_mm_per_rev == Approx(0.15));
    CHECK(config.machine.name == QStringLiteral("Generic lathe/mill"));
    CHECK(config.machine.maxSpindleRPM == Approx(4000.0));
}

TEST_CASE("malformed config is rejected")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    const QString truncated = writeFile(dir, QStringLiteral("truncated.json"), "{\"vision\": {");
    CHECK_THROWS_AS(pipeline::PipelineConfig::load(truncated), common::ConfigError);

    CHECK_THROWS_AS(pipeline::PipelineConfig::fromJson(R"({"vision": []})", QString()), common::ConfigError);
    CHECK_THROWS_AS(pipeline::PipelineConfig::fromJson(R"({"vision": {"endpoint": "not a url"}})", QString()),
                    common::ConfigError);
    CHECK_THROWS_AS(pipeline::PipelineConfig::fromJson(R"({"workers": {"io": 0}})", QString()), common::ConfigError);
    CHECK_THROWS_AS(pipeline::PipelineConfig::fromJson(R"({"workers": {"runs": -1}})", QString()), common::ConfigError);
    CHECK_THROWS_AS(
        pipeline::PipelineConfig::fromJson(R"({"classification": {"part_type_overrides": {"a.step": "conical"}}})",
                                           QString()),
        common::ConfigError);
}

TEST_CASE("part type overrides and the journal path come from the config")
{
    const pipeline::PipelineConfig config = pipeline::PipelineConfig::fromJson(
        R"({"classification": {"part_type_overrides": {"bracket.stp": "prismatic"}},
            "store": {"journal": "runs/journal.jsonl"}})",
        QStringLiteral("/srv/machest"));

    REQUIRE(config.partTypeOverrides.count(QStringLiteral("bracket.stp")) == 1);
    CHECK(config.partTypeOverrides.at(QStringLiteral("bracket.stp")) == geom::PartType::Prismatic);
    CHECK(config.journalPath == QStringLiteral("/srv/machest/runs/journal.jsonl"));
    CHECK(config.materialTablePath == QStringLiteral("/srv/machest/data/materials.json"));
}
