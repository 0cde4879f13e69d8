#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>

#include "common/Errors.h"
#include "geom/FallbackGeometrySource.h"
#include "geom/GeometrySerialization.h"
#include "geom/GeometrySummarizer.h"
#include "geom/OcctGeometrySource.h"

#include "machest_test_helpers.h"

#include <numbers>

using doctest::Approx;

TEST_CASE("fallback reproduces the pinned digest table for a known identifier")
{
    const QString identifier = QStringLiteral("JR_810686_16MnCr5.step");
    CHECK(geom::fallbackDigest(identifier).toHex()
          == QByteArray("478f9ad99b756d137b5567407f95f728e3492624d2432147b4f4b37377a2503d"));

    geom::FallbackGeometrySource fallback;
    const geom::GeometrySummary summary = fallback.generate(identifier);

    CHECK(summary.bounds.size().x == Approx(166.0));
    CHECK(summary.bounds.size().y == Approx(50.0));
    CHECK(summary.bounds.size().z == Approx(132.0));
    CHECK(summary.volume_mm3 == Approx(668316.0));
    CHECK(summary.faceCount == 25);
    CHECK(summary.rotationalScore == Approx(0.542));
    CHECK(summary.partType == geom::PartType::Prismatic);
    CHECK(summary.surfaceAreaRaw_mm2 == Approx(73624.0));
    CHECK(summary.surfaceAreaAdjusted_mm2 == Approx(73624.0));
    CHECK(summary.synthetic);
    CHECK(summary.extractor == QString::fromLatin1(geom::kFallbackHashName));
    CHECK(summary.faces.empty());
}

TEST_CASE("fallback classifies a high digest score as rotational")
{
    geom::FallbackGeometrySource fallback;
    const geom::GeometrySummary summary = fallback.generate(QStringLiteral("bracket.stp"));

    CHECK(summary.bounds.size().x == Approx(191.0));
    CHECK(summary.bounds.size().y == Approx(93.0));
    CHECK(summary.bounds.size().z == Approx(94.0));
    CHECK(summary.faceCount == 23);
    CHECK(summary.rotationalScore == Approx(0.657));
    CHECK(summary.partType == geom::PartType::Rotational);
    CHECK(summary.volume_mm3 == Approx(884952.66));
    CHECK(summary.surfaceAreaRaw_mm2 == Approx(88918.0));
}

TEST_CASE("fallback is deterministic and identifier-sensitive")
{
    geom::FallbackGeometrySource fallback;
    const geom::GeometrySummary first = fallback.generate(QStringLiteral("part-001.step"));
    const geom::GeometrySummary again = fallback.generate(QStringLiteral("part-001.step"));
    const geom::GeometrySummary other = fallback.generate(QStringLiteral("part-001.STEP"));

    CHECK(geom::toCanonicalJson(first) == geom::toCanonicalJson(again));
    CHECK(geom::toCanonicalJson(first) != geom::toCanonicalJson(other));
    CHECK(first.bounds.size().x >= 40.0);
    CHECK(first.bounds.size().x <= 200.0);
    CHECK(first.faceCount >= 6);
    CHECK(first.faceCount <= 64);
}

TEST_CASE("fallback extract uses the source id and ignores the bytes")
{
    geom::FallbackGeometrySource fallback;
    geom::CadInput input;
    input.sourceId = QStringLiteral("JR_810686_16MnCr5.step");
    input.bytes = QByteArray("not a step file");

    const geom::GeometrySummary summary = fallback.extract(input);
    CHECK(summary.faceCount == 25);
    CHECK(summary.sourceId == input.sourceId);
}

TEST_CASE("summarizer classifies a shaft and discounts bar-formed faces")
{
    const geom::GeometrySummary summary = test_helpers::makeShaft();

    CHECK(summary.faceCount == 5);
    CHECK(summary.faces.size() == 5);
    CHECK(summary.principalAxis.z == Approx(1.0));
    CHECK(summary.partType == geom::PartType::Rotational);
    CHECK(summary.rotationalScore == Approx(13697.34 / 16323.71).epsilon(1e-4));
    CHECK(summary.surfaceAreaRaw_mm2 == Approx(16323.71).epsilon(1e-4));
    CHECK(summary.surfaceAreaAdjusted_mm2 == Approx(16323.71 - 12566.37).epsilon(1e-4));
    CHECK(summary.surfaceAreaAdjusted_mm2 <= summary.surfaceAreaRaw_mm2);

    const geom::GeometryFace& bore = summary.faces[1];
    CHECK(bore.orientation == geom::FaceOrientation::Inner);
    CHECK(bore.axialMin_mm == Approx(0.0));
    CHECK(bore.axialMax_mm == Approx(30.0));
    CHECK_FALSE(geom::isStockFormed(bore, summary));
    CHECK(geom::isStockFormed(summary.faces[0], summary));

    CHECK(geom::axialLength(summary) == Approx(100.0));
    CHECK(geom::maxCrossSection(summary) == Approx(40.0));
}

TEST_CASE("part type override recomputes the adjusted area")
{
    geom::GeometrySummary summary = test_helpers::makeShaft();
    geom::overridePartType(summary, geom::PartType::Prismatic);

    CHECK(summary.partType == geom::PartType::Prismatic);
    CHECK(summary.surfaceAreaAdjusted_mm2 == Approx(summary.surfaceAreaRaw_mm2));
}

TEST_CASE("summarizer rejects solids without measurable faces")
{
    geom::RawSolid empty;
    CHECK_THROWS_AS(geom::summarize(QStringLiteral("empty.step"), empty), common::ExtractionError);

    geom::RawSolid degenerate;
    degenerate.faces.push_back(test_helpers::zDisc(0.0, 0.0));
    CHECK_THROWS_AS(geom::summarize(QStringLiteral("degenerate.step"), degenerate), common::ExtractionError);
}

TEST_CASE("summary json keeps every field")
{
    geom::GeometrySummary summary = test_helpers::makeShaft();
    summary.version = 3;

    bool ok = false;
    const geom::GeometrySummary restored = geom::summaryFromJson(geom::summaryToJson(summary), &ok);
    REQUIRE(ok);
    CHECK(restored.version == 3);
    CHECK(restored.faces.size() == summary.faces.size());
    CHECK(restored.faces[1].orientation == geom::FaceOrientation::Inner);
    REQUIRE(restored.faces[1].diameter_mm.has_value());
    CHECK(*restored.faces[1].diameter_mm == Approx(12.0));
    CHECK(geom::toCanonicalJson(restored) == geom::toCanonicalJson(summary));
}

#ifndef WITH_OCCT
TEST_CASE("kernel source reports itself unavailable without OpenCASCADE")
{
    geom::OcctGeometrySource source;
    CHECK_FALSE(source.isAvailable());

    geom::CadInput input;
    input.sourceId = QStringLiteral("shaft.step");
    CHECK_THROWS_AS(source.extract(input), common::ExtractionError);
}
#endif
