#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>

#include "est/ConstraintClassifier.h"
#include "est/Stock.h"
#include "est/ToleranceGrade.h"

#include "machest_test_helpers.h"

#include <numbers>

using doctest::Approx;

TEST_CASE("fit classes read their grade directly")
{
    CHECK(est::itGrade(QStringLiteral("H7"), 12.0) == 7);
    CHECK(est::itGrade(QStringLiteral("h6"), 30.0) == 6);
    CHECK(est::itGrade(QStringLiteral("js6"), 30.0) == 6);
    CHECK(est::itGrade(QStringLiteral("IT 8"), 30.0) == 8);
    CHECK_FALSE(est::itGrade(QStringLiteral("see note"), 30.0).has_value());
    CHECK_FALSE(est::itGrade(QString(), 30.0).has_value());
}

TEST_CASE("deviations map to the finest grade covering the band")
{
    CHECK(est::itGrade(QStringLiteral("±0.01"), 12.0) == 8);
    CHECK(est::itGrade(QStringLiteral("+/-0.005"), 12.0) == 6);
    CHECK(est::itGrade(QStringLiteral("0/-0.05"), 12.0) == 10);
    CHECK(est::itGrade(QStringLiteral("+0.02/-0.01"), 12.0) == 9);
    // Finer than IT5 still reports IT5.
    CHECK(est::itGrade(QStringLiteral("±0.0005"), 12.0) == 5);
}

TEST_CASE("standard tolerance table")
{
    CHECK(*est::standardTolerance_mm(7, 12.0) == Approx(0.016675).epsilon(1e-3));
    CHECK_FALSE(est::standardTolerance_mm(4, 12.0).has_value());
    CHECK_FALSE(est::standardTolerance_mm(17, 12.0).has_value());
}

TEST_CASE("stock is a bar for rotational parts and a block otherwise")
{
    const est::Stock bar = est::makeStock(test_helpers::makeShaft());
    CHECK(bar.shape == est::Stock::Shape::Bar);
    CHECK(bar.diameter_mm == Approx(43.0));
    CHECK(bar.length_mm == Approx(105.0));
    CHECK(bar.volume_mm3() == Approx(std::numbers::pi * 0.25 * 43.0 * 43.0 * 105.0));

    const est::Stock block = est::makeStock(test_helpers::makeBlock({90.0, 90.0, 45.0}, 450000.0));
    CHECK(block.shape == est::Stock::Shape::Block);
    CHECK(block.volume_mm3() == Approx(100.0 * 100.0 * 50.0));
}

TEST_CASE("a slender part triggers the aspect-ratio flag once")
{
    const geom::GeometrySummary slender = test_helpers::makeBlock({250.0, 50.0, 50.0}, 600000.0);
    const est::ConstraintFlags flags = est::classifyConstraints(slender, {});

    CHECK(flags.aspectRatio.triggered);
    CHECK(flags.aspectRatio.basis == Approx(5.0));
    CHECK_FALSE(flags.roughBlank.triggered);
    CHECK_FALSE(flags.stockRemoval.triggered);
    CHECK_FALSE(flags.tightTolerance.triggered);
    CHECK(flags.compoundedMultiplier() == Approx(1.20));
}

TEST_CASE("triggered multipliers compound")
{
    const geom::GeometrySummary slender = test_helpers::makeBlock({250.0, 50.0, 50.0}, 100000.0);
    const est::ConstraintFlags flags =
        est::classifyConstraints(slender, {{QStringLiteral("h6"), 30.0}, {QStringLiteral("H7"), 12.0}});

    CHECK(flags.aspectRatio.triggered);
    CHECK(flags.roughBlank.triggered);
    CHECK(flags.tightTolerance.triggered);
    CHECK(flags.tightTolerance.basis == Approx(6.0));
    CHECK_FALSE(flags.stockRemoval.triggered);
    CHECK(flags.compoundedMultiplier() == Approx(1.20 * 1.05 * 1.10));
}

TEST_CASE("near-net blanks and reference-grade fits")
{
    const geom::GeometrySummary nearNet = test_helpers::makeBlock({90.0, 90.0, 45.0}, 495000.0);
    const est::ConstraintFlags flags = est::classifyConstraints(nearNet, {{QStringLiteral("IT7"), 20.0}});

    CHECK(flags.stockRemovalRatio == Approx(0.01));
    CHECK(flags.stockRemoval.triggered);
    CHECK_FALSE(flags.tightTolerance.triggered);
    CHECK(flags.compoundedMultiplier() == Approx(1.10));
}

TEST_CASE("rotational aspect ratio is length over largest turned diameter")
{
    const geom::GeometrySummary shaft = test_helpers::makeShaft();
    CHECK(est::aspectRatio(shaft) == Approx(2.5));

    const est::ConstraintFlags flags = est::classifyConstraints(shaft, {{QStringLiteral("unreadable"), 12.0}});
    CHECK_FALSE(flags.aspectRatio.triggered);
    CHECK_FALSE(flags.tightTolerance.triggered);
    CHECK(flags.stock.shape == est::Stock::Shape::Bar);
}
