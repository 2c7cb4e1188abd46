#include <gtest/gtest.h>
#include "select/FanCurve.h"
#include "select/FanCurveCatalog.h"
#include <stdexcept>

using namespace ventsizer;

TEST(FanCurve, LinearInterpolation) {
    FanCurve c("T1", {{100, 2.0}, {300, 1.5}, {500, 0.5}});
    CurveLookup at200 = c.pressureAt(200);
    ASSERT_TRUE(at200.inDomain);
    EXPECT_NEAR(at200.pressure, 1.75, 1e-12);

    CurveLookup at400 = c.pressureAt(400);
    ASSERT_TRUE(at400.inDomain);
    EXPECT_NEAR(at400.pressure, 1.0, 1e-12);

    // Domain end points are inclusive
    EXPECT_TRUE(c.pressureAt(100).inDomain);
    EXPECT_DOUBLE_EQ(c.pressureAt(500).pressure, 0.5);
}

TEST(FanCurve, NoExtrapolation) {
    FanCurve c("T1", {{100, 2.0}, {500, 0.5}});
    EXPECT_FALSE(c.pressureAt(99.9).inDomain);
    EXPECT_FALSE(c.pressureAt(500.1).inDomain);
    EXPECT_FALSE(c.inDomain(50));
    EXPECT_DOUBLE_EQ(c.minFlow(), 100);
    EXPECT_DOUBLE_EQ(c.maxFlow(), 500);
    EXPECT_DOUBLE_EQ(c.shutoffPressure(), 2.0);
}

TEST(FanCurve, RejectsBadSamples) {
    EXPECT_THROW(FanCurve("X", {{100, 1.0}}), std::invalid_argument);
    EXPECT_THROW(FanCurve("X", {{100, 1.0}, {100, 0.5}}), std::invalid_argument);
    EXPECT_THROW(FanCurve("X", {{300, 1.0}, {100, 0.5}}), std::invalid_argument);
    EXPECT_THROW(FanCurve("", {{100, 1.0}, {200, 0.5}}), std::invalid_argument);
}

TEST(FanCurve, FreeFunctionOnRawSamples) {
    std::vector<FanCurvePoint> pts = {{0, 1.0}, {10, 0.0}};
    EXPECT_NEAR(interpolateCurve(pts, 2.5).pressure, 0.75, 1e-12);
    EXPECT_FALSE(interpolateCurve(pts, -1.0).inDomain);
    EXPECT_FALSE(interpolateCurve({}, 1.0).inDomain);
}

TEST(FanCurve, PolynomialFitRecoversQuadratic) {
    // ΔP = 2 − 0.001·Q − 1e-6·Q²
    std::vector<FanCurvePoint> pts;
    for (int q = 0; q <= 1000; q += 100) {
        pts.emplace_back(q, 2.0 - 0.001 * q - 1e-6 * q * q);
    }
    FanCurve c("Q", pts);
    std::vector<double> coeffs = c.fitPolynomial(2);
    ASSERT_EQ(coeffs.size(), 3u);
    EXPECT_NEAR(coeffs[0], 2.0, 1e-9);
    EXPECT_NEAR(coeffs[1], -0.001, 1e-11);
    EXPECT_NEAR(coeffs[2], -1e-6, 1e-13);
    EXPECT_NEAR(evalPolynomial(coeffs, 450.0), 2.0 - 0.45 - 0.2025, 1e-9);
    EXPECT_THROW(c.fitPolynomial(0), std::invalid_argument);
}

// ── FanCurveCatalog ──────────────────────────────────────────────────

static FanCurveCatalog smallCatalog() {
    std::vector<FanSeries> series = {
        {"BIG", "Big", FanKind::Inducer, 2, true, true},
        {"SMALL", "Small", FanKind::Inducer, 1, false, false},
        {"AIR", "Air", FanKind::Supply, 1, false, false}
    };
    std::vector<FanModel> models = {
        {"S2", "SMALL", FanCurve("S2", {{50, 1.0}, {400, 0.2}})},
        {"S1", "SMALL", FanCurve("S1", {{10, 1.0}, {100, 0.1}})},
        {"B1", "BIG", FanCurve("B1", {{200, 3.0}, {2000, 0.5}})},
        {"A1", "AIR", FanCurve("A1", {{0, 0.5}, {800, 0.1}})}
    };
    return FanCurveCatalog(series, models);
}

TEST(FanCurveCatalog, OrderingAndLookup) {
    FanCurveCatalog cat = smallCatalog();

    auto inducers = cat.seriesByPriority(FanKind::Inducer);
    ASSERT_EQ(inducers.size(), 2u);
    EXPECT_EQ(inducers[0]->id, "SMALL");
    EXPECT_EQ(inducers[1]->id, "BIG");

    auto models = cat.seriesModels("SMALL");
    ASSERT_EQ(models.size(), 2u);
    EXPECT_EQ(models[0]->id, "S1");
    EXPECT_EQ(models[1]->id, "S2");

    ASSERT_NE(cat.findModel("B1"), nullptr);
    EXPECT_DOUBLE_EQ(cat.findModel("B1")->capacity(), 2000);
    EXPECT_EQ(cat.findModel("nope"), nullptr);
    EXPECT_TRUE(cat.findSeries("BIG")->condensingRated);
}

TEST(FanCurveCatalog, RejectsInconsistentData) {
    std::vector<FanSeries> series = {{"A", "A", FanKind::Inducer, 1, false, false}};
    FanCurve curve("M", {{0, 1.0}, {10, 0.5}});
    EXPECT_THROW(FanCurveCatalog(series, {{"M", "B", curve}}), std::invalid_argument);
    EXPECT_THROW(FanCurveCatalog(series, {{"M", "A", curve}, {"M", "A", curve}}),
                 std::invalid_argument);
    series.push_back(series[0]);
    EXPECT_THROW(FanCurveCatalog(series, {}), std::invalid_argument);
}
