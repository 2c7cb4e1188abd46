#include <gtest/gtest.h>
#include "core/ScenarioEngine.h"
#include <algorithm>

using namespace ventsizer;

// ── Helpers ──────────────────────────────────────────────────────────

static VentRequest boilerRoom() {
    VentRequest req;
    req.ambientTemperature = 70.0;
    req.barometricPressure = 29.92;
    req.appliances = {
        ApplianceSpec(400, 6, ApplianceCategory::CatI).withName("B1"),
        ApplianceSpec(400, 6, ApplianceCategory::CatI).withName("B2"),
        ApplianceSpec(200, 5, ApplianceCategory::CatI).withName("DHW")
    };
    FittingCounts cf;
    cf.elbow90 = 2;
    cf.tee = 1;
    req.connector = VentSegment(6, 8, 3, VentType::UL441).withFittings(cf);
    req.manifold = VentSegment(12, 35, 28, VentType::UL441).withTerminationCap();
    req.connectorAppliance = 1;
    return req;
}

static VentRequest singleAppliance() {
    VentRequest req;
    req.ambientTemperature = 70.0;
    req.barometricPressure = 29.92;
    req.appliances = {ApplianceSpec(100, 4, ApplianceCategory::CatIV)};
    req.connector = VentSegment(4, 10, 15, VentType::UL441);
    return req;
}

static bool hasWarning(const std::vector<ComplianceWarning>& ws, WarningKind kind) {
    return std::any_of(ws.begin(), ws.end(),
                       [kind](const ComplianceWarning& w) { return w.kind == kind; });
}

// ── Scenario resolution ──────────────────────────────────────────────

TEST(ScenarioResolve, TiesGoToFirstInInputOrder) {
    VentRequest req = boilerRoom();

    OperatingScenario all = resolveScenario(ScenarioTag::All, req.appliances);
    EXPECT_EQ(all.active, (std::vector<int>{0, 1, 2}));

    OperatingScenario aml = resolveScenario(ScenarioTag::AllMinusLargest, req.appliances);
    EXPECT_EQ(aml.active, (std::vector<int>{1, 2}));

    EXPECT_EQ(resolveScenario(ScenarioTag::SingleLargest, req.appliances).active,
              std::vector<int>{0});
    EXPECT_EQ(resolveScenario(ScenarioTag::SingleSmallest, req.appliances).active,
              std::vector<int>{2});
}

TEST(ScenarioResolve, AllMinusLargestNotApplicableToOneAppliance) {
    VentRequest req = singleAppliance();
    EXPECT_TRUE(resolveScenario(ScenarioTag::AllMinusLargest, req.appliances).active.empty());
}

// ── ScenarioEngine ───────────────────────────────────────────────────

TEST(ScenarioEngine, AggregateCfmIsSumOfAppliances) {
    DraftCalculator calc;
    ScenarioEngine engine(calc, ScenarioConfig());
    VentRequest req = boilerRoom();

    ScenarioSet set = engine.run(req);
    ASSERT_EQ(set.results.size(), 4u);

    const CalculationResult* all = set.find(ScenarioTag::All);
    ASSERT_NE(all, nullptr);
    double sum = 0.0;
    for (int i = 0; i < 3; ++i) {
        sum += calc.applianceFlow(req.appliances[i], i, *req.barometricPressure).cfm;
    }
    EXPECT_NEAR(all->flow.totalCfm, sum, 1e-9);
    EXPECT_NEAR(all->manifold.cfm, sum, 1e-9);

    const CalculationResult* aml = set.find(ScenarioTag::AllMinusLargest);
    ASSERT_NE(aml, nullptr);
    EXPECT_EQ(aml->flow.appliances.size(), 2u);
    EXPECT_EQ(aml->flow.appliances[0].index, 1);
    EXPECT_LT(aml->flow.totalCfm, all->flow.totalCfm);
}

TEST(ScenarioEngine, ConnectorCarriesDesignatedApplianceWhenActive) {
    DraftCalculator calc;
    ScenarioEngine engine(calc, ScenarioConfig());
    VentRequest req = boilerRoom();
    ScenarioSet set = engine.run(req);

    double b2 = calc.applianceFlow(req.appliances[1], 1, *req.barometricPressure).cfm;
    double dhw = calc.applianceFlow(req.appliances[2], 2, *req.barometricPressure).cfm;

    const CalculationResult* all = set.find(ScenarioTag::All);
    EXPECT_EQ(all->connectorAppliance, 1);
    EXPECT_NEAR(all->connector.cfm, b2, 1e-9);

    // Designated appliance is off: connector carries the largest active one
    const CalculationResult* small = set.find(ScenarioTag::SingleSmallest);
    EXPECT_EQ(small->connectorAppliance, 2);
    EXPECT_NEAR(small->connector.cfm, dhw, 1e-9);
}

TEST(ScenarioEngine, TotalsAddConnectorAndManifold) {
    DraftCalculator calc;
    ScenarioEngine engine(calc, ScenarioConfig());
    ScenarioSet set = engine.run(boilerRoom());

    for (const auto& r : set.results) {
        ASSERT_TRUE(r.hasManifold);
        EXPECT_NEAR(r.theoreticalDraft,
                    r.connector.theoreticalDraft + r.manifold.theoreticalDraft, 1e-15);
        EXPECT_NEAR(r.totalLoss, r.connector.loss.total + r.manifold.loss.total, 1e-15);
        EXPECT_NEAR(r.availableDraft, r.theoreticalDraft - r.totalLoss, 1e-15);
        EXPECT_DOUBLE_EQ(r.outletPressure, -r.availableDraft);
    }
}

TEST(ScenarioEngine, WorstCaseHasLeastAvailableDraft) {
    DraftCalculator calc;
    ScenarioEngine engine(calc, ScenarioConfig());
    ScenarioSet set = engine.run(boilerRoom());

    ASSERT_GE(set.worstCase, 0);
    for (int i = 0; i < static_cast<int>(set.results.size()); ++i) {
        EXPECT_GE(set.results[i].availableDraft, set.worst().availableDraft);
        if (i < set.worstCase) {
            EXPECT_GT(set.results[i].availableDraft, set.worst().availableDraft);
        }
    }
}

TEST(ScenarioEngine, SingleApplianceScenariosAgree) {
    DraftCalculator calc;
    ScenarioEngine engine(calc, ScenarioConfig());
    ScenarioSet set = engine.run(singleAppliance());

    ASSERT_EQ(set.results.size(), 3u);
    EXPECT_EQ(set.find(ScenarioTag::AllMinusLargest), nullptr);

    const auto& all = *set.find(ScenarioTag::All);
    for (ScenarioTag tag : {ScenarioTag::SingleLargest, ScenarioTag::SingleSmallest}) {
        const auto& r = *set.find(tag);
        EXPECT_DOUBLE_EQ(r.flow.totalCfm, all.flow.totalCfm);
        EXPECT_DOUBLE_EQ(r.connector.velocityFpm, all.connector.velocityFpm);
        EXPECT_DOUBLE_EQ(r.availableDraft, all.availableDraft);
    }
    EXPECT_EQ(set.worstCase, 0);
}

TEST(ScenarioEngine, VelocityBandWarnings) {
    DraftCalculator calc;
    ScenarioEngine engine(calc, ScenarioConfig());

    VentRequest slow = singleAppliance();
    slow.connector = VentSegment(12, 10, 15, VentType::UL1738);
    ScenarioSet s = engine.run(slow);
    EXPECT_TRUE(hasWarning(s.results[0].warnings, WarningKind::VelocityLow));

    VentRequest fast = singleAppliance();
    fast.appliances = {ApplianceSpec(2000, 4, ApplianceCategory::CatIV)};
    fast.connector = VentSegment(4, 10, 15, VentType::UL1738);
    ScenarioSet f = engine.run(fast);
    EXPECT_TRUE(hasWarning(f.results[0].warnings, WarningKind::VelocityHigh));

    ScenarioConfig wide;
    wide.minVelocityFpm = 0.0;
    wide.maxVelocityFpm = 1e9;
    ScenarioEngine relaxed(calc, wide);
    EXPECT_TRUE(relaxed.run(fast).results[0].warnings.empty());
}

TEST(ScenarioEngine, VentRatingAndOutletPressureChecks) {
    DraftCalculator calc;
    ScenarioEngine engine(calc, ScenarioConfig());

    // Category IV into Type B vent
    ScenarioSet set = engine.run(singleAppliance());
    EXPECT_TRUE(hasWarning(set.warnings, WarningKind::VentTypeNotRated));
    // Strong natural draft pulls the outlet below the Category IV range
    EXPECT_LT(set.worst().outletPressure, -0.05);
    EXPECT_TRUE(hasWarning(set.warnings, WarningKind::OutletPressureTooNegative));

    VentRequest rated = singleAppliance();
    rated.connector = VentSegment(4, 10, 15, VentType::UL1738);
    EXPECT_FALSE(hasWarning(engine.run(rated).warnings, WarningKind::VentTypeNotRated));
}

TEST(ScenarioEngine, EmptyScenarioIsRejected) {
    DraftCalculator calc;
    ScenarioEngine engine(calc, ScenarioConfig());
    OperatingScenario none{ScenarioTag::AllMinusLargest, {}};
    EXPECT_THROW(engine.evaluate(singleAppliance(), none), std::invalid_argument);
}

TEST(ScenarioEngine, ConnectorApplianceOutOfRangeIsRejected) {
    DraftCalculator calc;
    ScenarioEngine engine(calc, ScenarioConfig());
    VentRequest req = boilerRoom();
    req.connectorAppliance = 3;
    EXPECT_THROW(engine.run(req), std::invalid_argument);
    req.connectorAppliance = -1;
    EXPECT_THROW(engine.run(req), std::invalid_argument);

    // Without a manifold the index is unused
    VentRequest single = singleAppliance();
    single.connectorAppliance = 5;
    EXPECT_NO_THROW(engine.run(single));
}

TEST(ScenarioEngine, MissingSiteConditionsAreRejected) {
    DraftCalculator calc;
    ScenarioEngine engine(calc, ScenarioConfig());
    VentRequest req = singleAppliance();
    req.ambientTemperature.reset();
    EXPECT_THROW(engine.run(req), std::invalid_argument);

    req = singleAppliance();
    req.barometricPressure.reset();
    EXPECT_THROW(engine.evaluate(req, resolveScenario(ScenarioTag::All, req.appliances)),
                 std::invalid_argument);
}
