#include <gtest/gtest.h>
#include "core/VentAnalyzer.h"
#include "io/CatalogReader.h"
#include <algorithm>

using namespace ventsizer;

// ── Helpers ──────────────────────────────────────────────────────────

static const char* CATALOG =
    "series TRV inducer priority=1 condensing=0 variable=0\n"
    "series T9F inducer priority=2 condensing=1 variable=0\n"
    "series PRIO supply priority=1\n"
    "model TRV002 TRV\n"
    "  20  1.10\n"
    "  100 0.85\n"
    "  180 0.25\n"
    "model T9F004 T9F\n"
    "  30  1.20\n"
    "  170 0.90\n"
    "  300 0.15\n"
    "model PRIO-600 PRIO\n"
    "  0   0.50\n"
    "  600 0.10\n";

// 100 MBH Category IV, 4 in. Type B vent, 10 ft developed, 15 ft rise
static VentRequest workedExample() {
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

// ── VentAnalyzer ─────────────────────────────────────────────────────

TEST(VentAnalyzer, WorkedExample) {
    VentAnalyzer analyzer(CatalogReader::readFromString(CATALOG));
    AnalysisOutcome out = analyzer.analyze(workedExample());

    ASSERT_EQ(out.status, AnalysisStatus::Ok);
    ASSERT_EQ(out.scenarios.results.size(), 3u);
    EXPECT_EQ(out.scenarios.worstCase, 0);

    const CalculationResult& r = out.scenarios.worst();
    EXPECT_NEAR(r.flow.totalCfm, 30.9, 0.05);
    EXPECT_NEAR(r.connector.velocityFpm, 354.2, 0.5);
    EXPECT_NEAR(r.theoreticalDraft, 0.0604, 0.0005);
    EXPECT_NEAR(r.totalLoss, 0.00564, 0.0002);
    EXPECT_NEAR(r.availableDraft, 0.0548, 0.0005);
    EXPECT_DOUBLE_EQ(r.outletPressure, -r.availableDraft);

    EXPECT_TRUE(hasWarning(out.scenarios.warnings, WarningKind::VentTypeNotRated));
    EXPECT_TRUE(hasWarning(out.scenarios.warnings, WarningKind::OutletPressureTooNegative));

    const SelectionResult& sel = out.selection;
    EXPECT_EQ(sel.guardRails.firedId, "cat4-low-pressure");
    EXPECT_DOUBLE_EQ(sel.inducer.requiredPressure, 0.0);
    EXPECT_EQ(sel.inducer.model, "T9F004");
    EXPECT_EQ(sel.controller.model, "H100-V");
    EXPECT_EQ(sel.supplyFan.status, SelectionStatus::NotRequired);
    EXPECT_TRUE(sel.barometricDampers.empty());
}

TEST(VentAnalyzer, RepeatedRunsAgree) {
    VentAnalyzer analyzer(CatalogReader::readFromString(CATALOG));
    VentRequest req = workedExample();
    req.preferences.supplyAir = true;

    AnalysisOutcome a = analyzer.analyze(req);
    AnalysisOutcome b = analyzer.analyze(req);

    ASSERT_EQ(a.scenarios.results.size(), b.scenarios.results.size());
    for (size_t i = 0; i < a.scenarios.results.size(); ++i) {
        EXPECT_EQ(a.scenarios.results[i].availableDraft, b.scenarios.results[i].availableDraft);
        EXPECT_EQ(a.scenarios.results[i].totalLoss, b.scenarios.results[i].totalLoss);
    }
    EXPECT_EQ(a.selection.inducer.model, b.selection.inducer.model);
    EXPECT_EQ(a.selection.supplyFan.model, b.selection.supplyFan.model);
    EXPECT_EQ(a.selection.controller.model, "H100-PV");
}

TEST(VentAnalyzer, InvalidRequestIsReportedNotThrown) {
    VentAnalyzer analyzer(CatalogReader::readFromString(CATALOG));
    VentRequest req = workedExample();
    req.appliances.push_back(ApplianceSpec(-10, 4, ApplianceCategory::CatIV));
    req.connector = VentSegment(3, 10, 15, VentType::UL441);

    AnalysisOutcome out;
    ASSERT_NO_THROW(out = analyzer.analyze(req));
    EXPECT_EQ(out.status, AnalysisStatus::ValidationFailed);
    EXPECT_FALSE(out.valid());
    EXPECT_TRUE(out.scenarios.results.empty());

    auto field = [&out](const std::string& f) {
        return std::any_of(out.issues.begin(), out.issues.end(),
                           [&f](const ValidationIssue& i) { return i.field == f; });
    };
    EXPECT_TRUE(field("appliance[2].mbh"));
    EXPECT_TRUE(field("connector.diameter"));
}

TEST(VentAnalyzer, TooManyAppliances) {
    VentAnalyzer analyzer(CatalogReader::readFromString(CATALOG));
    VentRequest req = workedExample();
    for (int i = 0; i < 6; ++i) req.appliances.push_back(req.appliances[0]);
    req.connector = VentSegment(12, 10, 15, VentType::UL1738);

    AnalysisOutcome out = analyzer.analyze(req);
    EXPECT_EQ(out.status, AnalysisStatus::ValidationFailed);
    ASSERT_FALSE(out.issues.empty());
    EXPECT_EQ(out.issues[0].field, "appliances");
}

TEST(VentAnalyzer, NoFitWhenNoCondensingSeries) {
    VentAnalyzer analyzer(CatalogReader::readFromString(
        "series TRV inducer priority=1\n"
        "model TRV002 TRV\n"
        "  20  1.10\n"
        "  180 0.25\n"));
    AnalysisOutcome out = analyzer.analyze(workedExample());

    EXPECT_EQ(out.status, AnalysisStatus::NoFit);
    EXPECT_TRUE(out.valid());
    EXPECT_EQ(out.selection.inducer.status, SelectionStatus::NoFit);
    // The draft calculation is still reported
    EXPECT_EQ(out.scenarios.results.size(), 3u);
    EXPECT_EQ(out.selection.guardRails.firedId, "cat4-low-pressure");
}

TEST(VentAnalyzer, ConfigFlowsThroughToCalculation) {
    AnalysisConfig cfg;
    cfg.constants.draftCoefficient = 0.2554 * 2.0;

    VentAnalyzer base(CatalogReader::readFromString(CATALOG));
    VentAnalyzer doubled(CatalogReader::readFromString(CATALOG), cfg);

    AnalysisOutcome a = base.analyze(workedExample());
    AnalysisOutcome b = doubled.analyze(workedExample());
    EXPECT_NEAR(b.scenarios.worst().theoreticalDraft, 2.0 * a.scenarios.worst().theoreticalDraft, 1e-12);
    EXPECT_DOUBLE_EQ(b.scenarios.worst().totalLoss, a.scenarios.worst().totalLoss);
}
