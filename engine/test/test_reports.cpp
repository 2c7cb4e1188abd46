#include <gtest/gtest.h>
#include "core/VentAnalyzer.h"
#include "io/CatalogReader.h"
#include "io/CurveReport.h"
#include "io/DraftReport.h"
#include <sstream>

using namespace ventsizer;

static CatalogPtr reportCatalog() {
    return CatalogReader::readFromString(
        "series T9F inducer priority=1 condensing=1\n"
        "model T9F004 T9F\n"
        "  30  1.20\n"
        "  170 0.90\n"
        "  300 0.15\n");
}

static VentRequest singleCatIV() {
    VentRequest req;
    req.ambientTemperature = 70.0;
    req.barometricPressure = 29.92;
    req.appliances = {ApplianceSpec(100, 4, ApplianceCategory::CatIV).withName("Heater")};
    req.connector = VentSegment(4, 10, 15, VentType::UL441);
    return req;
}

static bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

// ── DraftReport ──────────────────────────────────────────────────────

TEST(DraftReport, TextReportSections) {
    VentAnalyzer analyzer(reportCatalog());
    VentRequest req = singleCatIV();
    AnalysisOutcome out = analyzer.analyze(req);

    std::string text = DraftReport::formatText(req, out);
    EXPECT_TRUE(contains(text, "=== Combustion Vent Draft Report ==="));
    EXPECT_TRUE(contains(text, "Status: ok"));
    EXPECT_TRUE(contains(text, "Heater"));
    EXPECT_TRUE(contains(text, "--- Scenario ALL (worst case) ---"));
    EXPECT_TRUE(contains(text, "--- Scenario SINGLE_SMALLEST ---"));
    EXPECT_TRUE(contains(text, "  Vent (4 in.)"));
    EXPECT_FALSE(contains(text, "Manifold"));
    EXPECT_TRUE(contains(text, "[x] cat4-low-pressure"));
    EXPECT_TRUE(contains(text, "[ ] mixed-categories"));
    EXPECT_TRUE(contains(text, "T9F004 (T9F series)"));
    EXPECT_TRUE(contains(text, "H100-V (LCD)"));
}

TEST(DraftReport, TextReportListsValidationIssues) {
    VentAnalyzer analyzer(reportCatalog());
    VentRequest req = singleCatIV();
    req.appliances[0] = ApplianceSpec(0, 4, ApplianceCategory::CatIV);

    std::string text = DraftReport::formatText(req, analyzer.analyze(req));
    EXPECT_TRUE(contains(text, "Status: validation_failed"));
    EXPECT_TRUE(contains(text, "--- Validation Issues ---"));
    EXPECT_TRUE(contains(text, "appliance[1].mbh: must be positive"));
    EXPECT_FALSE(contains(text, "--- Scenario"));
}

TEST(DraftReport, CsvHasOneRowPerScenarioSegment) {
    VentAnalyzer analyzer(reportCatalog());
    AnalysisOutcome out = analyzer.analyze(singleCatIV());

    std::string csv = DraftReport::formatCsv(out);
    std::istringstream in(csv);
    std::string line;
    std::vector<std::string> meta, rows;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        (line[0] == '#' ? meta : rows).push_back(line);
    }

    ASSERT_EQ(meta.size(), 5u);
    EXPECT_EQ(meta[0], "# Status,ok");
    EXPECT_EQ(meta[1], "# WorstCase,ALL");
    EXPECT_EQ(meta[2], "# GuardRail,cat4-low-pressure");
    EXPECT_EQ(meta[3], "# Inducer,T9F004");
    EXPECT_EQ(meta[4], "# Controller,H100-V");

    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0].rfind("Scenario,Segment,Diameter_in", 0), 0u);
    EXPECT_EQ(rows[1].rfind("ALL,vent,4.000000,", 0), 0u);
    EXPECT_EQ(rows[2].rfind("SINGLE_LARGEST,vent,", 0), 0u);
    EXPECT_EQ(rows[3].rfind("SINGLE_SMALLEST,vent,", 0), 0u);
}

TEST(DraftReport, CsvSplitsConnectorAndManifold) {
    VentAnalyzer analyzer(reportCatalog());
    VentRequest req = singleCatIV();
    req.appliances.push_back(ApplianceSpec(60, 3, ApplianceCategory::CatIV));
    req.connector = VentSegment(4, 6, 2, VentType::UL1738);
    req.manifold = VentSegment(6, 20, 18, VentType::UL1738);

    std::string csv = DraftReport::formatCsv(analyzer.analyze(req));
    EXPECT_TRUE(contains(csv, "\nALL,connector,"));
    EXPECT_TRUE(contains(csv, "\nALL,manifold,"));
    EXPECT_TRUE(contains(csv, "\nALL_MINUS_LARGEST,manifold,"));
    EXPECT_FALSE(contains(csv, ",vent,"));
}

// ── CurveReport ──────────────────────────────────────────────────────

TEST(CurveReport, OperatingPointOnLinearCurve) {
    std::vector<FanCurvePoint> fan = {{0, 2.0}, {100, 0.0}};
    // 2 − 0.02·Q = Q²/2500 at Q = 50
    OperatingPoint op = CurveReport::operatingPoint(fan, 1.0 / 2500.0);
    ASSERT_TRUE(op.found);
    EXPECT_NEAR(op.flow, 50.0, 1e-9);
    EXPECT_NEAR(op.pressure, 1.0, 1e-9);

    // System curve steeper than the fan at every sample
    std::vector<FanCurvePoint> weak = {{50, 0.1}, {100, 0.05}};
    EXPECT_FALSE(CurveReport::operatingPoint(weak, 1.0).found);
}

TEST(CurveReport, GenerateFromSelection) {
    InducerSelection ind;
    ind.status = SelectionStatus::Selected;
    ind.model = "LIN";
    ind.curve = {{0, 2.0}, {100, 0.0}};
    ind.requiredCfm = 50.0;
    ind.requiredPressure = 1.0;

    CurveResult r = CurveReport::generate(ind, 1, 11);
    EXPECT_EQ(r.model, "LIN");
    EXPECT_NEAR(r.systemK, 1.0 / 2500.0, 1e-15);
    ASSERT_TRUE(r.operatingPoint.found);
    EXPECT_NEAR(r.operatingPoint.flow, 50.0, 1e-9);

    ASSERT_EQ(r.fitCoeffs.size(), 2u);
    EXPECT_NEAR(r.fitCoeffs[0], 2.0, 1e-9);
    EXPECT_NEAR(r.fitCoeffs[1], -0.02, 1e-12);

    ASSERT_EQ(r.systemCurve.size(), 11u);
    EXPECT_DOUBLE_EQ(r.systemCurve.front().flow, 0.0);
    EXPECT_DOUBLE_EQ(r.systemCurve.back().flow, 100.0);
    EXPECT_NEAR(r.systemCurve.back().pressure, 4.0, 1e-12);
    EXPECT_NEAR(r.fitted[5].pressure, 1.0, 1e-9);

    std::string csv = CurveReport::formatCsv(r);
    EXPECT_TRUE(contains(csv, "# Model,LIN\n"));
    EXPECT_TRUE(contains(csv, "# OperatingFlow_cfm,50.000000\n"));
    EXPECT_TRUE(contains(csv, "Series,Flow_cfm,Pressure_inwc\n"));
    EXPECT_TRUE(contains(csv, "fan,100.000000,0.000000\n"));
    EXPECT_TRUE(contains(csv, "system,100.000000,4.000000\n"));
}

TEST(CurveReport, RequiresASelectedInducer) {
    InducerSelection none;
    EXPECT_THROW(CurveReport::generate(none), std::invalid_argument);
}
