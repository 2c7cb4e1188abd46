#include <gtest/gtest.h>
#include "core/VentAnalyzer.h"
#include "io/CatalogReader.h"
#include "io/RequestReader.h"
#include <algorithm>

using namespace ventsizer;

// ── Helpers ──────────────────────────────────────────────────────────

static const char* CATALOG =
    "series T9F inducer priority=1 condensing=1\n"
    "series PRIO supply priority=1\n"
    "model T9F004 T9F\n"
    "  30  1.20\n"
    "  170 0.90\n"
    "  300 0.15\n"
    "model PRIO-600 PRIO\n"
    "  0   0.50\n"
    "  600 0.10\n";

static const char* WORKED_EXAMPLE =
    "ambient 70\n"
    "barometric 29.92\n"
    "appliance mbh=100 outlet=4 category=IV\n"
    "connector diameter=4 length=10 rise=15 vent=UL441\n";

static bool hasIssue(const std::vector<ValidationIssue>& issues, const std::string& field,
                     const std::string& text = "") {
    return std::any_of(issues.begin(), issues.end(), [&](const ValidationIssue& i) {
        return i.field == field && i.message.find(text) != std::string::npos;
    });
}

// ── Required fields ──────────────────────────────────────────────────

TEST(RequestValidation, MissingAmbientIsReported) {
    VentRequest req = RequestReader::readFromString(
        "barometric 29.92\n"
        "appliance mbh=100 outlet=4 category=IV\n"
        "connector diameter=4 length=10 rise=15\n");
    EXPECT_FALSE(req.ambientTemperature.has_value());

    auto issues = validateRequest(req);
    EXPECT_TRUE(hasIssue(issues, "ambient", "missing ambient temperature"));
    EXPECT_FALSE(hasIssue(issues, "barometric"));
    // No ambient to compare the flue temperature against
    EXPECT_FALSE(hasIssue(issues, "appliance[1].flueTemp"));
}

TEST(RequestValidation, MissingBarometricIsReported) {
    VentRequest req = RequestReader::readFromString(
        "ambient 70\n"
        "appliance mbh=100 outlet=4 category=IV\n"
        "connector diameter=4 length=10 rise=15\n");
    EXPECT_FALSE(req.barometricPressure.has_value());
    EXPECT_TRUE(hasIssue(validateRequest(req), "barometric", "missing barometric pressure"));
}

TEST(RequestValidation, AnalyzerDoesNotFillMissingSiteConditions) {
    VentAnalyzer analyzer(CatalogReader::readFromString(CATALOG));
    VentRequest req = RequestReader::readFromString(
        "appliance mbh=100 outlet=4 category=IV\n"
        "connector diameter=4 length=10 rise=15\n");

    AnalysisOutcome out;
    ASSERT_NO_THROW(out = analyzer.analyze(req));
    EXPECT_EQ(out.status, AnalysisStatus::ValidationFailed);
    EXPECT_TRUE(out.scenarios.results.empty());
    EXPECT_TRUE(hasIssue(out.issues, "ambient"));
    EXPECT_TRUE(hasIssue(out.issues, "barometric"));
}

// ── Geometry ─────────────────────────────────────────────────────────

TEST(RequestValidation, RiseMayExceedDevelopedLength) {
    VentRequest req = RequestReader::readFromString(WORKED_EXAMPLE);
    ASSERT_GT(req.connector.rise(), req.connector.length());
    EXPECT_TRUE(validateRequest(req).empty());

    req.connector = VentSegment(4, 10, -1, VentType::UL441);
    EXPECT_TRUE(hasIssue(validateRequest(req), "connector.rise"));
}

TEST(RequestValidation, NegativeAdditionalLossIsReported) {
    VentRequest req = RequestReader::readFromString(
        std::string(WORKED_EXAMPLE) + "manifold diameter=6 length=20 rise=18 additional_loss=-0.1\n");
    EXPECT_TRUE(hasIssue(validateRequest(req), "manifold.additionalLoss"));
}

// ── Temperature domain ───────────────────────────────────────────────

TEST(RequestValidation, AmbientBelowAbsoluteZeroIsReportedNotThrown) {
    VentAnalyzer analyzer(CatalogReader::readFromString(CATALOG));
    VentRequest req = RequestReader::readFromString(std::string(WORKED_EXAMPLE)
        + "prefer supply_air=1\n");
    req.ambientTemperature = -470.0;

    AnalysisOutcome out;
    ASSERT_NO_THROW(out = analyzer.analyze(req));
    EXPECT_EQ(out.status, AnalysisStatus::ValidationFailed);
    EXPECT_TRUE(hasIssue(out.issues, "ambient", "absolute zero"));

    req.ambientTemperature = -459.67;
    EXPECT_TRUE(hasIssue(validateRequest(req), "ambient", "absolute zero"));
}

TEST(RequestValidation, FlueOverrideBelowAbsoluteZeroIsReportedNotThrown) {
    VentAnalyzer analyzer(CatalogReader::readFromString(CATALOG));
    VentRequest req = RequestReader::readFromString(
        "ambient -600\n"
        "barometric 29.92\n"
        "appliance mbh=100 outlet=4 category=IV flue_temp=-500\n"
        "connector diameter=4 length=10 rise=15\n");

    AnalysisOutcome out;
    ASSERT_NO_THROW(out = analyzer.analyze(req));
    EXPECT_EQ(out.status, AnalysisStatus::ValidationFailed);
    EXPECT_TRUE(hasIssue(out.issues, "ambient", "absolute zero"));
    EXPECT_TRUE(hasIssue(out.issues, "appliance[1].flueTemp", "absolute zero"));
}

// ── End to end ───────────────────────────────────────────────────────

TEST(RequestValidation, WorkedExampleFromRequestText) {
    VentAnalyzer analyzer(CatalogReader::readFromString(CATALOG));
    AnalysisOutcome out = analyzer.analyze(RequestReader::readFromString(WORKED_EXAMPLE));

    ASSERT_EQ(out.status, AnalysisStatus::Ok);
    EXPECT_TRUE(out.issues.empty());
    ASSERT_EQ(out.scenarios.results.size(), 3u);

    const CalculationResult& r = out.scenarios.worst();
    EXPECT_NEAR(r.flow.totalCfm, 30.9, 0.05);
    EXPECT_NEAR(r.theoreticalDraft, 0.0604, 0.0005);
    EXPECT_NEAR(r.availableDraft, 0.0548, 0.0005);
    EXPECT_EQ(out.selection.inducer.model, "T9F004");
    EXPECT_EQ(out.selection.controller.model, "H100-V");
}

TEST(RequestValidation, AdditionalLossReducesAvailableDraft) {
    VentAnalyzer analyzer(CatalogReader::readFromString(CATALOG));
    AnalysisOutcome base = analyzer.analyze(RequestReader::readFromString(WORKED_EXAMPLE));
    AnalysisOutcome damper = analyzer.analyze(RequestReader::readFromString(
        "ambient 70\n"
        "barometric 29.92\n"
        "appliance mbh=100 outlet=4 category=IV\n"
        "connector diameter=4 length=10 rise=15 vent=UL441 additional_loss=0.02\n"));

    ASSERT_EQ(damper.status, AnalysisStatus::Ok);
    EXPECT_NEAR(damper.scenarios.worst().totalLoss,
                base.scenarios.worst().totalLoss + 0.02, 1e-12);
    EXPECT_NEAR(damper.scenarios.worst().availableDraft,
                base.scenarios.worst().availableDraft - 0.02, 1e-12);
}
