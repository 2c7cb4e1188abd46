#include "core/VentAnalyzer.h"
#include <spdlog/spdlog.h>

namespace ventsizer {

std::string analysisStatusName(AnalysisStatus status) {
    switch (status) {
        case AnalysisStatus::Ok:               return "ok";
        case AnalysisStatus::ValidationFailed: return "validation_failed";
        case AnalysisStatus::NoFit:            return "no_fit";
    }
    return "?";
}

VentAnalyzer::VentAnalyzer(CatalogPtr catalog, const AnalysisConfig& config)
    : config_(config),
      calc_(config_.constants),
      scenarios_(calc_, config_.scenario),
      selector_(std::move(catalog), calc_, config_.selection) {}

AnalysisOutcome VentAnalyzer::analyze(const VentRequest& request) const {
    AnalysisOutcome out;

    out.issues = validateRequest(request);
    if (!out.issues.empty()) {
        out.status = AnalysisStatus::ValidationFailed;
        for (const auto& issue : out.issues) {
            spdlog::warn("Invalid input {}: {}", issue.field, issue.message);
        }
        return out;
    }

    spdlog::info("Analyzing {} appliance(s), ambient {:.1f} F, barometric {:.2f} in. Hg",
                 request.appliances.size(), *request.ambientTemperature,
                 *request.barometricPressure);

    out.scenarios = scenarios_.run(request);
    out.selection = selector_.select(request, out.scenarios);
    if (out.selection.status == SelectionStatus::NoFit) {
        out.status = AnalysisStatus::NoFit;
    }
    return out;
}

} // namespace ventsizer
