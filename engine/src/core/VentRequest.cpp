#include "core/VentRequest.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace ventsizer {

static std::string fmt(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

static void validateSegment(const VentSegment& seg, const std::string& name,
                            double maxOutlet, std::vector<ValidationIssue>& issues) {
    if (!(seg.diameter() > 0.0)) {
        issues.push_back({name + ".diameter", "must be positive"});
    } else if (seg.diameter() < maxOutlet) {
        issues.push_back({name + ".diameter",
            fmt(seg.diameter()) + " in. is smaller than the largest appliance outlet ("
            + fmt(maxOutlet) + " in.)"});
    }
    if (!(seg.length() > 0.0)) {
        issues.push_back({name + ".length", "must be positive"});
    }
    if (!(seg.rise() >= 0.0)) {
        issues.push_back({name + ".rise", "must be non-negative"});
    }
    const auto& f = seg.fittings();
    if (f.elbow90 < 0 || f.elbow45 < 0 || f.elbow30 < 0 || f.tee < 0) {
        issues.push_back({name + ".fittings", "counts must be non-negative"});
    }
    if (!(seg.additionalK() >= 0.0)) {
        issues.push_back({name + ".additionalK", "must be non-negative"});
    }
    if (!(seg.additionalLoss() >= 0.0)) {
        issues.push_back({name + ".additionalLoss", "must be non-negative"});
    }
}

static bool aboveAbsoluteZero(double tempF) {
    return tempF + RANKINE_OFFSET > 0.0;
}

std::vector<ValidationIssue> validateRequest(const VentRequest& request) {
    std::vector<ValidationIssue> issues;
    const int n = static_cast<int>(request.appliances.size());

    if (n < MIN_APPLIANCES || n > MAX_APPLIANCES) {
        issues.push_back({"appliances", "count " + std::to_string(n) + " is outside "
            + std::to_string(MIN_APPLIANCES) + "-" + std::to_string(MAX_APPLIANCES)});
    }

    const auto& ambient = request.ambientTemperature;
    if (!ambient) {
        issues.push_back({"ambient", "missing ambient temperature"});
    } else if (!std::isfinite(*ambient)) {
        issues.push_back({"ambient", "must be a finite temperature"});
    } else if (!aboveAbsoluteZero(*ambient)) {
        issues.push_back({"ambient", fmt(*ambient) + " F is at or below absolute zero"});
    }
    const auto& baro = request.barometricPressure;
    if (!baro) {
        issues.push_back({"barometric", "missing barometric pressure"});
    } else if (!(*baro >= MIN_BAROMETRIC_INHG && *baro <= MAX_BAROMETRIC_INHG)) {
        issues.push_back({"barometric", fmt(*baro)
            + " in. Hg is outside " + fmt(MIN_BAROMETRIC_INHG) + "-" + fmt(MAX_BAROMETRIC_INHG)});
    }

    double maxOutlet = 0.0;
    for (int i = 0; i < n; ++i) {
        const auto& app = request.appliances[i];
        std::string field = "appliance[" + std::to_string(i + 1) + "]";
        if (!(app.mbh() > 0.0)) {
            issues.push_back({field + ".mbh", "must be positive"});
        }
        if (!(app.outletDiameter() > 0.0)) {
            issues.push_back({field + ".outlet", "must be positive"});
        } else {
            maxOutlet = std::max(maxOutlet, app.outletDiameter());
        }
        if (!(app.co2Percent() > 0.0 && app.co2Percent() <= MAX_CO2_PERCENT)) {
            issues.push_back({field + ".co2", fmt(app.co2Percent()) + " % is outside (0, "
                + fmt(MAX_CO2_PERCENT) + "]"});
        }
        if (!aboveAbsoluteZero(app.flueTemperature())) {
            issues.push_back({field + ".flueTemp", fmt(app.flueTemperature())
                + " F is at or below absolute zero"});
        } else if (ambient && !(app.flueTemperature() > *ambient)) {
            issues.push_back({field + ".flueTemp", "must be above the ambient temperature"});
        }
    }

    validateSegment(request.connector, "connector", maxOutlet, issues);
    if (request.manifold) {
        validateSegment(*request.manifold, "manifold", maxOutlet, issues);
    }

    if (n > 0 && (request.connectorAppliance < 0 || request.connectorAppliance >= n)) {
        issues.push_back({"connectorAppliance", "index "
            + std::to_string(request.connectorAppliance + 1) + " does not name an appliance"});
    }

    if (request.preferences.combustionAirCfm && !(*request.preferences.combustionAirCfm > 0.0)) {
        issues.push_back({"combustionAirCfm", "must be positive"});
    }

    return issues;
}

} // namespace ventsizer
