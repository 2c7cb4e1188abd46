#pragma once

#include "core/Appliance.h"
#include "elements/VentSegment.h"
#include "utils/Constants.h"
#include <optional>
#include <string>
#include <vector>

namespace ventsizer {

struct VentPreferences {
    bool touchscreen = false;
    std::string preferredInducerSeries;     // empty = no preference
    std::string preferredSupplySeries;      // empty = no preference
    bool supplyAir = false;                 // combustion-air supply fan wanted
    std::optional<double> combustionAirCfm; // overrides the computed requirement
};

// One fully formed calculation request
// Barometric pressure arrives already resolved from the site elevation.
// Ambient and barometric are required; unset values fail validation.
struct VentRequest {
    std::vector<ApplianceSpec> appliances;
    VentSegment connector;
    std::optional<VentSegment> manifold;
    int connectorAppliance = 0;                   // appliance on the worst-case connector
    std::optional<double> ambientTemperature;     // °F
    std::optional<double> barometricPressure;     // in. Hg
    VentPreferences preferences;
};

struct ValidationIssue {
    std::string field;
    std::string message;
};

// Checks the request against the supported input domain
// Returns an empty list when the request can be calculated.
std::vector<ValidationIssue> validateRequest(const VentRequest& request);

} // namespace ventsizer
