#pragma once

#include "core/DraftConstants.h"

namespace ventsizer {

// Recommended flue velocity band on every segment
// Below the band condensate pools instead of draining; above it the vent is
// noisy and erodes liners.
struct ScenarioConfig {
    double minVelocityFpm = 300.0;
    double maxVelocityFpm = 3000.0;
};

struct SelectionConfig {
    // Category IV worst-case operating pressure split (in. w.c.)
    double catIVPressureThreshold = 0.11;
    // Largest turndown requirement a fixed-speed inducer covers (in. w.c.)
    double fixedSpeedTurndownLimit = 0.50;
    // Catalog fan curves are published at standard air
    double standardAirTemperature = 70.0;  // °F
};

struct AnalysisConfig {
    DraftConstants constants;
    ScenarioConfig scenario;
    SelectionConfig selection;
};

} // namespace ventsizer
