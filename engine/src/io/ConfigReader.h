#pragma once
#include "core/AnalysisConfig.h"
#include <string>

namespace ventsizer {

/// Analysis settings file: one "key value..." entry per line, '#' comments.
/// Unlisted keys keep their compiled-in defaults; unknown keys are errors.
///
///   draft_coefficient 0.2554
///   combustion natural_gas 0.705 0.159 10.72
///   k UL441 elbow90 0.75
///   friction UL103 0.30
///   velocity_band 300 3000
///   cat4_pressure_threshold 0.11
class ConfigReader {
public:
    static AnalysisConfig readFromFile(const std::string& filepath);
    static AnalysisConfig readFromString(const std::string& content);
    // Apply entries on top of an existing configuration
    static void applyString(const std::string& content, AnalysisConfig& config);
};

} // namespace ventsizer
