#include "io/ConfigReader.h"
#include "io/TextInput.h"
#include "utils/Constants.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ventsizer {

static const char* SOURCE = "Config";

static void expectArgs(const TextLine& line, size_t count) {
    if (line.tokens.size() != count + 1) {
        throw std::runtime_error(parseError(SOURCE, line.number,
            "'" + line.tokens[0] + "' expects " + std::to_string(count) + " value(s)"));
    }
}

static double positive(const TextLine& line, size_t idx) {
    double v = parseNumber(line.tokens[idx], line.tokens[0], line.number);
    if (!(v > 0.0)) {
        throw std::runtime_error(parseError(SOURCE, line.number, line.tokens[0] + " must be positive"));
    }
    return v;
}

static double nonNegative(const TextLine& line, size_t idx) {
    double v = parseNumber(line.tokens[idx], line.tokens[0], line.number);
    if (!(v >= 0.0)) {
        throw std::runtime_error(parseError(SOURCE, line.number, line.tokens[0] + " must be non-negative"));
    }
    return v;
}

void ConfigReader::applyString(const std::string& content, AnalysisConfig& config) {
    DraftConstants& dc = config.constants;

    for (const TextLine& line : tokenizeLines(content)) {
        const std::string& key = line.tokens[0];

        try {
            if (key == "draft_coefficient") {
                expectArgs(line, 1);
                dc.draftCoefficient = positive(line, 1);
            } else if (key == "velocity_pressure_divisor") {
                expectArgs(line, 1);
                dc.velocityPressureDivisor = positive(line, 1);
            } else if (key == "gas_constant") {
                expectArgs(line, 1);
                dc.gasConstant = positive(line, 1);
            } else if (key == "reference_pressure") {
                expectArgs(line, 1);
                dc.referencePressure = positive(line, 1);
            } else if (key == "reference_barometric") {
                expectArgs(line, 1);
                dc.referenceBarometric = positive(line, 1);
            } else if (key == "combustion") {
                expectArgs(line, 4);
                CombustionCoefficients& cc = dc.combustionFor(parseFuel(line.tokens[1]));
                cc.scale = positive(line, 2);
                cc.base = nonNegative(line, 3);
                cc.co2Term = positive(line, 4);
            } else if (key == "k") {
                expectArgs(line, 3);
                FittingLossTable& t = dc.tableFor(parseVentType(line.tokens[1]));
                t.setKFactor(parseFittingType(line.tokens[2]), nonNegative(line, 3));
            } else if (key == "friction") {
                expectArgs(line, 2);
                dc.tableFor(parseVentType(line.tokens[1])).baseFrictionFactor = nonNegative(line, 2);
            } else if (key == "rated") {
                // rated UL103 I III BH
                if (line.tokens.size() < 3) {
                    throw std::runtime_error(parseError(SOURCE, line.number, "'rated' needs a vent type and categories"));
                }
                FittingLossTable& t = dc.tableFor(parseVentType(line.tokens[1]));
                t.ratedCategories.clear();
                for (size_t i = 2; i < line.tokens.size(); ++i) {
                    t.ratedCategories.push_back(parseCategory(line.tokens[i]));
                }
            } else if (key == "velocity_band") {
                expectArgs(line, 2);
                double lo = nonNegative(line, 1);
                double hi = positive(line, 2);
                if (!(hi > lo)) {
                    throw std::runtime_error(parseError(SOURCE, line.number, "velocity band is empty"));
                }
                config.scenario.minVelocityFpm = lo;
                config.scenario.maxVelocityFpm = hi;
            } else if (key == "cat4_pressure_threshold") {
                expectArgs(line, 1);
                config.selection.catIVPressureThreshold = nonNegative(line, 1);
            } else if (key == "fixed_speed_turndown_limit") {
                expectArgs(line, 1);
                config.selection.fixedSpeedTurndownLimit = nonNegative(line, 1);
            } else if (key == "standard_air_temperature") {
                expectArgs(line, 1);
                double t = parseNumber(line.tokens[1], key, line.number);
                if (!(t + RANKINE_OFFSET > 0.0)) {
                    throw std::runtime_error(parseError(SOURCE, line.number,
                        "standard_air_temperature is at or below absolute zero"));
                }
                config.selection.standardAirTemperature = t;
            } else {
                throw std::runtime_error(parseError(SOURCE, line.number, "unknown key '" + key + "'"));
            }
        } catch (const std::invalid_argument& e) {
            // unknown fuel / vent type / fitting / category names
            throw std::runtime_error(parseError(SOURCE, line.number, e.what()));
        }
    }
}

AnalysisConfig ConfigReader::readFromString(const std::string& content) {
    AnalysisConfig config;
    applyString(content, config);
    return config;
}

AnalysisConfig ConfigReader::readFromFile(const std::string& filepath) {
    AnalysisConfig config = readFromString(readTextFile(filepath));
    spdlog::info("Loaded configuration from {}", filepath);
    return config;
}

} // namespace ventsizer
