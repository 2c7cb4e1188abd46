#include "io/RequestReader.h"
#include "core/DraftCalculator.h"
#include "io/TextInput.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ventsizer {

static const char* SOURCE = "Request";

static double single(const TextLine& line) {
    if (line.tokens.size() != 2) {
        throw std::runtime_error(parseError(SOURCE, line.number,
            "'" + line.tokens[0] + "' expects one value"));
    }
    return parseNumber(line.tokens[1], line.tokens[0], line.number);
}

static ApplianceSpec parseAppliance(const TextLine& line) {
    KeyValueArgs args(line, 1, SOURCE);
    double mbh = args.number("mbh");
    double outlet = args.number("outlet");
    ApplianceCategory cat = parseCategory(args.text("category", "I"));
    FuelType fuel = parseFuel(args.text("fuel", "natural_gas"));

    ApplianceSpec app(mbh, outlet, cat, fuel);
    if (args.has("co2")) app.withCo2(args.number("co2"));
    if (args.has("flue_temp")) app.withFlueTemperature(args.number("flue_temp"));
    if (args.has("name")) app.withName(args.text("name"));
    args.finish();
    return app;
}

static VentSegment parseSegment(const TextLine& line) {
    KeyValueArgs args(line, 1, SOURCE);
    double diameter = args.number("diameter");
    double length = args.number("length");
    double rise = args.number("rise");
    VentType type = parseVentType(args.text("vent", "UL441"));

    // Raw counts; negatives are reported by validation, not rejected here
    FittingCounts fittings;
    fittings.elbow90 = args.integer("elbow90", 0);
    fittings.elbow45 = args.integer("elbow45", 0);
    fittings.elbow30 = args.integer("elbow30", 0);
    fittings.tee = args.integer("tee", 0);

    VentSegment seg(diameter, length, rise, type);
    seg.withFittings(fittings)
       .withTerminationCap(args.flag("cap", false))
       .withAdditionalK(args.number("additional_k", 0.0))
       .withAdditionalLoss(args.number("additional_loss", 0.0));
    args.finish();
    return seg;
}

static void parsePreferences(const TextLine& line, VentPreferences& prefs) {
    KeyValueArgs args(line, 1, SOURCE);
    prefs.touchscreen = args.flag("touchscreen", prefs.touchscreen);
    prefs.preferredInducerSeries = args.text("inducer", prefs.preferredInducerSeries);
    prefs.supplyAir = args.flag("supply_air", prefs.supplyAir);
    prefs.preferredSupplySeries = args.text("supply", prefs.preferredSupplySeries);
    if (args.has("combustion_air_cfm")) {
        prefs.combustionAirCfm = args.number("combustion_air_cfm");
    }
    args.finish();
}

VentRequest RequestReader::readFromString(const std::string& content) {
    VentRequest req;
    bool haveConnector = false;
    bool havePressure = false;

    for (const TextLine& line : tokenizeLines(content)) {
        const std::string& key = line.tokens[0];
        try {
            if (key == "ambient") {
                req.ambientTemperature = single(line);
            } else if (key == "barometric" || key == "elevation") {
                if (havePressure) {
                    throw std::runtime_error(parseError(SOURCE, line.number,
                        "give either barometric or elevation, once"));
                }
                havePressure = true;
                double v = single(line);
                req.barometricPressure = key == "elevation" ? barometricPressureFromElevation(v) : v;
            } else if (key == "appliance") {
                req.appliances.push_back(parseAppliance(line));
            } else if (key == "connector") {
                if (haveConnector) {
                    throw std::runtime_error(parseError(SOURCE, line.number, "duplicate connector"));
                }
                req.connector = parseSegment(line);
                haveConnector = true;
            } else if (key == "manifold") {
                if (req.manifold) {
                    throw std::runtime_error(parseError(SOURCE, line.number, "duplicate manifold"));
                }
                req.manifold = parseSegment(line);
            } else if (key == "connector_appliance") {
                if (line.tokens.size() != 2) {
                    throw std::runtime_error(parseError(SOURCE, line.number,
                        "'connector_appliance' expects one value"));
                }
                req.connectorAppliance = parseInteger(line.tokens[1], key, line.number) - 1;
            } else if (key == "prefer") {
                parsePreferences(line, req.preferences);
            } else {
                throw std::runtime_error(parseError(SOURCE, line.number, "unknown entry '" + key + "'"));
            }
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(parseError(SOURCE, line.number, e.what()));
        }
    }

    if (!haveConnector) {
        throw std::runtime_error("Request: no connector entry");
    }
    return req;
}

VentRequest RequestReader::readFromFile(const std::string& filepath) {
    VentRequest req = readFromString(readTextFile(filepath));
    spdlog::info("Read request {} ({} appliance(s))", filepath, req.appliances.size());
    return req;
}

} // namespace ventsizer
