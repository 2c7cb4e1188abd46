#include "core/DraftCalculator.h"
#include "utils/Constants.h"
#include <cmath>
#include <stdexcept>

namespace ventsizer {

double barometricPressureFromElevation(double elevationFt) {
    return STD_BAROMETRIC_INHG
        * std::pow(1.0 - ELEVATION_LAPSE_PER_FT * elevationFt, ELEVATION_EXPONENT);
}

const std::vector<double>& DraftCalculator::standardDiameters() {
    static const std::vector<double> diameters = {
        3, 4, 5, 6, 7, 8, 10, 12, 14, 16, 18, 20, 24, 30, 36
    };
    return diameters;
}

DraftCalculator::DraftCalculator(const DraftConstants& constants)
    : constants_(constants) {}

double DraftCalculator::gasDensity(double tempF, double barometric) const {
    double tempR = tempF + RANKINE_OFFSET;
    if (tempR <= 0.0) throw std::invalid_argument("Gas temperature below absolute zero");
    double pressure = constants_.referencePressure * barometric / constants_.referenceBarometric;
    return pressure / (constants_.gasConstant * tempR);
}

double DraftCalculator::mFactor(FuelType fuel, double co2Percent) const {
    if (co2Percent <= 0.0) throw std::invalid_argument("CO2 percentage must be positive");
    const auto& c = constants_.combustionFor(fuel);
    return c.scale * (c.base + c.co2Term / co2Percent);
}

ApplianceFlow DraftCalculator::applianceFlow(const ApplianceSpec& appliance, int index,
                                             double barometric) const {
    ApplianceFlow f;
    f.index = index;
    f.mFactor = mFactor(appliance.fuel(), appliance.co2Percent());
    // M is lb per 1000 BTU and MBH is thousands of BTU/hr
    f.massFlowLbHr = f.mFactor * appliance.mbh();
    f.massFlowLbMin = f.massFlowLbHr / MINUTES_PER_HOUR;
    f.flueTemperature = appliance.flueTemperature();
    f.density = gasDensity(f.flueTemperature, barometric);
    f.cfm = f.massFlowLbMin / f.density;
    return f;
}

CombinedFlow DraftCalculator::combineFlows(const std::vector<ApplianceSpec>& appliances,
                                           const std::vector<int>& active,
                                           double barometric) const {
    CombinedFlow combined;
    if (active.empty()) return combined;

    double weightedTempR = 0.0;
    for (int idx : active) {
        if (idx < 0 || idx >= static_cast<int>(appliances.size())) {
            throw std::out_of_range("Active appliance index out of range");
        }
        ApplianceFlow f = applianceFlow(appliances[idx], idx, barometric);
        combined.totalMassFlowLbMin += f.massFlowLbMin;
        combined.totalCfm += f.cfm;
        weightedTempR += f.massFlowLbMin * (f.flueTemperature + RANKINE_OFFSET);
        combined.appliances.push_back(f);
    }

    if (combined.totalMassFlowLbMin > 0.0) {
        combined.mixedTemperature = weightedTempR / combined.totalMassFlowLbMin - RANKINE_OFFSET;
    } else {
        combined.mixedTemperature = combined.appliances.front().flueTemperature;
    }
    combined.mixedDensity = gasDensity(combined.mixedTemperature, barometric);
    return combined;
}

double DraftCalculator::velocityFps(double cfm, double diameter) {
    if (diameter <= 0.0) throw std::invalid_argument("Vent diameter must be positive");
    double dFt = diameter / INCHES_PER_FOOT;
    double area = PI * dFt * dFt / 4.0;
    return cfm / area / SECONDS_PER_MINUTE;
}

double DraftCalculator::velocityPressure(double velocityFpm, double density) const {
    double v = velocityFpm / constants_.velocityPressureDivisor;
    return density * v * v;
}

double DraftCalculator::theoreticalDraft(double rise, double flueTempF, double ambientTempF,
                                         double barometric) const {
    double toR = ambientTempF + RANKINE_OFFSET;
    double tmR = flueTempF + RANKINE_OFFSET;
    return constants_.draftCoefficient * barometric * rise * (1.0 / toR - 1.0 / tmR);
}

LossBreakdown DraftCalculator::pressureLoss(const VentSegment& segment, double velocityFpm,
                                            double density) const {
    const FittingLossTable& table = constants_.tableFor(segment.ventType());

    LossBreakdown loss;
    loss.velocityPressure = velocityPressure(velocityFpm, density);
    loss.baseFrictionFactor = table.baseFrictionFactor;
    loss.frictionTerm = table.baseFrictionFactor * segment.length() / segment.diameter();
    loss.frictionLoss = loss.frictionTerm * loss.velocityPressure;

    auto addItem = [&](const std::string& name, int quantity, double kEach) {
        LossItem item;
        item.name = name;
        item.quantity = quantity;
        item.kEach = kEach;
        item.kTotal = kEach * quantity;
        item.loss = item.kTotal * loss.velocityPressure;
        loss.sumK += item.kTotal;
        loss.items.push_back(item);
    };

    const FittingType counted[] = {
        FittingType::Elbow90, FittingType::Elbow45, FittingType::Elbow30, FittingType::Tee
    };
    for (FittingType type : counted) {
        int n = segment.fittings().count(type);
        if (n > 0) addItem(fittingName(type), n, table.kFactor(type));
    }
    if (segment.hasTerminationCap()) {
        addItem(fittingName(FittingType::TerminationCap), 1,
                table.kFactor(FittingType::TerminationCap));
    }
    if (segment.additionalK() > 0.0) {
        addItem("additional", 1, segment.additionalK());
    }

    loss.fittingLoss = loss.sumK * loss.velocityPressure;
    loss.additionalLoss = segment.additionalLoss();
    loss.total = loss.frictionLoss + loss.fittingLoss + loss.additionalLoss;
    return loss;
}

SegmentResult DraftCalculator::analyzeSegment(const VentSegment& segment, double cfm,
                                              double gasTempF, double ambientTempF,
                                              double barometric) const {
    SegmentResult r;
    r.diameter = segment.diameter();
    r.cfm = cfm;
    r.gasTemperature = gasTempF;
    r.density = gasDensity(gasTempF, barometric);
    r.velocityFps = velocityFps(cfm, segment.diameter());
    r.velocityFpm = r.velocityFps * SECONDS_PER_MINUTE;
    r.theoreticalDraft = theoreticalDraft(segment.rise(), gasTempF, ambientTempF, barometric);
    r.loss = pressureLoss(segment, r.velocityFpm, r.density);
    r.availableDraft = r.theoreticalDraft - r.loss.total;
    return r;
}

DiameterSelection DraftCalculator::selectDiameter(const VentSegment& segment, double cfm,
                                                  double gasTempF, double ambientTempF,
                                                  double barometric,
                                                  double minAvailableDraft) const {
    DiameterSelection sel;
    for (double d : standardDiameters()) {
        VentSegment trial(d, segment.length(), segment.rise(), segment.ventType());
        trial.withFittings(segment.fittings())
             .withTerminationCap(segment.hasTerminationCap())
             .withAdditionalK(segment.additionalK());

        SegmentResult r = analyzeSegment(trial, cfm, gasTempF, ambientTempF, barometric);
        DiameterOption opt{d, r.velocityFps, r.loss.total, r.availableDraft,
                           r.availableDraft >= minAvailableDraft};
        sel.options.push_back(opt);
        if (opt.meetsRequirement && !sel.found) {
            sel.found = true;
            sel.diameter = d;
        }
    }
    return sel;
}

} // namespace ventsizer
