#ifdef VENTSIZER_HAS_HDF5

#include "io/Hdf5Writer.h"
#include <highfive/H5File.hpp>
#include <highfive/H5DataSet.hpp>
#include <highfive/H5DataSpace.hpp>
#include <cmath>

namespace ventsizer {

void Hdf5Writer::writeAnalysis(const std::string& filepath,
                               const VentRequest& request,
                               const AnalysisOutcome& outcome) {
    HighFive::File file(filepath, HighFive::File::Overwrite);

    auto meta = file.createGroup("metadata");
    meta.createAttribute("status", analysisStatusName(outcome.status));
    meta.createAttribute("ambientTemperature", request.ambientTemperature.value_or(std::nan("")));
    meta.createAttribute("barometricPressure", request.barometricPressure.value_or(std::nan("")));
    meta.createAttribute("applianceCount", static_cast<int>(request.appliances.size()));
    meta.createAttribute("worstCase", outcome.scenarios.worstCase);

    // Appliance inputs
    auto appGrp = file.createGroup("appliances");
    const int nApp = static_cast<int>(request.appliances.size());
    std::vector<double> mbh(nApp), outlet(nApp), co2(nApp), flueTemp(nApp);
    std::vector<std::string> names(nApp), categories(nApp);
    for (int i = 0; i < nApp; ++i) {
        const auto& a = request.appliances[i];
        mbh[i] = a.mbh();
        outlet[i] = a.outletDiameter();
        co2[i] = a.co2Percent();
        flueTemp[i] = a.flueTemperature();
        names[i] = a.name();
        categories[i] = categoryTag(a.category());
    }
    appGrp.createDataSet("mbh", mbh);
    appGrp.createDataSet("outletDiameter", outlet);
    appGrp.createDataSet("co2", co2);
    appGrp.createDataSet("flueTemperature", flueTemp);
    appGrp.createDataSet("name", names);
    appGrp.createDataSet("category", categories);

    if (!outcome.valid()) {
        std::vector<std::string> issues;
        for (const auto& is : outcome.issues) issues.push_back(is.field + ": " + is.message);
        file.createDataSet("issues", issues);
        return;
    }

    // Scenario table: one entry per evaluated scenario
    const auto& results = outcome.scenarios.results;
    const int nScen = static_cast<int>(results.size());
    auto scenGrp = file.createGroup("scenarios");
    std::vector<std::string> tags(nScen);
    std::vector<double> cfm(nScen), mixedTemp(nScen), draft(nScen), loss(nScen), avail(nScen);
    std::vector<double> connVel(nScen), manVel(nScen, 0.0);
    for (int s = 0; s < nScen; ++s) {
        const auto& r = results[s];
        tags[s] = scenarioName(r.scenario.tag);
        cfm[s] = r.flow.totalCfm;
        mixedTemp[s] = r.flow.mixedTemperature;
        draft[s] = r.theoreticalDraft;
        loss[s] = r.totalLoss;
        avail[s] = r.availableDraft;
        connVel[s] = r.connector.velocityFpm;
        if (r.hasManifold) manVel[s] = r.manifold.velocityFpm;
    }
    scenGrp.createDataSet("tag", tags);
    scenGrp.createDataSet("totalCfm", cfm);
    scenGrp.createDataSet("mixedTemperature", mixedTemp);
    scenGrp.createDataSet("theoreticalDraft", draft);
    scenGrp.createDataSet("totalLoss", loss);
    scenGrp.createDataSet("availableDraft", avail);
    scenGrp.createDataSet("connectorVelocityFpm", connVel);
    scenGrp.createDataSet("manifoldVelocityFpm", manVel);

    // Selected inducer curve: [nPoints x 2] (flow, pressure)
    const SelectionResult& sel = outcome.selection;
    auto selGrp = file.createGroup("selection");
    selGrp.createAttribute("guardRail", sel.guardRails.firedId);
    selGrp.createAttribute("inducerStatus", selectionStatusName(sel.inducer.status));
    selGrp.createAttribute("controller", sel.controller.model);
    selGrp.createAttribute("supplyFan", sel.supplyFan.model);
    if (sel.inducer.status == SelectionStatus::Selected) {
        selGrp.createAttribute("inducer", sel.inducer.model);
        selGrp.createAttribute("requiredCfm", sel.inducer.requiredCfm);
        selGrp.createAttribute("requiredPressure", sel.inducer.requiredPressure);
        std::vector<std::vector<double>> curve;
        for (const auto& p : sel.inducer.curve) curve.push_back({p.flow, p.pressure});
        selGrp.createDataSet("inducerCurve", curve);
    }
}

} // namespace ventsizer

#endif // VENTSIZER_HAS_HDF5
