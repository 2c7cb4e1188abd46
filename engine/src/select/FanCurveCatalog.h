#pragma once

#include "select/FanCurve.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ventsizer {

enum class FanKind {
    Inducer,  // draft inducer on the vent
    Supply    // combustion-air supply fan
};

std::string fanKindName(FanKind kind);
FanKind parseFanKind(const std::string& text);

struct FanSeries {
    std::string id;            // "TRV", "CBX", "PRIO", ...
    std::string name;          // display name
    FanKind kind = FanKind::Inducer;
    int priority = 0;          // lower is tried first
    bool condensingRated = false;
    bool variableSpeed = false;
};

struct FanModel {
    std::string id;
    std::string series;
    FanCurve curve;

    double capacity() const { return curve.maxFlow(); }
};

// Read-only set of fan series and model curves
// Built once, then shared as std::shared_ptr<const FanCurveCatalog>.
class FanCurveCatalog {
public:
    FanCurveCatalog() = default;
    FanCurveCatalog(std::vector<FanSeries> series, std::vector<FanModel> models);

    const std::vector<FanSeries>& series() const { return series_; }
    const std::vector<FanModel>& models() const { return models_; }

    const FanSeries* findSeries(const std::string& id) const;
    const FanModel* findModel(const std::string& id) const;

    // Series of one kind in ascending priority (ties keep insertion order)
    std::vector<const FanSeries*> seriesByPriority(FanKind kind) const;

    // Models of a series in ascending nominal capacity (max sampled flow)
    std::vector<const FanModel*> seriesModels(const std::string& seriesId) const;

    bool empty() const { return models_.empty(); }

private:
    std::vector<FanSeries> series_;
    std::vector<FanModel> models_;
    std::map<std::string, size_t> seriesIndex_;
    std::map<std::string, size_t> modelIndex_;
};

using CatalogPtr = std::shared_ptr<const FanCurveCatalog>;

} // namespace ventsizer
