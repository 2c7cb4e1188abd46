#include "select/FanCurveCatalog.h"
#include <algorithm>
#include <stdexcept>

namespace ventsizer {

std::string fanKindName(FanKind kind) {
    return kind == FanKind::Supply ? "supply" : "inducer";
}

FanKind parseFanKind(const std::string& text) {
    if (text == "inducer") return FanKind::Inducer;
    if (text == "supply") return FanKind::Supply;
    throw std::invalid_argument("Unknown fan kind: " + text);
}

FanCurveCatalog::FanCurveCatalog(std::vector<FanSeries> series, std::vector<FanModel> models)
    : series_(std::move(series)), models_(std::move(models))
{
    for (size_t i = 0; i < series_.size(); ++i) {
        if (!seriesIndex_.emplace(series_[i].id, i).second) {
            throw std::invalid_argument("Duplicate fan series: " + series_[i].id);
        }
    }
    for (size_t i = 0; i < models_.size(); ++i) {
        const auto& m = models_[i];
        if (seriesIndex_.find(m.series) == seriesIndex_.end()) {
            throw std::invalid_argument("Model " + m.id + " names unknown series " + m.series);
        }
        if (!modelIndex_.emplace(m.id, i).second) {
            throw std::invalid_argument("Duplicate fan model: " + m.id);
        }
    }
}

const FanSeries* FanCurveCatalog::findSeries(const std::string& id) const {
    auto it = seriesIndex_.find(id);
    return it == seriesIndex_.end() ? nullptr : &series_[it->second];
}

const FanModel* FanCurveCatalog::findModel(const std::string& id) const {
    auto it = modelIndex_.find(id);
    return it == modelIndex_.end() ? nullptr : &models_[it->second];
}

std::vector<const FanSeries*> FanCurveCatalog::seriesByPriority(FanKind kind) const {
    std::vector<const FanSeries*> out;
    for (const auto& s : series_) {
        if (s.kind == kind) out.push_back(&s);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const FanSeries* a, const FanSeries* b) {
                         return a->priority < b->priority;
                     });
    return out;
}

std::vector<const FanModel*> FanCurveCatalog::seriesModels(const std::string& seriesId) const {
    std::vector<const FanModel*> out;
    for (const auto& m : models_) {
        if (m.series == seriesId) out.push_back(&m);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const FanModel* a, const FanModel* b) {
                         return a->capacity() < b->capacity();
                     });
    return out;
}

} // namespace ventsizer
