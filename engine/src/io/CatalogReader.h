#pragma once
#include "select/FanCurveCatalog.h"
#include <memory>
#include <string>

namespace ventsizer {

/// Fan catalog text file
///
///   series TRV inducer priority=1 condensing=0 variable=0 name=TRV_True_Inline
///   model TRV004 TRV
///     80    1.60          # CFM  in. w.c. at 70 °F
///     250   1.35
///     ...
///
/// Sample rows belong to the most recent model line and must increase in flow.
class CatalogReader {
public:
    static CatalogPtr readFromFile(const std::string& filepath);
    static CatalogPtr readFromString(const std::string& content);
};

#ifdef VENTSIZER_HAS_SQLITE3

/// Same catalog from SQLite tables:
///   fan_series(id TEXT, name TEXT, kind TEXT, priority INTEGER,
///              condensing INTEGER, variable_speed INTEGER)
///   fan_curve_points(model TEXT, series TEXT, flow REAL, pressure REAL)
class SqliteCatalogReader {
public:
    static CatalogPtr readFromFile(const std::string& filepath);
};

#endif // VENTSIZER_HAS_SQLITE3

} // namespace ventsizer
