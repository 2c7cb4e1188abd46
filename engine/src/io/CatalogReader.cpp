#include "io/CatalogReader.h"
#include "io/TextInput.h"
#include <spdlog/spdlog.h>
#include <cctype>
#include <stdexcept>

#ifdef VENTSIZER_HAS_SQLITE3
#include <sqlite3.h>
#endif

namespace ventsizer {

static const char* SOURCE = "Catalog";

namespace {

struct PendingModel {
    std::string id;
    std::string series;
    int line;
    std::vector<FanCurvePoint> points;
};

bool isSampleRow(const TextLine& line) {
    const char c = line.tokens[0][0];
    return std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+';
}

FanModel buildModel(const PendingModel& m) {
    try {
        return FanModel{m.id, m.series, FanCurve(m.id, m.points)};
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(parseError(SOURCE, m.line, e.what()));
    }
}

CatalogPtr buildCatalog(std::vector<FanSeries> series, std::vector<FanModel> models) {
    try {
        return std::make_shared<const FanCurveCatalog>(std::move(series), std::move(models));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Catalog: ") + e.what());
    }
}

} // namespace

CatalogPtr CatalogReader::readFromString(const std::string& content) {
    std::vector<FanSeries> series;
    std::vector<FanModel> models;
    bool open = false;
    PendingModel current;

    for (const TextLine& line : tokenizeLines(content)) {
        if (isSampleRow(line)) {
            if (!open) {
                throw std::runtime_error(parseError(SOURCE, line.number, "sample row outside a model"));
            }
            if (line.tokens.size() != 2) {
                throw std::runtime_error(parseError(SOURCE, line.number, "expected: <flow> <pressure>"));
            }
            current.points.emplace_back(parseNumber(line.tokens[0], "flow", line.number),
                                        parseNumber(line.tokens[1], "pressure", line.number));
            continue;
        }

        const std::string& key = line.tokens[0];
        if (key == "series") {
            if (line.tokens.size() < 3) {
                throw std::runtime_error(parseError(SOURCE, line.number, "expected: series <id> <kind> ..."));
            }
            FanSeries s;
            s.id = line.tokens[1];
            try {
                s.kind = parseFanKind(line.tokens[2]);
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error(parseError(SOURCE, line.number, e.what()));
            }
            KeyValueArgs args(line, 3, SOURCE);
            s.priority = args.integer("priority", static_cast<int>(series.size()) + 1);
            s.condensingRated = args.flag("condensing", false);
            s.variableSpeed = args.flag("variable", false);
            s.name = args.text("name", s.id);
            for (auto& c : s.name) {
                if (c == '_') c = ' ';
            }
            args.finish();
            series.push_back(std::move(s));
        } else if (key == "model") {
            if (line.tokens.size() != 3) {
                throw std::runtime_error(parseError(SOURCE, line.number, "expected: model <id> <series>"));
            }
            if (open) models.push_back(buildModel(current));
            current = PendingModel{line.tokens[1], line.tokens[2], line.number, {}};
            open = true;
        } else {
            throw std::runtime_error(parseError(SOURCE, line.number, "unknown entry '" + key + "'"));
        }
    }
    if (open) models.push_back(buildModel(current));

    return buildCatalog(std::move(series), std::move(models));
}

CatalogPtr CatalogReader::readFromFile(const std::string& filepath) {
    CatalogPtr cat = readFromString(readTextFile(filepath));
    spdlog::info("Loaded {} fan model(s) in {} series from {}",
                 cat->models().size(), cat->series().size(), filepath);
    return cat;
}

#ifdef VENTSIZER_HAS_SQLITE3

// ── SqliteCatalogReader ──────────────────────────────────────────────

namespace {

struct Database {
    sqlite3* db = nullptr;
    sqlite3_stmt* stmt = nullptr;
    ~Database() {
        if (stmt) sqlite3_finalize(stmt);
        if (db) sqlite3_close(db);
    }

    void prepare(const char* sql) {
        if (stmt) {
            sqlite3_finalize(stmt);
            stmt = nullptr;
        }
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("SqliteCatalogReader: ") + sqlite3_errmsg(db));
        }
    }
};

std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* t = sqlite3_column_text(stmt, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

} // namespace

CatalogPtr SqliteCatalogReader::readFromFile(const std::string& filepath) {
    Database d;
    if (sqlite3_open_v2(filepath.c_str(), &d.db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        throw std::runtime_error("SqliteCatalogReader: cannot open database: " + filepath);
    }

    std::vector<FanSeries> series;
    d.prepare("SELECT id, name, kind, priority, condensing, variable_speed "
              "FROM fan_series ORDER BY priority, id;");
    int rc;
    while ((rc = sqlite3_step(d.stmt)) == SQLITE_ROW) {
        FanSeries s;
        s.id = columnText(d.stmt, 0);
        s.name = columnText(d.stmt, 1);
        try {
            s.kind = parseFanKind(columnText(d.stmt, 2));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("SqliteCatalogReader: series " + s.id + ": " + e.what());
        }
        s.priority = sqlite3_column_int(d.stmt, 3);
        s.condensingRated = sqlite3_column_int(d.stmt, 4) != 0;
        s.variableSpeed = sqlite3_column_int(d.stmt, 5) != 0;
        series.push_back(std::move(s));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteCatalogReader: ") + sqlite3_errmsg(d.db));
    }

    std::vector<FanModel> models;
    d.prepare("SELECT model, series, flow, pressure FROM fan_curve_points "
              "ORDER BY model, flow;");
    PendingModel current;
    bool open = false;
    while ((rc = sqlite3_step(d.stmt)) == SQLITE_ROW) {
        std::string id = columnText(d.stmt, 0);
        if (!open || id != current.id) {
            if (open) models.push_back(buildModel(current));
            current = PendingModel{id, columnText(d.stmt, 1), 0, {}};
            open = true;
        }
        current.points.emplace_back(sqlite3_column_double(d.stmt, 2),
                                    sqlite3_column_double(d.stmt, 3));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteCatalogReader: ") + sqlite3_errmsg(d.db));
    }
    if (open) models.push_back(buildModel(current));

    CatalogPtr cat = buildCatalog(std::move(series), std::move(models));
    spdlog::info("Loaded {} fan model(s) from {}", cat->models().size(), filepath);
    return cat;
}

#endif // VENTSIZER_HAS_SQLITE3

} // namespace ventsizer
