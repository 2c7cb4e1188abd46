#ifdef VENTSIZER_HAS_SQLITE3

#include "io/SqliteWriter.h"
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <optional>
#include <stdexcept>

namespace ventsizer {

struct SqliteWriter::Impl {
    sqlite3* db = nullptr;
    bool open = false;  // transaction in progress

    ~Impl() {
        if (db) {
            if (open) sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
            sqlite3_close(db);
        }
    }

    void exec(const char* sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(db, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string err = errMsg ? errMsg : "unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error("SqliteWriter: " + err);
        }
    }
};

namespace {

// Prepared INSERT bound column by column
class Insert {
public:
    Insert(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("SqliteWriter: ") + sqlite3_errmsg(db));
        }
    }
    ~Insert() { sqlite3_finalize(stmt_); }

    Insert& bind(long long v) { sqlite3_bind_int64(stmt_, ++col_, v); return *this; }
    Insert& bind(int v) { sqlite3_bind_int(stmt_, ++col_, v); return *this; }
    Insert& bind(double v) { sqlite3_bind_double(stmt_, ++col_, v); return *this; }
    Insert& bind(const std::optional<double>& v) {
        if (!v) {
            sqlite3_bind_null(stmt_, ++col_);
            return *this;
        }
        return bind(*v);
    }
    Insert& bind(const std::string& v) {
        sqlite3_bind_text(stmt_, ++col_, v.c_str(), -1, SQLITE_TRANSIENT);
        return *this;
    }

    void run() {
        if (sqlite3_step(stmt_) != SQLITE_DONE) {
            throw std::runtime_error(std::string("SqliteWriter: ") + sqlite3_errmsg(db_));
        }
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
        col_ = 0;
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    int col_ = 0;
};

} // namespace

SqliteWriter::SqliteWriter(const std::string& filename)
    : impl_(std::make_unique<Impl>())
{
    int rc = sqlite3_open(filename.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("SqliteWriter: cannot open database: " + filename);
    }

    impl_->exec(
        "CREATE TABLE IF NOT EXISTS runs ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT, status TEXT,"
        "  ambient_f REAL, barometric_inhg REAL, worst_case TEXT);"
        "CREATE TABLE IF NOT EXISTS appliances ("
        "  run_id INTEGER, idx INTEGER, name TEXT, category TEXT, fuel TEXT,"
        "  mbh REAL, outlet_in REAL, co2_pct REAL, flue_temp_f REAL);"
        "CREATE TABLE IF NOT EXISTS scenarios ("
        "  run_id INTEGER, scenario TEXT, active_count INTEGER, total_cfm REAL,"
        "  mixed_temp_f REAL, theoretical_draft REAL, total_loss REAL,"
        "  available_draft REAL, outlet_pressure REAL, worst INTEGER);"
        "CREATE TABLE IF NOT EXISTS segments ("
        "  run_id INTEGER, scenario TEXT, segment TEXT, diameter_in REAL, cfm REAL,"
        "  velocity_fpm REAL, velocity_pressure REAL, theoretical_draft REAL,"
        "  friction_loss REAL, fitting_loss REAL, total_loss REAL);"
        "CREATE TABLE IF NOT EXISTS warnings ("
        "  run_id INTEGER, scenario TEXT, kind TEXT, subject TEXT, message TEXT);"
        "CREATE TABLE IF NOT EXISTS guard_rails ("
        "  run_id INTEGER, position INTEGER, rule_id TEXT, matched INTEGER);"
        "CREATE TABLE IF NOT EXISTS selection ("
        "  run_id INTEGER, item TEXT, status TEXT, model TEXT, detail TEXT);"
        "CREATE TABLE IF NOT EXISTS issues ("
        "  run_id INTEGER, field TEXT, message TEXT);");

    impl_->exec("BEGIN TRANSACTION;");
    impl_->open = true;
}

SqliteWriter::~SqliteWriter() = default;

long long SqliteWriter::writeAnalysis(const VentRequest& request, const AnalysisOutcome& outcome) {
    sqlite3* db = impl_->db;
    const ScenarioSet& set = outcome.scenarios;

    Insert run(db, "INSERT INTO runs (status, ambient_f, barometric_inhg, worst_case) "
                   "VALUES (?, ?, ?, ?);");
    run.bind(analysisStatusName(outcome.status))
       .bind(request.ambientTemperature)
       .bind(request.barometricPressure)
       .bind(set.worstCase >= 0 ? scenarioName(set.worst().scenario.tag) : std::string());
    run.run();
    const long long runId = sqlite3_last_insert_rowid(db);

    Insert app(db, "INSERT INTO appliances VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
    for (int i = 0; i < static_cast<int>(request.appliances.size()); ++i) {
        const auto& a = request.appliances[i];
        app.bind(runId).bind(i + 1).bind(a.name()).bind(categoryTag(a.category()))
           .bind(fuelName(a.fuel())).bind(a.mbh()).bind(a.outletDiameter())
           .bind(a.co2Percent()).bind(a.flueTemperature());
        app.run();
    }

    Insert issue(db, "INSERT INTO issues VALUES (?, ?, ?);");
    for (const auto& is : outcome.issues) {
        issue.bind(runId).bind(is.field).bind(is.message);
        issue.run();
    }

    Insert scen(db, "INSERT INTO scenarios VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    Insert seg(db, "INSERT INTO segments VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    Insert warn(db, "INSERT INTO warnings VALUES (?, ?, ?, ?, ?);");

    auto writeSeg = [&](const std::string& scenario, const std::string& name,
                        const SegmentResult& s) {
        seg.bind(runId).bind(scenario).bind(name).bind(s.diameter).bind(s.cfm)
           .bind(s.velocityFpm).bind(s.loss.velocityPressure).bind(s.theoreticalDraft)
           .bind(s.loss.frictionLoss).bind(s.loss.fittingLoss).bind(s.loss.total);
        seg.run();
    };

    for (int i = 0; i < static_cast<int>(set.results.size()); ++i) {
        const auto& r = set.results[i];
        const std::string name = scenarioName(r.scenario.tag);
        scen.bind(runId).bind(name).bind(static_cast<int>(r.scenario.active.size()))
            .bind(r.flow.totalCfm).bind(r.flow.mixedTemperature).bind(r.theoreticalDraft)
            .bind(r.totalLoss).bind(r.availableDraft).bind(r.outletPressure)
            .bind(i == set.worstCase ? 1 : 0);
        scen.run();

        writeSeg(name, r.hasManifold ? "connector" : "vent", r.connector);
        if (r.hasManifold) writeSeg(name, "manifold", r.manifold);

        for (const auto& w : r.warnings) {
            warn.bind(runId).bind(name).bind(warningKindName(w.kind)).bind(w.subject).bind(w.message);
            warn.run();
        }
    }
    for (const auto& w : set.warnings) {
        warn.bind(runId).bind(std::string("system")).bind(warningKindName(w.kind))
            .bind(w.subject).bind(w.message);
        warn.run();
    }

    const SelectionResult& sel = outcome.selection;
    Insert rail(db, "INSERT INTO guard_rails VALUES (?, ?, ?, ?);");
    for (int i = 0; i < static_cast<int>(sel.guardRails.trail.size()); ++i) {
        const auto& t = sel.guardRails.trail[i];
        rail.bind(runId).bind(i + 1).bind(t.id).bind(t.matched ? 1 : 0);
        rail.run();
    }

    if (outcome.valid()) {
        Insert item(db, "INSERT INTO selection VALUES (?, ?, ?, ?, ?);");
        item.bind(runId).bind(std::string("inducer")).bind(selectionStatusName(sel.inducer.status))
            .bind(sel.inducer.model).bind(sel.inducer.series);
        item.run();
        item.bind(runId).bind(std::string("controller"))
            .bind(std::string(sel.controller.required ? "selected" : "not_required"))
            .bind(sel.controller.model).bind(sel.controller.display);
        item.run();
        item.bind(runId).bind(std::string("supply_fan")).bind(selectionStatusName(sel.supplyFan.status))
            .bind(sel.supplyFan.model).bind(sel.supplyFan.series);
        item.run();
        for (const auto& d : sel.barometricDampers) {
            item.bind(runId).bind(std::string("barometric_damper")).bind(std::string("selected"))
                .bind(d.product).bind("appliance " + std::to_string(d.appliance));
            item.run();
        }
    }

    spdlog::debug("Archived run {} to SQLite", runId);
    return runId;
}

void SqliteWriter::finalize() {
    if (!impl_->open) return;
    impl_->exec("COMMIT;");
    impl_->open = false;
}

} // namespace ventsizer

#endif // VENTSIZER_HAS_SQLITE3
