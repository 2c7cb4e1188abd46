#include "core/VentAnalyzer.h"
#include "io/CatalogReader.h"
#include "io/ConfigReader.h"
#include "io/CurveReport.h"
#include "io/DraftReport.h"
#include "io/RequestReader.h"
#include "io/SqliteWriter.h"
#include "io/Hdf5Writer.h"
#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace ventsizer;

namespace {

struct Options {
    std::string requestPath;
    std::string catalogPath;
    std::string configPath;
    std::string csvPath;
    std::string curveCsvPath;
    std::string sqlitePath;
    std::string hdf5Path;
    spdlog::level::level_enum level = spdlog::level::info;
};

void usage() {
    std::cerr << "usage: ventsizer <request> <catalog> [--config f] [--csv f] [--curve-csv f]\n"
                 "                 [--sqlite f] [--hdf5 f] [--verbose|--quiet]\n"
                 "  <catalog> ending in .db/.sqlite is read as a SQLite catalog\n";
}

Options parseArgs(int argc, char** argv) {
    Options opt;
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(name + " needs a file name");
            return argv[++i];
        };
        if (arg == "--config") opt.configPath = value(arg);
        else if (arg == "--csv") opt.csvPath = value(arg);
        else if (arg == "--curve-csv") opt.curveCsvPath = value(arg);
        else if (arg == "--sqlite") opt.sqlitePath = value(arg);
        else if (arg == "--hdf5") opt.hdf5Path = value(arg);
        else if (arg == "--verbose") opt.level = spdlog::level::debug;
        else if (arg == "--quiet") opt.level = spdlog::level::warn;
        else if (!arg.empty() && arg[0] == '-') throw std::invalid_argument("unknown option " + arg);
        else if (positional == 0) { opt.requestPath = arg; ++positional; }
        else if (positional == 1) { opt.catalogPath = arg; ++positional; }
        else throw std::invalid_argument("unexpected argument " + arg);
    }
    if (positional != 2) throw std::invalid_argument("request and catalog files are required");
    return opt;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

CatalogPtr loadCatalog(const std::string& path) {
    if (endsWith(path, ".db") || endsWith(path, ".sqlite")) {
#ifdef VENTSIZER_HAS_SQLITE3
        return SqliteCatalogReader::readFromFile(path);
#else
        throw std::runtime_error("SQLite catalogs need a build with SQLite3");
#endif
    }
    return CatalogReader::readFromFile(path);
}

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream f(path);
    if (!f.is_open()) throw std::runtime_error("Cannot write file: " + path);
    f << content;
    spdlog::info("Wrote {}", path);
}

} // namespace

int main(int argc, char** argv) {
    Options opt;
    try {
        opt = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ventsizer: " << e.what() << "\n";
        usage();
        return 2;
    }
    spdlog::set_level(opt.level);

    try {
        AnalysisConfig config;
        if (!opt.configPath.empty()) config = ConfigReader::readFromFile(opt.configPath);

        CatalogPtr catalog = loadCatalog(opt.catalogPath);
        VentRequest request = RequestReader::readFromFile(opt.requestPath);

        VentAnalyzer analyzer(catalog, config);
        AnalysisOutcome outcome = analyzer.analyze(request);

        std::cout << DraftReport::formatText(request, outcome);

        if (!opt.csvPath.empty() && outcome.valid()) {
            writeFile(opt.csvPath, DraftReport::formatCsv(outcome));
        }
        if (!opt.curveCsvPath.empty()) {
            if (outcome.selection.inducer.status == SelectionStatus::Selected) {
                writeFile(opt.curveCsvPath,
                          CurveReport::formatCsv(CurveReport::generate(outcome.selection.inducer)));
            } else {
                spdlog::warn("No inducer selected; {} not written", opt.curveCsvPath);
            }
        }
        if (!opt.sqlitePath.empty()) {
#ifdef VENTSIZER_HAS_SQLITE3
            SqliteWriter writer(opt.sqlitePath);
            writer.writeAnalysis(request, outcome);
            writer.finalize();
            spdlog::info("Wrote {}", opt.sqlitePath);
#else
            spdlog::error("Built without SQLite3; --sqlite ignored");
#endif
        }
        if (!opt.hdf5Path.empty()) {
#ifdef VENTSIZER_HAS_HDF5
            Hdf5Writer::writeAnalysis(opt.hdf5Path, request, outcome);
            spdlog::info("Wrote {}", opt.hdf5Path);
#else
            spdlog::error("Built without HDF5; --hdf5 ignored");
#endif
        }

        switch (outcome.status) {
            case AnalysisStatus::Ok:               return 0;
            case AnalysisStatus::NoFit:            return 3;
            case AnalysisStatus::ValidationFailed: return 4;
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
