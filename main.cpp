// main.cpp
#include "CompilationInput.hpp"
#include "Logger.hpp"
#include "StatsErrors.hpp"
#include "StatsExport.hpp"
#include "StatsRecorder.hpp"
#include "requirements.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

void print_help() {
    std::cout << "Usage:\n"
              << "  ./tustat [--config F] show [DB]            Print stored stats\n"
              << "  ./tustat [--config F] csv [DB] [OUT]       Export stored stats as CSV\n"
              << "  ./tustat [--config F] record <input.json>  Record one compilation\n"
              << "  ./tustat -h, --help                        Show this help message\n";
}

static std::optional<std::string> arg_at(const std::vector<std::string>& args, size_t i) {
    if (i < args.size()) return args[i];
    return std::nullopt;
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // Handle help flag early
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        print_help();
        return args.empty() ? 1 : 0;
    }

    const char* cfg_env = std::getenv("TUSTAT_CONFIG");
    std::string config_path = cfg_env ? cfg_env : "./tustat.json";
    if (args[0] == "--config") {
        if (args.size() < 2) { print_help(); return 1; }
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) { print_help(); return 1; }

    const std::string mode = args[0];
    if (mode != "show" && mode != "csv" && mode != "record") {
        std::cerr << "[Main] unknown mode: " << mode << "\n";
        print_help();
        return 1;
    }

    auto boot = Requirements::run(config_path, /*with_recorder=*/mode == "record");
    if (!boot.ok) {
        std::cerr << "[Main] aborted: " << boot.error << "\n";
        return 1;
    }

    // "record" mode
    if (mode == "record") {
        if (args.size() < 2) {
            std::cerr << "Usage: " << argv[0] << " record <input.json>\n";
            return 1;
        }
        if (!TuStatsRecorder::is_active()) {
            std::cerr << "[Main] translation_unit_stats disabled in " << config_path << "; nothing recorded\n";
            return 0;
        }
        std::ifstream in(args[1]);
        if (!in) {
            std::cerr << "[Main] cannot open " << args[1] << "\n";
            return 1;
        }
        std::stringstream ss;
        ss << in.rdbuf();
        try {
            const StatsRecord rec = stats_record_from_compilation(ss.str(), boot.config.getTopN(),
                                                                  WallClock::now());
            TuStatsRecorder::record(rec);
        } catch (const std::runtime_error& e) {
            std::cerr << "[Main] bad compilation description " << args[1] << ": " << e.what() << "\n";
            return 1;
        }
        TuStatsRecorder::shutdown();
        return 0;
    }

    // "show" / "csv" modes
    std::vector<StatsRecord> records;
    try {
        records = StatsExport::query(arg_at(args, 1), boot.config.getTuStatsConfig());
    } catch (const TuStatsError& e) {
        log_error(std::string("[Main] aborted: ") + e.what());
        return 1;
    }
    StatsExport::sort_by_timestamp(records);

    if (mode == "show") {
        StatsExport::print_human(records, std::cout);
        return 0;
    }

    const std::string csv = StatsExport::to_csv(records);
    if (auto out_path = arg_at(args, 2)) {
        std::ofstream ofs(*out_path);
        if (!ofs) {
            std::cerr << "[Main] cannot write " << *out_path << "\n";
            return 1;
        }
        ofs << csv;
        std::cout << "[Main] wrote " << records.size() << " rows to " << *out_path << "\n";
    } else {
        std::cout << csv;
    }
    return 0;
}
