#include "config/app_config.hpp"
#include "market/instrument_registry.hpp"
#include "report/market_report.hpp"
#include "util/clock.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

struct CliOptions {
    std::string                   config_path = "data/config.json";
    std::string                   report_path;
    std::string                   csv_path;
    std::optional<gbce::Duration> window;
    bool                          help = false;
};

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--window" && i + 1 < argc) {
            opts.window = gbce::window_from_minutes(std::stod(argv[++i]));
        } else if (arg == "--report" && i + 1 < argc) {
            opts.report_path = argv[++i];
        } else if (arg == "--csv" && i + 1 < argc) {
            opts.csv_path = argv[++i];
        } else if (arg == "--help") {
            opts.help = true;
        } else {
            throw std::invalid_argument("unknown argument '" + arg + "' (see --help)");
        }
    }
    return opts;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        auto opts = parse_args(argc, argv);
        if (opts.help) {
            std::cout << "Usage: gbce_index [options]\n"
                      << "  --config <path>   Config file (default: data/config.json)\n"
                      << "  --window <min>    Price window in minutes (default: from config, 15)\n"
                      << "  --report <path>   Also write the markdown report to a file\n"
                      << "  --csv <path>      Also write per-instrument figures as CSV\n"
                      << "  --help            Show this help\n";
            return 0;
        }

        std::cout << "Loading config from: " << opts.config_path << "\n";
        auto config = gbce::load_config(opts.config_path, std::cerr);
        if (opts.window) {
            config.window = *opts.window;
        }

        gbce::SystemClock clock;
        gbce::InstrumentRegistry registry(clock);
        auto loaded = gbce::populate_registry(config, registry, std::cerr);

        std::cout << "Registered " << loaded.instruments << " instruments, recorded "
                  << loaded.trades << " trades";
        if (loaded.skipped > 0) {
            std::cout << " (" << loaded.skipped << " entries skipped)";
        }
        std::cout << "\n";

        registry.for_each([](const gbce::InstrumentLedger& ledger) {
            std::cout << " - " << ledger.describe() << "\n";
        });

        gbce::MarketReport report(registry, config.window);
        std::cout << "\n" << report.generate_report();

        if (!opts.report_path.empty()) {
            report.write_report(opts.report_path);
            std::cout << "\nReport written to " << opts.report_path << "\n";
        }
        if (!opts.csv_path.empty()) {
            report.write_csv(opts.csv_path);
            std::cout << "CSV written to " << opts.csv_path << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
