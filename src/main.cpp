#include "Types.h"
#include "ConfigLoader.h"
#include "Study.h"
#include "OutputWriter.h"

#include <iostream>
#include <iomanip>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <config.yaml>\n"
              << "\nOptions:\n"
              << "  -o, --output <dir>   Output directory (default: ./output)\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --verbose        Verbose output\n"
              << "\nReturn codes:\n"
              << "  0  Success, recommended option passes voltage and practical current limits\n"
              << "  1  Success, no option passes\n"
              << "  2  Configuration or runtime error\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string output_dir = "output";
    bool verbose = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        }
        else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output_dir = argv[++i];
        }
        else if (arg[0] != '-') {
            config_path = arg;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    if (config_path.empty()) {
        std::cerr << "Error: No configuration file specified\n";
        print_usage(argv[0]);
        return 2;
    }

    try {
        if (verbose) {
            std::cout << "Loading configuration from: " << config_path << "\n";
        }

        pq::AnalysisConfig config = pq::ConfigLoader::load(config_path);

        std::string validation_error;
        if (!pq::ConfigLoader::validate(config, validation_error)) {
            std::cerr << "Configuration error: " << validation_error << "\n";
            return 2;
        }

        if (verbose) {
            std::cout << "Study: " << config.name << "\n";
            std::cout << "VLL: " << config.site.vll_v << " V @ " << config.site.frequency_hz << " Hz\n";
            std::cout << "Demand: " << config.load.demand_kw << " kW"
                      << (config.load.kw_is_output ? " (output)" : " (input)")
                      << ", load " << config.load.load_pu << " pu\n";
            std::cout << "Ssc: " << config.grid.sc_mva << " MVA, |Z| ~ h^" << config.grid.z_exp << "\n";
        }

        pq::StudyResults results = pq::run_study(config, verbose);
        const pq::ScenarioResult& best = results.best();

        fs::create_directories(output_dir);

        std::string csv_path = output_dir + "/scenarios.csv";
        std::string report_path = output_dir + "/results.json";

        if (verbose) {
            std::cout << "Writing scenarios to: " << csv_path << "\n";
        }
        pq::OutputWriter::write_csv(csv_path, results.scenarios);

        if (verbose) {
            std::cout << "Writing result packet to: " << report_path << "\n";
        }
        pq::OutputWriter::write_report(report_path, results);

        // Print summary
        std::cout << std::fixed << std::setprecision(2);
        std::cout << "\n=== UPS Harmonics & PCC Power Quality Screening ===\n";
        std::cout << "IL: " << results.il_a << " A, Isc/IL: " << results.isc_over_il
                  << " (row " << best.current.category_label << ")\n";
        std::cout << "Scenarios evaluated: " << results.scenarios.size() << "\n";
        std::cout << "Recommended: " << best.name << "\n";
        if (best.voltage) {
            std::cout << "  THDv: " << best.voltage->thdv_percent << "% (limit "
                      << best.voltage->limit_percent << "%) "
                      << (best.voltage->pass_limit ? "PASS" : "FAIL") << "\n";
        }
        std::cout << "  TDD: " << best.current.tdd_percent << "% (limit "
                  << best.current.tdd_limit_percent << "%) "
                  << (best.practical_pass ? "PASS (practical)" : "FAIL (practical)") << "\n";
        std::cout << "  Severity score: " << best.severity_score << "\n";

        if (!results.tipping_points.empty()) {
            const auto& grid = config.tipping_points.sc_mva_grid;
            std::cout << "\nTipping points (min Ssc for THDv / current):\n";
            for (const auto& tip : results.tipping_points) {
                std::cout << "  " << tip.option << ": "
                          << pq::format_bound(tip.min_sc_mva_voltage, grid) << " / "
                          << pq::format_bound(tip.min_sc_mva_current, grid) << "\n";
            }
        }

        if (results.waveform_check) {
            std::cout << "\nWaveform check THD-I: spectrum "
                      << results.waveform_check->thd_i_spectrum_percent << "%, FFT "
                      << results.waveform_check->thd_i_fft_percent << "%\n";
        }

        bool overall_pass = best.practical_pass && best.voltage && best.voltage->pass_limit;
        std::cout << "\nOverall: " << (overall_pass ? "COMPLIANT" : "NON-COMPLIANT") << "\n";

        return overall_pass ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
