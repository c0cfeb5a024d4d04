#include "Study.h"
#include "HarmonicModel.h"
#include "PccSizing.h"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace pq {

namespace {

std::string fmt(double value, int precision, const std::string& suffix = "") {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value << suffix;
    return out.str();
}

ScenarioRequest request_from_config(const AnalysisConfig& config, double il_a) {
    ScenarioRequest request;
    request.load_pu = config.load.load_pu;
    request.il_a = il_a;
    request.vll_v = config.site.vll_v;
    request.sc_mva = config.grid.sc_mva;
    request.topologies = config.scenario_space.topologies;
    request.mitigations = config.scenario_space.filters;
    request.per_topology_filters = config.scenario_space.per_topology_filters;
    request.thdv_limit_percent = config.limits.thdv_limit_pct;
    request.z_freq_exp = config.grid.z_exp;
    request.xr = config.grid.xr;
    request.even_harmonic_factor = config.limits.even_harmonic_factor;
    return request;
}

std::vector<std::pair<std::string, std::string>> build_inputs_block(const AnalysisConfig& config,
                                                                    double il_a) {
    return {
        {"VLL", fmt(config.site.vll_v, 1, " V")},
        {std::string("Demand (") + (config.load.kw_is_output ? "output" : "input") + ")",
         fmt(config.load.demand_kw, 2, " kW")},
        {"PF (disp)", fmt(config.load.pf_displacement, 3)},
        {"Efficiency", fmt(config.load.efficiency, 3)},
        {"IL (max-demand fundamental)", fmt(il_a, 2, " A")},
        {"Operating load", fmt(config.load.load_pu, 2, " pu")},
        {"PCC strength (Ssc)", fmt(config.grid.sc_mva, 1, " MVA")},
        {"THDv limit", fmt(config.limits.thdv_limit_pct, 1, "%")},
        {"Impedance scaling", "|Z| ~ h^" + fmt(config.grid.z_exp, 1)},
    };
}

std::vector<std::string> build_key_takeaways(const StudyResults& results) {
    const ScenarioResult& best = results.best();
    std::vector<std::string> takeaways;

    takeaways.push_back("Recommended option " + best.name + " at Ssc=" +
                        fmt(results.config.grid.sc_mva, 1, " MVA") + ".");

    if (best.voltage) {
        takeaways.push_back("Voltage distortion: THDv=" + fmt(best.voltage->thdv_percent, 2, "%") +
                            " (limit " + fmt(best.voltage->limit_percent, 1, "%") + ") -> " +
                            (best.voltage->pass_limit ? "PASS." : "FAIL."));
    }

    takeaways.push_back("Current distortion: TDD=" + fmt(best.current.tdd_percent, 2, "%") +
                        " (limit " + fmt(best.current.tdd_limit_percent, 1, "%") + ") -> " +
                        (best.practical_pass ? "PASS." : "FAIL (practical)."));

    takeaways.push_back("PCC category: Isc/IL=" + fmt(results.isc_over_il, 1) +
                        " -> table row " + best.current.category_label + ".");

    for (const auto& tip : results.tipping_points) {
        if (!tip.min_sc_mva_current && tip.option.find("no filter") != std::string::npos) {
            takeaways.push_back(
                "Several non-AFE options do not achieve practical current pass within the tested "
                "PCC range (often due to low-order harmonic limits), even if THDv can pass.");
            break;
        }
    }

    return takeaways;
}

} // namespace

WaveformCheckResult check_waveform(const std::string& scenario_name,
                                   const HarmonicSpectrum& spectrum,
                                   double frequency_hz,
                                   double i1_rms,
                                   const WaveformCheckConfig& options) {
    WaveformOptions wf;
    wf.frequency_hz = frequency_hz;
    wf.i1_rms = i1_rms;
    wf.cycles = options.cycles;
    wf.samples_per_cycle = options.samples_per_cycle;
    wf.phase_mode = options.phase_mode;
    wf.seed = options.seed;

    CurrentWaveform waveform = synthesize_current(spectrum, wf);

    constexpr int max_h = 50;
    HarmonicAnalysis analysis = extract_harmonics(waveform.current_a, waveform.sample_rate_hz,
                                                  frequency_hz, max_h, options.window);

    WaveformCheckResult result;
    result.scenario = scenario_name;
    result.sample_rate_hz = waveform.sample_rate_hz;
    result.n_samples = analysis.n_samples;
    result.window = options.window;
    result.thd_i_spectrum_percent = thd_from_spectrum(spectrum, max_h) * 100.0;
    result.thd_i_fft_percent = analysis.thd_i * 100.0;
    result.i1_rms_expected = i1_rms;
    result.i1_rms_measured = analysis.i1_rms;
    result.i_rms_total = analysis.i_rms_total;

    for (const auto& [h, pct] : spectrum) {
        if (h < 2 || h > max_h) {
            continue;
        }
        // bins[0] is h = 1
        result.harmonics.push_back({h, pct, analysis.bins[static_cast<size_t>(h - 1)].percent_of_fund});
    }

    return result;
}

StudyResults run_study(const AnalysisConfig& config, bool verbose) {
    StudyResults results;
    results.config = config;

    PCCInputs pcc;
    pcc.vll_v = config.site.vll_v;
    pcc.kw_demand = config.load.demand_kw;
    pcc.pf_disp = config.load.pf_displacement;
    pcc.efficiency = config.load.efficiency;
    pcc.kw_is_output = config.load.kw_is_output;

    results.il_a = compute_il(pcc);
    results.operating_i1_a = compute_operating_i1(pcc, config.load.load_pu);

    if (verbose) {
        std::cout << format_pcc_summary(pcc, config.load.load_pu);
    }

    ScenarioRequest request = request_from_config(config, results.il_a);
    ScenarioComparator comparator(request);
    results.isc_over_il = comparator.get_isc_over_il();

    if (verbose) {
        std::cout << "Comparing " << request.topologies.size() << " topologies at Ssc="
                  << config.grid.sc_mva << " MVA (Isc/IL=" << results.isc_over_il << ")\n";
    }
    results.scenarios = comparator.compare();
    if (results.scenarios.empty()) {
        throw PqError("Scenario comparison produced no results");
    }

    const ScenarioResult& best = results.best();

    if (config.thdv_sweep.enabled) {
        if (verbose) {
            std::cout << "Sweeping THDv vs Ssc for: " << best.name << "\n";
        }
        results.thdv_sweep = sweep_thdv_vs_sc_mva(request, best.name, config.thdv_sweep.sc_mva_points);
    }

    if (config.tipping_points.enabled) {
        if (verbose) {
            std::cout << "Finding tipping points for " << config.tipping_points.options.size()
                      << " options...\n";
        }
        results.tipping_points = find_tipping_points(request, config.tipping_points.options,
                                                     config.tipping_points.sc_mva_grid);
    }

    if (config.waveform_check.enabled) {
        if (verbose) {
            std::cout << "Synthesizing and extracting waveform for: " << best.name << "\n";
        }
        results.waveform_check = check_waveform(best.name, best.spectrum, config.site.frequency_hz,
                                                results.operating_i1_a, config.waveform_check);
    }

    results.inputs_block = build_inputs_block(config, results.il_a);
    results.key_takeaways = build_key_takeaways(results);

    return results;
}

} // namespace pq
