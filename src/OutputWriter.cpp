#include "OutputWriter.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace pq {

using json = nlohmann::json;

namespace {

constexpr size_t TOP_SCENARIO_ROWS = 12;

double round_to(double value, int digits) {
    double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

std::string utc_now_iso() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    std::ostringstream out;
    out << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

json optional_int(const std::optional<int>& value) {
    return value ? json(*value) : json(nullptr);
}

json spectrum_json(const HarmonicSpectrum& spectrum) {
    json out = json::object();
    for (const auto& [h, pct] : spectrum) {
        out[std::to_string(h)] = round_to(pct, 4);
    }
    return out;
}

json overage_list(const std::vector<HarmonicLimitCheck>& checks) {
    json out = json::array();
    for (const auto& c : checks) {
        out.push_back({{"h", c.h}, {"over_pct", round_to(c.overage(), 2)}});
    }
    return out;
}

json scenario_json(const ScenarioResult& s) {
    json top = json::array();
    for (const auto& v : s.current.worst_violations) {
        top.push_back({
            {"h", v.h},
            {"ih_pct", round_to(v.ih_percent_of_il, 2)},
            {"limit_pct", round_to(v.limit_percent_of_il, 2)}
        });
    }

    json row = {
        {"name", s.name},
        {"topology", s.topology ? json(to_key(*s.topology)) : json(nullptr)},
        {"mitigation", to_key(s.mitigation)},

        // Current distortion
        {"thd_i_percent", round_to(s.thd_i_percent, 2)},
        {"tdd_percent", round_to(s.current.tdd_percent, 2)},
        {"tdd_limit_percent", round_to(s.current.tdd_limit_percent, 2)},
        {"strict_pass", s.strict_pass},
        {"practical_pass", s.practical_pass},
        {"severity_score", round_to(s.severity_score, 3)},
        {"risk_level_current", to_string(s.current.risk_level)},
        {"isc_over_il", round_to(s.current.isc_over_il, 1)},
        {"category_label", s.current.category_label},
        {"worst_harmonic", optional_int(s.worst_harmonic)},
        {"irms_over_i1", round_to(s.irms_over_i1, 4)},
        {"heating_proxy", round_to(s.heating_proxy, 4)},

        {"top_violations", top},
        {"major_violations", overage_list(s.major_violations)},
        {"minor_violations", overage_list(s.minor_violations)},
        {"interpretation_current", s.current.interpretation},
        {"spectrum_pct_of_fund", spectrum_json(s.spectrum)}
    };

    // Voltage distortion
    if (s.voltage) {
        row["thdv_percent"] = round_to(s.voltage->thdv_percent, 2);
        row["thdv_limit_percent"] = round_to(s.voltage->limit_percent, 2);
        row["thdv_pass"] = s.voltage->pass_limit;
        row["risk_level_voltage"] = to_string(s.voltage->risk_level);
        row["interpretation_voltage"] = s.voltage->interpretation;
    }

    return row;
}

json top_scenarios_table(const std::vector<ScenarioResult>& scenarios) {
    json rows = json::array();
    for (size_t i = 0; i < scenarios.size() && i < TOP_SCENARIO_ROWS; ++i) {
        const auto& s = scenarios[i];
        rows.push_back({
            s.name,
            s.voltage ? json(round_to(s.voltage->thdv_percent, 2)) : json(nullptr),
            s.voltage ? s.voltage->pass_limit : false,
            round_to(s.current.tdd_percent, 2),
            round_to(s.current.tdd_limit_percent, 1),
            s.practical_pass,
            s.voltage ? to_string(s.voltage->risk_level) : std::string(),
            to_string(s.current.risk_level),
            optional_int(s.worst_harmonic)
        });
    }
    return {
        {"columns", {"Scenario", "THDv (%)", "V pass", "TDD (%)", "TDD limit",
                     "I practical pass", "Risk V", "Risk I", "Worst h"}},
        {"rows", rows}
    };
}

json tipping_points_table(const StudyResults& results) {
    const auto& grid = results.config.tipping_points.sc_mva_grid;
    json rows = json::array();
    for (const auto& tip : results.tipping_points) {
        rows.push_back({tip.option,
                        format_bound(tip.min_sc_mva_voltage, grid),
                        format_bound(tip.min_sc_mva_current, grid)});
    }
    return {
        {"columns", {"Option", "Min Ssc for THDv", "Min Ssc for Current (practical)"}},
        {"rows", rows}
    };
}

json waveform_json(const WaveformCheckResult& check) {
    json harmonics = json::array();
    for (const auto& h : check.harmonics) {
        harmonics.push_back({
            {"h", h.h},
            {"expected_pct", round_to(h.expected_percent, 3)},
            {"measured_pct", round_to(h.measured_percent, 3)}
        });
    }
    return {
        {"scenario", check.scenario},
        {"sample_rate_hz", check.sample_rate_hz},
        {"n_samples", check.n_samples},
        {"window", to_string(check.window)},
        {"thd_i_spectrum_percent", round_to(check.thd_i_spectrum_percent, 3)},
        {"thd_i_fft_percent", round_to(check.thd_i_fft_percent, 3)},
        {"i1_rms_expected_a", round_to(check.i1_rms_expected, 3)},
        {"i1_rms_measured_a", round_to(check.i1_rms_measured, 3)},
        {"i_rms_total_a", round_to(check.i_rms_total, 3)},
        {"harmonics", harmonics}
    };
}

json build_packet(const StudyResults& results) {
    const ScenarioResult& best = results.best();
    json report;

    report["schema_version"] = SCHEMA_VERSION;
    report["generated_utc"] = utc_now_iso();
    report["tool"] = {{"name", "ups-pq-analyzer"}, {"version", "0.1.0"}};
    report["report"] = {{"title", results.config.name}};

    json summary = {
        {"intro",
         "Screening report estimating UPS-driven harmonic current distortion at the PCC "
         "and estimating PCC voltage distortion (THDv) from short-circuit strength (Ssc)."},
        {"key_takeaways", results.key_takeaways},
        {"recommended_option", best.name},
        {"current_tdd_percent", round_to(best.current.tdd_percent, 2)},
        {"current_tdd_limit_percent", round_to(best.current.tdd_limit_percent, 1)},
        {"current_practical_pass", best.practical_pass},
        {"current_strict_pass", best.strict_pass},
        {"risk_current", to_string(best.current.risk_level)},
        {"isc_over_il", round_to(results.isc_over_il, 2)},
        {"worst_harmonic", optional_int(best.worst_harmonic)}
    };
    if (best.voltage) {
        summary["voltage_thdv_percent"] = round_to(best.voltage->thdv_percent, 2);
        summary["voltage_thdv_limit_percent"] = round_to(best.voltage->limit_percent, 1);
        summary["voltage_pass"] = best.voltage->pass_limit;
        summary["risk_voltage"] = to_string(best.voltage->risk_level);
    }
    report["executive_summary"] = summary;

    // Ordered key/value block
    json inputs = json::array();
    for (const auto& [key, value] : results.inputs_block) {
        inputs.push_back({{"name", key}, {"value", value}});
    }
    report["inputs_assumptions"] = inputs;

    json scenarios = json::array();
    for (const auto& s : results.scenarios) {
        scenarios.push_back(scenario_json(s));
    }
    report["scenarios"] = scenarios;

    report["tables"] = {
        {"top_scenarios_ranked", top_scenarios_table(results.scenarios)},
        {"tipping_points_min_ssc_required", tipping_points_table(results)}
    };

    json series = json::object();
    if (results.config.thdv_sweep.enabled) {
        json points = json::array();
        for (const auto& p : results.thdv_sweep) {
            points.push_back({p.sc_mva, round_to(p.thdv_percent, 3)});
        }
        series["thdv_vs_sc_mva"] = {
            {"option", best.name},
            {"x_name", "PCC short-circuit strength Ssc (MVA)"},
            {"y_name", "THDv (%)"},
            {"points", points}
        };
    }
    report["series"] = series;

    report["waveform_check"] = results.waveform_check ? waveform_json(*results.waveform_check)
                                                      : json(nullptr);

    report["disclaimer"] =
        "This report is a screening analysis using representative harmonic presets and simplified "
        "impedance scaling. It does not replace detailed harmonic studies when required by the "
        "utility or for final design signoff.";

    return report;
}

} // namespace

void OutputWriter::write_csv(const std::string& filepath, const std::vector<ScenarioResult>& scenarios) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw IOError("Cannot open output file: " + filepath);
    }

    // Write header
    file << "rank,name,thdv_percent,thdv_pass,tdd_percent,tdd_limit_percent,practical_pass,"
            "strict_pass,major_violations,severity_score,heating_proxy,risk_current,risk_voltage\n";

    // Write data
    file << std::fixed << std::setprecision(4);
    size_t rank = 1;
    for (const auto& s : scenarios) {
        file << rank++ << ","
             << "\"" << s.name << "\","
             << (s.voltage ? s.voltage->thdv_percent : 0.0) << ","
             << (s.voltage && s.voltage->pass_limit ? "true" : "false") << ","
             << s.current.tdd_percent << ","
             << s.current.tdd_limit_percent << ","
             << (s.practical_pass ? "true" : "false") << ","
             << (s.strict_pass ? "true" : "false") << ","
             << s.major_violations.size() << ","
             << s.severity_score << ","
             << s.heating_proxy << ","
             << to_string(s.current.risk_level) << ","
             << (s.voltage ? to_string(s.voltage->risk_level) : "") << "\n";
    }

    file.close();
}

std::string OutputWriter::render_report(const StudyResults& results) {
    return build_packet(results).dump(2);
}

void OutputWriter::write_report(const std::string& filepath, const StudyResults& results) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw IOError("Cannot open report file: " + filepath);
    }

    file << render_report(results) << std::endl;
    file.close();
}

} // namespace pq
