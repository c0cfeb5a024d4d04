#ifndef SCENARIO_COMPARE_H
#define SCENARIO_COMPARE_H

#include "Types.h"
#include "Ieee519.h"
#include "VoltageDistortion.h"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pq {

// One evaluated (topology, mitigation) combination
struct ScenarioResult {
    std::string name;
    std::optional<Topology> topology;     // Absent for mitigation-only baselines
    Mitigation mitigation;
    HarmonicSpectrum spectrum;            // % of fundamental after load and mitigation

    double thd_i_percent;
    double irms_over_i1;
    double heating_proxy;

    IEEE519CurrentReport current;
    std::optional<VoltageDistortionResult> voltage;

    std::vector<HarmonicLimitCheck> major_violations;
    std::vector<HarmonicLimitCheck> minor_violations;
    double severity_score;
    bool strict_pass;       // TDD pass and no individual violations
    bool practical_pass;    // TDD pass and no major violations
    std::optional<int> worst_harmonic;
};

// Inputs for a topology x mitigation comparison
struct ScenarioRequest {
    double load_pu = 0.6;
    double il_a = 0.0;             // Max-demand fundamental current at PCC
    double vll_v = 0.0;
    double sc_mva = 0.0;           // PCC short-circuit strength
    std::optional<double> isc_over_il;   // Overrides the ratio derived from sc_mva
    std::vector<Topology> topologies = all_topologies();
    std::vector<Mitigation> mitigations = all_mitigations();
    std::map<Topology, std::vector<Mitigation>> per_topology_filters;
    double thdv_limit_percent = 5.0;
    double z_freq_exp = 1.0;
    double xr = 10.0;
    double even_harmonic_factor = 0.25;
    LoadModel load_model = LoadModel::RECTIFIER_LIKE;
};

// Small high-order overages: h >= 23 with overage <= 1.0, or h >= 17 with overage <= 0.5
bool is_minor_violation(int h, double overage);

// Partition worst violations into (major, minor). Orders <= 13 are always major.
std::pair<std::vector<HarmonicLimitCheck>, std::vector<HarmonicLimitCheck>>
split_major_minor(const IEEE519CurrentReport& report);

// Weighted overage sum: 5.0 for h <= 13, 2.0 for h <= 23, 1.0 above,
// minor entries weighted x0.2
double severity_score(const IEEE519CurrentReport& report);

// Evaluate one spectrum through the limit table and derive ranking metrics
ScenarioResult run_scenario(const std::string& name,
                            std::optional<Topology> topology,
                            Mitigation mitigation,
                            const HarmonicSpectrum& spectrum,
                            double il_a,
                            double isc_a,
                            double even_harmonic_factor = 0.25);

// Compares UPS topologies and mitigation filters at one PCC strength.
// Ranking, most significant first: THDv pass, TDD pass, fewer major
// violations, lower severity, lower THDv, lower heating proxy.
class ScenarioComparator {
public:
    // Throws ValidationError for non-positive IL, voltage, strength or limit,
    // or load_pu outside (0, 1.5]
    explicit ScenarioComparator(const ScenarioRequest& request);

    const ScenarioRequest& get_request() const { return request_; }
    double get_isc_over_il() const { return isc_over_il_; }
    const SourceImpedanceModel& get_source() const { return source_; }

    // Evaluate every scenario and return them in rank order;
    // index 0 is the recommendation
    std::vector<ScenarioResult> compare() const;

    // Strict weak ordering used by compare()
    static bool ranks_before(const ScenarioResult& a, const ScenarioResult& b);

    // Stable sort into rank order
    static void rank(std::vector<ScenarioResult>& scenarios);

private:
    const std::vector<Mitigation>& mitigations_for(Topology topology) const;

    ScenarioRequest request_;
    double isc_over_il_;
    SourceImpedanceModel source_;
    double v1_v_;
};

// Key-based entry point; unknown topology or mitigation keys throw UnknownKeyError
std::vector<ScenarioResult> compare_scenarios(
    double load_pu,
    double il_a,
    double vll_v,
    double sc_mva,
    const std::vector<std::string>& topology_keys,
    const std::vector<std::string>& mitigation_keys,
    const std::map<std::string, std::vector<std::string>>& per_topology_override = {},
    double voltage_limit_percent = 5.0,
    double impedance_exponent = 1.0);

// Ordering for mitigation-only comparisons: TDD pass, major count,
// severity, TDD, heating proxy
bool mitigation_option_ranks_before(const ScenarioResult& a, const ScenarioResult& b);

// Baseline vs "baseline + <filter>" on a single spectrum, current limits only
std::vector<ScenarioResult> compare_mitigation_options(
    const HarmonicSpectrum& base_spectrum,
    double il_a,
    double isc_over_il,
    const std::vector<Mitigation>& filters = all_mitigations());

} // namespace pq

#endif // SCENARIO_COMPARE_H
