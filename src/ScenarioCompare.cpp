#include "ScenarioCompare.h"
#include "HarmonicModel.h"
#include "Mitigation.h"
#include <algorithm>
#include <cmath>
#include <tuple>

namespace pq {

namespace {
    int fail_rank(bool pass) {
        return pass ? 0 : 1;
    }

    std::string scenario_name(const UPSHarmonicProfile& profile, Mitigation mitigation) {
        if (mitigation == Mitigation::NONE) {
            return profile.name + " (no filter)";
        }
        return profile.name + " + " + to_key(mitigation);
    }
}

bool is_minor_violation(int h, double overage) {
    return (h >= 23 && overage <= 1.0) || (h >= 17 && overage <= 0.5);
}

std::pair<std::vector<HarmonicLimitCheck>, std::vector<HarmonicLimitCheck>>
split_major_minor(const IEEE519CurrentReport& report) {
    std::vector<HarmonicLimitCheck> major;
    std::vector<HarmonicLimitCheck> minor;

    for (const auto& v : report.worst_violations) {
        if (is_minor_violation(v.h, v.overage())) {
            minor.push_back(v);
        } else {
            major.push_back(v);
        }
    }
    return {major, minor};
}

double severity_score(const IEEE519CurrentReport& report) {
    double severity = 0.0;

    for (const auto& v : report.worst_violations) {
        double over = std::max(0.0, v.overage());

        double weight = 1.0;
        if (v.h <= 13) {
            weight = 5.0;
        } else if (v.h <= 23) {
            weight = 2.0;
        }

        if (is_minor_violation(v.h, over)) {
            weight *= 0.2;
        }

        severity += weight * over;
    }
    return severity;
}

ScenarioResult run_scenario(const std::string& name,
                            std::optional<Topology> topology,
                            Mitigation mitigation,
                            const HarmonicSpectrum& spectrum,
                            double il_a,
                            double isc_a,
                            double even_harmonic_factor) {
    ScenarioResult result;
    result.name = name;
    result.topology = topology;
    result.mitigation = mitigation;
    result.spectrum = spectrum;

    double thd_pu = thd_from_spectrum(spectrum);
    result.thd_i_percent = thd_pu * 100.0;
    result.irms_over_i1 = irms_inflation_factor(thd_pu);
    result.heating_proxy = heating_proxy(spectrum);

    result.current = evaluate_limits(spectrum, il_a, isc_a, even_harmonic_factor);

    auto [major, minor] = split_major_minor(result.current);
    result.major_violations = major;
    result.minor_violations = minor;
    result.severity_score = severity_score(result.current);

    result.strict_pass = result.current.tdd_pass && result.current.worst_violations.empty();
    result.practical_pass = result.current.tdd_pass && result.major_violations.empty();

    if (!result.current.worst_violations.empty()) {
        result.worst_harmonic = result.current.worst_violations.front().h;
    }

    return result;
}

ScenarioComparator::ScenarioComparator(const ScenarioRequest& request)
    : request_(request) {
    if (!(request_.il_a > 0.0)) {
        throw ValidationError("IL must be > 0 A");
    }
    if (!(request_.vll_v > 0.0)) {
        throw ValidationError("vll_v must be > 0");
    }
    if (!(request_.sc_mva > 0.0)) {
        throw ValidationError("sc_mva must be > 0");
    }
    if (!(request_.load_pu > 0.0 && request_.load_pu <= 1.5)) {
        throw ValidationError("load_pu must be in (0, 1.5]");
    }
    if (!(request_.thdv_limit_percent > 0.0)) {
        throw ValidationError("THDv limit must be > 0");
    }
    if (!(request_.z_freq_exp >= 0.0)) {
        throw ValidationError("impedance frequency exponent must be >= 0");
    }
    if (request_.topologies.empty()) {
        throw ValidationError("at least one topology is required");
    }

    if (request_.isc_over_il) {
        if (!(*request_.isc_over_il > 0.0)) {
            throw ValidationError("Isc/IL must be > 0");
        }
        isc_over_il_ = *request_.isc_over_il;
    } else {
        // Same PCC strength drives both the current and voltage checks
        isc_over_il_ = isc_over_il_from_sc_mva(request_.vll_v, request_.sc_mva, request_.il_a);
    }

    source_ = source_from_sc_mva(request_.vll_v, request_.sc_mva, request_.xr, request_.z_freq_exp);
    v1_v_ = vln_from_vll(request_.vll_v);
}

const std::vector<Mitigation>& ScenarioComparator::mitigations_for(Topology topology) const {
    auto it = request_.per_topology_filters.find(topology);
    if (it != request_.per_topology_filters.end()) {
        return it->second;
    }
    return request_.mitigations;
}

std::vector<ScenarioResult> ScenarioComparator::compare() const {
    std::vector<ScenarioResult> scenarios;
    double isc_a = isc_over_il_ * request_.il_a;

    for (Topology topology : request_.topologies) {
        const UPSHarmonicProfile& profile = get_preset(topology);
        HarmonicSpectrum base = load_adjust_spectrum(profile.spectrum, request_.load_pu,
                                                     request_.load_model);

        scenarios.push_back(run_scenario(scenario_name(profile, Mitigation::NONE), topology,
                                         Mitigation::NONE, base, request_.il_a, isc_a,
                                         request_.even_harmonic_factor));

        for (Mitigation mitigation : mitigations_for(topology)) {
            if (mitigation == Mitigation::NONE) {
                continue;
            }
            HarmonicSpectrum filtered = apply_attenuation(base, mitigation);
            scenarios.push_back(run_scenario(scenario_name(profile, mitigation), topology,
                                             mitigation, filtered, request_.il_a, isc_a,
                                             request_.even_harmonic_factor));
        }
    }

    for (auto& scenario : scenarios) {
        scenario.voltage = estimate_voltage_distortion(scenario.spectrum, request_.il_a, v1_v_,
                                                       source_, request_.thdv_limit_percent);
    }

    rank(scenarios);
    return scenarios;
}

bool ScenarioComparator::ranks_before(const ScenarioResult& a, const ScenarioResult& b) {
    auto key = [](const ScenarioResult& s) {
        bool v_pass = s.voltage ? s.voltage->pass_limit : false;
        double thdv = s.voltage ? s.voltage->thdv_percent : 0.0;
        return std::make_tuple(fail_rank(v_pass),
                               fail_rank(s.current.tdd_pass),
                               s.major_violations.size(),
                               s.severity_score,
                               thdv,
                               s.heating_proxy);
    };
    return key(a) < key(b);
}

void ScenarioComparator::rank(std::vector<ScenarioResult>& scenarios) {
    std::stable_sort(scenarios.begin(), scenarios.end(), ranks_before);
}

std::vector<ScenarioResult> compare_scenarios(
    double load_pu,
    double il_a,
    double vll_v,
    double sc_mva,
    const std::vector<std::string>& topology_keys,
    const std::vector<std::string>& mitigation_keys,
    const std::map<std::string, std::vector<std::string>>& per_topology_override,
    double voltage_limit_percent,
    double impedance_exponent) {

    ScenarioRequest request;
    request.load_pu = load_pu;
    request.il_a = il_a;
    request.vll_v = vll_v;
    request.sc_mva = sc_mva;
    request.thdv_limit_percent = voltage_limit_percent;
    request.z_freq_exp = impedance_exponent;

    request.topologies.clear();
    for (const auto& key : topology_keys) {
        request.topologies.push_back(parse_topology(key));
    }

    request.mitigations.clear();
    for (const auto& key : mitigation_keys) {
        request.mitigations.push_back(parse_mitigation(key));
    }

    for (const auto& [topology_key, keys] : per_topology_override) {
        std::vector<Mitigation> filters;
        for (const auto& key : keys) {
            filters.push_back(parse_mitigation(key));
        }
        request.per_topology_filters[parse_topology(topology_key)] = filters;
    }

    ScenarioComparator comparator(request);
    return comparator.compare();
}

bool mitigation_option_ranks_before(const ScenarioResult& a, const ScenarioResult& b) {
    auto key = [](const ScenarioResult& s) {
        return std::make_tuple(fail_rank(s.current.tdd_pass),
                               s.major_violations.size(),
                               s.severity_score,
                               s.current.tdd_percent,
                               s.heating_proxy);
    };
    return key(a) < key(b);
}

std::vector<ScenarioResult> compare_mitigation_options(
    const HarmonicSpectrum& base_spectrum,
    double il_a,
    double isc_over_il,
    const std::vector<Mitigation>& filters) {

    if (!(isc_over_il > 0.0)) {
        throw ValidationError("Isc/IL must be > 0");
    }
    double isc_a = isc_over_il * il_a;

    std::vector<ScenarioResult> scenarios;
    scenarios.push_back(run_scenario("baseline", std::nullopt, Mitigation::NONE,
                                     base_spectrum, il_a, isc_a));

    for (Mitigation mitigation : filters) {
        if (mitigation == Mitigation::NONE) {
            continue;
        }
        scenarios.push_back(run_scenario("baseline + " + to_key(mitigation), std::nullopt,
                                         mitigation, apply_attenuation(base_spectrum, mitigation),
                                         il_a, isc_a));
    }

    std::stable_sort(scenarios.begin(), scenarios.end(), mitigation_option_ranks_before);

    return scenarios;
}

} // namespace pq
