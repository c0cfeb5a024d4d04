#include "ConfigLoader.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <stdexcept>

namespace pq {

namespace {

std::vector<Topology> parse_topologies(const YAML::Node& node) {
    std::vector<Topology> topologies;
    for (const auto& key : node.as<std::vector<std::string>>()) {
        topologies.push_back(parse_topology(key));
    }
    return topologies;
}

std::vector<Mitigation> parse_mitigations(const YAML::Node& node) {
    std::vector<Mitigation> mitigations;
    for (const auto& key : node.as<std::vector<std::string>>()) {
        mitigations.push_back(parse_mitigation(key));
    }
    return mitigations;
}

AnalysisConfig from_yaml(const YAML::Node& yaml) {
    AnalysisConfig config = ConfigLoader::defaults();

    if (yaml["name"]) {
        config.name = yaml["name"].as<std::string>();
    }

    // Site
    if (yaml["site"]) {
        auto site = yaml["site"];
        config.site.vll_v = site["vll_v"].as<double>(config.site.vll_v);
        config.site.frequency_hz = site["frequency_hz"].as<double>(config.site.frequency_hz);
    }

    // Load
    if (yaml["load"]) {
        auto load = yaml["load"];
        config.load.demand_kw = load["demand_kw"].as<double>(config.load.demand_kw);
        config.load.load_pu = load["load_pu"].as<double>(config.load.load_pu);
        config.load.pf_displacement = load["pf_displacement"].as<double>(config.load.pf_displacement);
        config.load.efficiency = load["efficiency"].as<double>(config.load.efficiency);
        config.load.kw_is_output = load["kw_is_output"].as<bool>(config.load.kw_is_output);
    }

    // Grid strength
    if (yaml["grid"]) {
        auto grid = yaml["grid"];
        config.grid.sc_mva = grid["sc_mva"].as<double>(config.grid.sc_mva);
        config.grid.z_exp = grid["z_exp"].as<double>(config.grid.z_exp);
        config.grid.xr = grid["xr"].as<double>(config.grid.xr);
    }

    // Limits
    if (yaml["limits"]) {
        auto limits = yaml["limits"];
        config.limits.thdv_limit_pct = limits["thdv_limit_pct"].as<double>(config.limits.thdv_limit_pct);
        config.limits.even_harmonic_factor =
            limits["even_harmonic_factor"].as<double>(config.limits.even_harmonic_factor);
    }

    // Scenario space
    if (yaml["scenario_space"]) {
        auto space = yaml["scenario_space"];
        if (space["topology_keys"]) {
            config.scenario_space.topologies = parse_topologies(space["topology_keys"]);
        }
        if (space["filters"]) {
            config.scenario_space.filters = parse_mitigations(space["filters"]);
        }
        if (space["per_topology_filter_map"]) {
            config.scenario_space.per_topology_filters.clear();
            for (const auto& entry : space["per_topology_filter_map"]) {
                Topology topology = parse_topology(entry.first.as<std::string>());
                config.scenario_space.per_topology_filters[topology] = parse_mitigations(entry.second);
            }
        }
    }

    // Sweeps
    if (yaml["sweeps"]) {
        auto sweeps = yaml["sweeps"];
        if (sweeps["thdv_vs_sc_mva"]) {
            auto sweep = sweeps["thdv_vs_sc_mva"];
            config.thdv_sweep.enabled = sweep["enabled"].as<bool>(config.thdv_sweep.enabled);
            if (sweep["points"]) {
                config.thdv_sweep.sc_mva_points = sweep["points"].as<std::vector<double>>();
            }
        }
        if (sweeps["tipping_points"]) {
            auto tip = sweeps["tipping_points"];
            config.tipping_points.enabled = tip["enabled"].as<bool>(config.tipping_points.enabled);
            if (tip["grid"]) {
                config.tipping_points.sc_mva_grid = tip["grid"].as<std::vector<double>>();
            }
            if (tip["options"]) {
                config.tipping_points.options = tip["options"].as<std::vector<std::string>>();
            }
        }
    }

    // Waveform synthesis / extraction cross-check
    if (yaml["waveform_check"]) {
        auto wf = yaml["waveform_check"];
        auto& check = config.waveform_check;
        check.enabled = wf["enabled"].as<bool>(check.enabled);
        check.cycles = wf["cycles"].as<int>(check.cycles);
        check.samples_per_cycle = wf["samples_per_cycle"].as<int>(check.samples_per_cycle);
        if (wf["window"]) {
            check.window = parse_window(wf["window"].as<std::string>());
        }
        if (wf["phase_mode"]) {
            check.phase_mode = parse_phase_mode(wf["phase_mode"].as<std::string>());
        }
        check.seed = wf["seed"].as<unsigned int>(check.seed);
    }

    return config;
}

} // namespace

AnalysisConfig ConfigLoader::defaults() {
    AnalysisConfig config;
    config.name = "UPS Harmonics & Power Quality Screening Report";

    config.site = {415.0, 60.0};
    config.load = {1000.0, 0.60, 0.99, 0.96, true};
    config.grid = {50.0, 1.0, 10.0};
    config.limits = {5.0, 0.25};

    config.scenario_space.topologies = all_topologies();
    config.scenario_space.filters = all_mitigations();
    config.scenario_space.per_topology_filters = {{Topology::AFE, {Mitigation::NONE}}};

    config.thdv_sweep.enabled = true;
    config.thdv_sweep.sc_mva_points = {20.0, 35.0, 50.0, 75.0, 100.0, 150.0, 250.0, 500.0};

    config.tipping_points.enabled = true;
    config.tipping_points.sc_mva_grid = {10, 15, 20, 25, 30, 35, 40, 50, 60, 75, 100, 150, 250, 500};
    config.tipping_points.options = {
        "AFE (low low-order harmonics) (no filter)",
        "18-pulse (typical) (no filter)",
        "12-pulse (typical) (no filter)",
        "6-pulse (typical) (no filter)",
        "18-pulse (typical) + active_filter_like",
        "12-pulse (typical) + active_filter_like",
        "6-pulse (typical) + active_filter_like",
    };

    config.waveform_check = {true, 10, 4096, WindowType::HANN, PhaseMode::RANDOM, 17};

    return config;
}

AnalysisConfig ConfigLoader::load(const std::string& filepath) {
    try {
        YAML::Node yaml = YAML::LoadFile(filepath);
        if (!yaml.IsNull() && !yaml.IsMap()) {
            throw PqError("Config YAML must be a mapping");
        }
        return from_yaml(yaml);
    } catch (const YAML::Exception& e) {
        throw PqError("Failed to parse config file " + filepath + ": " + std::string(e.what()));
    }
}

AnalysisConfig ConfigLoader::load_from_string(const std::string& yaml_text) {
    try {
        YAML::Node yaml = YAML::Load(yaml_text);
        if (!yaml.IsNull() && !yaml.IsMap()) {
            throw PqError("Config YAML must be a mapping");
        }
        return from_yaml(yaml);
    } catch (const YAML::Exception& e) {
        throw PqError("Failed to parse config: " + std::string(e.what()));
    }
}

bool ConfigLoader::validate(const AnalysisConfig& config, std::string& error_message) {
    // Site
    if (config.site.vll_v <= 0) {
        error_message = "site.vll_v must be > 0";
        return false;
    }
    if (config.site.frequency_hz <= 0) {
        error_message = "site.frequency_hz must be > 0";
        return false;
    }

    // Load
    if (config.load.demand_kw <= 0) {
        error_message = "load.demand_kw must be > 0";
        return false;
    }
    if (!(config.load.load_pu > 0.0 && config.load.load_pu <= 1.5)) {
        error_message = "load.load_pu must be in (0, 1.5]";
        return false;
    }
    if (!(config.load.pf_displacement > 0.0 && config.load.pf_displacement <= 1.0)) {
        error_message = "load.pf_displacement must be in (0, 1]";
        return false;
    }
    if (!(config.load.efficiency > 0.0 && config.load.efficiency <= 1.0)) {
        error_message = "load.efficiency must be in (0, 1]";
        return false;
    }

    // Grid and limits
    if (config.grid.sc_mva <= 0) {
        error_message = "grid.sc_mva must be > 0";
        return false;
    }
    if (config.grid.z_exp <= 0) {
        error_message = "grid.z_exp must be > 0";
        return false;
    }
    if (config.limits.thdv_limit_pct <= 0) {
        error_message = "limits.thdv_limit_pct must be > 0";
        return false;
    }
    if (!(config.limits.even_harmonic_factor > 0.0 && config.limits.even_harmonic_factor <= 1.0)) {
        error_message = "limits.even_harmonic_factor must be in (0, 1]";
        return false;
    }

    // Scenario space
    if (config.scenario_space.topologies.empty()) {
        error_message = "scenario_space.topology_keys must be a non-empty list";
        return false;
    }
    if (config.scenario_space.filters.empty()) {
        error_message = "scenario_space.filters must be a non-empty list";
        return false;
    }

    // Sweeps
    for (double sc_mva : config.thdv_sweep.sc_mva_points) {
        if (sc_mva <= 0) {
            error_message = "sweeps.thdv_vs_sc_mva.points must be > 0";
            return false;
        }
    }
    const auto& grid = config.tipping_points.sc_mva_grid;
    if (std::any_of(grid.begin(), grid.end(), [](double v) { return v <= 0; })) {
        error_message = "sweeps.tipping_points.grid must be > 0";
        return false;
    }
    if (!std::is_sorted(grid.begin(), grid.end())) {
        error_message = "sweeps.tipping_points.grid must be ascending";
        return false;
    }

    // Waveform check
    if (config.waveform_check.cycles <= 0 || config.waveform_check.samples_per_cycle < 8) {
        error_message = "waveform_check needs cycles > 0 and samples_per_cycle >= 8";
        return false;
    }

    return true;
}

} // namespace pq
