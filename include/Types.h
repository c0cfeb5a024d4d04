#ifndef TYPES_H
#define TYPES_H

#include "Errors.h"
#include <map>
#include <string>
#include <vector>

namespace pq {

// Harmonic order -> magnitude in percent of fundamental RMS current.
// std::map keeps orders sorted for presentation.
using HarmonicSpectrum = std::map<int, double>;

// UPS input topology presets
enum class Topology {
    SIX_PULSE,
    TWELVE_PULSE,
    EIGHTEEN_PULSE,
    AFE
};

// Mitigation attenuation curves
enum class Mitigation {
    NONE,
    TUNED_5_7,
    BROADBAND_PASSIVE,
    ACTIVE_FILTER_LIKE
};

// FFT window applied before harmonic extraction
enum class WindowType {
    RECTANGULAR,
    HANN,
    HAMMING
};

// Harmonic phase policy for waveform synthesis
enum class PhaseMode {
    ZERO,
    DETERMINISTIC,   // (h * 17 deg) mod 360
    RANDOM           // uniform [0, 2pi), seeded
};

// Load-dependence law for harmonic magnitudes
enum class LoadModel {
    RECTIFIER_LIKE,  // higher distortion at light load
    FLAT
};

// Coarse risk classification
enum class RiskLevel {
    LOW,
    MEDIUM,
    HIGH
};

// Configuration key for a topology preset
inline std::string to_key(Topology topology) {
    switch (topology) {
        case Topology::SIX_PULSE: return "6pulse_typical";
        case Topology::TWELVE_PULSE: return "12pulse_typical";
        case Topology::EIGHTEEN_PULSE: return "18pulse_typical";
        case Topology::AFE: return "afe_low_harm";
        default: return "unknown";
    }
}

// Configuration key for a mitigation curve
inline std::string to_key(Mitigation mitigation) {
    switch (mitigation) {
        case Mitigation::NONE: return "none";
        case Mitigation::TUNED_5_7: return "tuned_5_7";
        case Mitigation::BROADBAND_PASSIVE: return "broadband_passive";
        case Mitigation::ACTIVE_FILTER_LIKE: return "active_filter_like";
        default: return "unknown";
    }
}

inline std::string to_string(WindowType window) {
    switch (window) {
        case WindowType::RECTANGULAR: return "rectangular";
        case WindowType::HANN: return "hann";
        case WindowType::HAMMING: return "hamming";
        default: return "unknown";
    }
}

inline std::string to_string(PhaseMode mode) {
    switch (mode) {
        case PhaseMode::ZERO: return "zero";
        case PhaseMode::DETERMINISTIC: return "deterministic";
        case PhaseMode::RANDOM: return "random";
        default: return "unknown";
    }
}

inline std::string to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW: return "LOW";
        case RiskLevel::MEDIUM: return "MEDIUM";
        case RiskLevel::HIGH: return "HIGH";
        default: return "UNKNOWN";
    }
}

inline const std::vector<Topology>& all_topologies() {
    static const std::vector<Topology> values = {
        Topology::SIX_PULSE, Topology::TWELVE_PULSE, Topology::EIGHTEEN_PULSE, Topology::AFE
    };
    return values;
}

inline const std::vector<Mitigation>& all_mitigations() {
    static const std::vector<Mitigation> values = {
        Mitigation::NONE, Mitigation::TUNED_5_7,
        Mitigation::BROADBAND_PASSIVE, Mitigation::ACTIVE_FILTER_LIKE
    };
    return values;
}

// Parse a topology key, throws UnknownKeyError listing the valid keys
inline Topology parse_topology(const std::string& str) {
    std::vector<std::string> valid;
    for (Topology t : all_topologies()) {
        if (to_key(t) == str) {
            return t;
        }
        valid.push_back(to_key(t));
    }
    throw UnknownKeyError("topology", str, valid);
}

// Parse a mitigation key, throws UnknownKeyError listing the valid keys
inline Mitigation parse_mitigation(const std::string& str) {
    std::vector<std::string> valid;
    for (Mitigation m : all_mitigations()) {
        if (to_key(m) == str) {
            return m;
        }
        valid.push_back(to_key(m));
    }
    throw UnknownKeyError("mitigation", str, valid);
}

inline WindowType parse_window(const std::string& str) {
    if (str == "rect" || str == "rectangular" || str == "none") {
        return WindowType::RECTANGULAR;
    }
    if (str == "hann" || str == "hanning") {
        return WindowType::HANN;
    }
    if (str == "hamming") {
        return WindowType::HAMMING;
    }
    throw UnknownKeyError("window", str, {"rectangular", "hann", "hamming"});
}

inline PhaseMode parse_phase_mode(const std::string& str) {
    if (str == "zero") return PhaseMode::ZERO;
    if (str == "deterministic") return PhaseMode::DETERMINISTIC;
    if (str == "random") return PhaseMode::RANDOM;
    throw UnknownKeyError("phase mode", str, {"zero", "deterministic", "random"});
}

// Site (PCC) configuration
struct SiteConfig {
    double vll_v;          // Line-to-line RMS voltage
    double frequency_hz;   // Fundamental frequency
};

// Load demand configuration
struct LoadConfig {
    double demand_kw;      // Max-demand kW (see kw_is_output)
    double load_pu;        // Operating load fraction of demand
    double pf_displacement;
    double efficiency;
    bool kw_is_output;     // true: demand_kw is UPS output (IT) power
};

// Utility short-circuit strength at the PCC
struct GridStrengthConfig {
    double sc_mva;         // Short-circuit apparent power
    double z_exp;          // |Z(h)| = |Z1| * h^z_exp
    double xr;             // X/R placeholder, unused in magnitude-only mode
};

struct LimitsConfig {
    double thdv_limit_pct;
    double even_harmonic_factor;
};

// Topologies x mitigations to evaluate
struct ScenarioSpaceConfig {
    std::vector<Topology> topologies;
    std::vector<Mitigation> filters;
    std::map<Topology, std::vector<Mitigation>> per_topology_filters;
};

struct ThdvSweepConfig {
    bool enabled;
    std::vector<double> sc_mva_points;
};

struct TippingPointConfig {
    bool enabled;
    std::vector<double> sc_mva_grid;      // ascending
    std::vector<std::string> options;     // scenario names to track
};

// Synthesize-and-extract cross-check of the recommended spectrum
struct WaveformCheckConfig {
    bool enabled;
    int cycles;
    int samples_per_cycle;
    WindowType window;
    PhaseMode phase_mode;
    unsigned int seed;
};

// Full study configuration
struct AnalysisConfig {
    std::string name;
    SiteConfig site;
    LoadConfig load;
    GridStrengthConfig grid;
    LimitsConfig limits;
    ScenarioSpaceConfig scenario_space;
    ThdvSweepConfig thdv_sweep;
    TippingPointConfig tipping_points;
    WaveformCheckConfig waveform_check;
};

} // namespace pq

#endif // TYPES_H
