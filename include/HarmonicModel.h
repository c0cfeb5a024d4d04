#ifndef HARMONIC_MODEL_H
#define HARMONIC_MODEL_H

#include "Types.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pq {

// Immutable harmonic preset for a UPS rectifier front end
struct UPSHarmonicProfile {
    std::string name;
    std::optional<int> pulse;      // Nominal pulse number (none for AFE)
    HarmonicSpectrum spectrum;     // Ih_rms / I1_rms * 100
    std::string notes;
};

// Load-dependence curve: scale = a + b / load_pu^c
struct LoadScalingCurve {
    double a = 0.85;
    double b = 0.15;
    double c = 0.8;
};

// Time-domain synthesis settings
struct WaveformOptions {
    double frequency_hz = 60.0;
    double i1_rms = 100.0;               // Fundamental RMS current (A)
    int cycles = 10;
    int samples_per_cycle = 4096;
    double fundamental_phase_deg = 0.0;
    PhaseMode phase_mode = PhaseMode::RANDOM;
    unsigned int seed = 17;
};

// Sampled current record
struct CurrentWaveform {
    std::vector<double> time_s;
    std::vector<double> current_a;
    double sample_rate_hz;
};

// Process-wide preset catalog, built once on first use
const std::map<Topology, UPSHarmonicProfile>& harmonic_presets();

// Preset for one topology
const UPSHarmonicProfile& get_preset(Topology topology);

// Harmonic magnitude multiplier at a load fraction.
// load_pu is clamped to [0.05, 1.00], the result to [0.95, 1.45].
double load_scale_factor(double load_pu,
                         LoadModel model = LoadModel::RECTIFIER_LIKE,
                         const LoadScalingCurve& curve = LoadScalingCurve());

// Scale every harmonic of a base spectrum for operating load
HarmonicSpectrum load_adjust_spectrum(const HarmonicSpectrum& base,
                                      double load_pu,
                                      LoadModel model = LoadModel::RECTIFIER_LIKE,
                                      const LoadScalingCurve& curve = LoadScalingCurve());

// Build i(t) = sqrt(2)*I1*sin(wt + phi1) + sum_h sqrt(2)*Ih*sin(h*wt + phi_h)
CurrentWaveform synthesize_current(const HarmonicSpectrum& spectrum,
                                   const WaveformOptions& options);

// THD-I (per-unit) over orders 2..max_h: sqrt(sum (pct/100)^2)
double thd_from_spectrum(const HarmonicSpectrum& spectrum, int max_h = 50);

// Human-readable preset summary at a load fraction
std::string describe_profile(const UPSHarmonicProfile& profile, double load_pu = 1.0);

} // namespace pq

#endif // HARMONIC_MODEL_H
