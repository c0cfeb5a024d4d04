#include "HarmonicModel.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

namespace pq {

namespace {
    constexpr double PI = 3.14159265358979323846;
    constexpr double DEG_TO_RAD = PI / 180.0;
    const double SQRT2 = std::sqrt(2.0);

    std::map<Topology, UPSHarmonicProfile> build_presets() {
        std::map<Topology, UPSHarmonicProfile> presets;

        // Legacy diode-bridge rectifier
        presets[Topology::SIX_PULSE] = {
            "6-pulse (typical)",
            6,
            {{5, 20.0}, {7, 14.0}, {11, 9.0}, {13, 7.0}, {17, 5.0},
             {19, 4.0}, {23, 3.0}, {25, 2.0}, {29, 1.5}, {31, 1.2}},
            "Typical for older 6-pulse UPS/rectifiers at moderate-high load. Strong 5th/7th."
        };

        // Phase-shift transformer cancels 5th/7th
        presets[Topology::TWELVE_PULSE] = {
            "12-pulse (typical)",
            12,
            {{11, 10.0}, {13, 8.0}, {23, 4.0}, {25, 3.0}, {35, 2.0}, {37, 1.5}},
            "5th/7th mostly canceled. Dominant 11th/13th."
        };

        presets[Topology::EIGHTEEN_PULSE] = {
            "18-pulse (typical)",
            18,
            {{17, 5.0}, {19, 4.0}, {35, 2.0}, {37, 1.5}, {53, 1.0}},
            "Lower THD-I, dominant 17th/19th."
        };

        // PWM rectifier, HF switching ripple not modeled
        presets[Topology::AFE] = {
            "AFE (low low-order harmonics)",
            std::nullopt,
            {{5, 2.0}, {7, 1.5}, {11, 1.0}, {13, 0.8}, {17, 0.6}, {19, 0.5}},
            "Represents modern AFE/PFC behavior for low-order harmonics; ignores HF switching ripple."
        };

        return presets;
    }
}

const std::map<Topology, UPSHarmonicProfile>& harmonic_presets() {
    static const std::map<Topology, UPSHarmonicProfile> presets = build_presets();
    return presets;
}

const UPSHarmonicProfile& get_preset(Topology topology) {
    const auto& presets = harmonic_presets();
    auto it = presets.find(topology);
    if (it == presets.end()) {
        std::vector<std::string> valid;
        for (const auto& entry : presets) {
            valid.push_back(to_key(entry.first));
        }
        throw UnknownKeyError("topology", to_key(topology), valid);
    }
    return it->second;
}

double load_scale_factor(double load_pu, LoadModel model, const LoadScalingCurve& curve) {
    if (model == LoadModel::FLAT) {
        return 1.0;
    }

    // ~1.35x at 20% load, ~1.0x at full load
    double load = std::clamp(load_pu, 0.05, 1.00);
    double scale = curve.a + curve.b / std::pow(load, curve.c);
    return std::clamp(scale, 0.95, 1.45);
}

HarmonicSpectrum load_adjust_spectrum(const HarmonicSpectrum& base,
                                      double load_pu,
                                      LoadModel model,
                                      const LoadScalingCurve& curve) {
    double scale = load_scale_factor(load_pu, model, curve);

    HarmonicSpectrum adjusted;
    for (const auto& [h, pct] : base) {
        adjusted[h] = pct * scale;
    }
    return adjusted;
}

CurrentWaveform synthesize_current(const HarmonicSpectrum& spectrum,
                                   const WaveformOptions& options) {
    if (options.frequency_hz <= 0.0) {
        throw ValidationError("frequency_hz must be > 0");
    }
    if (options.i1_rms < 0.0) {
        throw ValidationError("i1_rms must be >= 0");
    }
    if (options.cycles <= 0 || options.samples_per_cycle <= 0) {
        throw ValidationError("cycles and samples_per_cycle must be > 0");
    }

    CurrentWaveform waveform;
    waveform.sample_rate_hz = options.frequency_hz * options.samples_per_cycle;

    size_t n = static_cast<size_t>(options.cycles) * static_cast<size_t>(options.samples_per_cycle);
    waveform.time_s.resize(n);
    waveform.current_a.resize(n);

    double w = 2.0 * PI * options.frequency_hz;
    double phi1 = options.fundamental_phase_deg * DEG_TO_RAD;
    double i1_peak = SQRT2 * options.i1_rms;

    for (size_t k = 0; k < n; ++k) {
        double t = static_cast<double>(k) / waveform.sample_rate_hz;
        waveform.time_s[k] = t;
        waveform.current_a[k] = i1_peak * std::sin(w * t + phi1);
    }

    // Phases are drawn in ascending harmonic order so a seed fixes the record
    std::mt19937_64 rng(options.seed);
    std::uniform_real_distribution<double> phase_dist(0.0, 2.0 * PI);

    for (const auto& [h, pct] : spectrum) {
        double ih_peak = SQRT2 * (pct / 100.0) * options.i1_rms;

        double phase = 0.0;
        switch (options.phase_mode) {
            case PhaseMode::ZERO:
                phase = 0.0;
                break;
            case PhaseMode::DETERMINISTIC:
                phase = std::fmod(h * 17.0, 360.0) * DEG_TO_RAD;
                break;
            case PhaseMode::RANDOM:
                phase = phase_dist(rng);
                break;
        }

        for (size_t k = 0; k < n; ++k) {
            waveform.current_a[k] += ih_peak * std::sin(h * w * waveform.time_s[k] + phase);
        }
    }

    return waveform;
}

double thd_from_spectrum(const HarmonicSpectrum& spectrum, int max_h) {
    double sum_sq = 0.0;
    for (const auto& [h, pct] : spectrum) {
        if (h >= 2 && h <= max_h) {
            double pu = pct / 100.0;
            sum_sq += pu * pu;
        }
    }
    return std::sqrt(sum_sq);
}

std::string describe_profile(const UPSHarmonicProfile& profile, double load_pu) {
    HarmonicSpectrum adjusted = load_adjust_spectrum(profile.spectrum, load_pu);
    double thd_pct = thd_from_spectrum(adjusted) * 100.0;

    std::ostringstream out;
    out << std::fixed;
    out << profile.name << "\n"
        << "- load: " << std::setprecision(2) << load_pu << " pu\n"
        << "- approx THD-I (from spectrum): " << std::setprecision(1) << thd_pct << "%\n"
        << "- notes: " << profile.notes << "\n";
    return out.str();
}

} // namespace pq
