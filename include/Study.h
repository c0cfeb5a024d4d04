#ifndef STUDY_H
#define STUDY_H

#include "Types.h"
#include "HarmonicFFT.h"
#include "ScenarioCompare.h"
#include "Sweeps.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pq {

// Expected vs FFT-recovered magnitude for one order
struct HarmonicComparison {
    int h;
    double expected_percent;
    double measured_percent;
};

// Synthesize-then-extract cross-check of a spectrum
struct WaveformCheckResult {
    std::string scenario;
    double sample_rate_hz;
    size_t n_samples;
    WindowType window;
    double thd_i_spectrum_percent;
    double thd_i_fft_percent;
    double i1_rms_expected;
    double i1_rms_measured;
    double i_rms_total;
    std::vector<HarmonicComparison> harmonics;
};

// Everything a study run produces
struct StudyResults {
    AnalysisConfig config;
    double il_a;
    double operating_i1_a;
    double isc_over_il;
    std::vector<ScenarioResult> scenarios;                  // Ranked, [0] is the recommendation
    std::vector<ThdvSweepPoint> thdv_sweep;                 // For the recommended option
    std::vector<TippingPoint> tipping_points;
    std::optional<WaveformCheckResult> waveform_check;
    std::vector<std::pair<std::string, std::string>> inputs_block;
    std::vector<std::string> key_takeaways;

    const ScenarioResult& best() const { return scenarios.front(); }
};

// Run a full screening study from a validated configuration
StudyResults run_study(const AnalysisConfig& config, bool verbose = false);

// Synthesize a spectrum at i1_rms and extract it back
WaveformCheckResult check_waveform(const std::string& scenario_name,
                                   const HarmonicSpectrum& spectrum,
                                   double frequency_hz,
                                   double i1_rms,
                                   const WaveformCheckConfig& options);

} // namespace pq

#endif // STUDY_H
