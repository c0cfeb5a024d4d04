#ifndef HARMONIC_FFT_H
#define HARMONIC_FFT_H

#include "Types.h"
#include <string>
#include <vector>

namespace pq {

// One extracted harmonic
struct HarmonicBin {
    int h;                     // Harmonic order (1 = fundamental)
    double freq_hz;            // Center frequency of the FFT bin used
    double i_rms;              // RMS magnitude (A)
    double percent_of_fund;    // i_rms / I1_rms * 100
    double phase_deg;
};

// Result of harmonic extraction from a sampled waveform
struct HarmonicAnalysis {
    double f0_hz;
    double fs_hz;
    size_t n_samples;
    WindowType window;
    double i_rms_total;        // True RMS of the record
    double i1_rms;             // Fundamental RMS
    double thd_i;              // Per-unit THD-I
    std::vector<HarmonicBin> bins;   // h = 1..max_h
};

// Window weights matching the symmetric numpy definitions
std::vector<double> window_weights(size_t n, WindowType window);

// Extract harmonic RMS magnitudes using a windowed one-sided FFT.
// Each order is mapped to the FFT bin nearest h*f0; amplitudes are corrected
// by the window's coherent gain. Accuracy is best when the record spans an
// integer number of fundamental cycles.
// Throws SignalTooShortError for fewer than 8 samples.
HarmonicAnalysis extract_harmonics(const std::vector<double>& samples,
                                   double fs_hz,
                                   double f0_hz,
                                   int max_h = 50,
                                   WindowType window = WindowType::HANN);

// Percent-of-fundamental table (h >= 2) from an analysis, for feeding
// measured waveforms into the limit evaluator
HarmonicSpectrum spectrum_from_analysis(const HarmonicAnalysis& analysis,
                                        double min_percent = 0.0);

} // namespace pq

#endif // HARMONIC_FFT_H
