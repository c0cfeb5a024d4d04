#include "HarmonicFFT.h"
#include <unsupported/Eigen/FFT>
#include <algorithm>
#include <cmath>
#include <complex>
#include <numeric>

namespace pq {

namespace {
    constexpr double PI = 3.14159265358979323846;
    constexpr double RAD_TO_DEG = 180.0 / PI;
    constexpr double I1_FLOOR = 1e-12;

    // Nearest one-sided bin to freq; ties resolve to the lower bin
    size_t nearest_bin(double freq_hz, double fs_hz, size_t n) {
        size_t last = n / 2;
        double exact = freq_hz * static_cast<double>(n) / fs_hz;
        if (exact <= 0.0) {
            return 0;
        }
        double lower = std::floor(exact);
        size_t k = static_cast<size_t>(lower);
        if (exact - lower > 0.5) {
            ++k;
        }
        return std::min(k, last);
    }
}

std::vector<double> window_weights(size_t n, WindowType window) {
    std::vector<double> w(n, 1.0);
    if (window == WindowType::RECTANGULAR || n < 2) {
        return w;
    }

    double denom = static_cast<double>(n - 1);
    for (size_t k = 0; k < n; ++k) {
        double c = std::cos(2.0 * PI * static_cast<double>(k) / denom);
        w[k] = (window == WindowType::HANN) ? 0.5 - 0.5 * c : 0.54 - 0.46 * c;
    }
    return w;
}

HarmonicAnalysis extract_harmonics(const std::vector<double>& samples,
                                   double fs_hz,
                                   double f0_hz,
                                   int max_h,
                                   WindowType window) {
    size_t n = samples.size();
    if (n < 8) {
        throw SignalTooShortError("Signal too short: " + std::to_string(n) +
                                  " samples, need at least 8");
    }
    if (fs_hz <= 0.0 || f0_hz <= 0.0) {
        throw ValidationError("fs_hz and f0_hz must be > 0");
    }
    if (max_h < 1) {
        throw ValidationError("max_h must be >= 1");
    }

    std::vector<double> w = window_weights(n, window);
    double cg = std::accumulate(w.begin(), w.end(), 0.0) / static_cast<double>(n);

    std::vector<double> windowed(n);
    double sum_sq = 0.0;
    for (size_t k = 0; k < n; ++k) {
        windowed[k] = samples[k] * w[k];
        sum_sq += samples[k] * samples[k];
    }

    Eigen::FFT<double> fft;
    fft.SetFlag(Eigen::FFT<double>::HalfSpectrum);
    std::vector<std::complex<double>> spectrum;
    fft.fwd(spectrum, windowed);

    HarmonicAnalysis result;
    result.f0_hz = f0_hz;
    result.fs_hz = fs_hz;
    result.n_samples = n;
    result.window = window;
    result.i_rms_total = std::sqrt(sum_sq / static_cast<double>(n));

    // Single-sided peak amplitude: (2/N) * |X[k]| / CG, then RMS = peak / sqrt(2)
    auto rms_at = [&](size_t k) {
        double peak = (2.0 / static_cast<double>(n)) * std::abs(spectrum[k]) / cg;
        return peak / std::sqrt(2.0);
    };

    result.i1_rms = rms_at(nearest_bin(f0_hz, fs_hz, n));

    double harm_sq = 0.0;
    for (int h = 1; h <= max_h; ++h) {
        size_t k = nearest_bin(h * f0_hz, fs_hz, n);

        HarmonicBin bin;
        bin.h = h;
        bin.freq_hz = static_cast<double>(k) * fs_hz / static_cast<double>(n);
        bin.i_rms = rms_at(k);
        bin.percent_of_fund = (result.i1_rms > I1_FLOOR) ? bin.i_rms / result.i1_rms * 100.0 : 0.0;
        bin.phase_deg = std::arg(spectrum[k]) * RAD_TO_DEG;
        result.bins.push_back(bin);

        if (h >= 2) {
            harm_sq += bin.i_rms * bin.i_rms;
        }
    }

    result.thd_i = (result.i1_rms > I1_FLOOR) ? std::sqrt(harm_sq) / result.i1_rms : 0.0;

    return result;
}

HarmonicSpectrum spectrum_from_analysis(const HarmonicAnalysis& analysis, double min_percent) {
    HarmonicSpectrum spectrum;
    for (const auto& bin : analysis.bins) {
        if (bin.h >= 2 && bin.percent_of_fund > min_percent) {
            spectrum[bin.h] = bin.percent_of_fund;
        }
    }
    return spectrum;
}

} // namespace pq
