#include "Mitigation.h"
#include <cmath>
#include <map>

namespace pq {

namespace {
    [[noreturn]] void throw_unknown(Mitigation mitigation) {
        std::vector<std::string> valid;
        for (Mitigation m : all_mitigations()) {
            valid.push_back(to_key(m));
        }
        throw UnknownKeyError("mitigation", std::to_string(static_cast<int>(mitigation)), valid);
    }
}

HarmonicSpectrum IAttenuationCurve::apply(const HarmonicSpectrum& spectrum) const {
    HarmonicSpectrum result;
    for (const auto& [h, pct] : spectrum) {
        result[h] = pct * attenuation(h);
    }
    return result;
}

double NoAttenuation::attenuation(int /*h*/) const {
    return 1.0;
}

double TunedFilter57::attenuation(int h) const {
    if (h == 5) return 0.25;
    if (h == 7) return 0.30;
    if (h == 11 || h == 13) return 0.65;
    if (h >= 2 && h <= 25) return 0.85;
    return 0.95;
}

double BroadbandPassiveFilter::attenuation(int h) const {
    if (h >= 2 && h <= 11) return 0.55;
    if (h >= 12 && h <= 25) return 0.70;
    if (h >= 26 && h <= 50) return 0.85;
    return 1.0;
}

double ActiveFilterLike::attenuation(int h) const {
    if (h >= 2 && h <= 11) return 0.25;
    if (h >= 12 && h <= 25) return 0.40;
    if (h >= 26 && h <= 50) return 0.60;
    return 1.0;
}

std::unique_ptr<IAttenuationCurve> create_attenuation_curve(Mitigation mitigation) {
    switch (mitigation) {
        case Mitigation::NONE:
            return std::make_unique<NoAttenuation>();
        case Mitigation::TUNED_5_7:
            return std::make_unique<TunedFilter57>();
        case Mitigation::BROADBAND_PASSIVE:
            return std::make_unique<BroadbandPassiveFilter>();
        case Mitigation::ACTIVE_FILTER_LIKE:
            return std::make_unique<ActiveFilterLike>();
    }
    throw_unknown(mitigation);
}

const IAttenuationCurve& attenuation_curve(Mitigation mitigation) {
    // Immutable after construction, safe to share across threads
    static const std::map<Mitigation, std::unique_ptr<IAttenuationCurve>> library = [] {
        std::map<Mitigation, std::unique_ptr<IAttenuationCurve>> curves;
        for (Mitigation m : all_mitigations()) {
            curves[m] = create_attenuation_curve(m);
        }
        return curves;
    }();

    auto it = library.find(mitigation);
    if (it == library.end()) {
        throw_unknown(mitigation);
    }
    return *it->second;
}

HarmonicSpectrum apply_attenuation(const HarmonicSpectrum& spectrum, Mitigation mitigation) {
    return attenuation_curve(mitigation).apply(spectrum);
}

double irms_inflation_factor(double thd_pu) {
    return std::sqrt(1.0 + thd_pu * thd_pu);
}

double heating_proxy(const HarmonicSpectrum& spectrum, int max_h) {
    double sum = 0.0;
    for (const auto& [h, pct] : spectrum) {
        if (h >= 2 && h <= max_h) {
            double ih_pu = pct / 100.0;
            sum += static_cast<double>(h * h) * ih_pu * ih_pu;
        }
    }
    return sum;
}

} // namespace pq
