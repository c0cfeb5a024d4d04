#include "VoltageDistortion.h"
#include <cmath>

namespace pq {

namespace {
    constexpr double SQRT3 = 1.7320508075688772;

    void require_positive(double value, const char* name) {
        if (!(value > 0.0)) {
            throw ValidationError(std::string(name) + " must be > 0");
        }
    }
}

double isc_from_sc_mva(double vll_v, double sc_mva) {
    require_positive(vll_v, "vll_v");
    require_positive(sc_mva, "sc_mva");
    return sc_mva * 1e6 / (SQRT3 * vll_v);
}

double zth_from_sc_mva(double vll_v, double sc_mva) {
    require_positive(vll_v, "vll_v");
    require_positive(sc_mva, "sc_mva");
    return (vll_v * vll_v) / (sc_mva * 1e6);
}

double isc_over_il_from_sc_mva(double vll_v, double sc_mva, double il_a) {
    require_positive(il_a, "il_a");
    return isc_from_sc_mva(vll_v, sc_mva) / il_a;
}

double vln_from_vll(double vll_v) {
    return vll_v / SQRT3;
}

double z_at_harmonic(double z1_ohm, int h, double freq_exp) {
    if (h < 1) {
        throw ValidationError("harmonic order must be >= 1");
    }
    require_positive(z1_ohm, "z1_ohm");
    return z1_ohm * std::pow(static_cast<double>(h), freq_exp);
}

SourceImpedanceModel source_from_sc_mva(double vll_v, double sc_mva, double xr, double freq_exp) {
    SourceImpedanceModel source;
    source.z1_ohm = zth_from_sc_mva(vll_v, sc_mva);
    source.xr = xr;
    source.freq_exp = freq_exp;
    return source;
}

VoltageDistortionResult estimate_voltage_distortion(const HarmonicSpectrum& spectrum,
                                                    double i1_a,
                                                    double v1_v,
                                                    const SourceImpedanceModel& source,
                                                    double voltage_limit_percent,
                                                    int max_h) {
    require_positive(i1_a, "i1_a");
    require_positive(v1_v, "v1_v");
    require_positive(voltage_limit_percent, "voltage_limit_percent");

    VoltageDistortionResult result;
    result.v1_v = v1_v;
    result.limit_percent = voltage_limit_percent;

    double sum_sq = 0.0;
    for (const auto& [h, pct] : spectrum) {
        if (h < 2 || h > max_h) {
            continue;
        }
        double ih_a = (pct / 100.0) * i1_a;
        double vh_v = std::abs(ih_a) * z_at_harmonic(source.z1_ohm, h, source.freq_exp);
        result.vh_by_harmonic_v[h] = vh_v;
        sum_sq += vh_v * vh_v;
    }

    result.thdv_percent = 100.0 * std::sqrt(sum_sq) / v1_v;
    result.pass_limit = result.thdv_percent <= voltage_limit_percent;

    if (result.thdv_percent <= 0.6 * voltage_limit_percent) {
        result.risk_level = RiskLevel::LOW;
    } else if (result.thdv_percent <= voltage_limit_percent) {
        result.risk_level = RiskLevel::MEDIUM;
    } else {
        result.risk_level = RiskLevel::HIGH;
    }

    result.interpretation =
        "THDv is produced when harmonic currents flow through PCC source impedance. "
        "Weak PCC (low short-circuit MVA / high impedance) amplifies THDv. "
        "Confirm Zth using short-circuit data and verify with field measurements.";

    return result;
}

} // namespace pq
