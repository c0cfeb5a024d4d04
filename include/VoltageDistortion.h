#ifndef VOLTAGE_DISTORTION_H
#define VOLTAGE_DISTORTION_H

#include "Types.h"
#include <map>
#include <string>

namespace pq {

// Balanced 3-phase short-circuit relationships:
//   Ssc = sqrt(3) * VLL * Isc
//   Zth (per phase) = (VLL / sqrt(3)) / Isc = VLL^2 / Ssc

// Short-circuit current (A RMS line) from SC MVA
double isc_from_sc_mva(double vll_v, double sc_mva);

// Per-phase Thevenin impedance magnitude (ohm) at fundamental
double zth_from_sc_mva(double vll_v, double sc_mva);

double isc_over_il_from_sc_mva(double vll_v, double sc_mva, double il_a);

// Line-to-line -> line-to-neutral RMS voltage
double vln_from_vll(double vll_v);

// Magnitude-only PCC source impedance
struct SourceImpedanceModel {
    double z1_ohm;            // Per-phase |Z| at fundamental
    double xr = 10.0;         // Reserved for R/X separation
    double freq_exp = 1.0;    // |Z(h)| = |Z1| * h^freq_exp (1.0 ~ inductive)
};

// |Z(h)|, throws ValidationError for h < 1 or z1 <= 0
double z_at_harmonic(double z1_ohm, int h, double freq_exp);

SourceImpedanceModel source_from_sc_mva(double vll_v, double sc_mva,
                                        double xr = 10.0, double freq_exp = 1.0);

struct VoltageDistortionResult {
    double thdv_percent;
    std::map<int, double> vh_by_harmonic_v;
    double v1_v;
    double limit_percent;
    bool pass_limit;
    RiskLevel risk_level;
    std::string interpretation;
};

// Screening estimate Vh = Ih * |Z(h)| over orders 2..max_h,
// THDv = sqrt(sum Vh^2) / V1. V1 must be line-to-neutral when Z1 is per phase.
VoltageDistortionResult estimate_voltage_distortion(const HarmonicSpectrum& spectrum,
                                                    double i1_a,
                                                    double v1_v,
                                                    const SourceImpedanceModel& source,
                                                    double voltage_limit_percent = 5.0,
                                                    int max_h = 50);

} // namespace pq

#endif // VOLTAGE_DISTORTION_H
