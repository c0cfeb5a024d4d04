#ifndef MITIGATION_H
#define MITIGATION_H

#include "Types.h"
#include <memory>
#include <string>

namespace pq {

// Abstract interface for empirical mitigation attenuation curves
class IAttenuationCurve {
public:
    virtual ~IAttenuationCurve() = default;

    // Multiplicative factor in (0, 1] at harmonic order h
    virtual double attenuation(int h) const = 0;

    virtual Mitigation kind() const = 0;

    // New spectrum with every order scaled by attenuation(h); input untouched
    HarmonicSpectrum apply(const HarmonicSpectrum& spectrum) const;
};

// No mitigation (factor 1 everywhere)
class NoAttenuation : public IAttenuationCurve {
public:
    double attenuation(int h) const override;
    Mitigation kind() const override { return Mitigation::NONE; }
};

// Passive filter tuned near the 5th/7th
class TunedFilter57 : public IAttenuationCurve {
public:
    double attenuation(int h) const override;
    Mitigation kind() const override { return Mitigation::TUNED_5_7; }
};

// Reactor + filter bank style broadband reduction
class BroadbandPassiveFilter : public IAttenuationCurve {
public:
    double attenuation(int h) const override;
    Mitigation kind() const override { return Mitigation::BROADBAND_PASSIVE; }
};

// Active harmonic filter: strong low-order cleanup, diminishing with order
class ActiveFilterLike : public IAttenuationCurve {
public:
    double attenuation(int h) const override;
    Mitigation kind() const override { return Mitigation::ACTIVE_FILTER_LIKE; }
};

// Factory for one mitigation curve
std::unique_ptr<IAttenuationCurve> create_attenuation_curve(Mitigation mitigation);

// Process-wide shared instance of a curve
const IAttenuationCurve& attenuation_curve(Mitigation mitigation);

// Shorthand for attenuation_curve(mitigation).apply(spectrum)
HarmonicSpectrum apply_attenuation(const HarmonicSpectrum& spectrum, Mitigation mitigation);

// Irms / I1 assuming orthogonal harmonics: sqrt(1 + THD^2)
double irms_inflation_factor(double thd_pu);

// Eddy-current loss proxy: sum(h^2 * Ih_pu^2) over orders 2..max_h
double heating_proxy(const HarmonicSpectrum& spectrum, int max_h = 50);

} // namespace pq

#endif // MITIGATION_H
