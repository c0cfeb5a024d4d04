#ifndef IEEE519_H
#define IEEE519_H

#include "Types.h"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace pq {

// Number of harmonic-order bands in the current limit table
constexpr int NUM_HARMONIC_BANDS = 5;

// One row of the current distortion table, selected by Isc/IL
struct LimitRow {
    double ratio_min;    // Lower bound (exclusive)
    double ratio_max;    // Upper bound (inclusive)
    std::array<double, NUM_HARMONIC_BANDS> band_limits;   // Odd-harmonic limits, % of IL
    double tdd_limit;    // % of IL
    std::string label;
};

// Individual harmonic check against its band limit
struct HarmonicLimitCheck {
    int h;
    double ih_percent_of_il;
    double limit_percent_of_il;
    bool pass_limit;
    std::string band;
    std::string note;

    double overage() const { return ih_percent_of_il - limit_percent_of_il; }
};

// Current distortion evaluation at the PCC
struct IEEE519CurrentReport {
    std::string voltage_class;
    double isc_a;
    double il_a;
    double isc_over_il;
    std::string category_label;
    double tdd_percent;
    double tdd_limit_percent;
    bool tdd_pass;
    std::vector<HarmonicLimitCheck> checks;             // Sorted by order
    std::vector<HarmonicLimitCheck> worst_violations;   // Up to 5, largest overage first
    RiskLevel risk_level;
    std::vector<std::string> interpretation;
};

// Current distortion limits for systems rated 120 V through 69 kV.
// Bands by harmonic order: [2-10], [11-16], [17-22], [23-34], [35-50].
// Even harmonics are limited to even_harmonic_factor x the odd limit.
class Ieee519Limits {
public:
    explicit Ieee519Limits(double even_harmonic_factor = 0.25,
                           const std::string& voltage_class = "120V-69kV");

    // Fixed table rows, ascending and gap-free over (-inf, +inf)
    static const std::vector<LimitRow>& table();

    // Band index for an order, none outside [2, 50]
    static std::optional<int> band_index(int h);

    static const std::string& band_label(int band);

    // Row whose (ratio_min, ratio_max] contains isc_over_il
    static const LimitRow& select_row(double isc_over_il);

    // Applicable limit for an order in a row (even derating applied)
    double limit_for(int h, const LimitRow& row) const;

    double get_even_harmonic_factor() const { return even_harmonic_factor_; }

    // Evaluate a percent-of-IL spectrum. Throws ValidationError if
    // il_a <= 0 or isc_a <= 0.
    IEEE519CurrentReport evaluate(const HarmonicSpectrum& spectrum,
                                  double il_a,
                                  double isc_a) const;

private:
    double even_harmonic_factor_;
    std::string voltage_class_;
};

// Convenience entry point using the default table settings
IEEE519CurrentReport evaluate_limits(const HarmonicSpectrum& spectrum,
                                     double il_a,
                                     double isc_a,
                                     double even_harmonic_factor = 0.25);

} // namespace pq

#endif // IEEE519_H
