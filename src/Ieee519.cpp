#include "Ieee519.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace pq {

namespace {
    constexpr double PASS_TOLERANCE = 1e-12;
    constexpr size_t MAX_WORST_VIOLATIONS = 5;
    constexpr double INF = std::numeric_limits<double>::infinity();
}

Ieee519Limits::Ieee519Limits(double even_harmonic_factor, const std::string& voltage_class)
    : even_harmonic_factor_(even_harmonic_factor), voltage_class_(voltage_class) {
    if (!(even_harmonic_factor > 0.0 && even_harmonic_factor <= 1.0)) {
        throw ValidationError("even_harmonic_factor must be in (0, 1]");
    }
}

const std::vector<LimitRow>& Ieee519Limits::table() {
    // Percent of IL
    static const std::vector<LimitRow> rows = {
        {-INF,   20.0,   {4.0, 2.0, 1.5, 0.6, 0.3},   5.0,  "<=20"},
        {20.0,   50.0,   {7.0, 3.5, 2.5, 1.0, 0.5},   8.0,  "20-50"},
        {50.0,   100.0,  {10.0, 4.5, 4.0, 1.5, 0.7},  12.0, "50-100"},
        {100.0,  1000.0, {12.0, 5.5, 5.0, 2.0, 1.0},  15.0, "100-1000"},
        {1000.0, INF,    {15.0, 7.0, 6.0, 2.5, 1.4},  20.0, ">1000"},
    };
    return rows;
}

std::optional<int> Ieee519Limits::band_index(int h) {
    if (h < 2 || h > 50) {
        return std::nullopt;
    }
    if (h < 11) return 0;
    if (h < 17) return 1;
    if (h < 23) return 2;
    if (h < 35) return 3;
    return 4;
}

const std::string& Ieee519Limits::band_label(int band) {
    static const std::array<std::string, NUM_HARMONIC_BANDS> labels = {
        "2-10", "11-16", "17-22", "23-34", "35-50"
    };
    return labels.at(static_cast<size_t>(band));
}

const LimitRow& Ieee519Limits::select_row(double isc_over_il) {
    const auto& rows = table();
    for (const auto& row : rows) {
        if (isc_over_il > row.ratio_min && isc_over_il <= row.ratio_max) {
            return row;
        }
    }
    // Only reachable for NaN
    return rows.back();
}

double Ieee519Limits::limit_for(int h, const LimitRow& row) const {
    auto band = band_index(h);
    if (!band) {
        throw ValidationError("harmonic order " + std::to_string(h) + " outside evaluated range 2-50");
    }
    double limit = row.band_limits[static_cast<size_t>(*band)];
    if (h % 2 == 0) {
        limit *= even_harmonic_factor_;
    }
    return limit;
}

IEEE519CurrentReport Ieee519Limits::evaluate(const HarmonicSpectrum& spectrum,
                                             double il_a,
                                             double isc_a) const {
    if (!(il_a > 0.0)) {
        throw ValidationError("IL must be > 0 A");
    }
    if (!(isc_a > 0.0)) {
        throw ValidationError("Isc must be > 0 A");
    }

    IEEE519CurrentReport report;
    report.voltage_class = voltage_class_;
    report.isc_a = isc_a;
    report.il_a = il_a;
    report.isc_over_il = isc_a / il_a;

    const LimitRow& row = select_row(report.isc_over_il);
    report.category_label = row.label;
    report.tdd_limit_percent = row.tdd_limit;

    std::ostringstream even_note;
    even_note << "even harmonic limit = " << std::lround(even_harmonic_factor_ * 100.0)
              << "% of odd limit";

    double sum_sq = 0.0;
    for (const auto& [h, pct] : spectrum) {
        auto band = band_index(h);
        if (!band) {
            continue;
        }

        HarmonicLimitCheck check;
        check.h = h;
        check.ih_percent_of_il = pct;
        check.limit_percent_of_il = limit_for(h, row);
        check.pass_limit = pct <= check.limit_percent_of_il + PASS_TOLERANCE;
        check.band = band_label(*band);
        if (h % 2 == 0) {
            check.note = even_note.str();
        }
        report.checks.push_back(check);

        double pu = pct / 100.0;
        sum_sq += pu * pu;
    }

    report.tdd_percent = std::sqrt(sum_sq) * 100.0;
    report.tdd_pass = report.tdd_percent <= report.tdd_limit_percent + PASS_TOLERANCE;

    std::vector<HarmonicLimitCheck> violations;
    for (const auto& check : report.checks) {
        if (!check.pass_limit) {
            violations.push_back(check);
        }
    }
    std::stable_sort(violations.begin(), violations.end(),
        [](const HarmonicLimitCheck& a, const HarmonicLimitCheck& b) {
            return a.overage() > b.overage();
        });
    size_t n_worst = std::min(violations.size(), MAX_WORST_VIOLATIONS);
    report.worst_violations.assign(violations.begin(), violations.begin() + n_worst);

    if (report.isc_over_il < 20.0) {
        report.interpretation.push_back(
            "Weak PCC (low Isc/IL): harmonic currents are more likely to cause voltage distortion upstream.");
    } else if (report.isc_over_il < 50.0) {
        report.interpretation.push_back(
            "Moderate PCC strength: compliance depends strongly on low-order (5th/7th/11th/13th) magnitudes.");
    } else {
        report.interpretation.push_back(
            "Strong PCC: current limits are higher, but large 5th/7th can still trigger issues in shared systems.");
    }

    if (!report.tdd_pass) {
        report.interpretation.push_back(
            "TDD exceeds limit: utility/PCC compliance risk is elevated; expect higher RMS heating "
            "and potential voltage THD concerns.");
    }
    if (!report.worst_violations.empty()) {
        std::string orders;
        for (size_t i = 0; i < report.worst_violations.size() && i < 3; ++i) {
            if (i > 0) orders += ", ";
            orders += "h" + std::to_string(report.worst_violations[i].h);
        }
        report.interpretation.push_back(
            "Major individual harmonic violations: " + orders +
            ". These typically drive transformer/cable heating and upstream voltage distortion.");
    }

    if (!report.tdd_pass && violations.size() >= 2) {
        report.risk_level = RiskLevel::HIGH;
    } else if (!report.tdd_pass || !violations.empty()) {
        report.risk_level = RiskLevel::MEDIUM;
    } else {
        report.risk_level = RiskLevel::LOW;
    }

    return report;
}

IEEE519CurrentReport evaluate_limits(const HarmonicSpectrum& spectrum,
                                     double il_a,
                                     double isc_a,
                                     double even_harmonic_factor) {
    Ieee519Limits limits(even_harmonic_factor);
    return limits.evaluate(spectrum, il_a, isc_a);
}

} // namespace pq
