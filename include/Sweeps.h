#ifndef SWEEPS_H
#define SWEEPS_H

#include "ScenarioCompare.h"
#include <optional>
#include <string>
#include <vector>

namespace pq {

// THDv of one option at one PCC strength
struct ThdvSweepPoint {
    double sc_mva;
    double thdv_percent;
};

// Minimum PCC strength at which an option passes
struct TippingPoint {
    std::string option;
    std::optional<double> min_sc_mva_voltage;   // First grid value with THDv pass
    std::optional<double> min_sc_mva_current;   // First grid value with practical current pass
};

// Find a scenario by exact name, then by name prefix; nullptr if absent
const ScenarioResult* find_scenario(const std::vector<ScenarioResult>& results,
                                    const std::string& option_name);

// Rerun the comparison at each sc_mva point and record the option's THDv.
// Points where the option is absent are skipped.
std::vector<ThdvSweepPoint> sweep_thdv_vs_sc_mva(const ScenarioRequest& base_request,
                                                 const std::string& option_name,
                                                 const std::vector<double>& sc_mva_points);

// Scan an ascending sc_mva grid for the first voltage and current pass.
// Throws UnknownKeyError if the option is missing at any evaluated point.
TippingPoint find_tipping_point(const ScenarioRequest& base_request,
                                const std::string& option_name,
                                const std::vector<double>& sc_mva_grid);

std::vector<TippingPoint> find_tipping_points(const ScenarioRequest& base_request,
                                              const std::vector<std::string>& options,
                                              const std::vector<double>& sc_mva_grid);

// "<= {min} MVA" at the first grid point, "> {max} MVA" when never reached,
// otherwise "{v:.1f} MVA"
std::string format_bound(const std::optional<double>& value,
                         const std::vector<double>& sc_mva_grid);

} // namespace pq

#endif // SWEEPS_H
