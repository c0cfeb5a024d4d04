#include "Sweeps.h"
#include <iomanip>
#include <sstream>

namespace pq {

namespace {
    std::vector<ScenarioResult> compare_at(const ScenarioRequest& base_request, double sc_mva) {
        ScenarioRequest request = base_request;
        request.sc_mva = sc_mva;
        // The ratio must follow the swept strength
        request.isc_over_il.reset();
        return ScenarioComparator(request).compare();
    }

    std::vector<std::string> scenario_names(const std::vector<ScenarioResult>& results) {
        std::vector<std::string> names;
        for (const auto& r : results) {
            names.push_back(r.name);
        }
        return names;
    }
}

const ScenarioResult* find_scenario(const std::vector<ScenarioResult>& results,
                                    const std::string& option_name) {
    for (const auto& r : results) {
        if (r.name == option_name) {
            return &r;
        }
    }
    for (const auto& r : results) {
        if (r.name.compare(0, option_name.size(), option_name) == 0) {
            return &r;
        }
    }
    return nullptr;
}

std::vector<ThdvSweepPoint> sweep_thdv_vs_sc_mva(const ScenarioRequest& base_request,
                                                 const std::string& option_name,
                                                 const std::vector<double>& sc_mva_points) {
    std::vector<ThdvSweepPoint> rows;

    for (double sc_mva : sc_mva_points) {
        std::vector<ScenarioResult> results = compare_at(base_request, sc_mva);
        const ScenarioResult* row = find_scenario(results, option_name);
        if (!row || !row->voltage) {
            continue;
        }
        rows.push_back({sc_mva, row->voltage->thdv_percent});
    }

    return rows;
}

TippingPoint find_tipping_point(const ScenarioRequest& base_request,
                                const std::string& option_name,
                                const std::vector<double>& sc_mva_grid) {
    TippingPoint tip;
    tip.option = option_name;

    for (double sc_mva : sc_mva_grid) {
        std::vector<ScenarioResult> results = compare_at(base_request, sc_mva);
        const ScenarioResult* row = find_scenario(results, option_name);
        if (!row) {
            throw UnknownKeyError("scenario option", option_name, scenario_names(results));
        }

        if (!tip.min_sc_mva_voltage && row->voltage && row->voltage->pass_limit) {
            tip.min_sc_mva_voltage = sc_mva;
        }
        if (!tip.min_sc_mva_current && row->practical_pass) {
            tip.min_sc_mva_current = sc_mva;
        }

        if (tip.min_sc_mva_voltage && tip.min_sc_mva_current) {
            break;
        }
    }

    return tip;
}

std::vector<TippingPoint> find_tipping_points(const ScenarioRequest& base_request,
                                              const std::vector<std::string>& options,
                                              const std::vector<double>& sc_mva_grid) {
    std::vector<TippingPoint> tips;
    for (const auto& option : options) {
        tips.push_back(find_tipping_point(base_request, option, sc_mva_grid));
    }
    return tips;
}

std::string format_bound(const std::optional<double>& value,
                         const std::vector<double>& sc_mva_grid) {
    if (sc_mva_grid.empty()) {
        return "n/a";
    }

    std::ostringstream out;
    out << std::fixed;
    if (!value) {
        out << "> " << std::setprecision(0) << sc_mva_grid.back() << " MVA";
    } else if (*value == sc_mva_grid.front()) {
        out << "<= " << std::setprecision(0) << sc_mva_grid.front() << " MVA";
    } else {
        out << std::setprecision(1) << *value << " MVA";
    }
    return out.str();
}

} // namespace pq
