#include "PccSizing.h"
#include "Errors.h"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace pq {

namespace {
    constexpr double SQRT3 = 1.7320508075688772;

    double input_kw(const PCCInputs& pcc) {
        return pcc.kw_is_output ? input_kw_from_output_kw(pcc.kw_demand, pcc.efficiency)
                                : pcc.kw_demand;
    }
}

double input_kw_from_output_kw(double output_kw, double efficiency) {
    if (!(efficiency > 0.0 && efficiency <= 1.0)) {
        throw ValidationError("efficiency must be in (0, 1]");
    }
    return output_kw / efficiency;
}

double fundamental_current_a(double vll_v, double kw, double pf_disp, int phases) {
    if (phases != 3) {
        throw ValidationError("Only 3-phase systems are supported");
    }
    if (!(vll_v > 0.0)) {
        throw ValidationError("vll_v must be > 0");
    }
    if (!(pf_disp > 0.0 && pf_disp <= 1.0)) {
        throw ValidationError("pf_disp must be in (0, 1]");
    }
    return kw * 1000.0 / (SQRT3 * vll_v * pf_disp);
}

double compute_il(const PCCInputs& pcc) {
    return fundamental_current_a(pcc.vll_v, input_kw(pcc), pcc.pf_disp, pcc.phases);
}

double compute_operating_i1(const PCCInputs& pcc, double load_pu) {
    if (!(load_pu >= 0.0)) {
        throw ValidationError("load_pu must be >= 0");
    }
    PCCInputs operating = pcc;
    operating.kw_demand = pcc.kw_demand * load_pu;
    return compute_il(operating);
}

std::string format_pcc_summary(const PCCInputs& pcc, double load_pu) {
    double il = compute_il(pcc);
    double i1_op = compute_operating_i1(pcc, load_pu);

    std::ostringstream out;
    out << std::fixed;
    out << "PCC sizing summary:\n"
        << std::setprecision(1)
        << "- VLL: " << pcc.vll_v << " V\n"
        << std::setprecision(2)
        << "- Demand kW (" << (pcc.kw_is_output ? "output" : "input") << "): " << pcc.kw_demand << " kW\n"
        << "- Demand kW (input @ PCC): " << input_kw(pcc) << " kW\n"
        << std::setprecision(3)
        << "- PF (displacement): " << pcc.pf_disp << "\n"
        << "- Efficiency: " << pcc.efficiency << "\n"
        << std::setprecision(2)
        << "- IL (max-demand fundamental): " << il << " A\n"
        << "- Operating I1 @ load " << load_pu << " pu: " << i1_op << " A\n";
    return out.str();
}

} // namespace pq
