#ifndef PCC_SIZING_H
#define PCC_SIZING_H

#include <string>

namespace pq {

// Point of common coupling demand description
struct PCCInputs {
    double vll_v;          // Line-to-line voltage (V)
    double kw_demand;      // kW at max demand (see kw_is_output)
    double pf_disp;        // Displacement PF at fundamental, (0, 1]
    double efficiency;     // Conversion efficiency at demand, (0, 1]
    int phases = 3;
    bool kw_is_output = true;   // true: kw_demand is UPS output (IT) power
};

// Output kW -> input kW at the PCC
double input_kw_from_output_kw(double output_kw, double efficiency);

// Balanced 3-phase fundamental line current: I1 = P / (sqrt(3) * VLL * PF)
double fundamental_current_a(double vll_v, double kw, double pf_disp, int phases = 3);

// IL: maximum-demand fundamental current at the PCC
double compute_il(const PCCInputs& pcc);

// Fundamental current at an operating fraction of demand (kW scales linearly)
double compute_operating_i1(const PCCInputs& pcc, double load_pu);

std::string format_pcc_summary(const PCCInputs& pcc, double load_pu);

} // namespace pq

#endif // PCC_SIZING_H
