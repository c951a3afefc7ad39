#include "benchmarks.hpp"
#include <cmath>

namespace gsicalc {

double index_net_growth_rate(const ProjectionInputs& inputs) {
    return (inputs.spx_price_return + inputs.spx_div_yield) / 100.0 - INDEX_ANNUAL_DRAG;
}

double private_equity_net_rate(const ProjectionInputs& inputs) {
    return index_net_growth_rate(inputs) * PE_BETA - PE_MGMT_FEE;
}

BenchmarkValues compute_benchmarks(const ProjectionInputs& inputs, double t) {
    BenchmarkValues values;

    values.index = inputs.investment * std::pow(1.0 + index_net_growth_rate(inputs), t);

    double pe = inputs.investment * std::pow(1.0 + private_equity_net_rate(inputs), t);
    const double pe_profit = pe - inputs.investment;
    if (pe_profit > 0.0) {
        pe -= pe_profit * PE_CARRY;
    }
    values.private_equity = pe;

    values.bonds = inputs.investment * std::pow(1.0 + BOND_RATE, t);

    return values;
}

} // namespace gsicalc
