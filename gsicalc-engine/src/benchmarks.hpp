#ifndef GSICALC_BENCHMARKS_HPP
#define GSICALC_BENCHMARKS_HPP

#include "projection_inputs.hpp"

namespace gsicalc {

// Benchmark constants (decimals, annual)
constexpr double INDEX_ANNUAL_DRAG = 0.0003;   // 3 bps tracking cost
constexpr double PE_BETA = 1.2;                // Leverage on index growth
constexpr double PE_MGMT_FEE = 0.015;
constexpr double PE_CARRY = 0.20;              // Share of profit, single global carry
constexpr double BOND_RATE = 0.062;

// Value of each benchmark at one point of the quarterly grid
struct BenchmarkValues {
    double index;
    double private_equity;
    double bonds;
};

// (spx_price_return + spx_div_yield) / 100 - INDEX_ANNUAL_DRAG
double index_net_growth_rate(const ProjectionInputs& inputs);

// PE_BETA * index net growth - PE_MGMT_FEE
double private_equity_net_rate(const ProjectionInputs& inputs);

// Benchmarks at elapsed time t (years), each a closed form in t:
//   index = investment * (1 + index_net)^t
//   pe    = investment * (1 + pe_net)^t, less PE_CARRY of any profit
//   bonds = investment * (1 + BOND_RATE)^t
// Path-independent: no step depends on another.
BenchmarkValues compute_benchmarks(const ProjectionInputs& inputs, double t);

} // namespace gsicalc

#endif // GSICALC_BENCHMARKS_HPP
