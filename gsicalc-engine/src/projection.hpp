#ifndef GSICALC_PROJECTION_HPP
#define GSICALC_PROJECTION_HPP

#include "benchmarks.hpp"
#include "metrics.hpp"
#include "period.hpp"
#include "portfolio.hpp"
#include "portfolio_scaler.hpp"
#include "projection_inputs.hpp"
#include <string>
#include <vector>

namespace gsicalc {

constexpr double QUARTER_YEARS = 0.25;

// Parallel arrays, one entry per grid point. Index 0 is the starting point,
// index q is quarter q; every array has steps + 1 entries.
struct ProjectionSeries {
    std::vector<std::string> labels;
    std::vector<double> strategy;        // credit + options, after fees and carry
    std::vector<double> credit;          // Credit sleeve after fees and carry
    std::vector<double> options;         // Option sleeve, re-priced, after fees and carry
    std::vector<double> intrinsic;       // Option sleeve at intrinsic, same fee and carry load
    std::vector<double> index;           // Index benchmark
    std::vector<double> private_equity;  // Private equity proxy benchmark
    std::vector<double> bonds;           // Bond benchmark

    size_t size() const { return strategy.size(); }
    void resize(size_t n);
};

// Result of a carry allocation between the two sleeves
struct CarryAllocation {
    double credit;
    double option;
    double intrinsic;
    double carry;           // Total carry taken (0 when there is no profit)
    bool skipped;           // Profit existed but combined value was <= 0
};

// Take carry_fee percent of any profit over the investment, pro rata to each
// sleeve's share of the combined value. The option share is also taken from
// the intrinsic line so the two option lines stay comparable.
//
// No profit: values are returned unchanged. Profit with a combined value
// <= 0 cannot be split; values are returned unchanged and skipped is set.
CarryAllocation apply_carry(double credit, double option, double intrinsic,
                            double investment, double carry_fee);

// Strategy values at one quarter, after management drag and carry
struct StepValues {
    double credit;
    double option;
    double intrinsic;
    double total;
    bool carry_skipped;
};

// Project quarter q (1-based) directly from the starting state. Nothing is
// carried over from quarter q - 1, so quarters can be evaluated in any order.
//
//   t        = q * 0.25
//   S        = spot * (1 + price_return)^t
//   credit   = credit0 * (1 + credit_yield)^t
//   option   = bs_call_price(S, K, max(0, years - t), r, vol) * quantity
//   intrinsic= max(0, S - K) * quantity
//   each of the three is multiplied by (1 - mgmt_fee)^t, then apply_carry()
//
// Inputs must already be validated.
StepValues project_step(const ProjectionInputs& inputs, const ScaledState& state, int quarter);

// Run options that do not change the numbers
struct ProjectionConfig {
    PeriodStart start;          // Calendar month of grid point 0, for labels
    std::string run_id;         // Tag carried by log events
    bool parallel_steps;        // Evaluate quarters concurrently (OpenMP builds only)
    bool log_steps;             // Emit a DEBUG event per quarter

    ProjectionConfig();
};

struct ProjectionResult {
    ProjectionSeries series;
    ProjectionMetrics metrics;
    ScaledState scaled;
    int steps;                              // Quarters projected (years * 4)
    std::vector<int> carry_skipped_steps;   // Quarters whose carry could not be allocated
    double execution_time_ms;

    ProjectionResult();
};

// Scale the reference book to the investment, project every quarter, compute
// the benchmarks and summary metrics.
//
// Throws ValidationError before computing anything if the inputs or the
// portfolio are out of domain.
ProjectionResult run_projection(const ProjectionInputs& inputs,
                                const ReferencePortfolio& portfolio,
                                const ProjectionConfig& config = ProjectionConfig());

} // namespace gsicalc

#endif // GSICALC_PROJECTION_HPP
