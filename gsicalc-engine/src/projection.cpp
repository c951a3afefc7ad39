#include "projection.hpp"
#include "logger.hpp"
#include "option_pricer.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace gsicalc {

// ============================================================================
// ProjectionSeries / ProjectionConfig / ProjectionResult
// ============================================================================

void ProjectionSeries::resize(size_t n) {
    labels.resize(n);
    strategy.resize(n);
    credit.resize(n);
    options.resize(n);
    intrinsic.resize(n);
    index.resize(n);
    private_equity.resize(n);
    bonds.resize(n);
}

ProjectionConfig::ProjectionConfig()
    : start(), run_id("default"), parallel_steps(false), log_steps(false) {}

ProjectionResult::ProjectionResult() : steps(0), execution_time_ms(0.0) {}

// ============================================================================
// Carry waterfall
// ============================================================================

CarryAllocation apply_carry(double credit, double option, double intrinsic,
                            double investment, double carry_fee) {
    CarryAllocation out{credit, option, intrinsic, 0.0, false};

    const double combined = credit + option;
    const double profit = combined - investment;
    if (!(profit > 0.0)) {
        return out;
    }

    // Pro-rating divides by the combined value
    if (!(combined > 0.0)) {
        out.skipped = true;
        return out;
    }

    const double carry = profit * carry_fee / 100.0;
    const double credit_share = credit / combined;
    const double option_share = 1.0 - credit_share;

    out.credit = credit - carry * credit_share;
    out.option = option - carry * option_share;
    out.intrinsic = intrinsic - carry * option_share;
    out.carry = carry;
    return out;
}

// ============================================================================
// Quarterly step
// ============================================================================

StepValues project_step(const ProjectionInputs& inputs, const ScaledState& state, int quarter) {
    const double t = quarter * QUARTER_YEARS;

    const double g_price = inputs.spx_price_return / 100.0;
    const double g_credit = inputs.credit_yield / 100.0;
    const double vol = inputs.volatility / 100.0;
    const double r = inputs.risk_free_rate / 100.0;
    const double m_fee = inputs.mgmt_fee / 100.0;

    const double spot = inputs.current_spot * std::pow(1.0 + g_price, t);

    const double credit_gross = state.credit_value * std::pow(1.0 + g_credit, t);

    // Expiry sits at the horizon; the last quarter prices at intrinsic
    const double time_remaining = std::max(0.0, inputs.years - t);
    const double option_gross =
        bs_call_price(spot, state.weighted_strike, time_remaining, r, vol) * state.option_quantity;

    const double intrinsic_gross = intrinsic_value(spot, state.weighted_strike) * state.option_quantity;

    // Same drag on the intrinsic line keeps it comparable to the priced line
    const double drag = std::pow(1.0 - m_fee, t);

    CarryAllocation net = apply_carry(credit_gross * drag, option_gross * drag,
                                      intrinsic_gross * drag,
                                      inputs.investment, inputs.carry_fee);

    StepValues step;
    step.credit = net.credit;
    step.option = net.option;
    step.intrinsic = net.intrinsic;
    step.total = net.credit + net.option;
    step.carry_skipped = net.skipped;
    return step;
}

// ============================================================================
// Projection run
// ============================================================================

ProjectionResult run_projection(const ProjectionInputs& inputs,
                                const ReferencePortfolio& portfolio,
                                const ProjectionConfig& config) {
    Logger& logger = Logger::get_instance();
    RunContext ctx(config.run_id, "validate");

    auto start_time = std::chrono::high_resolution_clock::now();

    validate_inputs(inputs);
    logger.log_run_start(ctx, inputs);

    ctx.phase = "scale";
    ProjectionResult result;
    result.scaled = scale_portfolio(portfolio, inputs.investment);
    logger.log_portfolio_scaled(ctx, result.scaled, portfolio.master_cost_basis());

    ctx.phase = "project";
    const int steps = inputs.steps();
    result.steps = steps;

    ProjectionSeries& series = result.series;
    series.resize(static_cast<size_t>(steps) + 1);

    // Grid point 0: the scaled book as held today; benchmarks start at the investment
    series.labels[0] = format_period_label(config.start, 0);
    series.strategy[0] = result.scaled.initial_nav;
    series.credit[0] = result.scaled.credit_value;
    series.options[0] = result.scaled.option_value;
    series.intrinsic[0] = intrinsic_value(inputs.current_spot, result.scaled.weighted_strike)
                          * result.scaled.option_quantity;
    series.index[0] = inputs.investment;
    series.private_equity[0] = inputs.investment;
    series.bonds[0] = inputs.investment;

    std::vector<char> skipped(static_cast<size_t>(steps) + 1, 0);

    auto fill_step = [&](int q) {
        const size_t i = static_cast<size_t>(q);
        StepValues step = project_step(inputs, result.scaled, q);
        BenchmarkValues bench = compute_benchmarks(inputs, q * QUARTER_YEARS);

        series.labels[i] = format_period_label(config.start, q);
        series.strategy[i] = step.total;
        series.credit[i] = step.credit;
        series.options[i] = step.option;
        series.intrinsic[i] = step.intrinsic;
        series.index[i] = bench.index;
        series.private_equity[i] = bench.private_equity;
        series.bonds[i] = bench.bonds;
        skipped[i] = step.carry_skipped ? 1 : 0;
    };

#ifdef HAVE_OPENMP
    if (config.parallel_steps) {
        // Quarters are independent; each writes only its own slot.
        // Exceptions must not leave the parallel region.
        std::exception_ptr failure;
        #pragma omp parallel for schedule(static)
        for (int q = 1; q <= steps; ++q) {
            try {
                fill_step(q);
            } catch (...) {
                #pragma omp critical
                {
                    if (!failure) {
                        failure = std::current_exception();
                    }
                }
            }
        }
        if (failure) {
            std::rethrow_exception(failure);
        }
    } else
#endif
    {
        for (int q = 1; q <= steps; ++q) {
            fill_step(q);
        }
    }

    for (int q = 1; q <= steps; ++q) {
        const size_t i = static_cast<size_t>(q);
        if (skipped[i]) {
            result.carry_skipped_steps.push_back(q);
            logger.log_carry_skipped(ctx, q, series.credit[i] + series.options[i]);
        }
        if (config.log_steps) {
            logger.log_step(ctx, q, series.credit[i], series.options[i],
                            series.intrinsic[i], series.strategy[i]);
        }
    }

    // Summary metrics
    ProjectionMetrics& metrics = result.metrics;
    metrics.initial_notional = result.scaled.notional_at(inputs.current_spot);

    metrics.final_value = series.strategy.back();
    ReturnMetrics strategy = compute_return_metrics(metrics.final_value, inputs.investment,
                                                    inputs.years);
    metrics.moic = strategy.moic;
    metrics.irr = strategy.irr;

    metrics.index_final = series.index.back();
    ReturnMetrics index = compute_return_metrics(metrics.index_final, inputs.investment,
                                                 inputs.years);
    metrics.index_moic = index.moic;
    metrics.index_irr = index.irr;

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms =
        std::chrono::duration<double, std::milli>(end_time - start_time).count();

    logger.log_run_complete(ctx, metrics, steps, result.execution_time_ms);
    return result;
}

} // namespace gsicalc
