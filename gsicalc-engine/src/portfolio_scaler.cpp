#include "portfolio_scaler.hpp"
#include "errors.hpp"
#include <cmath>
#include <string>

namespace gsicalc {

namespace {

// Accumulates one reference row into the scaled state
struct ScaleVisitor {
    ScaledState& state;

    void operator()(const CreditPosition& credit) const {
        state.credit_value += credit.current_value * state.ratio;
    }

    void operator()(const OptionPosition& option) const {
        state.option_value += option.current_value * state.ratio;
        state.option_quantity += option.quantity * state.ratio;
        state.weighted_strike = option.strike;
    }
};

} // anonymous namespace

ScaledState::ScaledState()
    : ratio(0.0),
      credit_value(0.0),
      option_value(0.0),
      option_quantity(0.0),
      weighted_strike(0.0),
      initial_nav(0.0) {}

double ScaledState::notional_at(double spot) const {
    return credit_value + option_quantity * spot;
}

ScaledState scale_portfolio(const ReferencePortfolio& portfolio, double investment) {
    if (!(investment > 0.0) || !std::isfinite(investment)) {
        throw ValidationError("investment must be > 0, got " + std::to_string(investment));
    }
    portfolio.validate();

    ScaledState state;
    state.ratio = investment / portfolio.master_cost_basis();

    ScaleVisitor visitor{state};
    for (const auto& position : portfolio.positions()) {
        std::visit(visitor, position);
    }

    state.initial_nav = state.credit_value + state.option_value;
    return state;
}

} // namespace gsicalc
