#ifndef GSICALC_PORTFOLIO_SCALER_HPP
#define GSICALC_PORTFOLIO_SCALER_HPP

#include "portfolio.hpp"

namespace gsicalc {

// Starting position of the strategy, sized to one investment
struct ScaledState {
    double ratio;             // investment / master cost basis
    double credit_value;      // Scaled current value of the credit sleeve
    double option_value;      // Scaled current value of the option sleeve
    double option_quantity;   // Scaled contract count
    double weighted_strike;   // Strike of the last Option row, unscaled
    double initial_nav;       // credit_value + option_value

    ScaledState();

    // credit_value + option_quantity * spot
    double notional_at(double spot) const;
};

// Scale the reference book to an investment.
//
// ratio = investment / master_cost_basis. Credit rows add current_value * ratio
// to the credit sleeve; Option rows add current_value * ratio to the option
// sleeve and quantity * ratio to the contract count. The weighted strike is the
// strike of the last Option row seen.
//
// Throws ValidationError if investment <= 0 or the portfolio fails validate().
ScaledState scale_portfolio(const ReferencePortfolio& portfolio, double investment);

} // namespace gsicalc

#endif // GSICALC_PORTFOLIO_SCALER_HPP
