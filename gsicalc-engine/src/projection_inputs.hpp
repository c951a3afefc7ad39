#ifndef GSICALC_PROJECTION_INPUTS_HPP
#define GSICALC_PROJECTION_INPUTS_HPP

#include <map>
#include <string>

namespace gsicalc {

/**
 * @brief Parameters of one projection run
 *
 * Rates, yields and fees are in percent (8 means 8%), as a user enters them.
 * The engine converts to decimals internally.
 */
struct ProjectionInputs {
    double investment;        ///< Capital committed (> 0)
    double current_spot;      ///< Index level today (> 0)
    double spx_price_return;  ///< Annual index price return, % (> -100)
    double spx_div_yield;     ///< Annual index dividend yield, %
    double credit_yield;      ///< Annual credit sleeve yield, % (> -100)
    double volatility;        ///< Annual implied volatility, % (>= 0)
    double mgmt_fee;          ///< Annual management fee, % in [0, 100)
    double carry_fee;         ///< Share of profit taken as carry, % in [0, 100]
    double risk_free_rate;    ///< Annual risk-free rate, %
    int years;                ///< Horizon in whole years (1..MAX_YEARS); quarters = years * 4

    static constexpr int MAX_YEARS = 100;

    /// Defaults to the reference market scenario with a 1,000,000 investment
    ProjectionInputs();

    /// Number of quarterly steps, excluding the initial point
    int steps() const { return years * 4; }

    /// Field name -> value, for logging
    std::map<std::string, std::string> to_fields() const;
};

/**
 * @brief Check every field against its documented domain
 *
 * @throws ValidationError naming the first field out of range
 */
void validate_inputs(const ProjectionInputs& inputs);

/**
 * @brief Convert a floating horizon to whole years
 *
 * Accepts integer-like values only (10.0 is fine, 10.5 is not).
 *
 * @throws ValidationError if the value is not integer-like or out of range
 */
int years_from_double(double years);

} // namespace gsicalc

#endif // GSICALC_PROJECTION_INPUTS_HPP
