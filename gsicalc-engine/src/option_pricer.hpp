#ifndef GSICALC_OPTION_PRICER_HPP
#define GSICALC_OPTION_PRICER_HPP

namespace gsicalc {

// Below this remaining time (in years) a call is valued at intrinsic.
constexpr double EXPIRY_THRESHOLD_YEARS = 0.001;

// Standard normal CDF, Zelen & Severo rational approximation (A&S 26.2.17).
// Exactly 1.0 above z = 6 and exactly 0.0 below z = -6; negative z is
// reflected as 1 - cdf(|z|), so cdf(z) + cdf(-z) == 1.
double normal_cdf(double z);

// Payoff of a call exercised now: max(0, spot - strike)
double intrinsic_value(double spot, double strike);

// European call, closed form:
//   d1 = (ln(S/K) + 0.5 * vol^2 * T) / (vol * sqrt(T))
//   d2 = d1 - vol * sqrt(T)
//   C  = exp(-r * T) * (S * N(d1) - K * N(d2))
//
// The drift in d1 carries only the 0.5 * vol^2 term, no risk-free rate.
//
// T <= EXPIRY_THRESHOLD_YEARS returns intrinsic value. vol == 0 returns the
// discounted intrinsic value, which is the limit of the formula as vol -> 0.
//
// Rates and vol are decimals (0.04, not 4). Throws ValidationError when
// spot <= 0, strike <= 0 or vol < 0.
double bs_call_price(double spot, double strike, double time_to_expiry,
                     double risk_free_rate, double volatility);

} // namespace gsicalc

#endif // GSICALC_OPTION_PRICER_HPP
