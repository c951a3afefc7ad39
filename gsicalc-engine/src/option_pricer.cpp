#include "option_pricer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace gsicalc {

namespace {

// Zelen & Severo coefficients
constexpr double B1 = 0.31938153;
constexpr double B2 = -0.356563782;
constexpr double B3 = 1.781477937;
constexpr double B4 = -1.821255978;
constexpr double B5 = 1.330274429;
constexpr double P = 0.2316419;
constexpr double C = 0.39894228;  // 1/sqrt(2*pi)

constexpr double CDF_CLAMP = 6.0;

} // anonymous namespace

double normal_cdf(double z) {
    if (z > CDF_CLAMP) {
        return 1.0;
    }
    if (z < -CDF_CLAMP) {
        return 0.0;
    }

    const double a = std::fabs(z);
    const double t = 1.0 / (1.0 + P * a);
    const double density = C * std::exp(-a * a / 2.0);

    // Horner form of b1*t + b2*t^2 + ... + b5*t^5
    const double poly = ((((B5 * t + B4) * t + B3) * t + B2) * t + B1) * t;
    const double upper = 1.0 - density * poly;

    return z < 0.0 ? 1.0 - upper : upper;
}

double intrinsic_value(double spot, double strike) {
    return std::max(0.0, spot - strike);
}

double bs_call_price(double spot, double strike, double time_to_expiry,
                     double risk_free_rate, double volatility) {
    if (!(spot > 0.0)) {
        throw ValidationError("bs_call_price: spot must be > 0, got " + std::to_string(spot));
    }
    if (!(strike > 0.0)) {
        throw ValidationError("bs_call_price: strike must be > 0, got " + std::to_string(strike));
    }
    if (!(volatility >= 0.0)) {
        throw ValidationError("bs_call_price: volatility must be >= 0, got " + std::to_string(volatility));
    }

    // At or past expiry
    if (time_to_expiry <= EXPIRY_THRESHOLD_YEARS) {
        return intrinsic_value(spot, strike);
    }

    const double discount = std::exp(-risk_free_rate * time_to_expiry);

    if (volatility == 0.0) {
        return discount * intrinsic_value(spot, strike);
    }

    const double vol_sqrt_t = volatility * std::sqrt(time_to_expiry);
    const double d1 = (std::log(spot / strike) + 0.5 * volatility * volatility * time_to_expiry)
                      / vol_sqrt_t;
    const double d2 = d1 - vol_sqrt_t;

    return discount * (spot * normal_cdf(d1) - strike * normal_cdf(d2));
}

} // namespace gsicalc
