#include "projection_inputs.hpp"
#include "benchmarks.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>

namespace gsicalc {

namespace {

std::string format_value(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

void require(bool condition, const char* field, const std::string& rule, double value) {
    if (!condition) {
        throw ValidationError(std::string(field) + " " + rule + ", got " + format_value(value));
    }
}

} // anonymous namespace

ProjectionInputs::ProjectionInputs()
    : investment(1000000.0),
      current_spot(563.22),
      spx_price_return(8.0),
      spx_div_yield(1.3),
      credit_yield(5.0),
      volatility(15.0),
      mgmt_fee(1.5),
      carry_fee(20.0),
      risk_free_rate(4.0),
      years(10) {}

std::map<std::string, std::string> ProjectionInputs::to_fields() const {
    std::map<std::string, std::string> fields;
    fields["investment"] = format_value(investment);
    fields["current_spot"] = format_value(current_spot);
    fields["spx_price_return"] = format_value(spx_price_return);
    fields["spx_div_yield"] = format_value(spx_div_yield);
    fields["credit_yield"] = format_value(credit_yield);
    fields["volatility"] = format_value(volatility);
    fields["mgmt_fee"] = format_value(mgmt_fee);
    fields["carry_fee"] = format_value(carry_fee);
    fields["risk_free_rate"] = format_value(risk_free_rate);
    fields["years"] = std::to_string(years);
    return fields;
}

void validate_inputs(const ProjectionInputs& in) {
    require(std::isfinite(in.investment) && in.investment > 0.0,
            "investment", "must be > 0", in.investment);
    require(std::isfinite(in.current_spot) && in.current_spot > 0.0,
            "current_spot", "must be > 0", in.current_spot);
    require(std::isfinite(in.spx_price_return) && in.spx_price_return > -100.0,
            "spx_price_return", "must be > -100", in.spx_price_return);
    require(std::isfinite(in.spx_div_yield),
            "spx_div_yield", "must be finite", in.spx_div_yield);

    // Growth bases are raised to fractional powers and must stay positive
    require(1.0 + index_net_growth_rate(in) > 0.0,
            "spx_price_return + spx_div_yield", "must leave positive index growth",
            in.spx_price_return + in.spx_div_yield);
    require(1.0 + private_equity_net_rate(in) > 0.0,
            "spx_price_return + spx_div_yield", "must leave positive private equity growth",
            in.spx_price_return + in.spx_div_yield);

    require(std::isfinite(in.credit_yield) && in.credit_yield > -100.0,
            "credit_yield", "must be > -100", in.credit_yield);
    require(std::isfinite(in.volatility) && in.volatility >= 0.0,
            "volatility", "must be >= 0", in.volatility);
    require(std::isfinite(in.mgmt_fee) && in.mgmt_fee >= 0.0 && in.mgmt_fee < 100.0,
            "mgmt_fee", "must be in [0, 100)", in.mgmt_fee);
    require(std::isfinite(in.carry_fee) && in.carry_fee >= 0.0 && in.carry_fee <= 100.0,
            "carry_fee", "must be in [0, 100]", in.carry_fee);
    require(std::isfinite(in.risk_free_rate),
            "risk_free_rate", "must be finite", in.risk_free_rate);
    require(in.years >= 1 && in.years <= ProjectionInputs::MAX_YEARS,
            "years", "must be in [1, 100]", in.years);
}

int years_from_double(double years) {
    require(std::isfinite(years) && std::floor(years) == years,
            "years", "must be a whole number", years);
    require(years >= 1.0 && years <= ProjectionInputs::MAX_YEARS,
            "years", "must be in [1, 100]", years);
    return static_cast<int>(years);
}

} // namespace gsicalc
