#include "metrics.hpp"
#include "errors.hpp"
#include <cmath>
#include <string>

namespace gsicalc {

ReturnMetrics::ReturnMetrics() : moic(0.0), irr(0.0) {}

ReturnMetrics::ReturnMetrics(double moic_value, double irr_value)
    : moic(moic_value), irr(irr_value) {}

ProjectionMetrics::ProjectionMetrics()
    : initial_notional(0.0),
      final_value(0.0),
      moic(0.0),
      irr(0.0),
      index_final(0.0),
      index_moic(0.0),
      index_irr(0.0) {}

ReturnMetrics compute_return_metrics(double final_value, double investment, int years) {
    if (!(investment > 0.0)) {
        throw ValidationError("compute_return_metrics: investment must be > 0, got " +
                              std::to_string(investment));
    }
    if (years <= 0) {
        throw ValidationError("compute_return_metrics: years must be > 0, got " +
                              std::to_string(years));
    }
    if (!std::isfinite(final_value) || final_value < 0.0) {
        throw ValidationError("compute_return_metrics: final value must be finite and >= 0, got " +
                              std::to_string(final_value));
    }

    const double moic = final_value / investment;
    const double irr = (std::pow(moic, 1.0 / static_cast<double>(years)) - 1.0) * 100.0;
    return ReturnMetrics(moic, irr);
}

} // namespace gsicalc
