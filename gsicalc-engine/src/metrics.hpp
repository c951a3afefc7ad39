#ifndef GSICALC_METRICS_HPP
#define GSICALC_METRICS_HPP

namespace gsicalc {

struct ReturnMetrics {
    double moic;   // final / investment
    double irr;    // Annualised geometric growth, percent

    ReturnMetrics();
    ReturnMetrics(double moic_value, double irr_value);
};

// MOIC = final_value / investment
// IRR  = (MOIC^(1/years) - 1) * 100
//
// IRR here is the geometric-mean growth rate of a single buy-and-hold cash
// flow, not a cash-flow IRR.
//
// Throws ValidationError if investment <= 0, years <= 0, or final_value is
// negative or not finite.
ReturnMetrics compute_return_metrics(double final_value, double investment, int years);

// Summary of a projection run
struct ProjectionMetrics {
    double initial_notional;    // Credit value + option quantity * spot at t = 0
    double final_value;         // Strategy value at the horizon
    double moic;
    double irr;                 // Percent
    double index_final;         // Index benchmark value at the horizon
    double index_moic;
    double index_irr;           // Percent

    ProjectionMetrics();
};

} // namespace gsicalc

#endif // GSICALC_METRICS_HPP
