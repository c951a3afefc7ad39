#ifndef GSICALC_PERIOD_HPP
#define GSICALC_PERIOD_HPP

#include <string>

namespace gsicalc {

// Calendar month the projection grid starts from. Labels only; the engine's
// arithmetic uses elapsed years.
struct PeriodStart {
    int year;    // e.g. 2026
    int month;   // 1..12

    PeriodStart();
    PeriodStart(int y, int m);

    // Parses "YYYY-MM"; throws ValidationError on anything else
    static PeriodStart parse(const std::string& text);

    // Current local month
    static PeriodStart today();

    std::string to_string() const;
};

// Label of quarter q (0 = start): the month start + 3q, as "Mmm YY",
// e.g. start 2026-01, q = 1 -> "Apr 26".
std::string format_period_label(const PeriodStart& start, int quarter);

} // namespace gsicalc

#endif // GSICALC_PERIOD_HPP
