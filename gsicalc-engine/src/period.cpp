#include "period.hpp"
#include "errors.hpp"
#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace gsicalc {

namespace {

const std::array<const char*, 12> MONTH_NAMES = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

void check_month(int month, const std::string& source) {
    if (month < 1 || month > 12) {
        throw ValidationError("Invalid month in period start '" + source + "'");
    }
}

} // anonymous namespace

PeriodStart::PeriodStart() : year(2026), month(1) {}

PeriodStart::PeriodStart(int y, int m) : year(y), month(m) {
    check_month(m, std::to_string(y) + "-" + std::to_string(m));
}

PeriodStart PeriodStart::parse(const std::string& text) {
    std::istringstream iss(text);
    int y = 0;
    int m = 0;
    char dash = '\0';
    if (!(iss >> y >> dash >> m) || dash != '-' || iss.peek() != EOF) {
        throw ValidationError("Period start must be YYYY-MM, got '" + text + "'");
    }
    if (y < 1900 || y > 9999) {
        throw ValidationError("Invalid year in period start '" + text + "'");
    }
    check_month(m, text);
    return PeriodStart(y, m);
}

PeriodStart PeriodStart::today() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    return PeriodStart(tm_buf.tm_year + 1900, tm_buf.tm_mon + 1);
}

std::string PeriodStart::to_string() const {
    std::ostringstream oss;
    oss << year << "-" << std::setw(2) << std::setfill('0') << month;
    return oss.str();
}

std::string format_period_label(const PeriodStart& start, int quarter) {
    const int months = (start.month - 1) + quarter * 3;
    const int year = start.year + months / 12;
    const int month_index = months % 12;

    std::ostringstream oss;
    oss << MONTH_NAMES[month_index] << " "
        << std::setw(2) << std::setfill('0') << (year % 100);
    return oss.str();
}

} // namespace gsicalc
