#ifndef GSICALC_ERRORS_HPP
#define GSICALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace gsicalc {

/**
 * @brief Thrown when an input is outside the domain the engine accepts
 *
 * Raised before any computation starts: non-positive investment, master cost
 * basis, years, spot or strike, and out-of-range rates or fees.
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Thrown when a JSON configuration cannot be read or has a bad field type
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Thrown when a reference portfolio CSV cannot be opened or parsed
 */
class PortfolioLoadError : public std::runtime_error {
public:
    explicit PortfolioLoadError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace gsicalc

#endif // GSICALC_ERRORS_HPP
