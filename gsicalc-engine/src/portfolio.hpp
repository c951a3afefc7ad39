#ifndef GSICALC_PORTFOLIO_HPP
#define GSICALC_PORTFOLIO_HPP

#include <cstdint>
#include <istream>
#include <string>
#include <variant>
#include <vector>

namespace gsicalc {

enum class PositionKind : uint8_t {
    Credit = 0,
    Option = 1
};

std::string kind_to_string(PositionKind kind);

// Fixed-income sleeve of the reference book
struct CreditPosition {
    double cost_basis;
    double current_value;

    CreditPosition();
    CreditPosition(double cost, double value);

    bool operator==(const CreditPosition& other) const;
};

// Call option sleeve of the reference book
struct OptionPosition {
    double cost_basis;
    double current_value;
    double strike;
    double quantity;                // Contracts; fractional after scaling
    std::string expiration_date;    // ISO date, informational only

    OptionPosition();
    OptionPosition(double cost, double value, double strike_price, double qty,
                   const std::string& expiry);

    bool operator==(const OptionPosition& other) const;
};

using ReferencePosition = std::variant<CreditPosition, OptionPosition>;

PositionKind position_kind(const ReferencePosition& position);
double position_cost_basis(const ReferencePosition& position);
double position_current_value(const ReferencePosition& position);

/**
 * @brief Reference book that investments are scaled against
 *
 * The master cost basis is the book's total cost at reference scale. An
 * investment equal to the master cost basis reproduces the book unscaled.
 * Immutable once handed to the engine.
 */
class ReferencePortfolio {
public:
    ReferencePortfolio();
    ReferencePortfolio(std::vector<ReferencePosition> positions, double master_cost_basis);

    const std::vector<ReferencePosition>& positions() const { return positions_; }
    double master_cost_basis() const { return master_cost_basis_; }
    size_t size() const { return positions_.size(); }
    bool empty() const { return positions_.empty(); }

    size_t count(PositionKind kind) const;

    // Sum of every position's cost basis
    double total_cost_basis() const;

    // Throws ValidationError unless master cost basis > 0, there is at least one
    // Credit and one Option row, and each option has strike > 0, quantity >= 0.
    void validate() const;

    // Built-in reference book: one credit sleeve and one option sleeve
    static ReferencePortfolio demo();

    // CSV columns: kind,cost_basis,current_value,strike,quantity,expiration_date
    // A "# master_cost_basis=<value>" comment overrides the summed cost basis.
    static ReferencePortfolio load_from_csv(const std::string& filepath);
    static ReferencePortfolio load_from_csv(std::istream& is);

private:
    std::vector<ReferencePosition> positions_;
    double master_cost_basis_;
};

} // namespace gsicalc

#endif // GSICALC_PORTFOLIO_HPP
