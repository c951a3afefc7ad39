#include "portfolio.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <fstream>
#include <numeric>
#include <utility>

namespace gsicalc {

namespace {

constexpr const char* MASTER_COST_BASIS_DIRECTIVE = "master_cost_basis=";

double parse_number(const std::string& cell, const char* column, size_t line) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(cell, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != cell.size()) {
        throw PortfolioLoadError("Line " + std::to_string(line) + ": invalid " + column +
                                 " '" + cell + "'");
    }
    return value;
}

PositionKind parse_kind(const std::string& cell, size_t line) {
    if (cell == "Credit" || cell == "0") {
        return PositionKind::Credit;
    }
    if (cell == "Option" || cell == "1") {
        return PositionKind::Option;
    }
    throw PortfolioLoadError("Line " + std::to_string(line) + ": unknown position kind '" +
                             cell + "'");
}

} // anonymous namespace

std::string kind_to_string(PositionKind kind) {
    switch (kind) {
        case PositionKind::Credit: return "Credit";
        case PositionKind::Option: return "Option";
        default: return "Unknown";
    }
}

// ============================================================================
// Positions
// ============================================================================

CreditPosition::CreditPosition() : cost_basis(0.0), current_value(0.0) {}

CreditPosition::CreditPosition(double cost, double value)
    : cost_basis(cost), current_value(value) {}

bool CreditPosition::operator==(const CreditPosition& other) const {
    return cost_basis == other.cost_basis && current_value == other.current_value;
}

OptionPosition::OptionPosition()
    : cost_basis(0.0), current_value(0.0), strike(0.0), quantity(0.0) {}

OptionPosition::OptionPosition(double cost, double value, double strike_price, double qty,
                               const std::string& expiry)
    : cost_basis(cost), current_value(value), strike(strike_price), quantity(qty),
      expiration_date(expiry) {}

bool OptionPosition::operator==(const OptionPosition& other) const {
    return cost_basis == other.cost_basis &&
           current_value == other.current_value &&
           strike == other.strike &&
           quantity == other.quantity &&
           expiration_date == other.expiration_date;
}

PositionKind position_kind(const ReferencePosition& position) {
    return std::holds_alternative<CreditPosition>(position) ? PositionKind::Credit
                                                            : PositionKind::Option;
}

double position_cost_basis(const ReferencePosition& position) {
    return std::visit([](const auto& p) { return p.cost_basis; }, position);
}

double position_current_value(const ReferencePosition& position) {
    return std::visit([](const auto& p) { return p.current_value; }, position);
}

// ============================================================================
// ReferencePortfolio
// ============================================================================

ReferencePortfolio::ReferencePortfolio() : master_cost_basis_(0.0) {}

ReferencePortfolio::ReferencePortfolio(std::vector<ReferencePosition> positions,
                                       double master_cost_basis)
    : positions_(std::move(positions)), master_cost_basis_(master_cost_basis) {}

size_t ReferencePortfolio::count(PositionKind kind) const {
    size_t n = 0;
    for (const auto& position : positions_) {
        if (position_kind(position) == kind) {
            ++n;
        }
    }
    return n;
}

double ReferencePortfolio::total_cost_basis() const {
    return std::accumulate(positions_.begin(), positions_.end(), 0.0,
                           [](double sum, const ReferencePosition& p) {
                               return sum + position_cost_basis(p);
                           });
}

void ReferencePortfolio::validate() const {
    if (!(master_cost_basis_ > 0.0)) {
        throw ValidationError("Reference portfolio: master cost basis must be > 0, got " +
                              std::to_string(master_cost_basis_));
    }
    if (count(PositionKind::Credit) == 0) {
        throw ValidationError("Reference portfolio: no Credit position");
    }
    if (count(PositionKind::Option) == 0) {
        throw ValidationError("Reference portfolio: no Option position");
    }
    for (const auto& position : positions_) {
        if (const auto* option = std::get_if<OptionPosition>(&position)) {
            if (!(option->strike > 0.0)) {
                throw ValidationError("Reference portfolio: option strike must be > 0, got " +
                                      std::to_string(option->strike));
            }
            if (!(option->quantity >= 0.0)) {
                throw ValidationError("Reference portfolio: option quantity must be >= 0, got " +
                                      std::to_string(option->quantity));
            }
        }
    }
}

ReferencePortfolio ReferencePortfolio::demo() {
    std::vector<ReferencePosition> positions;
    positions.emplace_back(CreditPosition(3489323.60, 3489323.60));
    positions.emplace_back(OptionPosition(3799992.87, 3126483.16, 563.22, 33871.0, "2036-01-15"));
    return ReferencePortfolio(std::move(positions), 7289316.47);
}

ReferencePortfolio ReferencePortfolio::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw PortfolioLoadError("Cannot open file: " + filepath);
    }
    return load_from_csv(file);
}

ReferencePortfolio ReferencePortfolio::load_from_csv(std::istream& is) {
    io::CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        throw PortfolioLoadError("Portfolio CSV is empty");
    }

    std::vector<ReferencePosition> positions;
    for (auto row = reader.read_row(); !row.empty(); row = reader.read_row()) {
        const size_t line = reader.line_number();
        if (row.size() < 3) {
            throw PortfolioLoadError("Line " + std::to_string(line) +
                                     ": expected at least 3 columns, got " +
                                     std::to_string(row.size()));
        }

        PositionKind kind = parse_kind(row[0], line);
        double cost = parse_number(row[1], "cost_basis", line);
        double value = parse_number(row[2], "current_value", line);

        if (kind == PositionKind::Credit) {
            positions.emplace_back(CreditPosition(cost, value));
            continue;
        }

        if (row.size() < 5 || row[3].empty() || row[4].empty()) {
            throw PortfolioLoadError("Line " + std::to_string(line) +
                                     ": Option row requires strike and quantity");
        }
        double strike = parse_number(row[3], "strike", line);
        double quantity = parse_number(row[4], "quantity", line);
        std::string expiry = row.size() > 5 ? row[5] : std::string();
        positions.emplace_back(OptionPosition(cost, value, strike, quantity, expiry));
    }

    ReferencePortfolio portfolio(std::move(positions), 0.0);
    portfolio.master_cost_basis_ = portfolio.total_cost_basis();

    // Comments are collected as the reader passes them, so check after the last row
    const std::string directive(MASTER_COST_BASIS_DIRECTIVE);
    for (const auto& comment : reader.comments()) {
        if (comment.text.compare(0, directive.size(), directive) == 0) {
            portfolio.master_cost_basis_ =
                parse_number(io::CsvReader::trim(comment.text.substr(directive.size())),
                             "master_cost_basis", comment.line);
        }
    }

    return portfolio;
}

} // namespace gsicalc
