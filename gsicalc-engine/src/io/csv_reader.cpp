#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace gsicalc {
namespace io {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

bool CsvReader::next_data_line(std::string& line) {
    while (std::getline(is_, line)) {
        ++line_number_;
        std::string trimmed = trim(line);
        if (trimmed.empty()) {
            continue;
        }
        if (trimmed[0] == '#') {
            comments_.push_back({line_number_, trim(trimmed.substr(1))});
            continue;
        }
        line = trimmed;
        return true;
    }
    return false;
}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    std::string line;

    if (!next_data_line(line)) {
        return row;
    }

    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, delimiter_)) {
        row.push_back(trim(cell));
    }
    // "a,b," has a trailing empty cell that getline drops
    if (!line.empty() && line.back() == delimiter_) {
        row.emplace_back();
    }

    return row;
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace io
} // namespace gsicalc
