#ifndef GSICALC_IO_CSV_READER_HPP
#define GSICALC_IO_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace gsicalc {
namespace io {

// A '#' comment line and where it was read
struct CsvComment {
    size_t line;
    std::string text;
};

// Line-oriented CSV reader. Cells are whitespace-trimmed; quoting is not
// supported. Blank lines are skipped. Lines whose first non-blank character
// is '#' are comments: they are skipped by read_row() and collected in
// comments() so callers can read directives from them.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next data row, or an empty vector at end of input
    std::vector<std::string> read_row();

    // 1-based line number of the row last returned by read_row()
    size_t line_number() const { return line_number_; }

    // Comment lines seen so far, text without the leading '#', trimmed
    const std::vector<CsvComment>& comments() const { return comments_; }

    static std::string trim(const std::string& s);

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;
    std::vector<CsvComment> comments_;

    bool next_data_line(std::string& line);
};

} // namespace io
} // namespace gsicalc

#endif // GSICALC_IO_CSV_READER_HPP
