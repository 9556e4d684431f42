#ifndef AMORTCALC_CSV_READER_HPP
#define AMORTCALC_CSV_READER_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <istream>

namespace amortcalc {

// Line-oriented delimited reader. Fields may be wrapped in double quotes,
// in which case the delimiter is literal and "" is an escaped quote.
// Unquoted fields are trimmed.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next row; an empty vector at end of input
    std::vector<std::string> read_row();
    bool has_more() const;

    // 1-based number of the last line read
    size_t line_number() const { return line_number_; }

    static std::vector<std::string> split(const std::string& line, char delimiter);

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    static std::string trim(const std::string& s);
};

} // namespace amortcalc

#endif // AMORTCALC_CSV_READER_HPP
