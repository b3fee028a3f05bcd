#ifndef SCHOOLGOV_CSV_READER_HPP
#define SCHOOLGOV_CSV_READER_HPP

#include <string>
#include <vector>
#include <istream>

namespace schoolgov {

// Line-oriented CSV reader. Fields may be double-quoted; a quoted field may
// contain the delimiter and "" as an escaped quote, but not a line break.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

    // 1-based number of the line last returned by read_row()
    size_t line_number() const { return line_number_; }

    // Index of a header column (case-insensitive), or -1 when absent
    static int column_index(const std::vector<std::string>& header, const std::string& name);

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace schoolgov

#endif // SCHOOLGOV_CSV_READER_HPP
