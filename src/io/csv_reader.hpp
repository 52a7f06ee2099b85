/**
 * CSV Reader
 *
 * Parses a delimited text table with a header row into memory. Supports
 * quoted fields (with "" escapes and embedded delimiters/newlines), CRLF line
 * endings and a leading UTF-8 BOM. Blank lines are skipped.
 */

#ifndef CLARO_CSV_READER_HPP
#define CLARO_CSV_READER_HPP

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace claro {

struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    std::optional<size_t> column_index(const std::string& name) const;
};

class CsvReader {
public:
    /**
     * @throws std::runtime_error on an empty input, an unterminated quote, or
     *         a row whose field count differs from the header
     */
    static CsvTable read(std::istream& in, char delimiter = ',');

    /**
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static CsvTable read_file(const std::string& path, char delimiter = ',');
};

}  // namespace claro

#endif  // CLARO_CSV_READER_HPP
