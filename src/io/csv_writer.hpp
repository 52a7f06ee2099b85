/**
 * Lightweight CSV Writer
 *
 * Writes RFC 4180-style delimited rows to an ostream. The header fixes the
 * schema: every row must carry exactly one field per header column, and no
 * row can be written before a header exists.
 *
 * Usage:
 *   CsvWriter w(out);
 *   w.write_header({"timestamp", "Y_kwh"});
 *   w.field("2025-01-01T00:00:00").field(8.1234, 4).end_row();
 */

#ifndef CLARO_CSV_WRITER_HPP
#define CLARO_CSV_WRITER_HPP

#include <fstream>
#include <ostream>
#include <string>
#include <vector>

namespace claro {

class CsvWriter {
public:
    explicit CsvWriter(std::ostream& os, char delimiter = ',')
        : os_(os), delimiter_(delimiter) {}

    /**
     * Write the header row.
     * @throws std::logic_error if columns is empty or a header was already written
     */
    CsvWriter& write_header(const std::vector<std::string>& columns);

    CsvWriter& field(const std::string& v);
    CsvWriter& field(const char* v) { return field(std::string(v)); }
    CsvWriter& field(int v);

    /**
     * Numeric field. decimals < 0 writes full precision; otherwise the value
     * is rounded to that many places and printed in its shortest form with
     * at least one decimal ("1.0", "12.345"). NaN is written as an empty field.
     */
    CsvWriter& field(double v, int decimals = -1);

    /**
     * Terminate the current row.
     * @throws std::logic_error if the field count does not match the header
     */
    CsvWriter& end_row();

    size_t rows_written() const { return rows_; }
    size_t columns() const { return n_columns_; }

    /** Format a double the way field(double, decimals) does. */
    static std::string format_number(double v, int decimals = -1);

private:
    std::ostream& os_;
    char delimiter_;
    size_t n_columns_ = 0;
    size_t fields_in_row_ = 0;
    size_t rows_ = 0;

    void begin_field();
    void write_escaped(const std::string& s);
};

/**
 * Open path for writing, creating missing parent directories.
 * @throws std::runtime_error if the file cannot be opened
 */
std::ofstream open_output_file(const std::string& path);

}  // namespace claro

#endif  // CLARO_CSV_WRITER_HPP
