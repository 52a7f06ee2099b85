#include "io/csv_reader.hpp"
#include <fstream>
#include <stdexcept>

namespace claro {

std::optional<size_t> CsvTable::column_index(const std::string& name) const {
    for (size_t i = 0; i < header.size(); i++) {
        if (header[i] == name) return i;
    }
    return std::nullopt;
}

namespace {

class RecordParser {
public:
    RecordParser(std::istream& in, char delimiter) : in_(in), delim_(delimiter) {}

    /**
     * Read one record. Returns false at end of input.
     * Records made only of an empty line are skipped.
     */
    bool next(std::vector<std::string>& fields) {
        while (true) {
            fields.clear();
            if (in_.peek() == std::char_traits<char>::eof()) return false;

            record_line_ = line_;
            bool blank = parse_record(fields);
            if (!blank) return true;
        }
    }

    size_t record_line() const { return record_line_; }

private:
    std::istream& in_;
    char delim_;
    size_t line_ = 1;
    size_t record_line_ = 1;

    // Returns true when the record was a blank line.
    bool parse_record(std::vector<std::string>& fields) {
        std::string cur;
        bool in_quotes = false;
        bool any_content = false;
        int ch;

        while ((ch = in_.get()) != std::char_traits<char>::eof()) {
            char c = static_cast<char>(ch);

            if (in_quotes) {
                if (c == '"') {
                    if (in_.peek() == '"') {
                        in_.get();
                        cur += '"';
                    } else {
                        in_quotes = false;
                    }
                } else {
                    if (c == '\n') line_++;
                    cur += c;
                }
                continue;
            }

            if (c == '"') {
                in_quotes = true;
                any_content = true;
            } else if (c == delim_) {
                fields.push_back(std::move(cur));
                cur.clear();
                any_content = true;
            } else if (c == '\r') {
                // swallow; '\n' terminates
            } else if (c == '\n') {
                line_++;
                break;
            } else {
                cur += c;
                any_content = true;
            }
        }

        if (in_quotes) {
            throw std::runtime_error("CSV: unterminated quoted field starting on line " +
                                     std::to_string(record_line_));
        }
        if (!any_content) return true;

        fields.push_back(std::move(cur));
        return false;
    }
};

}  // anonymous namespace

CsvTable CsvReader::read(std::istream& in, char delimiter) {
    // UTF-8 BOM
    if (in.peek() == 0xEF) {
        char bom[3];
        in.read(bom, 3);
        if (in.gcount() != 3 ||
            !(static_cast<unsigned char>(bom[1]) == 0xBB &&
              static_cast<unsigned char>(bom[2]) == 0xBF)) {
            throw std::runtime_error("CSV: invalid byte sequence at start of input");
        }
    }

    RecordParser parser(in, delimiter);
    CsvTable table;

    if (!parser.next(table.header)) {
        throw std::runtime_error("CSV: input is empty (no header row)");
    }

    std::vector<std::string> fields;
    while (parser.next(fields)) {
        if (fields.size() != table.header.size()) {
            throw std::runtime_error("CSV: line " + std::to_string(parser.record_line()) +
                                     " has " + std::to_string(fields.size()) +
                                     " fields, header has " +
                                     std::to_string(table.header.size()));
        }
        table.rows.push_back(fields);
    }

    return table;
}

CsvTable CsvReader::read_file(const std::string& path, char delimiter) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open CSV file: " + path);
    }

    try {
        return read(file, delimiter);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

}  // namespace claro
