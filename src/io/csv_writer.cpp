#include "io/csv_writer.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace claro {

CsvWriter& CsvWriter::write_header(const std::vector<std::string>& columns) {
    if (columns.empty()) {
        throw std::logic_error("CsvWriter: cannot write a header with no columns");
    }
    if (n_columns_ != 0) {
        throw std::logic_error("CsvWriter: header already written");
    }

    for (size_t i = 0; i < columns.size(); i++) {
        if (i > 0) os_ << delimiter_;
        write_escaped(columns[i]);
    }
    os_ << '\n';
    n_columns_ = columns.size();
    return *this;
}

void CsvWriter::begin_field() {
    if (n_columns_ == 0) {
        throw std::logic_error("CsvWriter: no schema, write_header() must come first");
    }
    if (fields_in_row_ >= n_columns_) {
        throw std::logic_error("CsvWriter: row has more fields than the header");
    }
    if (fields_in_row_ > 0) os_ << delimiter_;
    fields_in_row_++;
}

CsvWriter& CsvWriter::field(const std::string& v) {
    begin_field();
    write_escaped(v);
    return *this;
}

CsvWriter& CsvWriter::field(int v) {
    begin_field();
    os_ << v;
    return *this;
}

CsvWriter& CsvWriter::field(double v, int decimals) {
    begin_field();
    os_ << format_number(v, decimals);
    return *this;
}

CsvWriter& CsvWriter::end_row() {
    if (n_columns_ == 0) {
        throw std::logic_error("CsvWriter: no schema, write_header() must come first");
    }
    if (fields_in_row_ != n_columns_) {
        throw std::logic_error("CsvWriter: row has " + std::to_string(fields_in_row_) +
                               " fields, header has " + std::to_string(n_columns_));
    }
    os_ << '\n';
    fields_in_row_ = 0;
    rows_++;
    return *this;
}

std::string CsvWriter::format_number(double v, int decimals) {
    if (std::isnan(v)) return "";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";

    char buf[64];
    if (decimals < 0) {
        // Shortest of 15..17 significant digits that reads back exactly
        for (int prec = 15; prec <= 17; prec++) {
            std::snprintf(buf, sizeof(buf), "%.*g", prec, v);
            if (std::strtod(buf, nullptr) == v) break;
        }
        std::string s(buf);
        if (s.find_first_of(".eE") == std::string::npos) s += ".0";
        return s;
    }

    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    std::string s(buf);

    // Trim trailing zeros, keep one digit after the point
    size_t dot = s.find('.');
    if (dot == std::string::npos) {
        s += ".0";
    } else {
        size_t last = s.find_last_not_of('0');
        if (last == dot) last++;
        s.erase(last + 1);
    }

    if (s == "-0.0") s = "0.0";
    return s;
}

void CsvWriter::write_escaped(const std::string& s) {
    bool needs_quotes = s.find_first_of(std::string(1, delimiter_) + "\"\r\n") != std::string::npos;
    if (!needs_quotes) {
        os_ << s;
        return;
    }

    os_ << '"';
    for (char c : s) {
        if (c == '"') os_ << '"';
        os_ << c;
    }
    os_ << '"';
}

std::ofstream open_output_file(const std::string& path) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " +
                                     p.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    return out;
}

}  // namespace claro
