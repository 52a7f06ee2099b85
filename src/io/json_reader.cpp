/**
 * JSON Reader Implementation: Recursive descent parser
 */

#include "io/json_reader.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace claro {

namespace {

const JsonValue& null_value() {
    static const JsonValue nil;
    return nil;
}

class Parser {
public:
    explicit Parser(const std::string& input) : src_(input) {}

    JsonValue parse_document() {
        skip_whitespace();
        JsonValue val = parse_value(0);
        skip_whitespace();
        if (pos_ < src_.size()) throw error("Trailing characters after document");
        return val;
    }

private:
    static constexpr int kMaxDepth = 64;

    const std::string& src_;
    size_t pos_ = 0;

    char peek() const {
        return pos_ < src_.size() ? src_[pos_] : '\0';
    }

    char advance() {
        if (pos_ >= src_.size()) throw error("Unexpected end of input");
        return src_[pos_++];
    }

    void expect(char c) {
        char got = advance();
        if (got != c) {
            throw error(std::string("Expected '") + c + "', got '" + got + "'");
        }
    }

    void skip_whitespace() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            pos_++;
        }
    }

    std::runtime_error error(const std::string& msg) const {
        int line = 1, col = 1;
        for (size_t i = 0; i < pos_ && i < src_.size(); i++) {
            if (src_[i] == '\n') { line++; col = 1; } else { col++; }
        }
        return std::runtime_error("JSON parse error at line " + std::to_string(line) +
                                  ", column " + std::to_string(col) + ": " + msg);
    }

    JsonValue parse_value(int depth) {
        if (depth > kMaxDepth) throw error("Nesting too deep");
        skip_whitespace();
        char c = peek();

        if (c == '"') return JsonValue(parse_string());
        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
        if (match_literal("true")) return JsonValue(true);
        if (match_literal("false")) return JsonValue(false);
        if (match_literal("null")) return JsonValue();

        if (c == '\0') throw error("Unexpected end of input");
        throw error(std::string("Unexpected character '") + c + "'");
    }

    bool match_literal(const char* lit) {
        std::string s(lit);
        if (src_.compare(pos_, s.size(), s) == 0) {
            pos_ += s.size();
            return true;
        }
        return false;
    }

    void append_utf8(std::string& out, unsigned long code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    std::string parse_string() {
        expect('"');
        std::string result;
        while (true) {
            if (pos_ >= src_.size()) throw error("Unterminated string");
            char c = src_[pos_++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) throw error("Control character in string");
            if (c != '\\') {
                result += c;
                continue;
            }

            char esc = advance();
            switch (esc) {
                case '"':  result += '"';  break;
                case '\\': result += '\\'; break;
                case '/':  result += '/';  break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    if (pos_ + 4 > src_.size()) throw error("Incomplete \\u escape");
                    std::string hex = src_.substr(pos_, 4);
                    for (char h : hex) {
                        if (!std::isxdigit(static_cast<unsigned char>(h))) {
                            throw error("Invalid \\u escape");
                        }
                    }
                    pos_ += 4;
                    append_utf8(result, std::strtoul(hex.c_str(), nullptr, 16));
                    break;
                }
                default:
                    throw error(std::string("Unknown escape: \\") + esc);
            }
        }
        return result;
    }

    void skip_digits() {
        while (std::isdigit(static_cast<unsigned char>(peek()))) pos_++;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') pos_++;

        if (peek() == '0') {
            pos_++;
        } else if (std::isdigit(static_cast<unsigned char>(peek()))) {
            skip_digits();
        } else {
            throw error("Expected digit in number");
        }

        if (peek() == '.') {
            pos_++;
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                throw error("Expected digit after decimal point");
            }
            skip_digits();
        }

        if (peek() == 'e' || peek() == 'E') {
            pos_++;
            if (peek() == '+' || peek() == '-') pos_++;
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                throw error("Expected digit in exponent");
            }
            skip_digits();
        }

        return JsonValue(std::strtod(src_.substr(start, pos_ - start).c_str(), nullptr));
    }

    JsonValue parse_object(int depth) {
        expect('{');
        JsonValue obj = JsonValue::make_object();

        skip_whitespace();
        if (peek() == '}') {
            pos_++;
            return obj;
        }

        while (true) {
            skip_whitespace();
            std::string key = parse_string();
            skip_whitespace();
            expect(':');
            JsonValue val = parse_value(depth + 1);
            if (!obj.add_member(key, std::move(val))) {
                throw error("Duplicate key '" + key + "'");
            }

            skip_whitespace();
            if (peek() != ',') break;
            pos_++;
        }

        skip_whitespace();
        expect('}');
        return obj;
    }

    JsonValue parse_array(int depth) {
        expect('[');
        JsonValue arr = JsonValue::make_array();

        skip_whitespace();
        if (peek() == ']') {
            pos_++;
            return arr;
        }

        while (true) {
            arr.add_element(parse_value(depth + 1));
            skip_whitespace();
            if (peek() != ',') break;
            pos_++;
        }

        skip_whitespace();
        expect(']');
        return arr;
    }
};

}  // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// JsonValue accessors
// ═══════════════════════════════════════════════════════════════

bool JsonValue::as_bool() const {
    if (!is_bool()) throw std::runtime_error("JsonValue: not a bool");
    return bool_val_;
}

double JsonValue::as_number() const {
    if (!is_number()) throw std::runtime_error("JsonValue: not a number");
    return num_val_;
}

const std::string& JsonValue::as_string() const {
    if (!is_string()) throw std::runtime_error("JsonValue: not a string");
    return str_val_;
}

const std::map<std::string, JsonValue>& JsonValue::as_object() const {
    if (!is_object()) throw std::runtime_error("JsonValue: not an object");
    return obj_map_;
}

const std::vector<JsonValue>& JsonValue::as_array() const {
    if (!is_array()) throw std::runtime_error("JsonValue: not an array");
    return arr_val_;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    if (!is_object()) return null_value();
    auto it = obj_map_.find(key);
    return it == obj_map_.end() ? null_value() : it->second;
}

const JsonValue& JsonValue::operator[](size_t index) const {
    if (!is_array() || index >= arr_val_.size()) return null_value();
    return arr_val_[index];
}

// ═══════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════

JsonValue JsonReader::parse(const std::string& json) {
    Parser parser(json);
    return parser.parse_document();
}

JsonValue JsonReader::parse_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open JSON file: " + filename);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    try {
        return parse(ss.str());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(filename + ": " + e.what());
    }
}

}  // namespace claro
