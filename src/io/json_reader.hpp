/**
 * Lightweight JSON Reader
 *
 * Recursive-descent parser for configuration and scenario files.
 * Produces a tree of JsonValue nodes; object members keep sorted key order
 * so iteration (and therefore error reporting) is deterministic.
 *
 * Usage:
 *   auto root = JsonReader::parse_file("scenario.json");
 *   int runs = root["runs"].get_int(10);
 *   for (const auto& v : root["variants"].as_array()) { ... }
 */

#ifndef CLARO_JSON_READER_HPP
#define CLARO_JSON_READER_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace claro {

enum class JsonType {
    NIL,
    BOOL,
    NUMBER,
    STRING,
    OBJECT,
    ARRAY
};

class JsonValue {
public:
    JsonValue() = default;
    explicit JsonValue(bool v) : type_(JsonType::BOOL), bool_val_(v) {}
    explicit JsonValue(double v) : type_(JsonType::NUMBER), num_val_(v) {}
    explicit JsonValue(std::string v) : type_(JsonType::STRING), str_val_(std::move(v)) {}

    static JsonValue make_object() { JsonValue v; v.type_ = JsonType::OBJECT; return v; }
    static JsonValue make_array()  { JsonValue v; v.type_ = JsonType::ARRAY;  return v; }

    JsonType type() const { return type_; }

    bool is_null()   const { return type_ == JsonType::NIL; }
    bool is_bool()   const { return type_ == JsonType::BOOL; }
    bool is_number() const { return type_ == JsonType::NUMBER; }
    bool is_string() const { return type_ == JsonType::STRING; }
    bool is_object() const { return type_ == JsonType::OBJECT; }
    bool is_array()  const { return type_ == JsonType::ARRAY; }

    // Strict accessors (throw on type mismatch)
    bool as_bool() const;
    double as_number() const;
    const std::string& as_string() const;
    const std::map<std::string, JsonValue>& as_object() const;
    const std::vector<JsonValue>& as_array() const;

    // Lenient accessors (default on type mismatch)
    bool get_bool(bool def = false) const { return is_bool() ? bool_val_ : def; }
    double get_number(double def = 0.0) const { return is_number() ? num_val_ : def; }
    int get_int(int def = 0) const { return is_number() ? static_cast<int>(num_val_) : def; }
    std::string get_string(const std::string& def = "") const { return is_string() ? str_val_ : def; }

    /** Member lookup; null value when absent or not an object. */
    const JsonValue& operator[](const std::string& key) const;

    /** Element lookup; null value when out of range or not an array. */
    const JsonValue& operator[](size_t index) const;

    bool has(const std::string& key) const {
        return is_object() && obj_map_.count(key) > 0;
    }

    size_t size() const {
        if (is_array()) return arr_val_.size();
        if (is_object()) return obj_map_.size();
        return 0;
    }

    /** @return false when key already exists */
    bool add_member(const std::string& key, JsonValue&& val) {
        return obj_map_.emplace(key, std::move(val)).second;
    }

    void add_element(JsonValue&& val) {
        arr_val_.push_back(std::move(val));
    }

private:
    JsonType type_ = JsonType::NIL;
    bool bool_val_ = false;
    double num_val_ = 0.0;
    std::string str_val_;
    std::map<std::string, JsonValue> obj_map_;
    std::vector<JsonValue> arr_val_;
};

class JsonReader {
public:
    /**
     * Parse a JSON document. Trailing non-whitespace and duplicate object
     * keys are errors.
     * @throws std::runtime_error with line:column on parse errors
     */
    static JsonValue parse(const std::string& json);

    /**
     * Parse a JSON file.
     * @throws std::runtime_error on file or parse errors
     */
    static JsonValue parse_file(const std::string& filename);
};

}  // namespace claro

#endif  // CLARO_JSON_READER_HPP
