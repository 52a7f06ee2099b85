/**
 * Lightweight JSON Writer (header-only)
 *
 * Streams well-formed, indented JSON to an ostream. Used for run summaries.
 *
 * Usage:
 *   JsonWriter w(out);
 *   w.begin_object();
 *     w.kv("runs", 10);
 *     w.key("seeds").begin_array();
 *       w.value(123); w.value(124);
 *     w.end_array();
 *   w.end_object();
 */

#ifndef CLARO_JSON_WRITER_HPP
#define CLARO_JSON_WRITER_HPP

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace claro {

class JsonWriter {
public:
    explicit JsonWriter(std::ostream& os, int indent_size = 2)
        : os_(os), indent_size_(indent_size) {}

    // ── Structure ──

    JsonWriter& begin_object() { return open('{', OBJECT); }
    JsonWriter& end_object()   { return close('}', OBJECT); }
    JsonWriter& begin_array()  { return open('[', ARRAY); }
    JsonWriter& end_array()    { return close(']', ARRAY); }

    JsonWriter& key(const std::string& k) {
        if (stack_.empty() || stack_.back().type != OBJECT || after_key_) {
            throw std::logic_error("JsonWriter: key() outside of an object");
        }
        separator();
        write_string(k);
        os_ << ": ";
        after_key_ = true;
        return *this;
    }

    // ── Values ──

    JsonWriter& value(const std::string& v) { prefix(); write_string(v); return *this; }
    JsonWriter& value(const char* v)        { return value(std::string(v)); }
    JsonWriter& value(bool v)               { prefix(); os_ << (v ? "true" : "false"); return *this; }
    JsonWriter& value(int v)                { prefix(); os_ << v; return *this; }
    JsonWriter& value(int64_t v)            { prefix(); os_ << v; return *this; }
    JsonWriter& value(uint64_t v)           { prefix(); os_ << v; return *this; }

    JsonWriter& value(double v) {
        prefix();
        if (!std::isfinite(v)) {
            os_ << "null";
        } else {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.15g", v);
            os_ << buf;
        }
        return *this;
    }

    JsonWriter& null_value() { prefix(); os_ << "null"; return *this; }

    template<typename T>
    JsonWriter& kv(const std::string& k, const T& v) {
        key(k);
        return value(v);
    }

private:
    enum ScopeType { OBJECT, ARRAY };

    struct Scope {
        ScopeType type;
        int count;
    };

    std::ostream& os_;
    int indent_size_;
    std::vector<Scope> stack_;
    bool after_key_ = false;

    JsonWriter& open(char c, ScopeType type) {
        prefix();
        os_ << c;
        stack_.push_back({type, 0});
        return *this;
    }

    JsonWriter& close(char c, ScopeType type) {
        if (stack_.empty() || stack_.back().type != type || after_key_) {
            throw std::logic_error("JsonWriter: mismatched close");
        }
        bool had_items = stack_.back().count > 0;
        stack_.pop_back();
        if (had_items) newline();
        os_ << c;
        return *this;
    }

    // Before any value: in an array emit the separator, in an object a key
    // must have come first.
    void prefix() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        if (!stack_.empty()) {
            if (stack_.back().type == OBJECT) {
                throw std::logic_error("JsonWriter: value in object without key");
            }
            separator();
        }
    }

    void separator() {
        Scope& s = stack_.back();
        if (s.count > 0) os_ << ',';
        newline();
        s.count++;
    }

    void newline() {
        os_ << '\n';
        for (size_t i = 0; i < stack_.size() * static_cast<size_t>(indent_size_); i++) {
            os_ << ' ';
        }
    }

    void write_string(const std::string& s) {
        os_ << '"';
        for (char c : s) {
            switch (c) {
                case '"':  os_ << "\\\""; break;
                case '\\': os_ << "\\\\"; break;
                case '\b': os_ << "\\b";  break;
                case '\f': os_ << "\\f";  break;
                case '\n': os_ << "\\n";  break;
                case '\r': os_ << "\\r";  break;
                case '\t': os_ << "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                        os_ << buf;
                    } else {
                        os_ << c;
                    }
                    break;
            }
        }
        os_ << '"';
    }
};

}  // namespace claro

#endif  // CLARO_JSON_WRITER_HPP
