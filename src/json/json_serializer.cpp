//! # JSON Serializer
//!
//! Compact and pretty printing of `JsonValue`.
//!
//! Strings are escaped per RFC 8259. Bytes >= 0x80 pass through unchanged,
//! since source text and paths are UTF-8. Empty containers print as `[]`
//! and `{}` in both forms.

#include "json/json_value.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>
#include <type_traits>

namespace semdiff::json {

namespace {

void write_escaped(std::ostream& os, const std::string& text) {
    os << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            os << "\\\"";
            break;
        case '\\':
            os << "\\\\";
            break;
        case '\b':
            os << "\\b";
            break;
        case '\f':
            os << "\\f";
            break;
        case '\n':
            os << "\\n";
            break;
        case '\r':
            os << "\\r";
            break;
        case '\t':
            os << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                os << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                   << static_cast<int>(c) << std::dec << std::setfill(' ');
            } else {
                os << c;
            }
        }
    }
    os << '"';
}

/// `indent == 0` selects the compact form.
class Printer {
public:
    Printer(std::ostream& os, int indent) : os_(os), indent_(indent) {}

    void print(const JsonValue& value, int depth) {
        std::visit(
            [&](const auto& v) {
                using V = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<V, JsonValue::Null>) {
                    os_ << "null";
                } else if constexpr (std::is_same_v<V, bool>) {
                    os_ << (v ? "true" : "false");
                } else if constexpr (std::is_same_v<V, std::string>) {
                    write_escaped(os_, v);
                } else if constexpr (std::is_same_v<V, Box<JsonArray>>) {
                    print_array(*v, depth);
                } else if constexpr (std::is_same_v<V, Box<JsonObject>>) {
                    print_object(*v, depth);
                } else {
                    os_ << v;
                }
            },
            value.data);
    }

private:
    std::ostream& os_;
    int indent_;

    void break_line(int depth) {
        if (indent_ > 0) {
            os_ << '\n' << std::string(static_cast<size_t>(depth * indent_), ' ');
        }
    }

    void print_array(const JsonArray& items, int depth) {
        if (items.empty()) {
            os_ << "[]";
            return;
        }
        os_ << '[';
        const char* separator = "";
        for (const auto& item : items) {
            os_ << separator;
            separator = ",";
            break_line(depth + 1);
            print(item, depth + 1);
        }
        break_line(depth);
        os_ << ']';
    }

    void print_object(const JsonObject& members, int depth) {
        if (members.empty()) {
            os_ << "{}";
            return;
        }
        os_ << '{';
        const char* separator = "";
        for (const auto& [key, value] : members) {
            os_ << separator;
            separator = ",";
            break_line(depth + 1);
            write_escaped(os_, key);
            os_ << (indent_ > 0 ? ": " : ":");
            print(value, depth + 1);
        }
        break_line(depth);
        os_ << '}';
    }
};

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::ostringstream os;
    Printer(os, 0).print(*this, 0);
    return os.str();
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::ostringstream os;
    write_pretty(os, indent);
    return os.str();
}

void JsonValue::write_pretty(std::ostream& os, int indent) const {
    Printer(os, indent > 0 ? indent : 2).print(*this, 0);
}

} // namespace semdiff::json
