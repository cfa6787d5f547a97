// json_writer.cpp - JSON text output

#include <charconv>
#include <cmath>
#include <cstdio>
#include <sstream>
#include "phijson/errors.hpp"
#include "phijson/json_writer.hpp"

namespace phijson {

namespace {

auto is_scalar(const value_t& v) -> bool {
    return !v.is_sequence() && !v.is_mapping();
}

} // namespace

void json_writer::write(const value_t& value) {
    indent_level = 0;
    write_value(value);
    if (pretty()) {
        os << "\n";
    }
}

void json_writer::write_value(const value_t& value) {
    std::visit([this](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, null_t>) {
            os << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            os << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            os << v;
        } else if constexpr (std::is_same_v<T, double>) {
            os << format_value(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            os << "\"" << escape(v) << "\"";
        } else if constexpr (std::is_same_v<T, sequence_t>) {
            write_sequence(v);
        } else {
            write_mapping(v);
        }
    }, value.data);
}

void json_writer::write_sequence(const sequence_t& items) {
    if (items.empty()) {
        os << "[]";
        return;
    }
    bool inline_items = !pretty();
    if (!inline_items) {
        inline_items = true;
        for (const auto& item : items) {
            if (!is_scalar(item)) {
                inline_items = false;
                break;
            }
        }
    }

    os << "[";
    if (inline_items) {
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i > 0) os << (pretty() ? ", " : ",");
            write_value(items[i]);
        }
        os << "]";
        return;
    }

    indent_level++;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) os << ",";
        newline();
        write_indent();
        write_value(items[i]);
    }
    indent_level--;
    newline();
    write_indent();
    os << "]";
}

void json_writer::write_mapping(const mapping_t& members) {
    if (members.empty()) {
        os << "{}";
        return;
    }
    os << "{";
    indent_level++;
    bool first = true;
    for (const auto& m : members) {
        if (!first) os << ",";
        first = false;
        newline();
        write_indent();
        os << "\"" << escape(m.key) << "\"" << (pretty() ? ": " : ":");
        write_value(m.value);
    }
    indent_level--;
    newline();
    write_indent();
    os << "}";
}

void json_writer::write_indent() {
    if (!pretty()) {
        return;
    }
    for (int i = 0; i < indent_level * indent_size; ++i) {
        os << ' ';
    }
}

void json_writer::newline() {
    if (pretty()) {
        os << "\n";
    }
}

// Shortest representation that reads back to the same double. A '.0' is
// appended to integral values so floats stay distinguishable from ints.
auto json_writer::format_value(double value) -> std::string {
    if (!std::isfinite(value)) {
        throw codec_error("non-finite float cannot be written as JSON");
    }
    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc{}) {
        throw codec_error("failed to format float");
    }
    auto s = std::string(buffer, end);
    if (s.find('.') == std::string::npos && s.find('e') == std::string::npos) {
        s += ".0";
    }
    return s;
}

auto json_writer::escape(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '\\': result += "\\\\"; break;
            case '"':  result += "\\\""; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char code[8];
                    std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    result += code;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

auto to_json(const value_t& value, int indent) -> std::string {
    auto oss = std::ostringstream{};
    auto writer = json_writer(oss, indent);
    writer.write(value);
    return oss.str();
}

} // namespace phijson
