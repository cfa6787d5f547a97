// json_reader.cpp - JSON text input

#include <cctype>
#include <charconv>
#include <sstream>
#include "phijson/errors.hpp"
#include "phijson/json_reader.hpp"

namespace phijson {

namespace {

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto describe(int c) -> std::string {
    if (c == std::char_traits<char>::eof()) {
        return "end of input";
    }
    return std::string("'") + static_cast<char>(c) + "'";
}

} // namespace

auto json_reader::read() -> value_t {
    auto value = read_value();
    skip_ws();
    if (!at_end()) {
        fail("unexpected " + describe(peek()) + " after document");
    }
    return value;
}

auto json_reader::get() -> char {
    auto c = static_cast<char>(is.get());
    if (c == '\n') {
        line++;
        column = 1;
    } else {
        column++;
    }
    return c;
}

void json_reader::skip_ws() {
    while (!at_end()) {
        auto c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        get();
    }
}

void json_reader::expect(char c) {
    skip_ws();
    if (peek() != c) {
        fail(std::string("expected '") + c + "', found " + describe(peek()));
    }
    get();
}

void json_reader::fail(const std::string& reason) const {
    throw parse_error(reason, line, column);
}

auto json_reader::read_value() -> value_t {
    skip_ws();
    int c = peek();
    if (c == '{') return read_mapping();
    if (c == '[') return read_sequence();
    if (c == '"') return value_t(read_quoted_string());
    if (c == '-' || std::isdigit(c)) return read_number();
    if (std::isalpha(c)) return read_literal();
    fail("unexpected " + describe(c));
}

auto json_reader::read_mapping() -> value_t {
    expect('{');
    auto members = mapping_t{};
    skip_ws();
    if (peek() == '}') {
        get();
        return value_t(std::move(members));
    }
    while (true) {
        skip_ws();
        if (peek() != '"') {
            fail("expected string key, found " + describe(peek()));
        }
        int key_line = line;
        int key_column = column;
        auto key = read_quoted_string();
        if (members.contains(key)) {
            throw parse_error("duplicate key '" + key + "'", key_line, key_column);
        }
        expect(':');
        auto value = read_value();
        members.insert(std::move(key), std::move(value));
        skip_ws();
        if (peek() == ',') { get(); continue; }
        if (peek() == '}') { get(); break; }
        fail("expected ',' or '}', found " + describe(peek()));
    }
    return value_t(std::move(members));
}

auto json_reader::read_sequence() -> value_t {
    expect('[');
    auto items = sequence_t{};
    skip_ws();
    if (peek() == ']') {
        get();
        return value_t(std::move(items));
    }
    while (true) {
        items.push_back(read_value());
        skip_ws();
        if (peek() == ',') { get(); continue; }
        if (peek() == ']') { get(); break; }
        fail("expected ',' or ']', found " + describe(peek()));
    }
    return value_t(std::move(items));
}

auto json_reader::read_literal() -> value_t {
    std::string word;
    while (!at_end() && std::isalpha(peek())) {
        word += get();
    }
    if (word == "null") return value_t(null_t{});
    if (word == "true") return value_t(true);
    if (word == "false") return value_t(false);
    fail("unknown literal '" + word + "'");
}

auto json_reader::read_number() -> value_t {
    int start_column = column;
    std::string token;
    bool is_integer = true;
    while (!at_end()) {
        int c = peek();
        if (std::isdigit(c) || c == '-' || c == '+') {
            token += get();
        } else if (c == '.' || c == 'e' || c == 'E') {
            is_integer = false;
            token += get();
        } else {
            break;
        }
    }

    // JSON grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
    std::size_t i = 0;
    auto digits = [&token, &i]() {
        auto n = std::size_t{0};
        while (i < token.size() && std::isdigit(static_cast<unsigned char>(token[i]))) { ++i; ++n; }
        return n;
    };
    bool valid = true;
    if (i < token.size() && token[i] == '-') ++i;
    auto int_start = i;
    auto int_digits = digits();
    valid = int_digits > 0 && !(int_digits > 1 && token[int_start] == '0');
    if (valid && i < token.size() && token[i] == '.') {
        ++i;
        valid = digits() > 0;
    }
    if (valid && i < token.size() && (token[i] == 'e' || token[i] == 'E')) {
        ++i;
        if (i < token.size() && (token[i] == '+' || token[i] == '-')) ++i;
        valid = digits() > 0;
    }
    if (!valid || i != token.size()) {
        throw parse_error("malformed number '" + token + "'", line, start_column);
    }

    const char* first = token.data();
    const char* last = token.data() + token.size();
    if (is_integer) {
        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc::result_out_of_range) {
            throw parse_error("integer out of range '" + token + "'", line, start_column);
        }
        if (ec != std::errc{} || ptr != last) {
            throw parse_error("malformed number '" + token + "'", line, start_column);
        }
        return value_t(value);
    }
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc::result_out_of_range) {
        throw parse_error("float out of range '" + token + "'", line, start_column);
    }
    if (ec != std::errc{} || ptr != last) {
        throw parse_error("malformed number '" + token + "'", line, start_column);
    }
    return value_t(value);
}

auto json_reader::read_quoted_string() -> std::string {
    expect('"');
    std::string result;
    while (true) {
        if (at_end()) {
            fail("unterminated string");
        }
        char c = get();
        if (c == '"') break;
        if (static_cast<unsigned char>(c) < 0x20) {
            fail("control character in string");
        }
        if (c != '\\') {
            result += c;
            continue;
        }
        if (at_end()) {
            fail("unterminated escape");
        }
        char next = get();
        switch (next) {
            case '\\': result += '\\'; break;
            case '"':  result += '"'; break;
            case '/':  result += '/'; break;
            case 'b':  result += '\b'; break;
            case 'f':  result += '\f'; break;
            case 'n':  result += '\n'; break;
            case 't':  result += '\t'; break;
            case 'r':  result += '\r'; break;
            case 'u': {
                auto cp = read_hex4();
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (get() != '\\' || get() != 'u') {
                        fail("unpaired surrogate in \\u escape");
                    }
                    auto low = read_hex4();
                    if (low < 0xDC00 || low > 0xDFFF) {
                        fail("invalid low surrogate in \\u escape");
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    fail("unpaired surrogate in \\u escape");
                }
                append_utf8(result, cp);
                break;
            }
            default:
                fail(std::string("invalid escape '\\") + next + "'");
        }
    }
    return result;
}

auto json_reader::read_hex4() -> std::uint32_t {
    std::uint32_t cp = 0;
    for (int k = 0; k < 4; ++k) {
        int c = peek();
        if (!std::isxdigit(c)) {
            fail("expected hex digit in \\u escape, found " + describe(c));
        }
        get();
        cp <<= 4;
        if (c >= '0' && c <= '9') cp |= static_cast<std::uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') cp |= static_cast<std::uint32_t>(c - 'a' + 10);
        else cp |= static_cast<std::uint32_t>(c - 'A' + 10);
    }
    return cp;
}

auto from_json(std::string_view text) -> value_t {
    auto iss = std::istringstream{std::string(text)};
    auto reader = json_reader(iss);
    return reader.read();
}

} // namespace phijson
