#pragma once

// JSON text input for canonical value trees.

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include "value.hpp"

namespace phijson {

// ============================================================================
// json_reader - strict JSON parser producing value_t
// ============================================================================
//
// Integers without fraction or exponent become int values, everything else
// numeric becomes a float. Duplicate keys and trailing content are errors.
// All failures are parse_error with the line and column of the offending
// character.

class json_reader {
public:
    explicit json_reader(std::istream& stream) : is(stream) {}

    // Reads one complete document; only whitespace may follow it.
    auto read() -> value_t;

private:
    std::istream& is;
    int line = 1;
    int column = 1;

    auto peek() -> int { return is.peek(); }
    auto get() -> char;
    auto at_end() -> bool { return peek() == std::char_traits<char>::eof(); }

    void skip_ws();
    void expect(char c);
    [[noreturn]] void fail(const std::string& reason) const;

    auto read_value() -> value_t;
    auto read_mapping() -> value_t;
    auto read_sequence() -> value_t;
    auto read_literal() -> value_t;
    auto read_number() -> value_t;
    auto read_quoted_string() -> std::string;
    auto read_hex4() -> std::uint32_t;
};

// Convenience wrapper: parse a complete document held in a string.
auto from_json(std::string_view text) -> value_t;

} // namespace phijson
