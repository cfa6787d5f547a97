#pragma once

// JSON text output for canonical value trees.

#include <ostream>
#include <string>
#include <string_view>
#include "value.hpp"

namespace phijson {

// ============================================================================
// json_writer - indented, human-diffable JSON
// ============================================================================
//
// With indent > 0 every mapping entry sits on its own line, sequences of
// scalars stay on one line, and a document ends with a newline. With
// indent <= 0 the output is compact: no whitespace at all. Compact output is
// also the canonical sort key for set items.

class json_writer {
public:
    explicit json_writer(std::ostream& stream, int indent = 4)
        : os(stream), indent_size(indent) {}

    // Writes one complete document. Throws codec_error for non-finite floats,
    // which have no JSON spelling.
    void write(const value_t& value);

private:
    std::ostream& os;
    int indent_size;
    int indent_level = 0;

    auto pretty() const -> bool { return indent_size > 0; }

    void write_value(const value_t& value);
    void write_sequence(const sequence_t& items);
    void write_mapping(const mapping_t& members);
    void write_indent();
    void newline();

    static auto format_value(double value) -> std::string;
    static auto escape(std::string_view s) -> std::string;
};

// Convenience wrapper: the document as a string.
auto to_json(const value_t& value, int indent = 4) -> std::string;

} // namespace phijson
