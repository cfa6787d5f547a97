#pragma once

// Canonical value tree: the closed set of shapes the JSON wire format can
// express. Encoders produce value_t trees, the text layer reads and writes
// them, decoders consume them.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace phijson {

struct value_t;
struct member_t;

using null_t = std::monostate;
using sequence_t = std::vector<value_t>;

// ============================================================================
// mapping_t - text keys, unique, kept in insertion order
// ============================================================================

class mapping_t {
public:
    using const_iterator = std::vector<member_t>::const_iterator;

    auto size() const -> std::size_t;
    auto empty() const -> bool;
    auto contains(std::string_view key) const -> bool;

    // Returns nullptr when the key is absent.
    auto find(std::string_view key) const -> const value_t*;

    // Throws field_error naming the key when it is absent.
    auto at(std::string_view key) const -> const value_t&;

    // Throws codec_error on a duplicate key.
    void insert(std::string key, value_t value);

    auto begin() const -> const_iterator;
    auto end() const -> const_iterator;

    friend auto operator==(const mapping_t& a, const mapping_t& b) -> bool;

private:
    std::vector<member_t> members;
};

// ============================================================================
// value_t
// ============================================================================

struct value_t {
    using variant_t = std::variant<null_t, bool, std::int64_t, double, std::string, sequence_t, mapping_t>;

    variant_t data;

    value_t() = default;
    value_t(null_t) {}
    value_t(bool v) : data(v) {}
    value_t(double v) : data(v) {}
    value_t(std::string v) : data(std::move(v)) {}
    value_t(std::string_view v) : data(std::string(v)) {}
    value_t(const char* v) : data(std::string(v)) {}
    value_t(sequence_t v);
    value_t(mapping_t v);

    template <typename T>
        requires (std::integral<T> && !std::same_as<T, bool>)
    value_t(T v) : data(static_cast<std::int64_t>(v)) {}

    auto is_null() const -> bool { return std::holds_alternative<null_t>(data); }
    auto is_bool() const -> bool { return std::holds_alternative<bool>(data); }
    auto is_int() const -> bool { return std::holds_alternative<std::int64_t>(data); }
    auto is_float() const -> bool { return std::holds_alternative<double>(data); }
    auto is_text() const -> bool { return std::holds_alternative<std::string>(data); }
    auto is_sequence() const -> bool { return std::holds_alternative<sequence_t>(data); }
    auto is_mapping() const -> bool { return std::holds_alternative<mapping_t>(data); }

    // Accessors throw field_error when the value holds another kind.
    auto as_bool() const -> bool;
    auto as_int() const -> std::int64_t;
    auto as_float() const -> double;
    auto as_text() const -> const std::string&;
    auto as_sequence() const -> const sequence_t&;
    auto as_mapping() const -> const mapping_t&;

    // "null", "bool", "int", "float", "text", "sequence" or "mapping".
    auto kind_name() const -> const char*;

    // The "type" key of a mapping, or nullptr if this is not a tagged mapping.
    auto tag() const -> const std::string*;
};

auto operator==(const value_t& a, const value_t& b) -> bool;

struct member_t {
    std::string key;
    value_t value;
};

inline value_t::value_t(sequence_t v) : data(std::move(v)) {}
inline value_t::value_t(mapping_t v) : data(std::move(v)) {}

// ============================================================================
// Floats on the wire
// ============================================================================

// Finite values pass through; NaN and the infinities become text sentinels.
auto float_to_value(double x) -> value_t;

// Accepts floats, integers (widened) and the text sentinels.
auto value_to_float(const value_t& v) -> double;

auto is_float_like(const value_t& v) -> bool;

} // namespace phijson
