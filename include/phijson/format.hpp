#pragma once

// Wire format constants for phijson documents.

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

namespace phijson {

// ============================================================================
// Wire format constants
// ============================================================================

namespace wire_format {

inline constexpr std::string_view VERSION = "1.1.0";

// Reserved keys
inline constexpr std::string_view KEY_TYPE    = "type";
inline constexpr std::string_view KEY_VERSION = "version";
inline constexpr std::string_view KEY_VALUE   = "value";
inline constexpr std::string_view KEY_SHAPE   = "shape";
inline constexpr std::string_view KEY_DTYPE   = "dtype";
inline constexpr std::string_view KEY_DATA    = "data";
inline constexpr std::string_view KEY_ITEMS   = "items";

// Reserved type tags
inline constexpr std::string_view TAG_ARRAY = "__array__";
inline constexpr std::string_view TAG_SET   = "__set__";
inline constexpr std::string_view RESERVED_TAG_PREFIX = "__";

// Non-finite float sentinels
inline constexpr std::string_view NAN_TEXT     = "NaN";
inline constexpr std::string_view POS_INF_TEXT = "Infinity";
inline constexpr std::string_view NEG_INF_TEXT = "-Infinity";

inline auto is_reserved_tag(std::string_view tag) -> bool {
    return tag.substr(0, RESERVED_TAG_PREFIX.size()) == RESERVED_TAG_PREFIX;
}

inline auto is_float_sentinel(std::string_view text) -> bool {
    return text == NAN_TEXT || text == POS_INF_TEXT || text == NEG_INF_TEXT;
}

} // namespace wire_format

// ============================================================================
// Array element kinds
// ============================================================================

enum class dtype {
    float64,
    int64,
    boolean,
};

inline auto to_string(dtype d) -> const char* {
    switch (d) {
        case dtype::float64: return "float64";
        case dtype::int64:   return "int64";
        case dtype::boolean: return "bool";
    }
    return "unknown";
}

auto from_string(std::type_identity<dtype>, const std::string& s) -> dtype;

template <typename T>
constexpr auto element_dtype() -> dtype {
    if constexpr (std::is_same_v<T, bool>) {
        return dtype::boolean;
    } else if constexpr (std::is_floating_point_v<T>) {
        return dtype::float64;
    } else {
        return dtype::int64;
    }
}

} // namespace phijson
