#pragma once

// Field declarations for composite types, and the type concepts the encoder
// and decoder dispatch on.

#include <charconv>
#include <concepts>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include "errors.hpp"

namespace phijson {

// ============================================================================
// Field helper - returns std::pair<const char*, T&>
// ============================================================================

template <typename T>
constexpr auto field(const char* name, T& value) {
    return std::pair<const char*, T&>{name, value};
}

template <typename T>
constexpr auto field(const char* name, const T& value) {
    return std::pair<const char*, const T&>{name, value};
}

// ============================================================================
// HasFields concept - requires ADL free function fields(t)
// ============================================================================
//
// A composite declares its persisted fields, in wire order:
//
//   auto fields(const cut_t& c) {
//       return std::make_tuple(field("from_nodes", c.from_nodes),
//                              field("to_nodes", c.to_nodes));
//   }
//
// plus the same overload taking a non-const reference. Derived or cached
// members are simply left out of fields().

template <typename T>
concept HasFields = requires(T& t) {
    { fields(t) };
};

template <typename T>
concept HasConstFields = requires(const T& t) {
    { fields(t) };
};

// ============================================================================
// Enum string conversion via ADL
// ============================================================================

template <typename E>
concept HasEnumStrings = std::is_enum_v<E> && requires(E e, const std::string& s) {
    { to_string(e) } -> std::convertible_to<const char*>;
    { from_string(std::type_identity<E>{}, s) } -> std::same_as<E>;
};

// ============================================================================
// Container traits
// ============================================================================

template <typename T> struct is_vector : std::false_type {};
template <typename T, typename A> struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T> struct is_set : std::false_type {};
template <typename T, typename C, typename A> struct is_set<std::set<T, C, A>> : std::true_type {};

template <typename T> struct is_string_map : std::false_type {};
template <typename T, typename C, typename A> struct is_string_map<std::map<std::string, T, C, A>> : std::true_type {};

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

template <typename T> struct is_variant : std::false_type {};
template <typename... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};

// ============================================================================
// Config field setter by path
// ============================================================================

namespace detail {

template <typename T>
void parse_and_assign(T& target, const std::string& value) {
    if constexpr (std::is_same_v<T, bool>) {
        if (value == "true" || value == "1") target = true;
        else if (value == "false" || value == "0") target = false;
        else throw field_error("", "expected true or false, got '" + value + "'");
    } else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>) {
        auto parsed = T{};
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (ec != std::errc{} || ptr != value.data() + value.size()) {
            throw field_error("", "cannot parse '" + value + "' as a number");
        }
        target = parsed;
    } else if constexpr (std::is_same_v<T, std::string>) {
        target = value;
    } else if constexpr (HasEnumStrings<T>) {
        target = from_string(std::type_identity<T>{}, value);
    } else {
        throw field_error("", "unsupported type for set()");
    }
}

// Forward declaration
template <typename T>
void set_impl(T& obj, const std::string& path, const std::string& value);

template <typename T>
void set_field(T& target, const std::string& rest, const std::string& value) {
    if (rest.empty()) {
        parse_and_assign(target, value);
    } else if constexpr (HasFields<T>) {
        set_impl(target, rest, value);
    } else {
        throw field_error(rest, "cannot descend: not a struct");
    }
}

template <typename T>
void try_set_field(const char* name, T& target, const std::string& key,
                   const std::string& rest, const std::string& value, bool& found) {
    if (!found && std::string(name) == key) {
        try {
            set_field(target, rest, value);
        } catch (const field_error& e) {
            throw e.within(key);
        }
        found = true;
    }
}

template <typename T>
void set_impl(T& obj, const std::string& path, const std::string& value) {
    auto dot = path.find('.');
    std::string key = path.substr(0, dot);
    std::string rest = (dot != std::string::npos) ? path.substr(dot + 1) : "";

    bool found = false;
    std::apply([&](auto&&... f) {
        (try_set_field(f.first, f.second, key, rest, value, found), ...);
    }, fields(obj));

    if (!found) {
        throw field_error(key, "no such field");
    }
}

} // namespace detail

/**
 * Set a field in a struct by dot-separated path.
 *
 * Example:
 *   set(config, "codec.indent", "2");
 *   set(config, "codec.strict_version", "true");
 */
template <HasFields T>
void set(T& obj, const std::string& path, const std::string& value) {
    detail::set_impl(obj, path, value);
}

/**
 * Apply a "key=value" assignment, as given on a command line.
 */
template <HasFields T>
void set(T& obj, const std::string& assignment) {
    auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw field_error("", "expected key=value, got '" + assignment + "'");
    }
    set(obj, assignment.substr(0, eq), assignment.substr(eq + 1));
}

} // namespace phijson
