#pragma once

// Type-erased domain values, used where the static type of a decoded
// document is not known up front.

#include <any>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>
#include "errors.hpp"

namespace phijson {

class object_t;

using list_t = std::vector<object_t>;
using dict_t = std::map<std::string, object_t>;

// ============================================================================
// object_t
// ============================================================================
//
// Holds null (the default), or any equality-comparable value. Integers are
// stored as std::int64_t, floating point as double and character strings as
// std::string, so the same logical value always has the same stored type.

class object_t {
public:
    object_t() = default;

    template <typename T>
        requires (!std::same_as<std::remove_cvref_t<T>, object_t>)
    object_t(T&& value) {
        assign(normalize(std::forward<T>(value)));
    }

    auto is_null() const -> bool { return !value.has_value(); }

    template <typename T>
    auto is() const -> bool {
        return value.type() == typeid(T);
    }

    // Throws field_error when the object holds another type.
    template <typename T>
    auto as() const -> const T& {
        if (auto* p = std::any_cast<T>(&value)) {
            return *p;
        }
        throw field_error("", std::string("object holds ") + type_name() +
                              ", requested " + typeid(T).name());
    }

    // typeid(void) when null.
    auto type() const -> std::type_index { return value.has_value() ? std::type_index(value.type()) : std::type_index(typeid(void)); }
    auto type_name() const -> const char* { return value.has_value() ? value.type().name() : "null"; }

    // Address of the held value, for registry encode functions.
    auto address() const -> const void* { return value.has_value() ? address_of(value) : nullptr; }

    friend auto operator==(const object_t& a, const object_t& b) -> bool {
        if (a.type() != b.type()) {
            return false;
        }
        return a.is_null() || a.equal(a.value, b.value);
    }

private:
    using equal_fn = bool (*)(const std::any&, const std::any&);
    using address_fn = const void* (*)(const std::any&);

    std::any value;
    equal_fn equal = nullptr;
    address_fn address_of = nullptr;

    template <typename T>
    static auto normalize(T&& v) {
        using U = std::remove_cvref_t<T>;
        if constexpr (std::same_as<U, bool>) {
            return v;
        } else if constexpr (std::integral<U>) {
            return static_cast<std::int64_t>(v);
        } else if constexpr (std::floating_point<U>) {
            return static_cast<double>(v);
        } else if constexpr (std::convertible_to<T, std::string_view>) {
            return std::string(std::string_view(v));
        } else {
            return U(std::forward<T>(v));
        }
    }

    template <typename U>
    void assign(U&& v) {
        using V = std::remove_cvref_t<U>;
        value = std::forward<U>(v);
        if constexpr (std::same_as<V, double>) {
            // NaN equals NaN, as in array_t
            equal = [](const std::any& a, const std::any& b) {
                auto x = *std::any_cast<double>(&a);
                auto y = *std::any_cast<double>(&b);
                return x == y || (std::isnan(x) && std::isnan(y));
            };
        } else {
            equal = [](const std::any& a, const std::any& b) {
                return *std::any_cast<V>(&a) == *std::any_cast<V>(&b);
            };
        }
        address_of = [](const std::any& a) -> const void* {
            return std::any_cast<V>(&a);
        };
    }
};

// ============================================================================
// object_set_t - unordered collection of objects, duplicates collapse
// ============================================================================

class object_set_t {
public:
    using const_iterator = list_t::const_iterator;

    object_set_t() = default;
    object_set_t(std::initializer_list<object_t> init) {
        for (const auto& item : init) {
            insert(item);
        }
    }

    // Returns false if an equal item was already present.
    auto insert(object_t item) -> bool {
        if (contains(item)) {
            return false;
        }
        items.push_back(std::move(item));
        return true;
    }

    auto contains(const object_t& item) const -> bool {
        for (const auto& existing : items) {
            if (existing == item) return true;
        }
        return false;
    }

    auto size() const -> std::size_t { return items.size(); }
    auto empty() const -> bool { return items.empty(); }
    auto begin() const -> const_iterator { return items.begin(); }
    auto end() const -> const_iterator { return items.end(); }

    friend auto operator==(const object_set_t& a, const object_set_t& b) -> bool {
        if (a.size() != b.size()) {
            return false;
        }
        for (const auto& item : a) {
            if (!b.contains(item)) return false;
        }
        return true;
    }

private:
    list_t items;
};

} // namespace phijson
