#pragma once

// Encoder: domain objects to canonical value trees.

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>
#include "array.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "object.hpp"
#include "protocol.hpp"
#include "registry.hpp"
#include "value.hpp"

namespace phijson {

// ============================================================================
// encoder_t
// ============================================================================
//
// Pure with respect to both its input and the registry. Every composite node
// it produces starts with the "type" key; arrays and sets use the reserved
// __array__ and __set__ tags.

class encoder_t {
public:
    explicit encoder_t(const type_registry_t& registry) : types(registry) {}

    auto registry() const -> const type_registry_t& { return types; }

    // --- Scalars ---

    auto encode(bool value) const -> value_t { return value_t(value); }

    template <typename T>
        requires (std::integral<T> && !std::same_as<T, bool>)
    auto encode(T value) const -> value_t {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(std::int64_t)) {
            if (value > static_cast<T>(std::numeric_limits<std::int64_t>::max())) {
                throw codec_error("integer " + std::to_string(value) + " exceeds the int64 range");
            }
        }
        return value_t(static_cast<std::int64_t>(value));
    }

    template <typename T>
        requires std::floating_point<T>
    auto encode(T value) const -> value_t {
        return float_to_value(static_cast<double>(value));
    }

    auto encode(const std::string& value) const -> value_t { return value_t(value); }
    auto encode(std::string_view value) const -> value_t { return value_t(value); }
    auto encode(const char* value) const -> value_t { return value_t(value); }

    // Enums with ADL to_string/from_string
    template <typename E>
        requires HasEnumStrings<E>
    auto encode(const E& value) const -> value_t {
        return value_t(std::string(to_string(value)));
    }

    // --- Arrays and collections ---

    auto encode(const array_t& value) const -> value_t { return value_t(encode_array(value)); }

    template <typename T, typename A>
    auto encode(const std::vector<T, A>& value) const -> value_t {
        auto items = sequence_t{};
        items.reserve(value.size());
        for (const auto& elem : value) {
            items.push_back(encode(elem));
        }
        return value_t(std::move(items));
    }

    template <typename T, typename C, typename A>
    auto encode(const std::set<T, C, A>& value) const -> value_t {
        auto items = sequence_t{};
        items.reserve(value.size());
        for (const auto& elem : value) {
            items.push_back(encode(elem));
        }
        return set_node(std::move(items));
    }

    auto encode(const object_set_t& value) const -> value_t;

    template <typename T, typename C, typename A>
    auto encode(const std::map<std::string, T, C, A>& value) const -> value_t {
        auto members = mapping_t{};
        for (const auto& [key, val] : value) {
            if (key == wire_format::KEY_TYPE) {
                throw codec_error("plain mapping cannot use the reserved key 'type'");
            }
            members.insert(key, encode(val));
        }
        return value_t(std::move(members));
    }

    template <typename T>
    auto encode(const std::optional<T>& value) const -> value_t {
        if (!value) {
            return value_t(null_t{});
        }
        return encode(*value);
    }

    auto encode(const std::monostate&) const -> value_t { return value_t(null_t{}); }

    template <typename... Ts>
    auto encode(const std::variant<Ts...>& value) const -> value_t {
        return std::visit([this](const auto& v) { return encode(v); }, value);
    }

    // --- Dynamic objects ---

    auto encode(const object_t& value) const -> value_t;

    // --- Registered composites ---

    template <typename T>
        requires HasConstFields<T>
    auto encode(const T& value) const -> value_t {
        const auto* entry = types.template lookup<T>();
        if (!entry) {
            throw unregistered_type(typeid(T).name());
        }
        return composite_node(*entry, &value);
    }

    // Fields of a composite in declared order, without the "type" key. This
    // is the encode function add<T>() registers.
    template <typename T>
        requires HasConstFields<T>
    auto encode_fields(const T& value) const -> mapping_t {
        auto members = mapping_t{};
        std::apply([this, &members](auto&&... f) {
            (members.insert(f.first, encode(f.second)), ...);
        }, fields(value));
        return members;
    }

private:
    const type_registry_t& types;

    auto composite_node(const registry_entry_t& entry, const void* object) const -> value_t;

    // Items sorted by their compact text, duplicates dropped.
    static auto set_node(sequence_t items) -> value_t;
};

} // namespace phijson
