#pragma once

// Decoder: canonical value trees back to domain objects.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
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
// decoder_t
// ============================================================================
//
// decode() rebuilds a dynamic object_t, dispatching composite nodes through
// the registry. decode_as<T>() and read() rebuild a concrete type and throw
// field_error (with the path to the offending field) when the tree does not
// have the shape T needs. Integers widen to floats; nothing else is coerced.
//
// In lenient mode, used for documents from an older minor version, missing
// fields keep their default values instead of failing.

class decoder_t {
public:
    explicit decoder_t(const type_registry_t& registry, bool lenient = false)
        : types(registry), lenient_(lenient) {}

    auto registry() const -> const type_registry_t& { return types; }
    auto lenient() const -> bool { return lenient_; }

    auto decode(const value_t& value) const -> object_t;

    template <typename T>
    auto decode_as(const value_t& value) const -> T {
        auto result = T{};
        read(value, result);
        return result;
    }

    // --- Scalars ---

    void read(const value_t& value, bool& out) const { out = value.as_bool(); }

    template <typename T>
        requires (std::integral<T> && !std::same_as<T, bool>)
    void read(const value_t& value, T& out) const {
        auto v = value.as_int();
        if (!std::in_range<T>(v)) {
            throw field_error("", "integer " + std::to_string(v) + " out of range");
        }
        out = static_cast<T>(v);
    }

    template <typename T>
        requires std::floating_point<T>
    void read(const value_t& value, T& out) const {
        out = static_cast<T>(value_to_float(value));
    }

    void read(const value_t& value, std::string& out) const { out = value.as_text(); }

    template <typename E>
        requires HasEnumStrings<E>
    void read(const value_t& value, E& out) const {
        out = from_string(std::type_identity<E>{}, value.as_text());
    }

    // --- Arrays and collections ---

    void read(const value_t& value, array_t& out) const {
        out = decode_array(expect_tagged(value, wire_format::TAG_ARRAY));
    }

    template <typename T, typename A>
    void read(const value_t& value, std::vector<T, A>& out) const {
        const auto& items = value.as_sequence();
        out.clear();
        out.reserve(items.size());
        for (std::size_t i = 0; i < items.size(); ++i) {
            try {
                out.push_back(decode_as<T>(items[i]));
            } catch (const field_error& e) {
                throw e.within("[" + std::to_string(i) + "]");
            }
        }
    }

    template <typename T, typename C, typename A>
    void read(const value_t& value, std::set<T, C, A>& out) const {
        const auto& items = set_items(value);
        out.clear();
        for (std::size_t i = 0; i < items.size(); ++i) {
            try {
                out.insert(decode_as<T>(items[i]));
            } catch (const field_error& e) {
                throw e.within("[" + std::to_string(i) + "]");
            }
        }
    }

    void read(const value_t& value, object_set_t& out) const;

    template <typename T, typename C, typename A>
    void read(const value_t& value, std::map<std::string, T, C, A>& out) const {
        const auto& members = value.as_mapping();
        if (members.contains(wire_format::KEY_TYPE)) {
            throw field_error("", "expected plain mapping, got tagged node");
        }
        out.clear();
        for (const auto& m : members) {
            try {
                out.emplace(m.key, decode_as<T>(m.value));
            } catch (const field_error& e) {
                throw e.within(m.key);
            }
        }
    }

    template <typename T>
    void read(const value_t& value, std::optional<T>& out) const {
        if (value.is_null()) {
            out = std::nullopt;
        } else {
            out = decode_as<T>(value);
        }
    }

    void read(const value_t& value, std::monostate&) const {
        if (!value.is_null()) {
            throw field_error("", std::string("expected null, got ") + value.kind_name());
        }
    }

    // The first alternative whose shape matches the value exactly is chosen.
    // An integer widens to a floating-point alternative only when no
    // alternative takes it as is.
    template <typename... Ts>
    void read(const value_t& value, std::variant<Ts...>& out) const {
        if (!read_alternative<0>(value, out, true) && !read_alternative<0>(value, out, false)) {
            throw field_error("", std::string("no variant alternative matches ") + value.kind_name());
        }
    }

    // --- Dynamic objects ---

    void read(const value_t& value, object_t& out) const { out = decode(value); }

    // --- Registered composites ---

    template <typename T>
        requires HasFields<T>
    void read(const value_t& value, T& out) const {
        const auto& node = value.as_mapping();
        const auto& entry = entry_for<T>(node);
        out = entry.decode(node, *this).template as<T>();
    }

    // Reads the declared fields of T from a composite node. This is the
    // decode function add<T>() registers.
    template <typename T>
        requires HasFields<T>
    void read_fields(const mapping_t& node, T& out) const {
        std::size_t matched = 0;
        std::apply([this, &node, &matched](auto&&... f) {
            (read_field(node, f.first, f.second, matched), ...);
        }, fields(out));

        auto expected = matched + (node.contains(wire_format::KEY_TYPE) ? 1 : 0);
        if (expected != node.size()) {
            reject_unexpected(node, out);
        }
    }

private:
    const type_registry_t& types;
    bool lenient_;

    auto expect_tagged(const value_t& value, std::string_view tag) const -> const mapping_t&;
    auto set_items(const value_t& value) const -> const sequence_t&;
    auto lookup_tag(const mapping_t& node) const -> const registry_entry_t&;

    template <typename T>
    auto entry_for(const mapping_t& node) const -> const registry_entry_t& {
        const auto& entry = lookup_tag(node);
        if (entry.type != typeid(T)) {
            const auto* wanted = types.template lookup<T>();
            throw field_error("", "expected '" + (wanted ? wanted->tag : std::string(typeid(T).name())) +
                                  "', got '" + entry.tag + "'");
        }
        return entry;
    }

    template <typename F>
    void read_field(const mapping_t& node, const char* name, F& target, std::size_t& matched) const {
        if (const auto* v = node.find(name)) {
            try {
                read(*v, target);
            } catch (const field_error& e) {
                throw e.within(name);
            }
            ++matched;
        } else if constexpr (is_optional<F>::value) {
            target = std::nullopt;
        } else if (!lenient_) {
            throw field_error(name, "missing field");
        }
    }

    template <typename T>
    void reject_unexpected(const mapping_t& node, T& out) const {
        for (const auto& m : node) {
            if (m.key == wire_format::KEY_TYPE) continue;
            bool declared = false;
            std::apply([&m, &declared](auto&&... f) {
                ((declared = declared || m.key == f.first), ...);
            }, fields(out));
            if (!declared) {
                throw field_error(m.key, "unexpected field");
            }
        }
    }

    template <std::size_t I, typename... Ts>
    auto read_alternative(const value_t& value, std::variant<Ts...>& out, bool exact) const -> bool {
        if constexpr (I == sizeof...(Ts)) {
            return false;
        } else {
            using Alt = std::variant_alternative_t<I, std::variant<Ts...>>;
            if (matches<Alt>(value, exact)) {
                auto alt = Alt{};
                read(value, alt);
                out = std::move(alt);
                return true;
            }
            return read_alternative<I + 1>(value, out, exact);
        }
    }

    // Shape test used to pick a variant alternative; does not decode.
    template <typename T>
    auto matches(const value_t& value, bool exact) const -> bool {
        if constexpr (std::is_same_v<T, std::monostate>) {
            return value.is_null();
        } else if constexpr (std::is_same_v<T, bool>) {
            return value.is_bool();
        } else if constexpr (std::is_integral_v<T>) {
            return value.is_int();
        } else if constexpr (std::is_floating_point_v<T>) {
            return exact ? is_float_like(value) && !value.is_int() : is_float_like(value);
        } else if constexpr (std::is_same_v<T, std::string> || HasEnumStrings<T>) {
            return value.is_text();
        } else if constexpr (std::is_same_v<T, array_t>) {
            auto* tag = value.tag();
            return tag && *tag == wire_format::TAG_ARRAY;
        } else if constexpr (is_set<T>::value || std::is_same_v<T, object_set_t>) {
            auto* tag = value.tag();
            return tag && *tag == wire_format::TAG_SET;
        } else if constexpr (is_vector<T>::value) {
            return value.is_sequence();
        } else if constexpr (is_string_map<T>::value) {
            return value.is_mapping() && value.tag() == nullptr;
        } else if constexpr (is_optional<T>::value || std::is_same_v<T, object_t>) {
            return true;
        } else if constexpr (HasFields<T>) {
            auto* tag = value.tag();
            const auto* entry = types.template lookup<T>();
            return tag && entry && *tag == entry->tag;
        } else {
            return false;
        }
    }
};

} // namespace phijson
