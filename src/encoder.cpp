// encoder.cpp - dynamic dispatch and node construction

#include "phijson/encoder.hpp"
#include "phijson/json_writer.hpp"

namespace phijson {

auto encoder_t::encode(const object_set_t& value) const -> value_t {
    auto items = sequence_t{};
    items.reserve(value.size());
    for (const auto& elem : value) {
        items.push_back(encode(elem));
    }
    return set_node(std::move(items));
}

auto encoder_t::encode(const object_t& value) const -> value_t {
    if (value.is_null())              return value_t(null_t{});
    if (value.is<bool>())             return encode(value.as<bool>());
    if (value.is<std::int64_t>())     return encode(value.as<std::int64_t>());
    if (value.is<double>())           return encode(value.as<double>());
    if (value.is<std::string>())      return encode(value.as<std::string>());
    if (value.is<list_t>())           return encode(value.as<list_t>());
    if (value.is<object_set_t>())     return encode(value.as<object_set_t>());
    if (value.is<dict_t>())           return encode(value.as<dict_t>());
    if (value.is<array_t>())          return encode(value.as<array_t>());

    const auto* entry = types.lookup_by_type(value.type());
    if (!entry) {
        throw unregistered_type(value.type_name());
    }
    return composite_node(*entry, value.address());
}

auto encoder_t::composite_node(const registry_entry_t& entry, const void* object) const -> value_t {
    auto node = mapping_t{};
    node.insert(std::string(wire_format::KEY_TYPE), value_t(entry.tag));
    for (const auto& m : entry.encode(object, *this)) {
        if (m.key == wire_format::KEY_TYPE) {
            throw codec_error("encode function of '" + entry.tag + "' produced the reserved key 'type'");
        }
        node.insert(m.key, m.value);
    }
    return value_t(std::move(node));
}

auto encoder_t::set_node(sequence_t items) -> value_t {
    auto keyed = std::vector<std::pair<std::string, value_t>>{};
    keyed.reserve(items.size());
    for (auto& item : items) {
        auto key = to_json(item, 0);
        keyed.emplace_back(std::move(key), std::move(item));
    }
    std::sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });
    keyed.erase(std::unique(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
        return a.first == b.first;
    }), keyed.end());

    auto sorted = sequence_t{};
    sorted.reserve(keyed.size());
    for (auto& [key, item] : keyed) {
        sorted.push_back(std::move(item));
    }

    auto node = mapping_t{};
    node.insert(std::string(wire_format::KEY_TYPE), value_t(wire_format::TAG_SET));
    node.insert(std::string(wire_format::KEY_ITEMS), value_t(std::move(sorted)));
    return value_t(std::move(node));
}

} // namespace phijson
