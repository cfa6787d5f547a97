// decoder.cpp - dynamic decode and tag dispatch

#include "phijson/decoder.hpp"

namespace phijson {

auto decoder_t::decode(const value_t& value) const -> object_t {
    if (value.is_null())  return object_t{};
    if (value.is_bool())  return object_t(value.as_bool());
    if (value.is_int())   return object_t(value.as_int());
    if (value.is_float()) return object_t(value.as_float());

    if (value.is_text()) {
        const auto& text = value.as_text();
        if (wire_format::is_float_sentinel(text)) {
            return object_t(value_to_float(value));
        }
        return object_t(text);
    }

    if (value.is_sequence()) {
        auto items = list_t{};
        const auto& seq = value.as_sequence();
        items.reserve(seq.size());
        for (std::size_t i = 0; i < seq.size(); ++i) {
            try {
                items.push_back(decode(seq[i]));
            } catch (const field_error& e) {
                throw e.within("[" + std::to_string(i) + "]");
            }
        }
        return object_t(std::move(items));
    }

    const auto& node = value.as_mapping();
    const auto* tag = value.tag();

    if (!tag) {
        auto members = dict_t{};
        for (const auto& m : node) {
            try {
                members.emplace(m.key, decode(m.value));
            } catch (const field_error& e) {
                throw e.within(m.key);
            }
        }
        return object_t(std::move(members));
    }
    if (*tag == wire_format::TAG_ARRAY) {
        return object_t(decode_array(node));
    }
    if (*tag == wire_format::TAG_SET) {
        auto items = object_set_t{};
        read(value, items);
        return object_t(std::move(items));
    }
    return lookup_tag(node).decode(node, *this);
}

void decoder_t::read(const value_t& value, object_set_t& out) const {
    const auto& items = set_items(value);
    out = object_set_t{};
    for (std::size_t i = 0; i < items.size(); ++i) {
        try {
            out.insert(decode(items[i]));
        } catch (const field_error& e) {
            throw e.within("[" + std::to_string(i) + "]");
        }
    }
}

auto decoder_t::expect_tagged(const value_t& value, std::string_view tag) const -> const mapping_t& {
    const auto& node = value.as_mapping();
    const auto* found = value.tag();
    if (!found) {
        throw field_error("", "expected '" + std::string(tag) + "' node, got untagged mapping");
    }
    if (*found != tag) {
        if (!wire_format::is_reserved_tag(*found) && !types.lookup_by_tag(*found)) {
            throw unknown_type(*found);
        }
        throw field_error("", "expected '" + std::string(tag) + "' node, got '" + *found + "'");
    }
    return node;
}

auto decoder_t::set_items(const value_t& value) const -> const sequence_t& {
    const auto& node = expect_tagged(value, wire_format::TAG_SET);
    for (const auto& m : node) {
        if (m.key != wire_format::KEY_TYPE && m.key != wire_format::KEY_ITEMS) {
            throw field_error(m.key, "unexpected field in set node");
        }
    }
    const auto& items = node.at(wire_format::KEY_ITEMS);
    try {
        return items.as_sequence();
    } catch (const field_error& e) {
        throw e.within(wire_format::KEY_ITEMS);
    }
}

auto decoder_t::lookup_tag(const mapping_t& node) const -> const registry_entry_t& {
    const auto* tag_value = node.find(wire_format::KEY_TYPE);
    if (!tag_value) {
        throw field_error("", "expected tagged composite node, got untagged mapping");
    }
    if (!tag_value->is_text()) {
        throw field_error(std::string(wire_format::KEY_TYPE),
                          std::string("expected text, got ") + tag_value->kind_name());
    }
    const auto& tag = tag_value->as_text();
    const auto* entry = types.lookup_by_tag(tag);
    if (!entry) {
        throw unknown_type(tag);
    }
    return *entry;
}

} // namespace phijson
