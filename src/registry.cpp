// registry.cpp - type registry

#include "phijson/errors.hpp"
#include "phijson/format.hpp"
#include "phijson/registry.hpp"

namespace phijson {

void type_registry_t::add(std::string tag, std::type_index type,
                          registry_entry_t::encode_fn encode, registry_entry_t::decode_fn decode) {
    if (is_sealed) {
        throw codec_error("type registry is sealed; cannot register '" + tag + "'");
    }
    if (tag.empty()) {
        throw duplicate_type_tag(tag, "empty tag");
    }
    if (wire_format::is_reserved_tag(tag)) {
        throw duplicate_type_tag(tag, "tags starting with '__' are reserved");
    }
    if (!encode || !decode) {
        throw codec_error("registration of '" + tag + "' is missing an encode or decode function");
    }

    auto tag_it = by_tag.find(tag);
    auto type_it = by_type.find(type);

    if (tag_it != by_tag.end()) {
        if (entries[tag_it->second].type == type) {
            return;
        }
        throw duplicate_type_tag(tag, std::string("already bound to ") + entries[tag_it->second].type.name());
    }
    if (type_it != by_type.end()) {
        throw duplicate_type_tag(tag, std::string(type.name()) + " is already registered as '" +
                                      entries[type_it->second].tag + "'");
    }

    auto index = entries.size();
    entries.push_back(registry_entry_t{tag, type, std::move(encode), std::move(decode)});
    by_tag.emplace(std::move(tag), index);
    by_type.emplace(type, index);
}

auto type_registry_t::lookup_by_tag(std::string_view tag) const -> const registry_entry_t* {
    auto it = by_tag.find(std::string(tag));
    return it == by_tag.end() ? nullptr : &entries[it->second];
}

auto type_registry_t::lookup_by_type(std::type_index type) const -> const registry_entry_t* {
    auto it = by_type.find(type);
    return it == by_type.end() ? nullptr : &entries[it->second];
}

auto type_registry_t::tags() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        result.push_back(entry.tag);
    }
    return result;
}

} // namespace phijson
