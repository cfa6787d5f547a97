#pragma once

// Type registry: stable type tags bound to the encode/decode functions of
// registered composite types.

#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>
#include "object.hpp"
#include "value.hpp"

namespace phijson {

class encoder_t;
class decoder_t;

// ============================================================================
// registry_entry_t
// ============================================================================
//
// encode receives the address of an object of exactly `type` and returns its
// fields in wire order, without the "type" key. decode receives the whole
// composite node (the "type" key included) and returns the rebuilt object.

struct registry_entry_t {
    using encode_fn = std::function<mapping_t(const void* object, const encoder_t& encoder)>;
    using decode_fn = std::function<object_t(const mapping_t& node, const decoder_t& decoder)>;

    std::string tag;
    std::type_index type;
    encode_fn encode;
    decode_fn decode;
};

// ============================================================================
// type_registry_t
// ============================================================================
//
// Built explicitly at startup, then sealed. A sealed registry is read-only
// and may be shared by any number of concurrent encoders and decoders.

class type_registry_t {
public:
    // Throws duplicate_type_tag when the tag is reserved, already bound to
    // another type, or the type is already bound to another tag. Adding the
    // same (tag, type) pair again is a no-op. Throws codec_error once sealed.
    void add(std::string tag, std::type_index type,
             registry_entry_t::encode_fn encode, registry_entry_t::decode_fn decode);

    // Typed form of add(): the functions see T directly.
    template <typename T>
    void add(std::string tag,
             std::function<mapping_t(const T&, const encoder_t&)> encode,
             std::function<T(const mapping_t&, const decoder_t&)> decode) {
        add(std::move(tag), typeid(T),
            [encode = std::move(encode)](const void* object, const encoder_t& encoder) {
                return encode(*static_cast<const T*>(object), encoder);
            },
            [decode = std::move(decode)](const mapping_t& node, const decoder_t& decoder) {
                return object_t(decode(node, decoder));
            });
    }

    // Codec derived from the type's ADL fields() declaration. Defined in
    // registry.ipp, which codec.hpp includes.
    template <typename T>
    void add(std::string tag);

    void seal() { is_sealed = true; }
    auto sealed() const -> bool { return is_sealed; }

    // nullptr when absent.
    auto lookup_by_tag(std::string_view tag) const -> const registry_entry_t*;
    auto lookup_by_type(std::type_index type) const -> const registry_entry_t*;

    template <typename T>
    auto lookup() const -> const registry_entry_t* {
        return lookup_by_type(typeid(T));
    }

    // Registered tags, in registration order.
    auto tags() const -> std::vector<std::string>;
    auto size() const -> std::size_t { return entries.size(); }

private:
    std::deque<registry_entry_t> entries;
    std::unordered_map<std::string, std::size_t> by_tag;
    std::unordered_map<std::type_index, std::size_t> by_type;
    bool is_sealed = false;
};

} // namespace phijson
