#pragma once

// Out-of-line definition of type_registry_t::add<T>(tag). Needs the complete
// encoder and decoder, so it lives apart from registry.hpp.

#include <string>
#include <tuple>
#include <utility>
#include "decoder.hpp"
#include "encoder.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "protocol.hpp"
#include "registry.hpp"

namespace phijson {

template <typename T>
void type_registry_t::add(std::string tag) {
    static_assert(HasFields<T> && HasConstFields<T>,
                  "add<T>(tag) requires const and non-const fields(T) overloads");

    auto probe = T{};
    std::apply([&tag](auto&&... f) {
        ((std::string_view(f.first) == wire_format::KEY_TYPE ||
          std::string_view(f.first) == wire_format::KEY_VERSION
              ? throw codec_error("field name '" + std::string(f.first) + "' of '" + tag + "' is reserved")
              : void()), ...);
    }, fields(std::as_const(probe)));

    add(std::move(tag), typeid(T),
        [](const void* object, const encoder_t& encoder) {
            return encoder.encode_fields(*static_cast<const T*>(object));
        },
        [](const mapping_t& node, const decoder_t& decoder) {
            auto result = T{};
            decoder.read_fields(node, result);
            return object_t(std::move(result));
        });
}

} // namespace phijson
