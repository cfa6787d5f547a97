#pragma once

// ============================================================================
// phijson - type-tagged JSON codec for scientific result objects
// ============================================================================
//
// Composite types declare their fields with an ADL fields() function and
// are registered under a stable tag before first use:
//
//   struct cut_t {
//       std::vector<int> from_nodes;
//       std::vector<int> to_nodes;
//       auto operator==(const cut_t&) const -> bool = default;
//   };
//
//   auto fields(const cut_t& c) {
//       return std::make_tuple(field("from_nodes", c.from_nodes),
//                              field("to_nodes", c.to_nodes));
//   }
//   auto fields(cut_t& c) { ... same, non-const ... }
//
//   auto types = phijson::type_registry_t{};
//   types.add<cut_t>("cut");
//   types.seal();
//
//   auto codec = phijson::codec_t(types);
//   codec.dump_file(cut, "cut.json");
//   auto loaded = codec.load_file_as<cut_t>("cut.json");
//   auto anything = codec.load_file("cut.json");   // object_t holding a cut_t
//
// ============================================================================

#include <filesystem>
#include <iostream>
#include <istream>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include "array.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "json_reader.hpp"
#include "json_writer.hpp"
#include "object.hpp"
#include "protocol.hpp"
#include "registry.hpp"
#include "value.hpp"
#include "version.hpp"

namespace phijson {

// ============================================================================
// Codec options
// ============================================================================

struct codec_options_t {
    int indent = 4;               // spaces per level; 0 writes compact JSON
    bool strict_version = false;  // reject older minor versions instead of warning
    auto operator==(const codec_options_t&) const -> bool = default;
};

inline auto fields(const codec_options_t& o) {
    return std::make_tuple(
        field("indent", o.indent),
        field("strict_version", o.strict_version)
    );
}

inline auto fields(codec_options_t& o) {
    return std::make_tuple(
        field("indent", o.indent),
        field("strict_version", o.strict_version)
    );
}

// ============================================================================
// codec_t - document-level dump and load
// ============================================================================
//
// A document is a mapping with the version stamp under "version". A
// composite root shares that mapping; any other root sits under "value".
// Loading checks the stamp before decoding anything else.

class codec_t {
public:
    // Throws codec_error unless the registry is sealed.
    explicit codec_t(const type_registry_t& registry, codec_options_t options = {},
                     std::ostream& err = std::cerr);

    auto registry() const -> const type_registry_t& { return types; }
    auto options() const -> const codec_options_t& { return opts; }
    auto version() const -> const std::string& { return gate.current(); }

    // --- Values ---

    template <typename T>
    auto encode(const T& value) const -> value_t {
        return encoder_t(types).encode(value);
    }

    auto decode(const value_t& value) const -> object_t {
        return decoder_t(types).decode(value);
    }

    template <typename T>
    auto decode_as(const value_t& value) const -> T {
        return decoder_t(types).decode_as<T>(value);
    }

    // --- Dump ---

    template <typename T>
    auto dumps(const T& value) const -> std::string {
        return to_json(make_document(encode(value)), opts.indent);
    }

    template <typename T>
    void dump(const T& value, std::ostream& os) const {
        auto text = dumps(value);
        os << text;
        if (!os) {
            throw codec_error("failed to write document to stream");
        }
    }

    // The document is encoded completely before the file is touched, then
    // written to "<path>.tmp" and renamed over the target.
    template <typename T>
    void dump_file(const T& value, const std::filesystem::path& path) const {
        write_file(path, dumps(value));
    }

    // --- Load ---

    auto loads(std::string_view text) const -> object_t;
    auto load(std::istream& is) const -> object_t;
    auto load_file(const std::filesystem::path& path) const -> object_t;

    template <typename T>
    auto loads_as(std::string_view text) const -> T {
        return load_document_as<T>(from_json(text));
    }

    template <typename T>
    auto load_as(std::istream& is) const -> T {
        return load_document_as<T>(json_reader(is).read());
    }

    template <typename T>
    auto load_file_as(const std::filesystem::path& path) const -> T {
        return load_document_as<T>(read_file(path));
    }

private:
    const type_registry_t& types;
    codec_options_t opts;
    version_gate_t gate;
    std::ostream* err;

    auto make_document(value_t root) const -> value_t;

    // Checks the stamp and splits the document into (root, lenient).
    auto open_document(const value_t& document) const -> std::pair<value_t, bool>;

    auto load_document(const value_t& document) const -> object_t;

    template <typename T>
    auto load_document_as(const value_t& document) const -> T {
        auto [root, lenient] = open_document(document);
        return decoder_t(types, lenient).decode_as<T>(root);
    }

    auto read_file(const std::filesystem::path& path) const -> value_t;
    void write_file(const std::filesystem::path& path, const std::string& text) const;
};

} // namespace phijson

#include "registry.ipp"
