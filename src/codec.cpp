// codec.cpp - document envelope, version checks and file I/O

#include <fstream>
#include <system_error>
#include "phijson/codec.hpp"
#include "phijson/color.hpp"

namespace fs = std::filesystem;

namespace phijson {

codec_t::codec_t(const type_registry_t& registry, codec_options_t options, std::ostream& log)
    : types(registry), opts(options), err(&log) {
    if (!types.sealed()) {
        throw codec_error("type registry must be sealed before it is used by a codec");
    }
    if (opts.indent < 0) {
        throw codec_error("indent must be non-negative, got " + std::to_string(opts.indent));
    }
}

// =============================================================================
// Envelope
// =============================================================================

auto codec_t::make_document(value_t root) const -> value_t {
    auto document = mapping_t{};
    document.insert(std::string(wire_format::KEY_VERSION), value_t(gate.current()));

    if (root.tag() && !wire_format::is_reserved_tag(*root.tag())) {
        for (const auto& m : root.as_mapping()) {
            document.insert(m.key, m.value);
        }
    } else {
        document.insert(std::string(wire_format::KEY_VALUE), std::move(root));
    }
    return value_t(std::move(document));
}

auto codec_t::open_document(const value_t& document) const -> std::pair<value_t, bool> {
    if (!document.is_mapping()) {
        throw incompatible_version("", gate.current(),
            std::string("document root is ") + document.kind_name() + ", not a mapping");
    }
    const auto& node = document.as_mapping();

    auto stamp = std::optional<std::string>{};
    if (const auto* v = node.find(wire_format::KEY_VERSION)) {
        if (!v->is_text()) {
            throw incompatible_version("", gate.current(), "version stamp is not text");
        }
        stamp = v->as_text();
    }

    auto lenient = false;
    if (gate.require(stamp) == gate_decision::proceed_with_warning) {
        if (opts.strict_version) {
            throw incompatible_version(*stamp, gate.current(),
                "older minor version rejected in strict mode");
        }
        auto colors = color::for_stream(*err);
        *err << colors.warning << "warning: " << colors.reset
             << "document version " << *stamp << " is older than " << gate.current()
             << "; missing fields keep their defaults\n";
        lenient = true;
    }

    auto root = mapping_t{};
    for (const auto& m : node) {
        if (m.key != wire_format::KEY_VERSION) {
            root.insert(m.key, m.value);
        }
    }

    if (!root.contains(wire_format::KEY_TYPE)) {
        if (root.size() != 1 || !root.contains(wire_format::KEY_VALUE)) {
            throw field_error("", "document must hold either a 'type' or a single 'value' entry");
        }
        return {root.at(wire_format::KEY_VALUE), lenient};
    }
    return {value_t(std::move(root)), lenient};
}

// =============================================================================
// Load
// =============================================================================

auto codec_t::load_document(const value_t& document) const -> object_t {
    auto [root, lenient] = open_document(document);
    return decoder_t(types, lenient).decode(root);
}

auto codec_t::loads(std::string_view text) const -> object_t {
    return load_document(from_json(text));
}

auto codec_t::load(std::istream& is) const -> object_t {
    return load_document(json_reader(is).read());
}

auto codec_t::load_file(const fs::path& path) const -> object_t {
    return load_document(read_file(path));
}

// =============================================================================
// Files
// =============================================================================

auto codec_t::read_file(const fs::path& path) const -> value_t {
    auto file = std::ifstream{path, std::ios::binary};
    if (!file) {
        throw io_error(path.string(), "failed to open for reading");
    }
    return json_reader(file).read();
}

void codec_t::write_file(const fs::path& path, const std::string& text) const {
    auto tmp = path;
    tmp += ".tmp";

    {
        auto file = std::ofstream{tmp, std::ios::binary | std::ios::trunc};
        if (!file) {
            throw io_error(tmp.string(), "failed to open for writing");
        }
        file << text;
        file.close();
        if (!file) {
            auto ec = std::error_code{};
            fs::remove(tmp, ec);
            throw io_error(tmp.string(), "write failed");
        }
    }

    auto ec = std::error_code{};
    fs::rename(tmp, path, ec);
    if (ec) {
        auto ignored = std::error_code{};
        fs::remove(tmp, ignored);
        throw io_error(path.string(), "rename failed: " + ec.message());
    }
}

} // namespace phijson
