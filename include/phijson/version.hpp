#pragma once

// Version gate: decides whether a document's format version can be read by
// the running codec.

#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include "format.hpp"

namespace phijson {

struct semver_t {
    int major = 0;
    int minor = 0;
    int patch = 0;

    // "MAJOR.MINOR.PATCH", optionally followed by a "-pre" or "+build"
    // suffix, which is ignored. Returns nullopt for anything else.
    static auto parse(std::string_view text) -> std::optional<semver_t>;

    auto operator<=>(const semver_t&) const = default;
};

auto to_string(const semver_t& v) -> std::string;

enum class gate_decision {
    proceed,
    proceed_with_warning,
    reject,
};

inline auto to_string(gate_decision d) -> const char* {
    switch (d) {
        case gate_decision::proceed:              return "proceed";
        case gate_decision::proceed_with_warning: return "proceed_with_warning";
        case gate_decision::reject:               return "reject";
    }
    return "unknown";
}

// ============================================================================
// version_gate_t
// ============================================================================
//
//   same major, same minor           -> proceed (patch releases share a format)
//   same major, older minor          -> proceed_with_warning
//   newer minor, other major, or an
//   unparseable stamp                -> reject

class version_gate_t {
public:
    explicit version_gate_t(std::string_view current = wire_format::VERSION);

    auto check(std::string_view stamp) const -> gate_decision;

    // Throws incompatible_version on reject. An absent stamp is rejected.
    auto require(const std::optional<std::string>& stamp) const -> gate_decision;

    auto current() const -> const std::string& { return current_text; }

private:
    std::string current_text;
    semver_t current_version;
};

} // namespace phijson
