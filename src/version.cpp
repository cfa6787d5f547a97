// version.cpp - semantic versions and the version gate

#include <cctype>
#include <charconv>
#include "phijson/errors.hpp"
#include "phijson/version.hpp"

namespace phijson {

auto semver_t::parse(std::string_view text) -> std::optional<semver_t> {
    auto end = text.find_first_of("-+");
    auto core = text.substr(0, end);

    int parts[3] = {0, 0, 0};
    std::size_t pos = 0;
    for (int k = 0; k < 3; ++k) {
        auto stop = (k < 2) ? core.find('.', pos) : core.size();
        if (stop == std::string_view::npos) {
            return std::nullopt;
        }
        auto piece = core.substr(pos, stop - pos);
        if (piece.empty() || !std::isdigit(static_cast<unsigned char>(piece.front()))) {
            return std::nullopt;
        }
        auto [ptr, ec] = std::from_chars(piece.data(), piece.data() + piece.size(), parts[k]);
        if (ec != std::errc{} || ptr != piece.data() + piece.size()) {
            return std::nullopt;
        }
        pos = stop + 1;
    }
    return semver_t{parts[0], parts[1], parts[2]};
}

auto to_string(const semver_t& v) -> std::string {
    return std::to_string(v.major) + "." + std::to_string(v.minor) + "." + std::to_string(v.patch);
}

version_gate_t::version_gate_t(std::string_view current) : current_text(current) {
    auto parsed = semver_t::parse(current);
    if (!parsed) {
        throw codec_error("invalid codec version '" + current_text + "'");
    }
    current_version = *parsed;
}

auto version_gate_t::check(std::string_view stamp) const -> gate_decision {
    auto found = semver_t::parse(stamp);
    if (!found || found->major != current_version.major) {
        return gate_decision::reject;
    }
    if (found->minor == current_version.minor) {
        return gate_decision::proceed;
    }
    if (found->minor < current_version.minor) {
        return gate_decision::proceed_with_warning;
    }
    return gate_decision::reject;
}

auto version_gate_t::require(const std::optional<std::string>& stamp) const -> gate_decision {
    if (!stamp) {
        throw incompatible_version("", current_text, "document has no version stamp");
    }
    auto decision = check(*stamp);
    if (decision == gate_decision::reject) {
        auto found = semver_t::parse(*stamp);
        if (!found) {
            throw incompatible_version(*stamp, current_text, "malformed version stamp");
        }
        if (found->major != current_version.major) {
            throw incompatible_version(*stamp, current_text, "major version differs");
        }
        throw incompatible_version(*stamp, current_text, "document was written by a newer minor version");
    }
    return decision;
}

} // namespace phijson
