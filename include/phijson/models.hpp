#pragma once

// Result types stored in fixtures, their registration, and the hand-built
// example values the fixture tool writes.

#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <type_traits>
#include <variant>
#include <vector>
#include "array.hpp"
#include "object.hpp"
#include "protocol.hpp"
#include "registry.hpp"

namespace phijson::models {

// =============================================================================
// Direction with ADL string conversion
// =============================================================================

enum class direction { cause, effect, bidirectional };

inline auto to_string(direction d) -> const char* {
    switch (d) {
        case direction::cause: return "CAUSE";
        case direction::effect: return "EFFECT";
        case direction::bidirectional: return "BIDIRECTIONAL";
    }
    return "unknown";
}

auto from_string(std::type_identity<direction>, const std::string& s) -> direction;

// =============================================================================
// Network and subsystem
// =============================================================================

// tpm is state-by-node, [2^n, n] float64; cm is the [n, n] int64
// connectivity matrix.
struct network_t {
    array_t tpm;
    array_t cm;
    std::vector<std::string> node_labels;

    auto size() const -> std::size_t { return node_labels.size(); }
    auto operator==(const network_t&) const -> bool = default;
};

inline auto fields(const network_t& n) {
    return std::make_tuple(
        field("tpm", n.tpm),
        field("cm", n.cm),
        field("node_labels", n.node_labels)
    );
}

inline auto fields(network_t& n) {
    return std::make_tuple(
        field("tpm", n.tpm),
        field("cm", n.cm),
        field("node_labels", n.node_labels)
    );
}

struct subsystem_t {
    network_t network;
    std::vector<int> state;
    std::vector<int> node_indices;

    auto operator==(const subsystem_t&) const -> bool = default;
};

inline auto fields(const subsystem_t& s) {
    return std::make_tuple(
        field("network", s.network),
        field("state", s.state),
        field("node_indices", s.node_indices)
    );
}

inline auto fields(subsystem_t& s) {
    return std::make_tuple(
        field("network", s.network),
        field("state", s.state),
        field("node_indices", s.node_indices)
    );
}

// =============================================================================
// Partitions
// =============================================================================

// Severs the connections from from_nodes to to_nodes in the given direction.
struct cut_t {
    direction dir = direction::bidirectional;
    std::vector<int> from_nodes;
    std::vector<int> to_nodes;

    auto operator==(const cut_t&) const -> bool = default;
};

inline auto fields(const cut_t& c) {
    return std::make_tuple(
        field("direction", c.dir),
        field("from_nodes", c.from_nodes),
        field("to_nodes", c.to_nodes)
    );
}

inline auto fields(cut_t& c) {
    return std::make_tuple(
        field("direction", c.dir),
        field("from_nodes", c.from_nodes),
        field("to_nodes", c.to_nodes)
    );
}

// =============================================================================
// Distinctions
// =============================================================================

// Maximally irreducible cause or effect of a mechanism.
struct mice_t {
    direction dir = direction::cause;
    std::vector<int> mechanism;
    std::vector<int> purview;
    std::vector<int> state;
    double phi = 0.0;
    array_t repertoire;
    array_t partitioned_repertoire;

    auto operator==(const mice_t&) const -> bool = default;
};

inline auto fields(const mice_t& m) {
    return std::make_tuple(
        field("direction", m.dir),
        field("mechanism", m.mechanism),
        field("purview", m.purview),
        field("state", m.state),
        field("phi", m.phi),
        field("repertoire", m.repertoire),
        field("partitioned_repertoire", m.partitioned_repertoire)
    );
}

inline auto fields(mice_t& m) {
    return std::make_tuple(
        field("direction", m.dir),
        field("mechanism", m.mechanism),
        field("purview", m.purview),
        field("state", m.state),
        field("phi", m.phi),
        field("repertoire", m.repertoire),
        field("partitioned_repertoire", m.partitioned_repertoire)
    );
}

struct distinction_t {
    std::vector<int> mechanism;
    std::vector<int> mechanism_state;
    double phi = 0.0;
    mice_t cause;
    mice_t effect;

    auto operator==(const distinction_t&) const -> bool = default;
};

inline auto fields(const distinction_t& d) {
    return std::make_tuple(
        field("mechanism", d.mechanism),
        field("mechanism_state", d.mechanism_state),
        field("phi", d.phi),
        field("cause", d.cause),
        field("effect", d.effect)
    );
}

inline auto fields(distinction_t& d) {
    return std::make_tuple(
        field("mechanism", d.mechanism),
        field("mechanism_state", d.mechanism_state),
        field("phi", d.phi),
        field("cause", d.cause),
        field("effect", d.effect)
    );
}

// =============================================================================
// Relations
// =============================================================================

// Relata are identified by mechanism; both collections are unordered.
struct relation_t {
    std::set<std::vector<int>> relata;
    std::set<int> purview;
    double phi = 0.0;

    auto degree() const -> std::size_t { return relata.size(); }
    auto operator==(const relation_t&) const -> bool = default;
};

inline auto fields(const relation_t& r) {
    return std::make_tuple(
        field("relata", r.relata),
        field("purview", r.purview),
        field("phi", r.phi)
    );
}

inline auto fields(relation_t& r) {
    return std::make_tuple(
        field("relata", r.relata),
        field("purview", r.purview),
        field("phi", r.phi)
    );
}

// =============================================================================
// Cause-effect structure
// =============================================================================

struct cause_effect_structure_t {
    std::vector<distinction_t> distinctions;
    std::vector<relation_t> relations;

    // Not stored: recomputed from the distinctions and relations.
    auto sum_phi() const -> double;

    auto operator==(const cause_effect_structure_t&) const -> bool = default;
};

inline auto fields(const cause_effect_structure_t& c) {
    return std::make_tuple(
        field("distinctions", c.distinctions),
        field("relations", c.relations)
    );
}

inline auto fields(cause_effect_structure_t& c) {
    return std::make_tuple(
        field("distinctions", c.distinctions),
        field("relations", c.relations)
    );
}

// =============================================================================
// System irreducibility analysis
// =============================================================================

struct system_irreducibility_analysis_t {
    double phi = 0.0;
    std::vector<int> node_indices;
    std::vector<int> system_state;
    cut_t partition;
    std::optional<cause_effect_structure_t> ces;

    auto operator==(const system_irreducibility_analysis_t&) const -> bool = default;
};

inline auto fields(const system_irreducibility_analysis_t& s) {
    return std::make_tuple(
        field("phi", s.phi),
        field("node_indices", s.node_indices),
        field("system_state", s.system_state),
        field("partition", s.partition),
        field("ces", s.ces)
    );
}

inline auto fields(system_irreducibility_analysis_t& s) {
    return std::make_tuple(
        field("phi", s.phi),
        field("node_indices", s.node_indices),
        field("system_state", s.system_state),
        field("partition", s.partition),
        field("ces", s.ces)
    );
}

// Stands in for an analysis that was never run, e.g. a reducible system.
struct null_sia_t {
    std::vector<int> node_indices;
    std::vector<std::string> reasons;

    auto operator==(const null_sia_t&) const -> bool = default;
};

inline auto fields(const null_sia_t& n) {
    return std::make_tuple(
        field("node_indices", n.node_indices),
        field("reasons", n.reasons)
    );
}

inline auto fields(null_sia_t& n) {
    return std::make_tuple(
        field("node_indices", n.node_indices),
        field("reasons", n.reasons)
    );
}

struct phi_structure_t {
    std::variant<system_irreducibility_analysis_t, null_sia_t> sia;
    cause_effect_structure_t ces;

    // Zero when the analysis is null.
    auto big_phi() const -> double;

    auto operator==(const phi_structure_t&) const -> bool = default;
};

inline auto fields(const phi_structure_t& p) {
    return std::make_tuple(
        field("sia", p.sia),
        field("ces", p.ces)
    );
}

inline auto fields(phi_structure_t& p) {
    return std::make_tuple(
        field("sia", p.sia),
        field("ces", p.ces)
    );
}

// =============================================================================
// Registration and examples
// =============================================================================

// Registers every type above under its stable tag. Does not seal.
void register_models(type_registry_t& registry);

// The standard 3-node network: A = OR(B, C), B = AND(A, C), C = XOR(A, B).
auto basic_network() -> network_t;
auto basic_subsystem() -> subsystem_t;
auto basic_cut() -> cut_t;
auto basic_distinction() -> distinction_t;
auto basic_relation() -> relation_t;
auto basic_ces() -> cause_effect_structure_t;
auto basic_sia() -> system_irreducibility_analysis_t;
auto reducible_sia() -> null_sia_t;
auto basic_phi_structure() -> phi_structure_t;

struct fixture_t {
    std::string name;
    object_t value;
};

// Every fixture the tool knows, in a fixed order.
auto example_fixtures() -> std::vector<fixture_t>;

} // namespace phijson::models
