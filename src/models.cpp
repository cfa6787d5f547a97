// models.cpp - registration and example values of the stored result types

#include <cmath>
#include <limits>
#include "phijson/codec.hpp"
#include "phijson/models.hpp"

namespace phijson::models {

auto from_string(std::type_identity<direction>, const std::string& s) -> direction {
    if (s == "CAUSE") return direction::cause;
    if (s == "EFFECT") return direction::effect;
    if (s == "BIDIRECTIONAL") return direction::bidirectional;
    throw field_error("", "invalid direction '" + s + "'");
}

auto cause_effect_structure_t::sum_phi() const -> double {
    auto total = 0.0;
    for (const auto& d : distinctions) total += d.phi;
    for (const auto& r : relations) total += r.phi;
    return total;
}

auto phi_structure_t::big_phi() const -> double {
    if (std::holds_alternative<null_sia_t>(sia)) {
        return 0.0;
    }
    return ces.sum_phi();
}

void register_models(type_registry_t& registry) {
    registry.add<network_t>("Network");
    registry.add<subsystem_t>("Subsystem");
    registry.add<cut_t>("Cut");
    registry.add<mice_t>("MaximallyIrreducibleCauseOrEffect");
    registry.add<distinction_t>("Distinction");
    registry.add<relation_t>("Relation");
    registry.add<cause_effect_structure_t>("CauseEffectStructure");
    registry.add<system_irreducibility_analysis_t>("SystemIrreducibilityAnalysis");
    registry.add<null_sia_t>("NullSystemIrreducibilityAnalysis");
    registry.add<phi_structure_t>("PhiStructure");
}

// =============================================================================
// Examples
// =============================================================================

auto basic_network() -> network_t {
    // State-by-node; row i is the state with node k on iff bit k of i is set.
    auto tpm = array_t({8, 3}, std::vector<double>{
        0, 0, 0,
        0, 0, 1,
        1, 0, 1,
        1, 0, 0,
        1, 1, 0,
        1, 1, 1,
        1, 1, 1,
        1, 1, 0,
    });
    auto cm = array_t({3, 3}, std::vector<std::int64_t>{
        0, 0, 1,
        1, 0, 1,
        1, 1, 0,
    });
    return network_t{std::move(tpm), std::move(cm), {"A", "B", "C"}};
}

auto basic_subsystem() -> subsystem_t {
    return subsystem_t{basic_network(), {1, 0, 0}, {0, 1, 2}};
}

auto basic_cut() -> cut_t {
    return cut_t{direction::bidirectional, {0}, {1, 2}};
}

auto basic_distinction() -> distinction_t {
    auto cause = mice_t{
        direction::cause, {0}, {1, 2}, {0, 0}, 0.5,
        array_t({2, 2}, std::vector<double>{0.5, 0.0, 0.0, 0.5}),
        array_t({2, 2}, std::vector<double>{0.25, 0.25, 0.25, 0.25}),
    };
    auto effect = mice_t{
        direction::effect, {0}, {2}, {1}, 0.25,
        array_t({2}, std::vector<double>{0.0, 1.0}),
        array_t({2}, std::vector<double>{0.5, 0.5}),
    };
    return distinction_t{{0}, {1}, 0.25, std::move(cause), std::move(effect)};
}

auto basic_relation() -> relation_t {
    return relation_t{{{0}, {1}, {0, 1}}, {2}, 0.125};
}

auto basic_ces() -> cause_effect_structure_t {
    auto second = distinction_t{
        {1}, {0}, 0.5,
        mice_t{
            direction::cause, {1}, {0, 2}, {1, 0}, 0.5,
            array_t({2, 2}, std::vector<double>{0.0, 1.0, 0.0, 0.0}),
            array_t({2, 2}, std::vector<double>{0.0, 0.5, 0.0, 0.5}),
        },
        mice_t{
            direction::effect, {1}, {2}, {1}, 0.5,
            array_t({2}, std::vector<double>{0.0, 1.0}),
            array_t({2}, std::vector<double>{0.5, 0.5}),
        },
    };
    return cause_effect_structure_t{{basic_distinction(), std::move(second)}, {basic_relation()}};
}

auto basic_sia() -> system_irreducibility_analysis_t {
    return system_irreducibility_analysis_t{2.3125, {0, 1, 2}, {1, 0, 0}, basic_cut(), basic_ces()};
}

auto reducible_sia() -> null_sia_t {
    return null_sia_t{{0, 1}, {"subsystem is not strongly connected"}};
}

auto basic_phi_structure() -> phi_structure_t {
    return phi_structure_t{basic_sia(), basic_ces()};
}

auto example_fixtures() -> std::vector<fixture_t> {
    constexpr auto nan = std::numeric_limits<double>::quiet_NaN();
    constexpr auto inf = std::numeric_limits<double>::infinity();

    auto sentinels = array_t({2, 3}, std::vector<double>{1.0, nan, -2.5, inf, -inf, 0.0});
    auto purview = object_set_t{object_t(2), object_t(0), object_t(1)};
    auto labels = dict_t{{"A", object_t(0)}, {"B", object_t(1)}, {"C", object_t(2)}};

    return {
        {"network", object_t(basic_network())},
        {"subsystem", object_t(basic_subsystem())},
        {"cut", object_t(basic_cut())},
        {"distinction", object_t(basic_distinction())},
        {"relation", object_t(basic_relation())},
        {"ces", object_t(basic_ces())},
        {"sia", object_t(basic_sia())},
        {"null_sia", object_t(reducible_sia())},
        {"phi_structure", object_t(basic_phi_structure())},
        {"null_phi_structure", object_t(phi_structure_t{reducible_sia(), {}})},
        {"array_sentinels", object_t(std::move(sentinels))},
        {"purview_set", object_t(std::move(purview))},
        {"node_labels", object_t(std::move(labels))},
    };
}

} // namespace phijson::models
