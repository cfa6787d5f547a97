#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include "phijson/errors.hpp"
#include "phijson/value.hpp"

using namespace phijson;

// =============================================================================
// Helpers
// =============================================================================

template<typename E, typename F>
auto throws(F&& f) -> bool {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

// =============================================================================
// value_t tests
// =============================================================================

void test_scalar_kinds() {
    std::cout << "Testing scalar kinds... ";

    assert(value_t().is_null());
    assert(value_t(null_t{}).is_null());
    assert(value_t(true).is_bool());
    assert(value_t(42).is_int());
    assert(value_t(std::int64_t{-7}).as_int() == -7);
    assert(value_t(2.5).is_float());
    assert(value_t("text").is_text());
    assert(value_t(std::string("abc")).as_text() == "abc");

    assert(std::string(value_t(1.0).kind_name()) == "float");
    assert(std::string(value_t(sequence_t{}).kind_name()) == "sequence");
    assert(std::string(value_t(mapping_t{}).kind_name()) == "mapping");

    std::cout << "PASSED\n";
}

void test_wrong_kind_access() {
    std::cout << "Testing wrong kind access... ";

    assert(throws<field_error>([] { value_t(1).as_text(); }));
    assert(throws<field_error>([] { value_t("1").as_int(); }));
    assert(throws<field_error>([] { value_t(1.0).as_int(); }));
    assert(throws<codec_error>([] { value_t().as_sequence(); }));

    std::cout << "PASSED\n";
}

void test_mapping_order_and_keys() {
    std::cout << "Testing mapping insertion order... ";

    auto m = mapping_t{};
    m.insert("zeta", value_t(1));
    m.insert("alpha", value_t(2));
    m.insert("mid", value_t(3));

    auto keys = std::vector<std::string>{};
    for (const auto& member : m) {
        keys.push_back(member.key);
    }
    assert((keys == std::vector<std::string>{"zeta", "alpha", "mid"}));
    assert(m.size() == 3);
    assert(m.contains("alpha"));
    assert(m.find("missing") == nullptr);
    assert(m.at("mid").as_int() == 3);

    assert(throws<codec_error>([&m] { m.insert("alpha", value_t(9)); }));

    try {
        m.at("missing");
        assert(false);
    } catch (const field_error& e) {
        assert(e.path() == "missing");
    }

    std::cout << "PASSED\n";
}

void test_mapping_equality() {
    std::cout << "Testing mapping equality... ";

    auto a = mapping_t{};
    a.insert("x", value_t(1));
    a.insert("y", value_t("two"));

    auto b = mapping_t{};
    b.insert("x", value_t(1));
    b.insert("y", value_t("two"));

    auto c = mapping_t{};
    c.insert("y", value_t("two"));
    c.insert("x", value_t(1));

    assert(a == b);
    assert(!(a == c));
    assert(value_t(a) == value_t(b));
    assert(!(value_t(1) == value_t(1.0)));

    std::cout << "PASSED\n";
}

void test_tag() {
    std::cout << "Testing type tag lookup... ";

    auto tagged = mapping_t{};
    tagged.insert("type", value_t("Cut"));
    tagged.insert("from_nodes", value_t(sequence_t{value_t(0)}));
    assert(value_t(tagged).tag() != nullptr);
    assert(*value_t(tagged).tag() == "Cut");

    auto plain = mapping_t{};
    plain.insert("x", value_t(1));
    assert(value_t(plain).tag() == nullptr);
    assert(value_t(3).tag() == nullptr);

    auto bad = mapping_t{};
    bad.insert("type", value_t(5));
    assert(throws<field_error>([&bad] { value_t(bad).tag(); }));

    std::cout << "PASSED\n";
}

// =============================================================================
// Float sentinels
// =============================================================================

void test_float_sentinels() {
    std::cout << "Testing float sentinels... ";

    auto nan = std::numeric_limits<double>::quiet_NaN();
    auto inf = std::numeric_limits<double>::infinity();

    assert(float_to_value(nan).as_text() == "NaN");
    assert(float_to_value(inf).as_text() == "Infinity");
    assert(float_to_value(-inf).as_text() == "-Infinity");
    assert(float_to_value(1.5).as_float() == 1.5);

    assert(std::isnan(value_to_float(value_t("NaN"))));
    assert(value_to_float(value_t("Infinity")) == inf);
    assert(value_to_float(value_t("-Infinity")) == -inf);
    assert(value_to_float(value_t(3)) == 3.0);
    assert(throws<field_error>([] { value_to_float(value_t("nan")); }));
    assert(throws<field_error>([] { value_to_float(value_t(true)); }));

    assert(is_float_like(value_t(1)));
    assert(is_float_like(value_t("Infinity")));
    assert(!is_float_like(value_t("inf")));

    std::cout << "PASSED\n";
}

// =============================================================================
// field_error paths
// =============================================================================

void test_field_error_paths() {
    std::cout << "Testing field_error paths... ";

    auto e = field_error("phi", "expected float, got text");
    assert(e.within("cause").path() == "cause.phi");
    assert(e.within("[2]").within("distinctions").path() == "distinctions[2].phi");
    assert(field_error("", "missing").within("ces").path() == "ces");
    assert(e.within("x").detail() == "expected float, got text");

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Canonical Values ===\n\n";

    test_scalar_kinds();
    test_wrong_kind_access();
    test_mapping_order_and_keys();
    test_mapping_equality();
    test_tag();

    std::cout << "\n=== Floats and Errors ===\n\n";

    test_float_sentinels();
    test_field_error_paths();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
