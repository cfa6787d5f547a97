#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include "phijson/errors.hpp"
#include "phijson/version.hpp"

using namespace phijson;

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
// semver_t tests
// =============================================================================

void test_parse() {
    std::cout << "Testing semver parse... ";

    auto v = semver_t::parse("1.12.3");
    assert(v);
    assert(v->major == 1 && v->minor == 12 && v->patch == 3);
    assert(to_string(*v) == "1.12.3");

    assert(semver_t::parse("2.0.0-rc.1") == (semver_t{2, 0, 0}));
    assert(semver_t::parse("1.1.0+build.5") == (semver_t{1, 1, 0}));

    assert(!semver_t::parse(""));
    assert(!semver_t::parse("1.1"));
    assert(!semver_t::parse("1.1.0.0"));
    assert(!semver_t::parse("v1.1.0"));
    assert(!semver_t::parse("1.x.0"));
    assert(!semver_t::parse("1..0"));

    assert((semver_t{1, 2, 0} < semver_t{1, 10, 0}));

    std::cout << "PASSED\n";
}

// =============================================================================
// version_gate_t tests
// =============================================================================

void test_gate_decisions() {
    std::cout << "Testing gate decisions... ";

    auto gate = version_gate_t("1.4.2");
    assert(gate.current() == "1.4.2");

    assert(gate.check("1.4.2") == gate_decision::proceed);
    assert(gate.check("1.4.0") == gate_decision::proceed);
    assert(gate.check("1.4.9") == gate_decision::proceed);
    assert(gate.check("1.3.7") == gate_decision::proceed_with_warning);
    assert(gate.check("1.0.0") == gate_decision::proceed_with_warning);
    assert(gate.check("1.5.0") == gate_decision::reject);
    assert(gate.check("2.4.2") == gate_decision::reject);
    assert(gate.check("0.4.2") == gate_decision::reject);
    assert(gate.check("one") == gate_decision::reject);

    assert(std::string(to_string(gate_decision::proceed_with_warning)) == "proceed_with_warning");

    std::cout << "PASSED\n";
}

void test_gate_require() {
    std::cout << "Testing gate require... ";

    auto gate = version_gate_t{};
    assert(gate.current() == "1.1.0");
    assert(gate.require(std::string("1.1.3")) == gate_decision::proceed);
    assert(gate.require(std::string("1.0.0")) == gate_decision::proceed_with_warning);

    try {
        gate.require(std::string("2.0.0"));
        assert(false);
    } catch (const incompatible_version& e) {
        assert(e.found() == "2.0.0");
        assert(e.expected() == "1.1.0");
        assert(std::string(e.what()).find("major version differs") != std::string::npos);
    }

    try {
        gate.require(std::nullopt);
        assert(false);
    } catch (const incompatible_version& e) {
        assert(e.found().empty());
    }

    assert(throws<incompatible_version>([&gate] { gate.require(std::string("1.2.0")); }));
    assert(throws<incompatible_version>([&gate] { gate.require(std::string("garbage")); }));
    assert(throws<codec_error>([] { version_gate_t("not.a.version"); }));

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Versions ===\n\n";

    test_parse();
    test_gate_decisions();
    test_gate_require();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
