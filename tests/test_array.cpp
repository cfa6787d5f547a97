#include <bit>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include "phijson/array.hpp"
#include "phijson/json_reader.hpp"
#include "phijson/json_writer.hpp"

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

auto bits(double x) -> std::uint64_t {
    return std::bit_cast<std::uint64_t>(x);
}

auto node_from(const char* text) -> mapping_t {
    return from_json(text).as_mapping();
}

// =============================================================================
// array_t tests
// =============================================================================

void test_construction() {
    std::cout << "Testing array construction... ";

    auto a = array_t({2, 3}, std::vector<double>{1, 2, 3, 4, 5, 6});
    assert(a.rank() == 2);
    assert(a.size() == 6);
    assert(a.kind() == dtype::float64);
    assert(a.offset({1, 2}) == 5);
    assert(a.at({1, 0}) == 4.0);

    auto scalar = array_t({}, std::vector<std::int64_t>{7});
    assert(scalar.rank() == 0);
    assert(scalar.size() == 1);

    auto empty = array_t({0, 4}, std::vector<bool>{});
    assert(empty.size() == 0);
    assert(empty.kind() == dtype::boolean);

    auto z = array_t::zeros({3, 3}, dtype::int64);
    assert(z.values<std::int64_t>().size() == 9);

    assert(throws<malformed_array>([] { array_t({2, 2}, std::vector<double>{1, 2, 3}); }));
    assert(throws<malformed_array>([] { array_t({}, std::vector<double>{}); }));
    assert(throws<malformed_array>([&a] { a.values<std::int64_t>(); }));
    assert(throws<malformed_array>([&a] { a.offset({2, 0}); }));
    assert(throws<malformed_array>([&a] { a.offset({0}); }));

    std::cout << "PASSED\n";
}

void test_equality() {
    std::cout << "Testing array equality... ";

    auto nan = std::numeric_limits<double>::quiet_NaN();
    auto a = array_t({2}, std::vector<double>{nan, 1.0});
    auto b = array_t({2}, std::vector<double>{nan, 1.0});
    auto c = array_t({1, 2}, std::vector<double>{nan, 1.0});
    auto d = array_t({2}, std::vector<std::int64_t>{0, 1});

    assert(a == b);
    assert(!(a == c));
    assert(!(a == d));

    std::cout << "PASSED\n";
}

// =============================================================================
// Array node codec
// =============================================================================

void test_node_layout() {
    std::cout << "Testing array node layout... ";

    auto a = array_t({2, 2}, std::vector<std::int64_t>{0, 1, 1, 0});
    auto text = to_json(value_t(encode_array(a)), 0);
    assert(text == "{\"type\":\"__array__\",\"shape\":[2,2],\"dtype\":\"int64\",\"data\":[0,1,1,0]}");

    auto flags = array_t({3}, std::vector<bool>{true, false, true});
    assert(to_json(value_t(encode_array(flags)), 0) ==
           "{\"type\":\"__array__\",\"shape\":[3],\"dtype\":\"bool\",\"data\":[true,false,true]}");

    std::cout << "PASSED\n";
}

void test_non_finite_fidelity() {
    std::cout << "Testing non-finite float fidelity... ";

    auto nan = std::numeric_limits<double>::quiet_NaN();
    auto inf = std::numeric_limits<double>::infinity();
    auto original = array_t({2, 3}, std::vector<double>{0.1, nan, -0.0, inf, -inf, 1e-300});

    auto text = to_json(value_t(encode_array(original)));
    assert(text.find("\"NaN\"") != std::string::npos);
    assert(text.find("\"Infinity\"") != std::string::npos);
    assert(text.find("\"-Infinity\"") != std::string::npos);

    auto loaded = decode_array(from_json(text).as_mapping());
    assert(loaded.shape() == original.shape());
    assert(loaded.kind() == dtype::float64);

    const auto& x = original.values<double>();
    const auto& y = loaded.values<double>();
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (std::isnan(x[i])) {
            assert(std::isnan(y[i]));
        } else {
            assert(bits(x[i]) == bits(y[i]));
        }
    }

    std::cout << "PASSED\n";
}

void test_int_widens_in_float_array() {
    std::cout << "Testing integer data in float64 array... ";

    auto a = decode_array(node_from(
        "{\"type\": \"__array__\", \"shape\": [2], \"dtype\": \"float64\", \"data\": [1, 2.5]}"));
    assert(a.values<double>()[0] == 1.0);
    assert(a.values<double>()[1] == 2.5);

    std::cout << "PASSED\n";
}

void test_malformed_nodes() {
    std::cout << "Testing malformed array nodes... ";

    // shape/data mismatch
    assert(throws<malformed_array>([] { decode_array(node_from(
        "{\"type\": \"__array__\", \"shape\": [2, 3], \"dtype\": \"float64\", \"data\": [1, 2, 3]}")); }));
    // bad element kind
    assert(throws<malformed_array>([] { decode_array(node_from(
        "{\"type\": \"__array__\", \"shape\": [2], \"dtype\": \"int64\", \"data\": [1, 2.0]}")); }));
    assert(throws<malformed_array>([] { decode_array(node_from(
        "{\"type\": \"__array__\", \"shape\": [1], \"dtype\": \"bool\", \"data\": [1]}")); }));
    assert(throws<malformed_array>([] { decode_array(node_from(
        "{\"type\": \"__array__\", \"shape\": [1], \"dtype\": \"float64\", \"data\": [\"nan\"]}")); }));
    // bad shape
    assert(throws<malformed_array>([] { decode_array(node_from(
        "{\"type\": \"__array__\", \"shape\": [-1], \"dtype\": \"float64\", \"data\": []}")); }));
    assert(throws<malformed_array>([] { decode_array(node_from(
        "{\"type\": \"__array__\", \"shape\": 3, \"dtype\": \"float64\", \"data\": [1, 2, 3]}")); }));
    // dtype
    assert(throws<malformed_array>([] { decode_array(node_from(
        "{\"type\": \"__array__\", \"shape\": [1], \"dtype\": \"complex128\", \"data\": [1]}")); }));
    // keys
    assert(throws<malformed_array>([] { decode_array(node_from(
        "{\"type\": \"__array__\", \"shape\": [1], \"dtype\": \"int64\"}")); }));
    assert(throws<malformed_array>([] { decode_array(node_from(
        "{\"type\": \"__array__\", \"shape\": [1], \"dtype\": \"int64\", \"data\": [1], \"order\": \"C\"}")); }));

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Arrays ===\n\n";

    test_construction();
    test_equality();

    std::cout << "\n=== Array Nodes ===\n\n";

    test_node_layout();
    test_non_finite_fidelity();
    test_int_widens_in_float_array();
    test_malformed_nodes();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
