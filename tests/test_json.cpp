#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include "phijson/errors.hpp"
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

auto make_document() -> value_t {
    auto inner = mapping_t{};
    inner.insert("type", value_t("Cut"));
    inner.insert("from_nodes", value_t(sequence_t{value_t(0), value_t(1)}));
    inner.insert("to_nodes", value_t(sequence_t{}));

    auto root = mapping_t{};
    root.insert("version", value_t("1.1.0"));
    root.insert("phi", value_t(2.0));
    root.insert("label", value_t("a \"quoted\"\nline"));
    root.insert("flags", value_t(sequence_t{value_t(true), value_t(null_t{})}));
    root.insert("partition", value_t(std::move(inner)));
    root.insert("empty", value_t(mapping_t{}));
    return value_t(std::move(root));
}

// =============================================================================
// Writer
// =============================================================================

void test_pretty_layout() {
    std::cout << "Testing pretty layout... ";

    auto expected = std::string(
        "{\n"
        "    \"version\": \"1.1.0\",\n"
        "    \"phi\": 2.0,\n"
        "    \"label\": \"a \\\"quoted\\\"\\nline\",\n"
        "    \"flags\": [true, null],\n"
        "    \"partition\": {\n"
        "        \"type\": \"Cut\",\n"
        "        \"from_nodes\": [0, 1],\n"
        "        \"to_nodes\": []\n"
        "    },\n"
        "    \"empty\": {}\n"
        "}\n");
    assert(to_json(make_document()) == expected);

    std::cout << "PASSED\n";
}

void test_compact_layout() {
    std::cout << "Testing compact layout... ";

    auto text = to_json(make_document(), 0);
    assert(text.find('\n') == std::string::npos);
    assert(text.find(' ') == text.find("a \\\"quoted") + 1);
    assert(text.starts_with("{\"version\":\"1.1.0\",\"phi\":2.0,"));

    auto nested = value_t(sequence_t{value_t(sequence_t{value_t(1)}), value_t(2)});
    assert(to_json(nested, 0) == "[[1],2]");
    assert(to_json(nested, 2) == "[\n  [1],\n  2\n]\n");

    std::cout << "PASSED\n";
}

void test_float_format() {
    std::cout << "Testing float format... ";

    assert(to_json(value_t(1.0), 0) == "1.0");
    assert(to_json(value_t(0.1), 0) == "0.1");
    assert(to_json(value_t(-2.5), 0) == "-2.5");
    assert(to_json(value_t(2.3125), 0) == "2.3125");
    assert(to_json(value_t(1e300), 0) == "1e+300");
    assert(to_json(value_t(7), 0) == "7");

    assert(throws<codec_error>([] { to_json(value_t(std::numeric_limits<double>::quiet_NaN())); }));
    assert(throws<codec_error>([] { to_json(value_t(std::numeric_limits<double>::infinity())); }));

    std::cout << "PASSED\n";
}

void test_escapes() {
    std::cout << "Testing string escapes... ";

    assert(to_json(value_t("tab\there"), 0) == "\"tab\\there\"");
    assert(to_json(value_t(std::string("\x01", 1)), 0) == "\"\\u0001\"");
    assert(to_json(value_t("back\\slash"), 0) == "\"back\\\\slash\"");

    std::cout << "PASSED\n";
}

// =============================================================================
// Reader
// =============================================================================

void test_parse_document() {
    std::cout << "Testing parse of written document... ";

    auto doc = make_document();
    assert(from_json(to_json(doc)) == doc);
    assert(from_json(to_json(doc, 0)) == doc);
    assert(to_json(from_json(to_json(doc))) == to_json(doc));

    std::cout << "PASSED\n";
}

void test_parse_numbers() {
    std::cout << "Testing number parsing... ";

    assert(from_json("42").is_int());
    assert(from_json("-0").is_int());
    assert(from_json("42.0").is_float());
    assert(from_json("1e3").as_float() == 1000.0);
    assert(from_json("-1.5E-1").as_float() == -0.15);
    assert(from_json("9223372036854775807").as_int() == std::numeric_limits<std::int64_t>::max());

    assert(throws<parse_error>([] { from_json("01"); }));
    assert(throws<parse_error>([] { from_json("1."); }));
    assert(throws<parse_error>([] { from_json(".5"); }));
    assert(throws<parse_error>([] { from_json("+1"); }));
    assert(throws<parse_error>([] { from_json("9223372036854775808"); }));
    assert(throws<parse_error>([] { from_json("NaN"); }));

    std::cout << "PASSED\n";
}

void test_parse_strings() {
    std::cout << "Testing string parsing... ";

    assert(from_json("\"a\\u00e9b\"").as_text() == "a\xc3\xa9" "b");
    assert(from_json("\"\\ud83d\\ude00\"").as_text() == "\xf0\x9f\x98\x80");
    assert(from_json("\"\\/\"").as_text() == "/");

    assert(throws<parse_error>([] { from_json("\"unterminated"); }));
    assert(throws<parse_error>([] { from_json("\"\\ud83d\""); }));
    assert(throws<parse_error>([] { from_json("\"\\q\""); }));

    std::cout << "PASSED\n";
}

void test_parse_errors_report_position() {
    std::cout << "Testing parse error positions... ";

    try {
        from_json("{\n  \"a\": 1,\n  \"b\" 2\n}");
        assert(false);
    } catch (const parse_error& e) {
        assert(e.line() == 3);
        assert(e.column() == 7);
    }

    try {
        from_json("[1, 2] x");
        assert(false);
    } catch (const parse_error& e) {
        assert(e.line() == 1);
        assert(e.column() == 8);
    }

    assert(throws<parse_error>([] { from_json(""); }));
    assert(throws<parse_error>([] { from_json("[1, 2,]"); }));
    assert(throws<parse_error>([] { from_json("{\"a\": 1,}"); }));
    assert(throws<parse_error>([] { from_json("nul"); }));

    std::cout << "PASSED\n";
}

void test_duplicate_keys() {
    std::cout << "Testing duplicate key rejection... ";

    try {
        from_json("{\"a\": 1,\n \"a\": 2}");
        assert(false);
    } catch (const parse_error& e) {
        assert(e.line() == 2);
        assert(e.column() == 2);
        assert(std::string(e.what()).find("duplicate key 'a'") != std::string::npos);
    }

    std::cout << "PASSED\n";
}

void test_whitespace() {
    std::cout << "Testing whitespace... ";

    auto value = from_json(" \t\r\n[1,\r\n\t2] \n");
    assert(value.as_sequence().size() == 2);
    assert(value.as_sequence()[1].as_int() == 2);

    assert(throws<parse_error>([] { from_json("\v[1]"); }));
    assert(throws<parse_error>([] { from_json("[1,\f2]"); }));
    assert(throws<parse_error>([] { from_json("{\"a\": 1}\v"); }));

    std::cout << "PASSED\n";
}

void test_stream_reader() {
    std::cout << "Testing stream reader... ";

    auto ss = std::istringstream("  {\"x\": [1, 2.5, \"Infinity\"]}  \n");
    auto value = json_reader(ss).read();
    const auto& items = value.as_mapping().at("x").as_sequence();
    assert(items.size() == 3);
    assert(items[0].as_int() == 1);
    assert(items[1].as_float() == 2.5);
    assert(std::isinf(value_to_float(items[2])));

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== JSON Writer ===\n\n";

    test_pretty_layout();
    test_compact_layout();
    test_float_format();
    test_escapes();

    std::cout << "\n=== JSON Reader ===\n\n";

    test_parse_document();
    test_parse_numbers();
    test_parse_strings();
    test_parse_errors_report_position();
    test_duplicate_keys();
    test_whitespace();
    test_stream_reader();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
