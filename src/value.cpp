// value.cpp - canonical value tree

#include <cmath>
#include <limits>
#include "phijson/errors.hpp"
#include "phijson/format.hpp"
#include "phijson/value.hpp"

namespace phijson {

// =============================================================================
// mapping_t
// =============================================================================

auto mapping_t::size() const -> std::size_t {
    return members.size();
}

auto mapping_t::empty() const -> bool {
    return members.empty();
}

auto mapping_t::contains(std::string_view key) const -> bool {
    return find(key) != nullptr;
}

auto mapping_t::find(std::string_view key) const -> const value_t* {
    for (const auto& m : members) {
        if (m.key == key) {
            return &m.value;
        }
    }
    return nullptr;
}

auto mapping_t::at(std::string_view key) const -> const value_t& {
    if (auto* v = find(key)) {
        return *v;
    }
    throw field_error(std::string(key), "missing field");
}

void mapping_t::insert(std::string key, value_t value) {
    if (contains(key)) {
        throw codec_error("duplicate key '" + key + "' in mapping");
    }
    members.push_back(member_t{std::move(key), std::move(value)});
}

auto mapping_t::begin() const -> const_iterator {
    return members.begin();
}

auto mapping_t::end() const -> const_iterator {
    return members.end();
}

auto operator==(const mapping_t& a, const mapping_t& b) -> bool {
    if (a.members.size() != b.members.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.members.size(); ++i) {
        if (a.members[i].key != b.members[i].key || !(a.members[i].value == b.members[i].value)) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// value_t
// =============================================================================

namespace {

template <typename T>
auto expect_kind(const value_t& v, const char* wanted) -> const T& {
    if (auto* p = std::get_if<T>(&v.data)) {
        return *p;
    }
    throw field_error("", std::string("expected ") + wanted + ", got " + v.kind_name());
}

} // namespace

auto value_t::as_bool() const -> bool {
    return expect_kind<bool>(*this, "bool");
}

auto value_t::as_int() const -> std::int64_t {
    return expect_kind<std::int64_t>(*this, "int");
}

auto value_t::as_float() const -> double {
    return expect_kind<double>(*this, "float");
}

auto value_t::as_text() const -> const std::string& {
    return expect_kind<std::string>(*this, "text");
}

auto value_t::as_sequence() const -> const sequence_t& {
    return expect_kind<sequence_t>(*this, "sequence");
}

auto value_t::as_mapping() const -> const mapping_t& {
    return expect_kind<mapping_t>(*this, "mapping");
}

auto value_t::kind_name() const -> const char* {
    switch (data.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "float";
        case 4: return "text";
        case 5: return "sequence";
        case 6: return "mapping";
    }
    return "unknown";
}

auto value_t::tag() const -> const std::string* {
    auto* m = std::get_if<mapping_t>(&data);
    if (!m) {
        return nullptr;
    }
    auto* t = m->find(wire_format::KEY_TYPE);
    if (!t) {
        return nullptr;
    }
    if (!t->is_text()) {
        throw field_error(std::string(wire_format::KEY_TYPE), std::string("expected text, got ") + t->kind_name());
    }
    return &t->as_text();
}

auto operator==(const value_t& a, const value_t& b) -> bool {
    return a.data == b.data;
}

// =============================================================================
// Floats on the wire
// =============================================================================

auto float_to_value(double x) -> value_t {
    if (std::isnan(x)) {
        return value_t(wire_format::NAN_TEXT);
    }
    if (std::isinf(x)) {
        return value_t(x > 0 ? wire_format::POS_INF_TEXT : wire_format::NEG_INF_TEXT);
    }
    return value_t(x);
}

auto value_to_float(const value_t& v) -> double {
    if (v.is_float()) {
        return v.as_float();
    }
    if (v.is_int()) {
        return static_cast<double>(v.as_int());
    }
    if (v.is_text()) {
        const auto& s = v.as_text();
        if (s == wire_format::NAN_TEXT) return std::numeric_limits<double>::quiet_NaN();
        if (s == wire_format::POS_INF_TEXT) return std::numeric_limits<double>::infinity();
        if (s == wire_format::NEG_INF_TEXT) return -std::numeric_limits<double>::infinity();
        throw field_error("", "expected float, got text '" + s + "'");
    }
    throw field_error("", std::string("expected float, got ") + v.kind_name());
}

auto is_float_like(const value_t& v) -> bool {
    return v.is_float() || v.is_int() || (v.is_text() && wire_format::is_float_sentinel(v.as_text()));
}

} // namespace phijson
