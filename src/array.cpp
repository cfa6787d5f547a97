// array.cpp - numeric arrays and the array-node codec

#include <cmath>
#include <limits>
#include "phijson/array.hpp"
#include "phijson/errors.hpp"

namespace phijson {

auto from_string(std::type_identity<dtype>, const std::string& s) -> dtype {
    if (s == "float64") return dtype::float64;
    if (s == "int64")   return dtype::int64;
    if (s == "bool")    return dtype::boolean;
    throw malformed_array("unknown dtype '" + s + "'");
}

auto shape_product(const std::vector<std::size_t>& shape) -> std::size_t {
    std::size_t n = 1;
    for (auto extent : shape) {
        if (extent != 0 && n > std::numeric_limits<std::size_t>::max() / extent) {
            throw malformed_array("shape product overflows");
        }
        n *= extent;
    }
    return n;
}

// =============================================================================
// array_t
// =============================================================================

array_t::array_t() : shape_{0}, data_(std::vector<double>{}) {}

array_t::array_t(std::vector<std::size_t> shape, std::vector<double> data)
    : shape_(std::move(shape)), data_(std::move(data)) {
    validate();
}

array_t::array_t(std::vector<std::size_t> shape, std::vector<std::int64_t> data)
    : shape_(std::move(shape)), data_(std::move(data)) {
    validate();
}

array_t::array_t(std::vector<std::size_t> shape, std::vector<bool> data)
    : shape_(std::move(shape)), data_(std::move(data)) {
    validate();
}

auto array_t::zeros(std::vector<std::size_t> shape, dtype kind) -> array_t {
    auto n = shape_product(shape);
    switch (kind) {
        case dtype::float64: return array_t(std::move(shape), std::vector<double>(n, 0.0));
        case dtype::int64:   return array_t(std::move(shape), std::vector<std::int64_t>(n, 0));
        case dtype::boolean: return array_t(std::move(shape), std::vector<bool>(n, false));
    }
    throw malformed_array("unknown dtype");
}

auto array_t::kind() const -> dtype {
    switch (data_.index()) {
        case 0: return dtype::float64;
        case 1: return dtype::int64;
        default: return dtype::boolean;
    }
}

auto array_t::size() const -> std::size_t {
    return std::visit([](const auto& v) { return v.size(); }, data_);
}

void array_t::validate() const {
    auto expected = shape_product(shape_);
    if (expected != size()) {
        throw malformed_array("shape product " + std::to_string(expected) +
                              " does not match data length " + std::to_string(size()));
    }
}

auto array_t::offset(std::initializer_list<std::size_t> index) const -> std::size_t {
    if (index.size() != shape_.size()) {
        throw malformed_array("index of rank " + std::to_string(index.size()) +
                              " for array of rank " + std::to_string(shape_.size()));
    }
    std::size_t flat = 0;
    std::size_t axis = 0;
    for (auto i : index) {
        if (i >= shape_[axis]) {
            throw malformed_array("index " + std::to_string(i) + " out of range on axis " + std::to_string(axis));
        }
        flat = flat * shape_[axis] + i;
        ++axis;
    }
    return flat;
}

auto array_t::at(std::initializer_list<std::size_t> index) const -> double {
    auto flat = offset(index);
    return std::visit([flat](const auto& v) { return static_cast<double>(v[flat]); }, data_);
}

auto operator==(const array_t& a, const array_t& b) -> bool {
    if (a.shape_ != b.shape_ || a.data_.index() != b.data_.index()) {
        return false;
    }
    if (auto* x = std::get_if<std::vector<double>>(&a.data_)) {
        const auto& y = std::get<std::vector<double>>(b.data_);
        for (std::size_t i = 0; i < x->size(); ++i) {
            auto u = (*x)[i];
            auto w = y[i];
            if (!(u == w || (std::isnan(u) && std::isnan(w)))) {
                return false;
            }
        }
        return true;
    }
    return a.data_ == b.data_;
}

// =============================================================================
// Array node codec
// =============================================================================

auto encode_array(const array_t& array) -> mapping_t {
    auto shape = sequence_t{};
    for (auto extent : array.shape()) {
        shape.emplace_back(extent);
    }

    auto data = sequence_t{};
    data.reserve(array.size());
    switch (array.kind()) {
        case dtype::float64:
            for (auto x : array.values<double>()) data.push_back(float_to_value(x));
            break;
        case dtype::int64:
            for (auto x : array.values<std::int64_t>()) data.emplace_back(x);
            break;
        case dtype::boolean:
            for (bool x : array.values<bool>()) data.emplace_back(x);
            break;
    }

    auto node = mapping_t{};
    node.insert(std::string(wire_format::KEY_TYPE), value_t(wire_format::TAG_ARRAY));
    node.insert(std::string(wire_format::KEY_SHAPE), value_t(std::move(shape)));
    node.insert(std::string(wire_format::KEY_DTYPE), value_t(to_string(array.kind())));
    node.insert(std::string(wire_format::KEY_DATA), value_t(std::move(data)));
    return node;
}

namespace {

auto required(const mapping_t& node, std::string_view key) -> const value_t& {
    if (auto* v = node.find(key)) {
        return *v;
    }
    throw malformed_array("missing '" + std::string(key) + "'");
}

template <typename T, typename Convert>
auto convert_data(const sequence_t& items, const char* kind, Convert convert) -> std::vector<T> {
    auto out = std::vector<T>{};
    out.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (!convert.accepts(items[i])) {
            throw malformed_array("element " + std::to_string(i) + " is " + items[i].kind_name() +
                                  ", expected " + kind);
        }
        out.push_back(convert(items[i]));
    }
    return out;
}

struct to_float64 {
    auto accepts(const value_t& v) const -> bool { return is_float_like(v); }
    auto operator()(const value_t& v) const -> double { return value_to_float(v); }
};

struct to_int64 {
    auto accepts(const value_t& v) const -> bool { return v.is_int(); }
    auto operator()(const value_t& v) const -> std::int64_t { return v.as_int(); }
};

struct to_boolean {
    auto accepts(const value_t& v) const -> bool { return v.is_bool(); }
    auto operator()(const value_t& v) const -> bool { return v.as_bool(); }
};

} // namespace

auto decode_array(const mapping_t& node) -> array_t {
    for (const auto& m : node) {
        if (m.key != wire_format::KEY_TYPE && m.key != wire_format::KEY_SHAPE &&
            m.key != wire_format::KEY_DTYPE && m.key != wire_format::KEY_DATA) {
            throw malformed_array("unexpected key '" + m.key + "'");
        }
    }

    const auto& shape_value = required(node, wire_format::KEY_SHAPE);
    const auto& dtype_value = required(node, wire_format::KEY_DTYPE);
    const auto& data_value = required(node, wire_format::KEY_DATA);

    if (!shape_value.is_sequence()) {
        throw malformed_array(std::string("shape is ") + shape_value.kind_name() + ", expected sequence");
    }
    auto shape = std::vector<std::size_t>{};
    for (const auto& extent : shape_value.as_sequence()) {
        if (!extent.is_int() || extent.as_int() < 0) {
            throw malformed_array("shape entries must be non-negative integers");
        }
        shape.push_back(static_cast<std::size_t>(extent.as_int()));
    }

    if (!dtype_value.is_text()) {
        throw malformed_array(std::string("dtype is ") + dtype_value.kind_name() + ", expected text");
    }
    auto kind = from_string(std::type_identity<dtype>{}, dtype_value.as_text());

    if (!data_value.is_sequence()) {
        throw malformed_array(std::string("data is ") + data_value.kind_name() + ", expected sequence");
    }
    const auto& items = data_value.as_sequence();
    if (shape_product(shape) != items.size()) {
        throw malformed_array("shape product " + std::to_string(shape_product(shape)) +
                              " does not match data length " + std::to_string(items.size()));
    }

    switch (kind) {
        case dtype::float64:
            return array_t(std::move(shape), convert_data<double>(items, "float64", to_float64{}));
        case dtype::int64:
            return array_t(std::move(shape), convert_data<std::int64_t>(items, "int64", to_int64{}));
        case dtype::boolean:
            return array_t(std::move(shape), convert_data<bool>(items, "bool", to_boolean{}));
    }
    throw malformed_array("unknown dtype");
}

} // namespace phijson
