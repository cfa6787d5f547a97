#pragma once

// Rectangular numeric arrays with a runtime shape and element kind, and
// their array-node encoding.

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>
#include "errors.hpp"
#include "format.hpp"
#include "value.hpp"

namespace phijson {

// ============================================================================
// array_t - shape, dtype and flat row-major data
// ============================================================================
//
// Invariant: product(shape) == size(). The empty shape is a 0-d array with
// a single element. Constructors throw malformed_array when the invariant
// does not hold.

class array_t {
public:
    using data_t = std::variant<std::vector<double>, std::vector<std::int64_t>, std::vector<bool>>;

    array_t();
    array_t(std::vector<std::size_t> shape, std::vector<double> data);
    array_t(std::vector<std::size_t> shape, std::vector<std::int64_t> data);
    array_t(std::vector<std::size_t> shape, std::vector<bool> data);

    static auto zeros(std::vector<std::size_t> shape, dtype kind) -> array_t;

    auto shape() const -> const std::vector<std::size_t>& { return shape_; }
    auto kind() const -> dtype;
    auto rank() const -> std::size_t { return shape_.size(); }
    auto size() const -> std::size_t;

    // Flat storage; throws malformed_array if T does not match kind().
    template <typename T>
    auto values() const -> const std::vector<T>& {
        if (auto* v = std::get_if<std::vector<T>>(&data_)) {
            return *v;
        }
        throw malformed_array(std::string("array holds ") + to_string(kind()) +
                              ", requested " + to_string(element_dtype<T>()));
    }

    // Row-major offset of a multi-index; throws malformed_array when out of range.
    auto offset(std::initializer_list<std::size_t> index) const -> std::size_t;

    auto at(std::initializer_list<std::size_t> index) const -> double;

    // Element-wise equality; NaN compares equal to NaN.
    friend auto operator==(const array_t& a, const array_t& b) -> bool;

private:
    std::vector<std::size_t> shape_;
    data_t data_;

    void validate() const;
};

auto shape_product(const std::vector<std::size_t>& shape) -> std::size_t;

// ============================================================================
// Array node codec
// ============================================================================

// {"type": "__array__", "shape": [...], "dtype": "...", "data": [...]}
auto encode_array(const array_t& array) -> mapping_t;

// Accepts a mapping carrying the __array__ tag. Throws malformed_array on a
// bad shape, unknown dtype, element of the wrong kind, or shape/data mismatch.
auto decode_array(const mapping_t& node) -> array_t;

} // namespace phijson
