#pragma once

// Error taxonomy for the phijson codec. Every failure is a codec_error so
// callers can catch the family, or one of the named kinds below.

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace phijson {

class codec_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Encode met a composite value whose C++ type has no registry entry.
class unregistered_type : public codec_error {
public:
    explicit unregistered_type(std::string type_name)
        : codec_error("unregistered type: " + type_name), name(std::move(type_name)) {}

    auto type_name() const -> const std::string& { return name; }

private:
    std::string name;
};

// Decode met a type tag that is not in the registry.
class unknown_type : public codec_error {
public:
    explicit unknown_type(std::string type_tag)
        : codec_error("unknown type tag '" + type_tag + "'"), tag_(std::move(type_tag)) {}

    auto tag() const -> const std::string& { return tag_; }

private:
    std::string tag_;
};

class duplicate_type_tag : public codec_error {
public:
    duplicate_type_tag(std::string type_tag, const std::string& reason)
        : codec_error("cannot register type tag '" + type_tag + "': " + reason), tag_(std::move(type_tag)) {}

    auto tag() const -> const std::string& { return tag_; }

private:
    std::string tag_;
};

class malformed_array : public codec_error {
public:
    explicit malformed_array(const std::string& reason)
        : codec_error("malformed array: " + reason) {}
};

class incompatible_version : public codec_error {
public:
    incompatible_version(std::string found, std::string expected, const std::string& reason)
        : codec_error("incompatible document version '" + found + "' (codec version " + expected + "): " + reason),
          found_(std::move(found)), expected_(std::move(expected)) {}

    auto found() const -> const std::string& { return found_; }
    auto expected() const -> const std::string& { return expected_; }

private:
    std::string found_;
    std::string expected_;
};

class parse_error : public codec_error {
public:
    parse_error(const std::string& reason, int line, int column)
        : codec_error("parse error at line " + std::to_string(line) + ", column " +
                      std::to_string(column) + ": " + reason),
          line_(line), column_(column) {}

    auto line() const -> int { return line_; }
    auto column() const -> int { return column_; }

private:
    int line_;
    int column_;
};

// A typed decode found a value of the wrong shape. The path names the
// offending field, e.g. "ces.distinctions[2].phi".
class field_error : public codec_error {
public:
    field_error(std::string path, std::string detail)
        : codec_error(path.empty() ? detail : "field '" + path + "': " + detail),
          path_(std::move(path)), detail_(std::move(detail)) {}

    auto path() const -> const std::string& { return path_; }
    auto detail() const -> const std::string& { return detail_; }

    auto within(std::string_view outer) const -> field_error {
        if (path_.empty()) {
            return field_error(std::string(outer), detail_);
        }
        auto joined = std::string(outer);
        if (path_.front() != '[') {
            joined += '.';
        }
        joined += path_;
        return field_error(std::move(joined), detail_);
    }

private:
    std::string path_;
    std::string detail_;
};

class io_error : public codec_error {
public:
    io_error(const std::filesystem::path& path, const std::string& reason)
        : codec_error(path.string() + ": " + reason) {}
};

} // namespace phijson
