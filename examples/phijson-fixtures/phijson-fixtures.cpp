#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "phijson/codec.hpp"
#include "phijson/color.hpp"
#include "phijson/models.hpp"

using namespace phijson;

namespace fs = std::filesystem;

// =============================================================================
// Tool configuration
// =============================================================================

struct fixture_config_t {
    codec_options_t codec;
    std::vector<std::string> fixtures;  // empty selects every fixture
    auto operator==(const fixture_config_t&) const -> bool = default;
};

inline auto fields(const fixture_config_t& c) {
    return std::make_tuple(field("codec", c.codec), field("fixtures", c.fixtures));
}

inline auto fields(fixture_config_t& c) {
    return std::make_tuple(field("codec", c.codec), field("fixtures", c.fixtures));
}

struct arguments_t {
    std::string command;
    std::optional<fs::path> directory;
    std::optional<fs::path> config_file;
    std::vector<std::string> assignments;
};

static void print_usage(std::ostream& os, const char* program) {
    os << "usage: " << program << " write <dir> [--config <file>] [key=value ...]\n"
       << "       " << program << " verify <dir> [--config <file>] [key=value ...]\n"
       << "       " << program << " list\n"
       << "       " << program << " config [--config <file>] [key=value ...]\n";
}

static auto parse_arguments(int argc, char* argv[]) -> arguments_t {
    if (argc < 2) {
        throw std::runtime_error("missing command");
    }
    auto args = arguments_t{};
    args.command = argv[1];

    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--config requires a file name");
            }
            args.config_file = argv[++i];
        } else if (std::strchr(argv[i], '=')) {
            args.assignments.emplace_back(argv[i]);
        } else if (!args.directory) {
            args.directory = argv[i];
        } else {
            throw std::runtime_error(std::string("unexpected argument '") + argv[i] + "'");
        }
    }

    auto needs_dir = args.command == "write" || args.command == "verify";
    if (needs_dir && !args.directory) {
        throw std::runtime_error(args.command + " requires a directory");
    }
    if (!needs_dir && args.directory) {
        throw std::runtime_error(args.command + " does not take a directory");
    }
    return args;
}

static auto load_config(const type_registry_t& types, const arguments_t& args) -> fixture_config_t {
    auto config = fixture_config_t{};
    if (args.config_file) {
        config = codec_t(types).load_file_as<fixture_config_t>(*args.config_file);
    }
    for (const auto& assignment : args.assignments) {
        set(config, assignment);
    }
    return config;
}

static auto select_fixtures(const fixture_config_t& config) -> std::vector<models::fixture_t> {
    auto all = models::example_fixtures();
    if (config.fixtures.empty()) {
        return all;
    }
    auto selected = std::vector<models::fixture_t>{};
    for (const auto& name : config.fixtures) {
        auto it = std::find_if(all.begin(), all.end(), [&name](const auto& f) { return f.name == name; });
        if (it == all.end()) {
            throw std::runtime_error("unknown fixture '" + name + "'");
        }
        selected.push_back(*it);
    }
    return selected;
}

static auto root_tag(const codec_t& codec, const object_t& value) -> std::string {
    auto node = codec.encode(value);
    if (const auto* tag = node.tag()) {
        return *tag;
    }
    return node.kind_name();
}

// =============================================================================
// Commands
// =============================================================================

static auto run_write(const codec_t& codec, const fixture_config_t& config, const fs::path& dir) -> int {
    auto colors = color::for_stream(std::cout);
    fs::create_directories(dir);

    for (const auto& fixture : select_fixtures(config)) {
        auto path = dir / (fixture.name + ".json");
        codec.dump_file(fixture.value, path);
        std::cout << colors.info << "wrote " << colors.reset << path.string()
                  << " (" << fs::file_size(path) << " bytes)\n";
    }
    return 0;
}

static auto run_verify(const codec_t& codec, const fixture_config_t& config, const fs::path& dir) -> int {
    auto colors = color::for_stream(std::cout);
    auto err_colors = color::for_stream(std::cerr);
    auto failures = 0;

    for (const auto& fixture : select_fixtures(config)) {
        auto path = dir / (fixture.name + ".json");
        try {
            auto file = std::ifstream{path, std::ios::binary};
            if (!file) {
                throw io_error(path, "failed to open for reading");
            }
            auto buffer = std::ostringstream{};
            buffer << file.rdbuf();
            auto text = buffer.str();
            auto loaded = codec.loads(text);

            if (!(loaded == fixture.value)) {
                throw std::runtime_error("loaded value differs from the example");
            }
            if (codec.dumps(loaded) != text) {
                throw std::runtime_error("re-dump is not byte-identical to the file");
            }
            std::cout << colors.info << "ok " << colors.reset << path.string() << "\n";
        } catch (const std::exception& e) {
            std::cerr << err_colors.error << "error: " << err_colors.reset
                      << path.string() << ": " << e.what() << "\n";
            ++failures;
        }
    }

    if (failures > 0) {
        std::cerr << err_colors.error << "error: " << err_colors.reset
                  << failures << " fixture(s) failed verification\n";
        return 1;
    }
    return 0;
}

static auto run_list(const codec_t& codec) -> int {
    auto colors = color::for_stream(std::cout);
    for (const auto& fixture : models::example_fixtures()) {
        std::cout << colors.label << fixture.name << colors.reset
                  << " " << root_tag(codec, fixture.value) << "\n";
    }
    return 0;
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    auto err_colors = color::for_stream(std::cerr);

    auto args = arguments_t{};
    try {
        args = parse_arguments(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << err_colors.error << "error: " << err_colors.reset << e.what() << "\n";
        print_usage(std::cerr, argv[0]);
        return 1;
    }

    try {
        auto types = type_registry_t{};
        models::register_models(types);
        types.add<codec_options_t>("CodecOptions");
        types.add<fixture_config_t>("FixtureConfig");
        types.seal();

        auto config = load_config(types, args);
        auto codec = codec_t(types, config.codec);

        if (args.command == "write") {
            return run_write(codec, config, *args.directory);
        }
        if (args.command == "verify") {
            return run_verify(codec, config, *args.directory);
        }
        if (args.command == "list") {
            return run_list(codec);
        }
        if (args.command == "config") {
            codec.dump(config, std::cout);
            return 0;
        }
        std::cerr << err_colors.error << "error: " << err_colors.reset
                  << "unknown command '" << args.command << "'\n";
        print_usage(std::cerr, argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << err_colors.error << "error: " << err_colors.reset << e.what() << "\n";
        return 1;
    }
}
