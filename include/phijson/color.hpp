#pragma once

#include <iostream>
#include <unistd.h>

namespace phijson {

// =============================================================================
// ANSI Color Support
// =============================================================================

namespace color {

namespace ansi {
    inline constexpr const char* reset   = "\033[0m";
    inline constexpr const char* red     = "\033[31m";
    inline constexpr const char* green   = "\033[32m";
    inline constexpr const char* yellow  = "\033[33m";
    inline constexpr const char* cyan    = "\033[36m";
} // namespace ansi

struct scheme_t {
    const char* reset   = ansi::reset;
    const char* label   = ansi::cyan;
    const char* info    = ansi::green;
    const char* warning = ansi::yellow;
    const char* error   = ansi::red;
};

inline auto enabled() -> scheme_t { return scheme_t{}; }
inline auto disabled() -> scheme_t {
    return scheme_t{"", "", "", "", ""};
}

inline auto is_tty(int fd) -> bool { return isatty(fd) != 0; }
inline auto is_tty(std::ostream& os) -> bool {
    if (&os == &std::cout) return is_tty(STDOUT_FILENO);
    if (&os == &std::cerr) return is_tty(STDERR_FILENO);
    return false;
}

inline auto for_stream(std::ostream& os) -> scheme_t {
    return is_tty(os) ? enabled() : disabled();
}

} // namespace color

} // namespace phijson
