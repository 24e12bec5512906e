// ============================================================================
// cotree/core/check.hpp - Always-On Precondition Checks
// ============================================================================
//
// COTREE_CHECK(cond, msg) guards the structural preconditions of the
// intrusive containers: inserting a hook that is already linked, removing a
// hook from a list it does not belong to, and so on. Breaking one of these
// would silently corrupt link pointers, so the check stays on in Release
// builds too.
//
// On failure it prints the condition, message, and source location to stderr,
// then calls std::abort(). All checked conditions are O(1).
//
// Recoverable misuse (e.g. reparenting into a cycle) is reported through
// Result<T, Error> by the Try* operations instead. See error.hpp.
//
// ============================================================================

#pragma once

#include <charconv>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace cotree::detail {

[[noreturn]] inline void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    char line_buf[16];
    auto [line_end, ec] = std::to_chars(line_buf, line_buf + sizeof(line_buf), loc.line());
    if (ec != std::errc{}) {
        line_end = line_buf;
    }

    std::fputs("COTREE_CHECK(", stderr);
    std::fputs(cond_str, stderr);
    std::fputs(") failed: ", stderr);
    std::fputs(msg, stderr);
    std::fputs("\n  at ", stderr);
    std::fputs(loc.file_name(), stderr);
    std::fputs(":", stderr);
    std::fwrite(line_buf, 1, static_cast<size_t>(line_end - line_buf), stderr);
    std::fputs(" in ", stderr);
    std::fputs(loc.function_name(), stderr);
    std::fputs("\n", stderr);
    std::abort();
}

}  // namespace cotree::detail

#define COTREE_CHECK(cond, msg)                                                       \
    do {                                                                              \
        if (!(cond)) [[unlikely]] {                                                   \
            ::cotree::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                             \
    } while (0)
