#ifndef METAMARK_TTY_HPP
#define METAMARK_TTY_HPP

#include <cstdio>

namespace metamark {

// https://pubs.opengroup.org/onlinepubs/009695399/functions/isatty.html
[[nodiscard]] bool is_tty(std::FILE*) noexcept;

/// @brief True if `is_tty(stdout)` is `true`.
/// Diagnostics are only colored when this is set.
extern const bool is_stdout_tty;
/// @brief True if `is_tty(stderr)` is `true`.
extern const bool is_stderr_tty;

} // namespace metamark

#endif
