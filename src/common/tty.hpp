#ifndef MARKDOWN_ACADEMIC_TTY_HPP
#define MARKDOWN_ACADEMIC_TTY_HPP

#include <cstdio>

namespace markdown_academic {

/// @brief Returns `true` if `file` is connected to a terminal,
/// in which case diagnostics and dumps are printed with ANSI colors.
/// Always `false` on platforms without `isatty`.
[[nodiscard]] bool is_tty(std::FILE* file) noexcept;

/// @brief `is_tty(stdout)`, computed once at startup.
extern const bool is_stdout_tty;

} // namespace markdown_academic

#endif
