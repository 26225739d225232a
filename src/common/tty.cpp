#include "common/tty.hpp"

#ifdef __unix__
#include <unistd.h>
#endif

namespace markdown_academic {

bool is_tty(std::FILE* file) noexcept
{
#ifdef __unix__
    return isatty(fileno(file)) != 0;
#else
    (void)file;
    return false;
#endif
}

const bool is_stdout_tty = is_tty(stdout);

} // namespace markdown_academic
