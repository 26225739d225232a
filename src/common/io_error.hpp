#ifndef MARKDOWN_ACADEMIC_IO_ERROR_HPP
#define MARKDOWN_ACADEMIC_IO_ERROR_HPP

#include "common/config.hpp"

namespace markdown_academic {

enum struct IO_Error_Code : Default_Underlying {
    /// @brief The file could not be opened, e.g. because it does not exist.
    cannot_open,
    /// @brief The file was opened, but reading from it failed.
    read_error,
    /// @brief Writing to a file or stream failed.
    write_error,
};

} // namespace markdown_academic

#endif
