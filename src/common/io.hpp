#ifndef MARKDOWN_ACADEMIC_IO_HPP
#define MARKDOWN_ACADEMIC_IO_HPP

#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "common/io_error.hpp"
#include "common/result.hpp"

namespace markdown_academic {

/// @brief Reads the whole file at `path` as raw bytes.
Result<std::pmr::vector<char>, IO_Error_Code> file_to_bytes(std::string_view path,
                                                            std::pmr::memory_resource* memory);

/// @brief Reads the whole file at `path` into a string.
Result<std::pmr::string, IO_Error_Code> file_to_string(std::string_view path,
                                                       std::pmr::memory_resource* memory);

/// @brief Joins a directory and a relative path with a single `/`.
/// If `path` is absolute or `directory` is empty, returns `path` unchanged.
std::pmr::string join_path(std::string_view directory,
                           std::string_view path,
                           std::pmr::memory_resource* memory);

} // namespace markdown_academic

#endif
