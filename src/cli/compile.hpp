#ifndef MARKDOWN_ACADEMIC_CLI_COMPILE_HPP
#define MARKDOWN_ACADEMIC_CLI_COMPILE_HPP

#include <memory_resource>
#include <string>
#include <string_view>

#include "mda/diagnostic.hpp"
#include "mda/document.hpp"
#include "mda/resolution/resolve.hpp"

namespace markdown_academic {

/// @brief A logger which prints every diagnostic to standard output, as it is logged.
struct Printing_Logger final : mda::Logger {
    std::string_view file;
    bool colors;
    std::pmr::memory_resource* memory;

    [[nodiscard]] Printing_Logger(std::string_view file,
                                  bool colors,
                                  std::pmr::memory_resource* memory,
                                  mda::Severity min_severity = mda::Severity::warning)
        : mda::Logger { min_severity }
        , file { file }
        , colors { colors }
        , memory { memory }
    {
    }

    void operator()(mda::Diagnostic&& diagnostic) final;
};

// The following functions print an error and exit the program with exit code 1 on failure.

std::pmr::string load_file(std::string_view file, std::pmr::memory_resource* memory);

mda::Document
parse_mda_file(std::string_view source, std::string_view file, std::pmr::memory_resource* memory);

mda::Resolved_Document resolve_document(mda::Document&& document,
                                        std::string_view file,
                                        const mda::Resolve_Config& config,
                                        std::pmr::memory_resource* memory);

/// @brief Returns the directory part of `file`, or an empty string if `file` has none.
[[nodiscard]] std::string_view parent_directory(std::string_view file);

} // namespace markdown_academic

#endif
