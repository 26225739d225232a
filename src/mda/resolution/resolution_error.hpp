#ifndef MARKDOWN_ACADEMIC_MDA_RESOLUTION_ERROR_HPP
#define MARKDOWN_ACADEMIC_MDA_RESOLUTION_ERROR_HPP

#include <memory_resource>
#include <string>
#include <string_view>

#include "mda/fwd.hpp"

namespace markdown_academic::mda {

enum struct Resolution_Error_Code : Default_Underlying {
    /// @brief The same label was attached to two blocks.
    duplicate_label,
    /// @brief A reference `@label` names no label, and references are resolved strictly.
    unknown_reference,
    /// @brief A citation key is missing from the bibliography, and citations are
    /// resolved strictly.
    unknown_citation,
    /// @brief A footnote reference `[^id]` has no definition, and references are
    /// resolved strictly.
    undefined_footnote,
    /// @brief Two footnote definitions `[^id]: ...` use the same id.
    duplicate_footnote,
    /// @brief The bibliography file could not be read.
    bibliography_unreadable,
    /// @brief The bibliography parser rejected the contents of the bibliography file.
    bibliography_invalid,
};

[[nodiscard]] std::string_view resolution_error_code_name(Resolution_Error_Code code);

struct Resolution_Error {
    Resolution_Error_Code code;
    /// @brief The label, citation key, footnote id, or bibliography path which the error is about.
    std::pmr::string subject;
    /// @brief Additional information, such as the message of the bibliography parser.
    std::pmr::string detail {};
};

} // namespace markdown_academic::mda

#endif
