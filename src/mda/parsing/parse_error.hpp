#ifndef MARKDOWN_ACADEMIC_MDA_PARSE_ERROR_HPP
#define MARKDOWN_ACADEMIC_MDA_PARSE_ERROR_HPP

#include <string_view>

#include "common/source_position.hpp"

#include "mda/fwd.hpp"

namespace markdown_academic::mda {

enum struct Parse_Error_Code : Default_Underlying {
    /// @brief The front matter was opened with `+++`, but never closed.
    unterminated_front_matter,
    /// @brief The front matter contains malformed syntax,
    /// such as a missing `=`, an unterminated string, or an unterminated array.
    front_matter_syntax,
    /// @brief A known front matter key has a value of the wrong type,
    /// such as `title = 42`.
    front_matter_type,
    /// @brief The same key was assigned twice within one table.
    front_matter_duplicate_key,
};

[[nodiscard]] std::string_view parse_error_code_name(Parse_Error_Code code);

/// @brief An error which makes the whole document unusable.
/// Only the front matter can produce such errors;
/// the markup of the document body is always parsed successfully.
struct Parse_Error {
    Parse_Error_Code code;
    /// @brief The offending range within the whole document source.
    Local_Source_Span pos;
    /// @brief The key which the error is about, if any.
    /// This points into the document source.
    std::string_view subject {};
};

} // namespace markdown_academic::mda

#endif
