#ifndef MARKDOWN_ACADEMIC_CODE_SPAN_TYPE_HPP
#define MARKDOWN_ACADEMIC_CODE_SPAN_TYPE_HPP

#include "common/fwd.hpp"

namespace markdown_academic {

/// @brief The type of a span in colored diagnostic output.
/// Every span of a `Code_String` is printed in the color associated with its type.
enum struct Code_Span_Type : Default_Underlying {
    /// @brief Plain prose.
    diagnostic_text,
    /// @brief Prose which is part of an error message.
    diagnostic_error_text,
    /// @brief A `file:line:column` location.
    diagnostic_code_position,
    /// @brief The `error:` prefix.
    diagnostic_error,
    /// @brief The `warning:` prefix.
    diagnostic_warning,
    /// @brief The `note:` prefix, and `info:`/`debug:` prefixes.
    diagnostic_note,
    diagnostic_line_number,
    diagnostic_punctuation,
    /// @brief The caret and tildes below an affected line.
    diagnostic_position_indicator,
    /// @brief Text quoted from the document source.
    diagnostic_code_citation,
    diagnostic_internal_error_notice,
    /// @brief A label, key or other name which a diagnostic is about.
    diagnostic_operand,
    /// @brief The name of an AST node.
    diagnostic_tag,
    /// @brief A property of an AST node.
    diagnostic_attribute,
    /// @brief An escape sequence such as `\n` in printed text.
    diagnostic_escape,
    diagnostic_internal,
};

} // namespace markdown_academic

#endif
