#ifndef MARKDOWN_ACADEMIC_SOURCE_POSITION_HPP
#define MARKDOWN_ACADEMIC_SOURCE_POSITION_HPP

#include <string_view>

#include "common/assert.hpp"
#include "common/config.hpp"

namespace markdown_academic {

/// Represents a position in a source file.
struct Local_Source_Position {
    /// Line number, starting at zero.
    Size line;
    /// Column number, starting at zero.
    Size column;
    /// Index in the source file of the first character of the syntactical element.
    Size begin;

    [[nodiscard]] friend constexpr auto operator<=>(Local_Source_Position, Local_Source_Position)
        = default;

    /// @brief Computes the position of the character at `index` within `source`.
    /// @param source the whole source
    /// @param index the index of the character, in range `[0, source.size()]`
    [[nodiscard]] static constexpr Local_Source_Position at(std::string_view source, Size index)
    {
        MARKDOWN_ACADEMIC_ASSERT(index <= source.size());
        Local_Source_Position result { .line = 0, .column = 0, .begin = index };
        for (Size i = 0; i < index; ++i) {
            if (source[i] == '\n') {
                ++result.line;
                result.column = 0;
            }
            else {
                ++result.column;
            }
        }
        return result;
    }

    [[nodiscard]] constexpr Local_Source_Position to_right(Size offset) const
    {
        return { .line = line, .column = column + offset, .begin = begin + offset };
    }
};

/// Represents a range of characters on a single line of a source file.
struct Local_Source_Span : Local_Source_Position {
    Size length;

    [[nodiscard]] friend constexpr auto operator<=>(Local_Source_Span, Local_Source_Span) = default;

    [[nodiscard]] constexpr bool empty() const
    {
        return length == 0;
    }

    /// @brief Returns the one-past-the-end position in the source.
    [[nodiscard]] constexpr Size end() const
    {
        return begin + length;
    }
};

} // namespace markdown_academic

#endif
