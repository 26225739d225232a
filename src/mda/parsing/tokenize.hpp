#ifndef MARKDOWN_ACADEMIC_MDA_TOKENIZE_HPP
#define MARKDOWN_ACADEMIC_MDA_TOKENIZE_HPP

#include <memory_resource>
#include <optional>
#include <string_view>
#include <vector>

#include "mda/fwd.hpp"

// This file contains the recognizers for the atomic lexical patterns of the document language.
// Every recognizer either matches completely and returns a token (and possibly the remaining
// text), or returns `std::nullopt` without any effect.
// Block-level recognizers operate on a single line without its terminating newline.
// Inline recognizers operate on the remaining text of a paragraph, starting at the cursor.

namespace markdown_academic::mda {

// TEXT UTILITIES ==================================================================================

[[nodiscard]] constexpr bool is_ascii_alpha(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

[[nodiscard]] constexpr bool is_ascii_digit(char c)
{
    return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr bool is_ascii_alphanumeric(char c)
{
    return is_ascii_alpha(c) || is_ascii_digit(c);
}

/// @brief Returns `true` for ASCII alphanumeric characters and for all bytes of non-ASCII
/// UTF-8 sequences, which are assumed to be letters.
[[nodiscard]] constexpr bool is_word_character(char c)
{
    return is_ascii_alphanumeric(c) || static_cast<unsigned char>(c) >= 0x80;
}

[[nodiscard]] constexpr bool is_ascii_whitespace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]] constexpr bool is_ascii_punctuation(char c)
{
    return (c >= '!' && c <= '/') || (c >= ':' && c <= '@') || (c >= '[' && c <= '`')
        || (c >= '{' && c <= '~');
}

[[nodiscard]] std::string_view trim_start(std::string_view text);
[[nodiscard]] std::string_view trim_end(std::string_view text);
[[nodiscard]] std::string_view trim(std::string_view text);

/// @brief Returns `true` if the line consists only of whitespace.
[[nodiscard]] bool is_blank(std::string_view line);

/// @brief Returns the number of leading spaces and tabs, each counting as one column.
[[nodiscard]] Size indentation_of(std::string_view line);

/// @brief Splits `text` into lines, dropping the newline characters as well as
/// a `\r` preceding them.
/// A trailing newline does not produce an empty final line.
[[nodiscard]] std::pmr::vector<std::string_view> split_lines(std::string_view text,
                                                             std::pmr::memory_resource* memory);

template <typename T>
struct Match {
    T value;
    /// @brief The remaining, unconsumed text following the token.
    std::string_view rest;
};

// BLOCK TOKENS ====================================================================================

struct Heading_Token {
    int level;
    /// @brief The heading text, without closing `#`s and surrounding whitespace.
    std::string_view text;
};

/// @brief Matches an ATX heading, i.e. one to six `#` followed by whitespace.
[[nodiscard]] std::optional<Heading_Token> match_heading(std::string_view line);

/// @brief Matches three or more `-`, `*`, or `_`, possibly separated by spaces.
[[nodiscard]] bool is_thematic_break(std::string_view line);

/// @brief Matches `---pagebreak---`, `\pagebreak`, `\newpage`, `<!-- pagebreak -->`,
/// and `<!-- newpage -->`.
[[nodiscard]] bool is_page_break(std::string_view line);

/// @brief Matches `---appendix---`, `\appendix`, and `<!-- appendix -->`.
[[nodiscard]] bool is_appendix_marker(std::string_view line);

/// @brief Matches `[[toc]]`.
[[nodiscard]] bool is_table_of_contents(std::string_view line);

struct Code_Fence_Token {
    /// @brief The run of three or more backticks or tildes.
    std::string_view fence;
    /// @brief The language tag, possibly empty.
    std::string_view language;
};

/// @brief Matches an opening code fence such as "```cpp" or "~~~".
[[nodiscard]] std::optional<Code_Fence_Token> match_code_fence(std::string_view line);

/// @brief Returns `true` if `line` closes a code block opened with `opening_fence`.
[[nodiscard]] bool is_code_fence_end(std::string_view line, std::string_view opening_fence);

struct Environment_Fence_Token {
    std::string_view kind;
    std::optional<std::string_view> label;
};

/// @brief Matches `::: kind` with an optional `{#label}`.
[[nodiscard]] std::optional<Environment_Fence_Token>
match_environment_open(std::string_view line);

/// @brief Matches a line which is exactly `:::`, ignoring surrounding whitespace.
[[nodiscard]] bool is_environment_close(std::string_view line);

/// @brief Returns `true` if the line opens display math with `$$`.
[[nodiscard]] bool is_display_math_start(std::string_view line);

struct List_Marker_Token {
    bool ordered;
    /// @brief The number of an ordered marker, or zero.
    Uint64 number;
    /// @brief For `- [ ]` and `- [x]`, whether the box is checked.
    std::optional<bool> checked;
    /// @brief The indentation preceding the marker.
    Size indent;
    /// @brief The indentation of the content, i.e. the length of everything up to the content.
    Size content_offset;
    std::string_view content;
};

/// @brief Matches a list item marker: `-`, `*`, `+`, `N.`, or `N)` followed by a space,
/// where unordered markers may be followed by a checkbox `[ ]`, `[x]`, or `[X]`.
[[nodiscard]] std::optional<List_Marker_Token> match_list_marker(std::string_view line);

/// @brief Returns `true` if both markers belong to the same kind of list.
/// Checkbox items belong to unordered lists.
[[nodiscard]] constexpr bool marker_types_match(const List_Marker_Token& a,
                                                const List_Marker_Token& b)
{
    return a.ordered == b.ordered;
}

struct Footnote_Definition_Token {
    std::string_view id;
    std::string_view content;
};

/// @brief Matches `[^id]: content`.
[[nodiscard]] std::optional<Footnote_Definition_Token>
match_footnote_definition(std::string_view line);

/// @brief Returns `true` if the line is a table delimiter row such as `| --- | :--: |`.
[[nodiscard]] bool is_table_delimiter_row(std::string_view line);

/// @brief Splits a table row such as `| a | b |` into trimmed cells.
/// Escaped pipes `\|` do not split cells.
[[nodiscard]] std::pmr::vector<std::string_view> split_table_row(std::string_view line,
                                                                 std::pmr::memory_resource* memory);

/// @brief Returns the alignment of a delimiter row cell: `:-:` is centered, `-:` is right-aligned,
/// and anything else is left-aligned.
[[nodiscard]] Alignment alignment_of_delimiter(std::string_view cell);

/// @brief Matches a table caption line `Table: text` or `Caption: text`.
/// @return the text following the colon
[[nodiscard]] std::optional<std::string_view> match_table_caption(std::string_view line);

struct Label_Split {
    std::string_view content;
    std::optional<std::string_view> label;
};

/// @brief Separates a trailing `{#label}` from the preceding content.
/// If there is no trailing label, the whole trimmed text is returned as content.
[[nodiscard]] Label_Split split_trailing_label(std::string_view text);

/// @brief Returns `true` if the line starts an HTML block, i.e. an HTML comment or
/// a block-level tag such as `<div>`.
[[nodiscard]] bool is_html_block_start(std::string_view line);

// INLINE TOKENS ===================================================================================

/// @brief Matches `$$...$$` within running text.
[[nodiscard]] std::optional<Match<std::string_view>> match_double_dollar_math(std::string_view text);

/// @brief Matches `$...$`, where the opening `$` must not be followed by whitespace or `$`,
/// the closing `$` must not be preceded by whitespace, and must not be followed by a digit.
/// This prevents amounts of money like "$5 and $6" from being recognized.
[[nodiscard]] std::optional<Match<std::string_view>> match_inline_math(std::string_view text);

/// @brief Matches text surrounded by `delimiter`, such as `**strong**` or `~sub~`.
/// The content must be non-empty and must neither start nor end with whitespace.
/// For single-character delimiters, doubled delimiters within the content are skipped over,
/// so that `*a **b** c*` matches as a whole.
/// @param allow_whitespace if `false`, the content must not contain any whitespace
[[nodiscard]] std::optional<Match<std::string_view>>
match_delimited(std::string_view text, std::string_view delimiter, bool allow_whitespace = true);

/// @brief Matches a code span delimited by backtick runs of equal length.
[[nodiscard]] std::optional<Match<std::string_view>> match_code_span(std::string_view text);

struct Citation_Item {
    std::string_view key;
    std::string_view locator;
};

struct Citation_Token {
    std::string_view prefix;
    bool year_only;
    std::pmr::vector<Citation_Item> items;
};

/// @brief Matches a bracketed citation: `[@key]`, `[@key, locator]`, `[@a; @b]`,
/// `[-@key]`, or `[prefix @key]`.
[[nodiscard]] std::optional<Match<Citation_Token>>
match_citation(std::string_view text, std::pmr::memory_resource* memory);

/// @brief Matches a bare reference `@label`, not immediately followed by `[`.
[[nodiscard]] std::optional<Match<std::string_view>> match_reference(std::string_view text);

/// @brief Matches an inline footnote `^[content]`, where the content may contain balanced
/// brackets.
[[nodiscard]] std::optional<Match<std::string_view>> match_inline_footnote(std::string_view text);

/// @brief Matches a footnote reference `[^id]`.
[[nodiscard]] std::optional<Match<std::string_view>> match_footnote_reference(std::string_view text);

/// @brief Matches a label annotation `{#label}`.
[[nodiscard]] std::optional<Match<std::string_view>> match_label(std::string_view text);

/// @brief Matches `[sc]content[/sc]`.
[[nodiscard]] std::optional<Match<std::string_view>> match_small_caps(std::string_view text);

struct Link_Token {
    std::string_view text;
    std::string_view url;
    std::optional<std::string_view> title;
};

/// @brief Matches `[text](url "title")`, where text and destination may contain balanced
/// brackets and parentheses respectively.
[[nodiscard]] std::optional<Match<Link_Token>> match_link(std::string_view text);

/// @brief Matches `![alt](url "title")`.
[[nodiscard]] std::optional<Match<Link_Token>> match_image(std::string_view text);

/// @brief Matches an autolink such as `<https://example.com>`.
[[nodiscard]] std::optional<Match<std::string_view>> match_autolink(std::string_view text);

/// @brief Matches an HTML tag such as `<span class="x">`, `</span>`, or `<!-- comment -->`.
[[nodiscard]] std::optional<Match<std::string_view>> match_inline_html(std::string_view text);

} // namespace markdown_academic::mda

#endif
