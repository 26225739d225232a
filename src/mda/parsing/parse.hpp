#ifndef MARKDOWN_ACADEMIC_MDA_PARSE_HPP
#define MARKDOWN_ACADEMIC_MDA_PARSE_HPP

#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "common/result.hpp"

#include "mda/ast.hpp"
#include "mda/document.hpp"
#include "mda/parsing/parse_error.hpp"

namespace markdown_academic::mda {

/// @brief Parses a whole document, consisting of optional front matter and the body.
/// Only malformed front matter results in an error; the body is always parsed successfully.
/// @param source the document source, assumed to be UTF-8
/// @param memory the memory resource which all nodes of the document are allocated with
[[nodiscard]] Result<Document, Parse_Error> parse(std::string_view source,
                                                  std::pmr::memory_resource* memory);

/// @brief Parses a sequence of blocks.
/// Every line of `text` ends up in some block, with unrecognized lines forming paragraphs.
[[nodiscard]] std::pmr::vector<ast::Block> parse_blocks(std::string_view text,
                                                        std::pmr::memory_resource* memory);

/// @brief Like `parse_blocks`, but operates on lines which have already been split.
[[nodiscard]] std::pmr::vector<ast::Block>
parse_block_lines(std::span<const std::string_view> lines, std::pmr::memory_resource* memory);

/// @brief Parses inline content, such as the text of a paragraph.
/// Unmatched delimiters are treated as literal text, so this never fails.
[[nodiscard]] std::pmr::vector<ast::Inline> parse_inlines(std::string_view text,
                                                          std::pmr::memory_resource* memory);

} // namespace markdown_academic::mda

#endif
