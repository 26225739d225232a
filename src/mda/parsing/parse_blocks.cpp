#include <algorithm>
#include <optional>
#include <span>
#include <string>

#include "common/assert.hpp"

#include "mda/ast.hpp"
#include "mda/environment_kind.hpp"
#include "mda/parsing/parse.hpp"
#include "mda/parsing/tokenize.hpp"

namespace markdown_academic::mda {

namespace {

/// @brief A block which a recognizer produced, and the number of lines it consumed.
struct Matched_Block {
    ast::Block block;
    Size lines;
};

[[nodiscard]] std::optional<std::pmr::string> to_optional_string(std::optional<std::string_view> s,
                                                                 std::pmr::memory_resource* memory)
{
    if (!s) {
        return std::nullopt;
    }
    return std::pmr::string(*s, memory);
}

/// @brief Removes up to `amount` columns of leading spaces and tabs.
[[nodiscard]] std::string_view dedent(std::string_view line, Size amount)
{
    return line.substr(std::min(indentation_of(line), amount));
}

[[nodiscard]] std::string_view without_quote_marker(std::string_view line)
{
    line = trim_start(line);
    MARKDOWN_ACADEMIC_ASSERT(line.starts_with('>'));
    line.remove_prefix(1);
    if (line.starts_with(' ')) {
        line.remove_prefix(1);
    }
    return line;
}

[[nodiscard]] bool is_quote_line(std::string_view line)
{
    return trim_start(line).starts_with('>');
}

[[nodiscard]] bool is_definition_line(std::string_view line)
{
    return trim_start(line).starts_with(':') && !trim_start(line).starts_with(":::");
}

/// @brief Returns `true` if `line` introduces a block which interrupts a paragraph.
[[nodiscard]] bool starts_block(std::string_view line)
{
    const std::string_view trimmed = trim_start(line);
    return match_heading(line) || is_page_break(line) || is_appendix_marker(line)
        || is_thematic_break(line) || is_table_of_contents(line) || match_code_fence(line)
        || is_display_math_start(line) || trimmed.starts_with(":::") || trimmed.starts_with('>')
        || match_list_marker(line) || match_footnote_definition(line);
}

struct Block_Parser {
private:
    std::span<const std::string_view> m_lines;
    std::pmr::memory_resource* m_memory;
    Size m_index = 0;

public:
    Block_Parser(std::span<const std::string_view> lines, std::pmr::memory_resource* memory)
        : m_lines { lines }
        , m_memory { memory }
    {
    }

    std::pmr::vector<ast::Block> parse()
    {
        std::pmr::vector<ast::Block> result(m_memory);
        while (m_index < m_lines.size()) {
            if (is_blank(m_lines[m_index])) {
                ++m_index;
                continue;
            }
            Matched_Block matched = match_block(m_index);
            MARKDOWN_ACADEMIC_ASSERT(matched.lines != 0);
            m_index += matched.lines;
            result.push_back(std::move(matched.block));
        }
        return result;
    }

private:
    [[nodiscard]] Size line_count() const
    {
        return m_lines.size();
    }

    [[nodiscard]] std::string_view line(Size index) const
    {
        MARKDOWN_ACADEMIC_ASSERT(index < m_lines.size());
        return m_lines[index];
    }

    /// @brief Returns the index of the first non-blank line at or after `index`,
    /// or `line_count()` if there is none.
    [[nodiscard]] Size next_non_blank(Size index) const
    {
        while (index < line_count() && is_blank(m_lines[index])) {
            ++index;
        }
        return index;
    }

    [[nodiscard]] std::pmr::vector<ast::Inline> inlines(std::string_view text) const
    {
        return parse_inlines(text, m_memory);
    }

    [[nodiscard]] std::pmr::vector<ast::Block> blocks(std::span<const std::string_view> lines) const
    {
        return parse_block_lines(lines, m_memory);
    }

    [[nodiscard]] std::pmr::string join(std::span<const std::string_view> lines) const
    {
        std::pmr::string result(m_memory);
        for (Size i = 0; i < lines.size(); ++i) {
            if (i != 0) {
                result += '\n';
            }
            result += lines[i];
        }
        return result;
    }

    Matched_Block match_block(Size i)
    {
        // The order of these recognizers determines precedence between ambiguous constructs.
        if (auto heading = try_match_heading(i)) {
            return std::move(*heading);
        }
        if (is_page_break(line(i))) {
            return { ast::Page_Break {}, 1 };
        }
        if (is_appendix_marker(line(i))) {
            return { ast::Appendix_Marker {}, 1 };
        }
        if (is_thematic_break(line(i))) {
            return { ast::Thematic_Break {}, 1 };
        }
        if (is_table_of_contents(line(i))) {
            return { ast::Table_Of_Contents {}, 1 };
        }
        if (auto code = try_match_code_block(i)) {
            return std::move(*code);
        }
        if (auto math = try_match_display_math(i)) {
            return std::move(*math);
        }
        if (auto environment = try_match_environment(i)) {
            return std::move(*environment);
        }
        if (auto quote = try_match_block_quote(i)) {
            return std::move(*quote);
        }
        if (auto list = try_match_list(i)) {
            return std::move(*list);
        }
        if (auto table = try_match_table(i)) {
            return std::move(*table);
        }
        if (auto description_list = try_match_description_list(i)) {
            return std::move(*description_list);
        }
        if (auto footnote = try_match_footnote_definition(i)) {
            return std::move(*footnote);
        }
        if (auto html = try_match_html_block(i)) {
            return std::move(*html);
        }
        return match_paragraph(i);
    }

    std::optional<Matched_Block> try_match_heading(Size i)
    {
        const std::optional<Heading_Token> heading = match_heading(line(i));
        if (!heading) {
            return std::nullopt;
        }
        const Label_Split split = split_trailing_label(heading->text);
        return Matched_Block { ast::Heading { .level = heading->level,
                                              .content = inlines(split.content),
                                              .label = to_optional_string(split.label, m_memory) },
                               1 };
    }

    std::optional<Matched_Block> try_match_code_block(Size i)
    {
        const std::optional<Code_Fence_Token> fence = match_code_fence(line(i));
        if (!fence) {
            return std::nullopt;
        }
        Size end = i + 1;
        while (end < line_count() && !is_code_fence_end(line(end), fence->fence)) {
            ++end;
        }
        // An unterminated code block extends until the end of the input.
        const Size consumed = end < line_count() ? end - i + 1 : end - i;
        std::optional<std::pmr::string> language;
        if (!fence->language.empty()) {
            language.emplace(fence->language, m_memory);
        }
        return Matched_Block { ast::Code_Block { .language = std::move(language),
                                                 .code = join(m_lines.subspan(i + 1, end - i - 1)) },
                               consumed };
    }

    std::optional<Matched_Block> try_match_display_math(Size i)
    {
        if (!is_display_math_start(line(i))) {
            return std::nullopt;
        }
        const std::string_view first = trim_start(line(i)).substr(2);

        if (const Size close = first.find("$$"); close != std::string_view::npos) {
            const Label_Split trailer = split_trailing_label(first.substr(close + 2));
            return Matched_Block {
                ast::Display_Math { .source = std::pmr::string(trim(first.substr(0, close)), m_memory),
                                    .label = to_optional_string(trailer.label, m_memory) },
                1
            };
        }

        std::pmr::vector<std::string_view> content(m_memory);
        if (!is_blank(first)) {
            content.push_back(first);
        }
        std::optional<std::string_view> label;
        Size end = i + 1;
        for (; end < line_count(); ++end) {
            const std::string_view current = line(end);
            if (const Size close = current.find("$$"); close != std::string_view::npos) {
                if (!is_blank(current.substr(0, close))) {
                    content.push_back(current.substr(0, close));
                }
                label = split_trailing_label(current.substr(close + 2)).label;
                break;
            }
            content.push_back(current);
        }
        const Size consumed = end < line_count() ? end - i + 1 : end - i;
        return Matched_Block { ast::Display_Math { .source = std::pmr::string(trim(join(content)),
                                                                               m_memory),
                                                   .label = to_optional_string(label, m_memory) },
                               consumed };
    }

    std::optional<Matched_Block> try_match_environment(Size i)
    {
        const std::optional<Environment_Fence_Token> fence = match_environment_open(line(i));
        if (!fence) {
            return std::nullopt;
        }
        int depth = 1;
        Size end = i + 1;
        for (; end < line_count(); ++end) {
            if (is_environment_close(line(end))) {
                if (--depth == 0) {
                    break;
                }
            }
            else if (match_environment_open(line(end))) {
                ++depth;
            }
        }
        const Size consumed = end < line_count() ? end - i + 1 : end - i;

        Environment_Kind kind = environment_kind_by_name(fence->kind, m_memory);
        std::pmr::vector<ast::Block> content = blocks(m_lines.subspan(i + 1, end - i - 1));

        if (kind.type == Environment_Type::abstract && !fence->label) {
            return Matched_Block { ast::Abstract { .content = std::move(content) }, consumed };
        }

        std::optional<std::pmr::vector<ast::Inline>> caption;
        const bool has_caption_rule
            = kind.type == Environment_Type::figure || kind.type == Environment_Type::table;
        if (has_caption_rule && content.size() > 1
            && std::holds_alternative<ast::Paragraph>(content.back())) {
            caption = std::move(std::get<ast::Paragraph>(content.back()).content);
            content.pop_back();
        }

        return Matched_Block { ast::Environment { .kind = std::move(kind),
                                                  .label = to_optional_string(fence->label, m_memory),
                                                  .content = std::move(content),
                                                  .caption = std::move(caption) },
                               consumed };
    }

    std::optional<Matched_Block> try_match_block_quote(Size i)
    {
        if (!is_quote_line(line(i))) {
            return std::nullopt;
        }
        std::pmr::vector<std::string_view> content(m_memory);
        Size end = i;
        for (; end < line_count(); ++end) {
            const std::string_view current = line(end);
            if (is_quote_line(current)) {
                content.push_back(without_quote_marker(current));
            }
            else if (is_blank(current) && end + 1 < line_count() && is_quote_line(line(end + 1))) {
                content.push_back({});
            }
            else {
                break;
            }
        }
        return Matched_Block { ast::Block_Quote { .content = blocks(content) }, end - i };
    }

    std::optional<Matched_Block> try_match_list(Size i)
    {
        const std::optional<List_Marker_Token> first = match_list_marker(line(i));
        if (!first) {
            return std::nullopt;
        }
        const auto is_sibling = [&](const std::optional<List_Marker_Token>& marker) {
            return marker && marker->indent <= first->indent && marker_types_match(*marker, *first);
        };

        ast::List list { .ordered = first->ordered,
                         .start = first->ordered ? std::optional<Uint64>(first->number)
                                                 : std::nullopt,
                         .items = std::pmr::vector<ast::List_Item>(m_memory) };

        Size j = i;
        while (j < line_count()) {
            if (is_blank(line(j))) {
                const Size next = next_non_blank(j);
                if (next == line_count() || !is_sibling(match_list_marker(line(next)))) {
                    break;
                }
                j = next;
                continue;
            }
            const std::optional<List_Marker_Token> marker = match_list_marker(line(j));
            if (!is_sibling(marker)) {
                break;
            }
            j = match_list_item(list, *marker, first->indent, j);
        }
        return Matched_Block { std::move(list), j - i };
    }

    /// @brief Matches a single list item whose marker is on line `i`.
    /// @return the index of the first line following the item
    Size match_list_item(ast::List& list, const List_Marker_Token& marker, Size list_indent, Size i)
    {
        std::pmr::vector<std::string_view> content(m_memory);
        content.push_back(marker.content);

        Size j = i + 1;
        while (j < line_count()) {
            const std::string_view current = line(j);
            if (is_blank(current)) {
                // A blank line only continues the item if deeper-indented content follows it.
                const Size next = next_non_blank(j);
                if (next == line_count() || indentation_of(line(next)) <= list_indent) {
                    break;
                }
                content.push_back({});
                ++j;
                continue;
            }
            const Size indent = indentation_of(current);
            if (indent <= list_indent) {
                if (match_list_marker(current)) {
                    break;
                }
                // Lazy continuation of the preceding paragraph.
                if (!content.empty() && !is_blank(content.back()) && !starts_block(current)) {
                    content.push_back(trim_start(current));
                    ++j;
                    continue;
                }
                break;
            }
            content.push_back(dedent(current, marker.content_offset));
            ++j;
        }

        list.items.push_back({ .content = blocks(content), .checked = marker.checked });
        return j;
    }

    std::optional<Matched_Block> try_match_table(Size i)
    {
        if (line(i).find('|') == std::string_view::npos || i + 1 >= line_count()
            || !is_table_delimiter_row(line(i + 1))) {
            return std::nullopt;
        }
        ast::Table table { .headers = ast::Table_Row(m_memory),
                           .alignments = std::pmr::vector<Alignment>(m_memory),
                           .rows = std::pmr::vector<ast::Table_Row>(m_memory),
                           .label = {},
                           .caption = {} };
        table.headers = row_of(line(i));
        for (const std::string_view cell : split_table_row(line(i + 1), m_memory)) {
            table.alignments.push_back(alignment_of_delimiter(cell));
        }

        Size end = i + 2;
        while (end < line_count() && !is_blank(line(end))
               && line(end).find('|') != std::string_view::npos) {
            table.rows.push_back(row_of(line(end)));
            ++end;
        }

        // A caption must directly follow the last row.
        if (end < line_count()) {
            if (const std::optional<std::string_view> caption = match_table_caption(line(end))) {
                const Label_Split split = split_trailing_label(*caption);
                table.caption = inlines(split.content);
                table.label = to_optional_string(split.label, m_memory);
                ++end;
            }
        }
        return Matched_Block { std::move(table), end - i };
    }

    [[nodiscard]] ast::Table_Row row_of(std::string_view row_line) const
    {
        ast::Table_Row row(m_memory);
        for (const std::string_view cell : split_table_row(row_line, m_memory)) {
            row.push_back(inlines(cell));
        }
        return row;
    }

    std::optional<Matched_Block> try_match_description_list(Size i)
    {
        const auto starts_item = [&](Size index) {
            return index + 1 < line_count() && !is_blank(line(index))
                && !is_definition_line(line(index)) && is_definition_line(line(index + 1));
        };
        if (!starts_item(i)) {
            return std::nullopt;
        }

        ast::Description_List list { .items = std::pmr::vector<ast::Description_Item>(m_memory) };
        Size j = i;
        while (starts_item(j)) {
            std::pmr::vector<std::string_view> details(m_memory);
            const std::string_view term = trim(line(j));
            Size k = j + 1;
            while (k < line_count()) {
                const std::string_view current = line(k);
                if (is_definition_line(current)) {
                    // Consecutive definition lines are joined into one paragraph.
                    details.push_back(trim(trim_start(current).substr(1)));
                    ++k;
                }
                else if (is_blank(current) && k + 1 < line_count()
                         && is_definition_line(line(k + 1))) {
                    // A single blank line between definitions starts a new paragraph.
                    details.push_back({});
                    ++k;
                }
                else {
                    break;
                }
            }
            list.items.push_back({ .term = inlines(term), .details = blocks(details) });
            j = k;

            // Further terms may follow after blank lines.
            const Size next = next_non_blank(j);
            if (next != j && starts_item(next)) {
                j = next;
            }
        }
        return Matched_Block { std::move(list), j - i };
    }

    std::optional<Matched_Block> try_match_footnote_definition(Size i)
    {
        const std::optional<Footnote_Definition_Token> definition
            = match_footnote_definition(line(i));
        if (!definition) {
            return std::nullopt;
        }
        std::pmr::vector<std::string_view> content(m_memory);
        content.push_back(definition->content);
        Size end = i + 1;
        while (end < line_count() && !is_blank(line(end)) && indentation_of(line(end)) != 0) {
            content.push_back(trim_start(line(end)));
            ++end;
        }
        return Matched_Block { ast::Footnote_Definition {
                                   .id = std::pmr::string(definition->id, m_memory),
                                   .content = inlines(join(content)) },
                               end - i };
    }

    std::optional<Matched_Block> try_match_html_block(Size i)
    {
        if (!is_html_block_start(line(i))) {
            return std::nullopt;
        }
        Size end = i;
        if (trim_start(line(i)).starts_with("<!--")) {
            while (end < line_count() && line(end).find("-->") == std::string_view::npos) {
                ++end;
            }
            end = std::min(end + 1, line_count());
        }
        else {
            while (end < line_count() && !is_blank(line(end))) {
                ++end;
            }
        }
        return Matched_Block { ast::Html_Block { .html = join(m_lines.subspan(i, end - i)) },
                               end - i };
    }

    Matched_Block match_paragraph(Size i)
    {
        std::pmr::vector<std::string_view> content(m_memory);
        // The first line has been rejected by every other recognizer, so it always belongs here.
        content.push_back(trim_start(line(i)));
        Size end = i + 1;
        while (end < line_count() && !is_blank(line(end)) && !starts_block(line(end))) {
            content.push_back(trim_start(line(end)));
            ++end;
        }
        const std::pmr::string text = join(content);
        return { ast::Paragraph { .content = inlines(trim_end(text)) }, end - i };
    }
};

} // namespace

std::pmr::vector<ast::Block> parse_block_lines(std::span<const std::string_view> lines,
                                               std::pmr::memory_resource* memory)
{
    return Block_Parser { lines, memory }.parse();
}

std::pmr::vector<ast::Block> parse_blocks(std::string_view text, std::pmr::memory_resource* memory)
{
    const std::pmr::vector<std::string_view> lines = split_lines(text, memory);
    return parse_block_lines(lines, memory);
}

} // namespace markdown_academic::mda
