#include <algorithm>
#include <array>
#include <charconv>

#include "common/assert.hpp"

#include "mda/ast.hpp"
#include "mda/parsing/tokenize.hpp"

namespace markdown_academic::mda {

namespace {

[[nodiscard]] constexpr bool is_label_character(char c)
{
    return is_word_character(c) || c == ':' || c == '-' || c == '_';
}

[[nodiscard]] constexpr bool is_citation_key_character(char c)
{
    return is_word_character(c) || c == ':' || c == '-' || c == '_' || c == '.' || c == '/'
        || c == '+';
}

[[nodiscard]] constexpr bool is_footnote_id_character(char c)
{
    return is_word_character(c) || c == '-' || c == '_' || c == '.' || c == ':';
}

[[nodiscard]] constexpr bool is_language_character(char c)
{
    return is_ascii_alphanumeric(c) || c == '-' || c == '_' || c == '+' || c == '#' || c == '.';
}

[[nodiscard]] constexpr char to_ascii_lower(char c)
{
    return c >= 'A' && c <= 'Z' ? char(c - 'A' + 'a') : c;
}

template <typename Predicate>
[[nodiscard]] Size length_of_run(std::string_view text, Predicate predicate)
{
    Size length = 0;
    while (length < text.size() && predicate(text[length])) {
        ++length;
    }
    return length;
}

/// @brief Returns the index of the bracket which closes the bracket at `text[0]`,
/// or `npos` if there is none.
/// Backslash-escaped brackets are not counted.
[[nodiscard]] Size find_matching_bracket(std::string_view text, char open, char close)
{
    MARKDOWN_ACADEMIC_ASSERT(!text.empty() && text[0] == open);
    int depth = 0;
    for (Size i = 0; i < text.size(); ++i) {
        if (text[i] == '\\') {
            ++i;
        }
        else if (text[i] == open) {
            ++depth;
        }
        else if (text[i] == close && --depth == 0) {
            return i;
        }
    }
    return std::string_view::npos;
}

/// @brief Parses the destination and optional title inside the parentheses of a link.
[[nodiscard]] std::optional<Link_Token> parse_link_destination(std::string_view text,
                                                               std::string_view inner)
{
    inner = trim(inner);
    const Size url_length = length_of_run(inner, [](char c) { return !is_ascii_whitespace(c); });
    Link_Token result { .text = text, .url = inner.substr(0, url_length), .title = {} };
    const std::string_view title = trim(inner.substr(url_length));
    if (title.empty()) {
        return result;
    }
    if (title.size() >= 2 && (title.front() == '"' || title.front() == '\'')
        && title.back() == title.front()) {
        result.title = title.substr(1, title.size() - 2);
        return result;
    }
    return std::nullopt;
}

} // namespace

// TEXT UTILITIES ==================================================================================

std::string_view trim_start(std::string_view text)
{
    const Size first = length_of_run(text, is_ascii_whitespace);
    return text.substr(first);
}

std::string_view trim_end(std::string_view text)
{
    Size length = text.size();
    while (length != 0 && is_ascii_whitespace(text[length - 1])) {
        --length;
    }
    return text.substr(0, length);
}

std::string_view trim(std::string_view text)
{
    return trim_end(trim_start(text));
}

bool is_blank(std::string_view line)
{
    return std::ranges::all_of(line, is_ascii_whitespace);
}

Size indentation_of(std::string_view line)
{
    return length_of_run(line, [](char c) { return c == ' ' || c == '\t'; });
}

std::pmr::vector<std::string_view> split_lines(std::string_view text,
                                               std::pmr::memory_resource* memory)
{
    std::pmr::vector<std::string_view> result(memory);
    while (!text.empty()) {
        const Size newline = text.find('\n');
        std::string_view line = text.substr(0, newline);
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }
        result.push_back(line);
        if (newline == std::string_view::npos) {
            break;
        }
        text.remove_prefix(newline + 1);
    }
    return result;
}

// BLOCK TOKENS ====================================================================================

std::optional<Heading_Token> match_heading(std::string_view line)
{
    const Size hashes = length_of_run(line, [](char c) { return c == '#'; });
    if (hashes == 0 || hashes > 6 || hashes == line.size()
        || (line[hashes] != ' ' && line[hashes] != '\t')) {
        return std::nullopt;
    }
    std::string_view text = trim(line.substr(hashes));

    // Strip an optional closing sequence, which must be separated from the content by a space.
    Size closing_begin = text.size();
    while (closing_begin != 0 && text[closing_begin - 1] == '#') {
        --closing_begin;
    }
    if (closing_begin == 0) {
        text = {};
    }
    else if (closing_begin != text.size() && text[closing_begin - 1] == ' ') {
        text = trim_end(text.substr(0, closing_begin));
    }
    return Heading_Token { .level = int(hashes), .text = text };
}

bool is_thematic_break(std::string_view line)
{
    line = trim(line);
    if (line.empty() || (line[0] != '-' && line[0] != '*' && line[0] != '_')) {
        return false;
    }
    const char marker = line[0];
    Size count = 0;
    for (char c : line) {
        if (c == marker) {
            ++count;
        }
        else if (c != ' ' && c != '\t') {
            return false;
        }
    }
    return count >= 3;
}

bool is_page_break(std::string_view line)
{
    static constexpr std::string_view forms[] {
        "---pagebreak---", "\\pagebreak", "\\newpage", "<!-- pagebreak -->", "<!-- newpage -->",
    };
    line = trim(line);
    return std::ranges::find(forms, line) != std::end(forms);
}

bool is_appendix_marker(std::string_view line)
{
    static constexpr std::string_view forms[] {
        "---appendix---",
        "\\appendix",
        "<!-- appendix -->",
    };
    line = trim(line);
    return std::ranges::find(forms, line) != std::end(forms);
}

bool is_table_of_contents(std::string_view line)
{
    return trim(line) == "[[toc]]";
}

std::optional<Code_Fence_Token> match_code_fence(std::string_view line)
{
    line = trim_start(line);
    if (line.empty() || (line[0] != '`' && line[0] != '~')) {
        return std::nullopt;
    }
    const char marker = line[0];
    const Size fence_length = length_of_run(line, [marker](char c) { return c == marker; });
    if (fence_length < 3) {
        return std::nullopt;
    }
    const std::string_view info = trim_start(line.substr(fence_length));
    const Size language_length = length_of_run(info, is_language_character);
    return Code_Fence_Token { .fence = line.substr(0, fence_length),
                              .language = info.substr(0, language_length) };
}

bool is_code_fence_end(std::string_view line, std::string_view opening_fence)
{
    MARKDOWN_ACADEMIC_ASSERT(!opening_fence.empty());
    return trim_start(line).starts_with(opening_fence);
}

std::optional<Environment_Fence_Token> match_environment_open(std::string_view line)
{
    line = trim(line);
    if (!line.starts_with(":::")) {
        return std::nullopt;
    }
    std::string_view rest = trim_start(line.substr(3));
    const Size kind_length
        = length_of_run(rest, [](char c) { return is_word_character(c) || c == '-' || c == '_'; });
    if (kind_length == 0) {
        return std::nullopt;
    }
    Environment_Fence_Token result { .kind = rest.substr(0, kind_length), .label = {} };
    rest = trim_start(rest.substr(kind_length));
    if (const std::optional<Match<std::string_view>> label = match_label(rest)) {
        result.label = label->value;
    }
    return result;
}

bool is_environment_close(std::string_view line)
{
    return trim(line) == ":::";
}

bool is_display_math_start(std::string_view line)
{
    return trim_start(line).starts_with("$$");
}

std::optional<List_Marker_Token> match_list_marker(std::string_view line)
{
    const Size indent = indentation_of(line);
    const std::string_view rest = line.substr(indent);
    if (rest.empty()) {
        return std::nullopt;
    }

    const auto is_marker_end = [&](Size i) {
        return i == rest.size() || rest[i] == ' ' || rest[i] == '\t';
    };

    if (rest[0] == '-' || rest[0] == '*' || rest[0] == '+') {
        if (rest.size() < 2 || (rest[1] != ' ' && rest[1] != '\t')) {
            return std::nullopt;
        }
        List_Marker_Token result { .ordered = false,
                                   .number = 0,
                                   .checked = {},
                                   .indent = indent,
                                   .content_offset = indent + 2,
                                   .content = rest.substr(2) };
        const std::string_view box = rest.substr(2);
        if (box.size() >= 3 && box[0] == '[' && box[2] == ']'
            && (box[1] == ' ' || box[1] == 'x' || box[1] == 'X')) {
            const Size box_end = 3;
            if (box.size() == box_end || box[box_end] == ' ' || box[box_end] == '\t') {
                result.checked = box[1] != ' ';
                const Size skip = std::min(box.size(), box_end + 1);
                result.content_offset = indent + 2 + skip;
                result.content = box.substr(skip);
            }
        }
        return result;
    }

    const Size digits = length_of_run(rest, is_ascii_digit);
    if (digits == 0 || digits > 9 || digits == rest.size()
        || (rest[digits] != '.' && rest[digits] != ')') || !is_marker_end(digits + 1)) {
        return std::nullopt;
    }
    Uint64 number = 0;
    std::from_chars(rest.data(), rest.data() + digits, number);
    const Size skip = std::min(rest.size(), digits + 2);
    return List_Marker_Token { .ordered = true,
                               .number = number,
                               .checked = {},
                               .indent = indent,
                               .content_offset = indent + skip,
                               .content = rest.substr(skip) };
}

std::optional<Footnote_Definition_Token> match_footnote_definition(std::string_view line)
{
    if (!line.starts_with("[^")) {
        return std::nullopt;
    }
    const std::string_view rest = line.substr(2);
    const Size id_length = length_of_run(rest, is_footnote_id_character);
    if (id_length == 0 || !rest.substr(id_length).starts_with("]:")) {
        return std::nullopt;
    }
    return Footnote_Definition_Token { .id = rest.substr(0, id_length),
                                       .content = trim(rest.substr(id_length + 2)) };
}

bool is_table_delimiter_row(std::string_view line)
{
    line = trim(line);
    if (line.find('|') == std::string_view::npos || line.find('-') == std::string_view::npos) {
        return false;
    }
    if (line.starts_with('|')) {
        line.remove_prefix(1);
    }
    if (line.ends_with('|')) {
        line.remove_suffix(1);
    }
    while (true) {
        const Size bar = line.find('|');
        const std::string_view cell = trim(line.substr(0, bar));
        const bool valid = !cell.empty()
            && std::ranges::all_of(cell, [](char c) { return c == '-' || c == ':'; })
            && cell.find('-') != std::string_view::npos;
        if (!valid) {
            return false;
        }
        if (bar == std::string_view::npos) {
            return true;
        }
        line.remove_prefix(bar + 1);
    }
}

std::pmr::vector<std::string_view> split_table_row(std::string_view line,
                                                   std::pmr::memory_resource* memory)
{
    line = trim(line);
    if (line.starts_with('|')) {
        line.remove_prefix(1);
    }
    if (line.ends_with('|') && !line.ends_with("\\|")) {
        line.remove_suffix(1);
    }

    std::pmr::vector<std::string_view> cells(memory);
    Size cell_begin = 0;
    for (Size i = 0; i < line.size(); ++i) {
        if (line[i] == '\\') {
            ++i;
        }
        else if (line[i] == '|') {
            cells.push_back(trim(line.substr(cell_begin, i - cell_begin)));
            cell_begin = i + 1;
        }
    }
    cells.push_back(trim(line.substr(std::min(cell_begin, line.size()))));
    return cells;
}

Alignment alignment_of_delimiter(std::string_view cell)
{
    cell = trim(cell);
    if (cell.size() >= 2 && cell.starts_with(':') && cell.ends_with(':')) {
        return Alignment::center;
    }
    if (cell.ends_with(':')) {
        return Alignment::right;
    }
    return Alignment::left;
}

std::optional<std::string_view> match_table_caption(std::string_view line)
{
    line = trim(line);
    for (const std::string_view prefix : { std::string_view("Table:"), std::string_view("Caption:") }) {
        if (line.starts_with(prefix)) {
            return trim(line.substr(prefix.size()));
        }
    }
    return std::nullopt;
}

Label_Split split_trailing_label(std::string_view text)
{
    text = trim(text);
    if (!text.ends_with('}')) {
        return { .content = text, .label = {} };
    }
    const Size open = text.rfind("{#");
    if (open == std::string_view::npos) {
        return { .content = text, .label = {} };
    }
    const std::optional<Match<std::string_view>> label = match_label(text.substr(open));
    if (!label || !label->rest.empty()) {
        return { .content = text, .label = {} };
    }
    return { .content = trim_end(text.substr(0, open)), .label = label->value };
}

bool is_html_block_start(std::string_view line)
{
    static constexpr std::string_view block_tags[] {
        "address", "article", "aside",    "blockquote", "details", "div",     "dl",
        "fieldset", "figcaption", "figure", "footer", "form", "h1", "h2", "h3", "h4", "h5", "h6",
        "header",  "hr",      "iframe",   "main",       "nav",     "ol",      "p",
        "pre",     "section", "summary",  "table",      "ul",      "script",  "style",
    };

    line = trim_start(line);
    if (line.starts_with("<!--")) {
        return true;
    }
    if (!line.starts_with('<')) {
        return false;
    }
    std::string_view tag = line.substr(line.starts_with("</") ? 2 : 1);
    const Size name_length = length_of_run(tag, is_ascii_alphanumeric);
    if (name_length == 0) {
        return false;
    }
    if (name_length != tag.size() && tag[name_length] != '>' && tag[name_length] != ' '
        && tag[name_length] != '/') {
        return false;
    }
    tag = tag.substr(0, name_length);
    return std::ranges::any_of(block_tags, [tag](std::string_view block_tag) {
        return std::ranges::equal(tag, block_tag,
                                  [](char a, char b) { return to_ascii_lower(a) == b; });
    });
}

// INLINE TOKENS ===================================================================================

std::optional<Match<std::string_view>> match_double_dollar_math(std::string_view text)
{
    if (!text.starts_with("$$")) {
        return std::nullopt;
    }
    const Size close = text.find("$$", 2);
    if (close == std::string_view::npos || close == 2) {
        return std::nullopt;
    }
    return Match<std::string_view> { .value = text.substr(2, close - 2),
                                     .rest = text.substr(close + 2) };
}

std::optional<Match<std::string_view>> match_inline_math(std::string_view text)
{
    if (text.size() < 3 || text[0] != '$' || text[1] == '$' || is_ascii_whitespace(text[1])) {
        return std::nullopt;
    }
    for (Size i = 1; i < text.size(); ++i) {
        if (text[i] == '\\') {
            ++i;
            continue;
        }
        if (text[i] != '$') {
            continue;
        }
        if (is_ascii_whitespace(text[i - 1])) {
            continue;
        }
        if (i + 1 < text.size() && is_ascii_digit(text[i + 1])) {
            return std::nullopt;
        }
        return Match<std::string_view> { .value = text.substr(1, i - 1),
                                         .rest = text.substr(i + 1) };
    }
    return std::nullopt;
}

std::optional<Match<std::string_view>>
match_delimited(std::string_view text, std::string_view delimiter, bool allow_whitespace)
{
    MARKDOWN_ACADEMIC_ASSERT(!delimiter.empty());
    if (!text.starts_with(delimiter)) {
        return std::nullopt;
    }
    const std::string_view after = text.substr(delimiter.size());
    if (after.empty() || is_ascii_whitespace(after[0])) {
        return std::nullopt;
    }
    const bool single = delimiter.size() == 1;
    const char marker = delimiter[0];
    if (single && after[0] == marker) {
        return std::nullopt;
    }

    for (Size i = 1; i < after.size(); ++i) {
        if (after[i] == '\\') {
            ++i;
            continue;
        }
        if (!allow_whitespace && is_ascii_whitespace(after[i])) {
            return std::nullopt;
        }
        if (!after.substr(i).starts_with(delimiter)) {
            continue;
        }
        if (single && i + 1 < after.size() && after[i + 1] == marker) {
            // A doubled delimiter inside single-delimited content belongs to nested content.
            ++i;
            continue;
        }
        if (is_ascii_whitespace(after[i - 1])) {
            continue;
        }
        return Match<std::string_view> { .value = after.substr(0, i),
                                         .rest = after.substr(i + delimiter.size()) };
    }
    return std::nullopt;
}

std::optional<Match<std::string_view>> match_code_span(std::string_view text)
{
    const Size ticks = length_of_run(text, [](char c) { return c == '`'; });
    if (ticks == 0) {
        return std::nullopt;
    }
    for (Size i = ticks; i < text.size();) {
        if (text[i] != '`') {
            ++i;
            continue;
        }
        const Size run = length_of_run(text.substr(i), [](char c) { return c == '`'; });
        if (run == ticks) {
            std::string_view code = text.substr(ticks, i - ticks);
            if (code.size() >= 2 && code.front() == ' ' && code.back() == ' ' && !is_blank(code)) {
                code = code.substr(1, code.size() - 2);
            }
            return Match<std::string_view> { .value = code, .rest = text.substr(i + run) };
        }
        i += run;
    }
    return std::nullopt;
}

std::optional<Match<Citation_Token>> match_citation(std::string_view text,
                                                    std::pmr::memory_resource* memory)
{
    if (!text.starts_with('[')) {
        return std::nullopt;
    }
    const Size close = text.find(']');
    if (close == std::string_view::npos) {
        return std::nullopt;
    }
    const std::string_view inner = text.substr(1, close - 1);
    if (inner.find('[') != std::string_view::npos) {
        return std::nullopt;
    }
    const std::string_view rest = text.substr(close + 1);

    Citation_Token result { .prefix = {},
                            .year_only = false,
                            .items = std::pmr::vector<Citation_Item>(memory) };
    std::string_view body = inner;
    if (!body.starts_with('@') && !body.starts_with("-@")) {
        // A prefixed citation such as "[see @key]" must not be mistaken for link text.
        if (rest.starts_with('(')) {
            return std::nullopt;
        }
        Size at = body.find(" @");
        const Size suppressed_at = body.find(" -@");
        at = std::min(at, suppressed_at);
        if (at == std::string_view::npos) {
            return std::nullopt;
        }
        result.prefix = trim(body.substr(0, at));
        body = body.substr(at + 1);
    }
    if (body.starts_with('-')) {
        result.year_only = true;
        body.remove_prefix(1);
    }

    while (true) {
        const Size semicolon = body.find(';');
        std::string_view part = trim(body.substr(0, semicolon));
        if (!part.starts_with('@')) {
            return std::nullopt;
        }
        part.remove_prefix(1);
        const Size key_length = length_of_run(part, is_citation_key_character);
        if (key_length == 0) {
            return std::nullopt;
        }
        std::string_view locator = trim(part.substr(key_length));
        if (locator.starts_with(',')) {
            locator = trim(locator.substr(1));
        }
        result.items.push_back({ .key = part.substr(0, key_length), .locator = locator });
        if (semicolon == std::string_view::npos) {
            break;
        }
        body.remove_prefix(semicolon + 1);
    }

    return Match<Citation_Token> { .value = std::move(result), .rest = rest };
}

std::optional<Match<std::string_view>> match_reference(std::string_view text)
{
    if (text.size() < 2 || text[0] != '@' || text[1] == '[' || !is_word_character(text[1])) {
        return std::nullopt;
    }
    Size length = length_of_run(text.substr(1), is_label_character);
    // A colon ending the label belongs to the surrounding prose, as in "see @sec:intro: ...".
    while (text[length] == ':') {
        --length;
    }
    return Match<std::string_view> { .value = text.substr(1, length),
                                     .rest = text.substr(1 + length) };
}

std::optional<Match<std::string_view>> match_inline_footnote(std::string_view text)
{
    if (!text.starts_with("^[")) {
        return std::nullopt;
    }
    const Size close = find_matching_bracket(text.substr(1), '[', ']');
    if (close == std::string_view::npos || close == 1) {
        return std::nullopt;
    }
    return Match<std::string_view> { .value = text.substr(2, close - 1),
                                     .rest = text.substr(close + 2) };
}

std::optional<Match<std::string_view>> match_footnote_reference(std::string_view text)
{
    if (!text.starts_with("[^")) {
        return std::nullopt;
    }
    const std::string_view rest = text.substr(2);
    const Size id_length = length_of_run(rest, is_footnote_id_character);
    if (id_length == 0 || id_length == rest.size() || rest[id_length] != ']') {
        return std::nullopt;
    }
    return Match<std::string_view> { .value = rest.substr(0, id_length),
                                     .rest = rest.substr(id_length + 1) };
}

std::optional<Match<std::string_view>> match_label(std::string_view text)
{
    if (!text.starts_with("{#")) {
        return std::nullopt;
    }
    const std::string_view rest = text.substr(2);
    const Size length
        = length_of_run(rest, [](char c) { return c != '}' && !is_ascii_whitespace(c); });
    if (length == 0 || length == rest.size() || rest[length] != '}') {
        return std::nullopt;
    }
    return Match<std::string_view> { .value = rest.substr(0, length),
                                     .rest = rest.substr(length + 1) };
}

std::optional<Match<std::string_view>> match_small_caps(std::string_view text)
{
    static constexpr std::string_view open = "[sc]";
    static constexpr std::string_view close = "[/sc]";
    if (!text.starts_with(open)) {
        return std::nullopt;
    }
    const Size end = text.find(close, open.size());
    if (end == std::string_view::npos || end == open.size()) {
        return std::nullopt;
    }
    return Match<std::string_view> { .value = text.substr(open.size(), end - open.size()),
                                     .rest = text.substr(end + close.size()) };
}

std::optional<Match<Link_Token>> match_link(std::string_view text)
{
    if (!text.starts_with('[')) {
        return std::nullopt;
    }
    const Size text_end = find_matching_bracket(text, '[', ']');
    if (text_end == std::string_view::npos || text_end + 1 >= text.size()
        || text[text_end + 1] != '(') {
        return std::nullopt;
    }
    const std::string_view destination = text.substr(text_end + 1);
    const Size destination_end = find_matching_bracket(destination, '(', ')');
    if (destination_end == std::string_view::npos) {
        return std::nullopt;
    }
    std::optional<Link_Token> link = parse_link_destination(
        text.substr(1, text_end - 1), destination.substr(1, destination_end - 1));
    if (!link || link->url.empty()) {
        return std::nullopt;
    }
    return Match<Link_Token> { .value = *link, .rest = destination.substr(destination_end + 1) };
}

std::optional<Match<Link_Token>> match_image(std::string_view text)
{
    if (!text.starts_with("![")) {
        return std::nullopt;
    }
    return match_link(text.substr(1));
}

std::optional<Match<std::string_view>> match_autolink(std::string_view text)
{
    static constexpr std::string_view schemes[] { "http://", "https://", "mailto:", "ftp://" };
    if (!text.starts_with('<')) {
        return std::nullopt;
    }
    const std::string_view rest = text.substr(1);
    if (std::ranges::none_of(schemes, [rest](std::string_view s) { return rest.starts_with(s); })) {
        return std::nullopt;
    }
    const Size length = length_of_run(
        rest, [](char c) { return c != '>' && c != '<' && !is_ascii_whitespace(c); });
    if (length == rest.size() || rest[length] != '>') {
        return std::nullopt;
    }
    return Match<std::string_view> { .value = rest.substr(0, length),
                                     .rest = rest.substr(length + 1) };
}

std::optional<Match<std::string_view>> match_inline_html(std::string_view text)
{
    if (text.starts_with("<!--")) {
        const Size end = text.find("-->", 4);
        if (end == std::string_view::npos) {
            return std::nullopt;
        }
        return Match<std::string_view> { .value = text.substr(0, end + 3),
                                         .rest = text.substr(end + 3) };
    }
    if (text.size() < 3 || text[0] != '<') {
        return std::nullopt;
    }
    const Size name_begin = text[1] == '/' ? 2 : 1;
    if (name_begin >= text.size() || !is_ascii_alpha(text[name_begin])) {
        return std::nullopt;
    }
    const Size end = text.find('>', name_begin);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return Match<std::string_view> { .value = text.substr(0, end + 1),
                                     .rest = text.substr(end + 1) };
}

} // namespace markdown_academic::mda
