#include <optional>
#include <string>

#include "common/assert.hpp"

#include "mda/ast.hpp"
#include "mda/parsing/parse.hpp"
#include "mda/parsing/tokenize.hpp"

namespace markdown_academic::mda {

namespace {

/// @brief Returns `true` if `c` may begin some inline construct other than plain text.
[[nodiscard]] constexpr bool is_special_character(char c)
{
    switch (c) {
    case '\\':
    case '\n':
    case '$':
    case '*':
    case '_':
    case '~':
    case '^':
    case '`':
    case '[':
    case '@':
    case '{':
    case '!':
    case '<': return true;
    default: return false;
    }
}

struct Inline_Parser {
private:
    std::string_view m_text;
    std::pmr::memory_resource* m_memory;
    std::pmr::vector<ast::Inline> m_out;
    /// @brief The most recently consumed character, or `'\0'` at the start.
    char m_previous = '\0';

public:
    Inline_Parser(std::string_view text, std::pmr::memory_resource* memory)
        : m_text { text }
        , m_memory { memory }
        , m_out { memory }
    {
    }

    std::pmr::vector<ast::Inline> parse() &&
    {
        while (!m_text.empty()) {
            match_inline();
        }
        return std::move(m_out);
    }

private:
    void match_inline()
    {
        const bool matched = try_match_escape() || try_match_line_break() || try_match_math()
            || try_match_emphasis() || try_match_tilde_or_caret() || try_match_code()
            || try_match_citation() || try_match_footnote() || try_match_reference()
            || try_match_label() || try_match_small_caps() || try_match_link_or_image()
            || try_match_angle_bracket();
        if (!matched) {
            match_text();
        }
    }

    /// @brief Advances the cursor to `rest`, which must be a suffix of the remaining text.
    void advance_to(std::string_view rest)
    {
        MARKDOWN_ACADEMIC_ASSERT(rest.size() < m_text.size());
        const Size consumed = m_text.size() - rest.size();
        m_previous = m_text[consumed - 1];
        m_text = rest;
    }

    void advance(Size amount)
    {
        advance_to(m_text.substr(amount));
    }

    [[nodiscard]] std::pmr::vector<ast::Inline> nested(std::string_view text) const
    {
        return parse_inlines(text, m_memory);
    }

    [[nodiscard]] std::pmr::string string(std::string_view text) const
    {
        return std::pmr::string(text, m_memory);
    }

    void append_text(std::string_view text)
    {
        if (text.empty()) {
            return;
        }
        if (!m_out.empty()) {
            if (auto* const last = std::get_if<ast::Text>(&m_out.back())) {
                last->text += text;
                return;
            }
        }
        m_out.push_back(ast::Text { string(text) });
    }

    bool try_match_escape()
    {
        if (m_text.size() < 2 || m_text[0] != '\\') {
            return false;
        }
        if (m_text[1] == '\n') {
            push_break(true);
            advance(2);
            skip_indentation();
            return true;
        }
        if (!is_ascii_punctuation(m_text[1])) {
            return false;
        }
        append_text(m_text.substr(1, 1));
        advance(2);
        return true;
    }

    bool try_match_line_break()
    {
        if (m_text[0] != '\n') {
            return false;
        }
        push_break(false);
        advance(1);
        skip_indentation();
        return true;
    }

    /// @brief Removes trailing spaces from the preceding text and appends a break.
    /// Two or more trailing spaces turn the break into a hard break.
    void push_break(bool hard)
    {
        if (!m_out.empty()) {
            if (auto* const last = std::get_if<ast::Text>(&m_out.back())) {
                const Size trimmed_size = trim_end(last->text).size();
                hard |= last->text.size() - trimmed_size >= 2;
                last->text.resize(trimmed_size);
                if (last->text.empty()) {
                    m_out.pop_back();
                }
            }
        }
        if (hard) {
            m_out.push_back(ast::Hard_Break {});
        }
        else {
            m_out.push_back(ast::Soft_Break {});
        }
    }

    void skip_indentation()
    {
        if (const Size indent = indentation_of(m_text); indent != 0) {
            advance(indent);
        }
    }

    bool try_match_math()
    {
        if (auto math = match_double_dollar_math(m_text)) {
            m_out.push_back(ast::Inline_Math { string(trim(math->value)) });
            advance_to(math->rest);
            return true;
        }
        if (auto math = match_inline_math(m_text)) {
            m_out.push_back(ast::Inline_Math { string(math->value) });
            advance_to(math->rest);
            return true;
        }
        return false;
    }

    bool try_match_emphasis()
    {
        if (m_text[0] != '*' && m_text[0] != '_') {
            return false;
        }
        // Underscores within words, as in "snake_case_name", are not delimiters.
        if (m_text[0] == '_' && is_word_character(m_previous)) {
            return false;
        }
        const std::string_view doubled = m_text[0] == '*' ? "**" : "__";
        if (auto strong = match_delimited(m_text, doubled)) {
            m_out.push_back(ast::Strong { nested(strong->value) });
            advance_to(strong->rest);
            return true;
        }
        if (auto emphasis = match_delimited(m_text, doubled.substr(0, 1))) {
            m_out.push_back(ast::Emphasis { nested(emphasis->value) });
            advance_to(emphasis->rest);
            return true;
        }
        return false;
    }

    bool try_match_tilde_or_caret()
    {
        if (auto strikethrough = match_delimited(m_text, "~~")) {
            m_out.push_back(ast::Strikethrough { nested(strikethrough->value) });
            advance_to(strikethrough->rest);
            return true;
        }
        if (auto subscript = match_delimited(m_text, "~", false)) {
            m_out.push_back(ast::Subscript { nested(subscript->value) });
            advance_to(subscript->rest);
            return true;
        }
        if (m_text.starts_with("^[")) {
            return false;
        }
        if (auto superscript = match_delimited(m_text, "^", false)) {
            m_out.push_back(ast::Superscript { nested(superscript->value) });
            advance_to(superscript->rest);
            return true;
        }
        return false;
    }

    bool try_match_code()
    {
        if (m_text[0] != '`') {
            return false;
        }
        if (auto code = match_code_span(m_text)) {
            m_out.push_back(ast::Code { string(code->value) });
            advance_to(code->rest);
            return true;
        }
        // A backtick run without a closing run of equal length is literal text.
        Size ticks = 0;
        while (ticks < m_text.size() && m_text[ticks] == '`') {
            ++ticks;
        }
        append_text(m_text.substr(0, ticks));
        advance(ticks);
        return true;
    }

    bool try_match_citation()
    {
        std::optional<Match<Citation_Token>> citation = match_citation(m_text, m_memory);
        if (!citation) {
            return false;
        }
        const Citation_Token& token = citation->value;
        MARKDOWN_ACADEMIC_ASSERT(!token.items.empty());

        ast::Citation result { .keys = std::pmr::vector<std::pmr::string>(m_memory),
                               .style = token.year_only ? Citation_Style::year_only
                                                        : Citation_Style::parenthetical,
                               .prefix = {},
                               .locator = {} };
        for (const Citation_Item& item : token.items) {
            result.keys.push_back(string(item.key));
        }
        if (!token.prefix.empty()) {
            result.prefix = string(token.prefix);
        }
        if (!token.items.front().locator.empty()) {
            result.locator = string(token.items.front().locator);
        }
        m_out.push_back(std::move(result));
        advance_to(citation->rest);
        return true;
    }

    bool try_match_footnote()
    {
        if (auto footnote = match_inline_footnote(m_text)) {
            m_out.push_back(ast::Footnote { .id = {}, .content = nested(footnote->value) });
            advance_to(footnote->rest);
            return true;
        }
        if (auto reference = match_footnote_reference(m_text)) {
            m_out.push_back(ast::Footnote { .id = string(reference->value),
                                            .content = std::pmr::vector<ast::Inline>(m_memory) });
            advance_to(reference->rest);
            return true;
        }
        return false;
    }

    bool try_match_reference()
    {
        // An '@' within a word, as in "user@example.com", is not a reference.
        if (is_word_character(m_previous)) {
            return false;
        }
        if (auto reference = match_reference(m_text)) {
            m_out.push_back(ast::Reference { .label = string(reference->value), .resolved = {} });
            advance_to(reference->rest);
            return true;
        }
        return false;
    }

    bool try_match_label()
    {
        // Labels are attached to blocks by the block parser; stray ones are dropped.
        if (auto label = match_label(m_text)) {
            advance_to(label->rest);
            return true;
        }
        return false;
    }

    bool try_match_small_caps()
    {
        if (auto small_caps = match_small_caps(m_text)) {
            m_out.push_back(ast::Small_Caps { nested(small_caps->value) });
            advance_to(small_caps->rest);
            return true;
        }
        return false;
    }

    bool try_match_link_or_image()
    {
        if (auto link = match_link(m_text)) {
            m_out.push_back(ast::Link { .url = string(link->value.url),
                                        .title = to_optional_string(link->value.title),
                                        .content = nested(link->value.text) });
            advance_to(link->rest);
            return true;
        }
        if (auto image = match_image(m_text)) {
            m_out.push_back(ast::Image { .url = string(image->value.url),
                                         .alt = string(image->value.text),
                                         .title = to_optional_string(image->value.title) });
            advance_to(image->rest);
            return true;
        }
        return false;
    }

    bool try_match_angle_bracket()
    {
        if (auto autolink = match_autolink(m_text)) {
            std::pmr::vector<ast::Inline> content(m_memory);
            content.push_back(ast::Text { string(autolink->value) });
            m_out.push_back(ast::Link { .url = string(autolink->value),
                                        .title = {},
                                        .content = std::move(content) });
            advance_to(autolink->rest);
            return true;
        }
        if (auto html = match_inline_html(m_text)) {
            m_out.push_back(ast::Inline_Html { string(html->value) });
            advance_to(html->rest);
            return true;
        }
        return false;
    }

    void match_text()
    {
        Size length = 1;
        while (length < m_text.size() && !is_special_character(m_text[length])) {
            ++length;
        }
        append_text(m_text.substr(0, length));
        advance(length);
    }

    [[nodiscard]] std::optional<std::pmr::string>
    to_optional_string(std::optional<std::string_view> text) const
    {
        if (!text) {
            return std::nullopt;
        }
        return string(*text);
    }
};

} // namespace

std::pmr::vector<ast::Inline> parse_inlines(std::string_view text,
                                            std::pmr::memory_resource* memory)
{
    return Inline_Parser { text, memory }.parse();
}

} // namespace markdown_academic::mda
