#include <algorithm>
#include <charconv>
#include <set>
#include <variant>

#include "common/assert.hpp"

#include "mda/parsing/front_matter.hpp"
#include "mda/parsing/tokenize.hpp"

namespace markdown_academic::mda {

namespace {

constexpr std::string_view front_matter_fence = "+++";

struct Toml_Value;
struct Toml_Entry;

using Toml_Array = std::pmr::vector<Toml_Value>;
using Toml_Table = std::pmr::vector<Toml_Entry>;

/// @brief The subset of TOML values which may appear in front matter.
/// Local dates and times are represented as strings.
struct Toml_Value : std::variant<std::pmr::string, long long, double, bool, Toml_Array, Toml_Table> {
    using variant::variant;
};

struct Toml_Entry {
    std::pmr::string key;
    Toml_Value value;
};

/// @brief The table which key/value pairs are currently assigned to.
enum struct Table_Kind : Default_Underlying {
    root,
    macros,
    bibliography,
    /// @brief Any other table, whose contents are ignored.
    other,
};

[[nodiscard]] constexpr bool is_bare_key_character(char c)
{
    return is_ascii_alphanumeric(c) || c == '_' || c == '-';
}

[[nodiscard]] constexpr bool is_number_character(char c)
{
    return is_ascii_alphanumeric(c) || c == '_' || c == '+' || c == '-' || c == '.' || c == ':';
}

[[nodiscard]] constexpr bool is_line_space(char c)
{
    return c == ' ' || c == '\t';
}

void append_utf8(std::pmr::string& out, char32_t code_point)
{
    if (code_point < 0x80) {
        out += char(code_point);
    }
    else if (code_point < 0x800) {
        out += char(0xc0 | (code_point >> 6));
        out += char(0x80 | (code_point & 0x3f));
    }
    else if (code_point < 0x10000) {
        out += char(0xe0 | (code_point >> 12));
        out += char(0x80 | ((code_point >> 6) & 0x3f));
        out += char(0x80 | (code_point & 0x3f));
    }
    else {
        out += char(0xf0 | (code_point >> 18));
        out += char(0x80 | ((code_point >> 12) & 0x3f));
        out += char(0x80 | ((code_point >> 6) & 0x3f));
        out += char(0x80 | (code_point & 0x3f));
    }
}

/// @brief Returns `true` if `token` looks like a TOML local date such as `2024-01-15`,
/// possibly followed by a time.
[[nodiscard]] bool is_date_like(std::string_view token)
{
    return token.size() >= 10 && is_ascii_digit(token[0]) && is_ascii_digit(token[1])
        && is_ascii_digit(token[2]) && is_ascii_digit(token[3]) && token[4] == '-'
        && is_ascii_digit(token[5]) && is_ascii_digit(token[6]) && token[7] == '-';
}

struct Front_Matter_Parser {
private:
    /// @brief The whole document source, which all positions refer to.
    std::string_view m_source;
    std::pmr::memory_resource* m_memory;
    Metadata& m_metadata;
    /// @brief The current position within `m_source`.
    Size m_pos;
    /// @brief The end of the front matter content, exclusive.
    Size m_end;

    Table_Kind m_table = Table_Kind::root;
    std::pmr::string m_table_name;
    /// @brief Table-qualified keys and table names which have already been assigned.
    std::pmr::set<std::pmr::string> m_seen_keys;
    std::optional<std::pmr::string> m_author;

public:
    Front_Matter_Parser(std::string_view source,
                        Size begin,
                        Size end,
                        Metadata& metadata,
                        std::pmr::memory_resource* memory)
        : m_source { source }
        , m_memory { memory }
        , m_metadata { metadata }
        , m_pos { begin }
        , m_end { end }
        , m_table_name { memory }
        , m_seen_keys { memory }
    {
    }

    Result<void, Parse_Error> operator()()
    {
        while (true) {
            skip_blank_and_comments();
            if (eof()) {
                break;
            }
            auto result = peek() == '[' ? match_table_header() : match_key_value();
            if (!result) {
                return result;
            }
        }
        if (m_author && m_metadata.authors.empty()) {
            m_metadata.authors.push_back(std::move(*m_author));
        }
        return {};
    }

private:
    [[nodiscard]] bool eof() const
    {
        return m_pos >= m_end;
    }

    [[nodiscard]] char peek(Size offset = 0) const
    {
        return m_pos + offset < m_end ? m_source[m_pos + offset] : '\0';
    }

    [[nodiscard]] std::string_view remaining() const
    {
        return m_source.substr(m_pos, m_end - m_pos);
    }

    [[nodiscard]] Parse_Error error(Parse_Error_Code code,
                                    Size begin,
                                    Size length,
                                    std::string_view subject = {}) const
    {
        return Parse_Error { .code = code,
                             .pos = { Local_Source_Position::at(m_source, begin), length },
                             .subject = subject };
    }

    [[nodiscard]] Parse_Error syntax_error() const
    {
        return error(Parse_Error_Code::front_matter_syntax, m_pos, eof() ? 0 : 1);
    }

    void skip_line_space()
    {
        while (is_line_space(peek())) {
            ++m_pos;
        }
    }

    void skip_comment()
    {
        if (peek() != '#') {
            return;
        }
        while (!eof() && peek() != '\n') {
            ++m_pos;
        }
    }

    void skip_blank_and_comments()
    {
        while (!eof()) {
            if (is_ascii_whitespace(peek())) {
                ++m_pos;
            }
            else if (peek() == '#') {
                skip_comment();
            }
            else {
                break;
            }
        }
    }

    /// @brief Matches the end of a line, which may be preceded by spaces and a comment.
    Result<void, Parse_Error> expect_line_end()
    {
        skip_line_space();
        skip_comment();
        if (peek() == '\r') {
            ++m_pos;
        }
        if (eof()) {
            return {};
        }
        if (peek() != '\n') {
            return syntax_error();
        }
        ++m_pos;
        return {};
    }

    Result<void, Parse_Error> match_table_header()
    {
        MARKDOWN_ACADEMIC_ASSERT(peek() == '[');
        const Size begin = m_pos;
        // Arrays of tables are accepted, but their contents are ignored.
        const bool is_array = peek(1) == '[';
        m_pos += is_array ? 2 : 1;

        std::pmr::string name(m_memory);
        while (true) {
            skip_line_space();
            auto key = match_key();
            if (!key) {
                return key.error();
            }
            name += *key;
            skip_line_space();
            if (peek() != '.') {
                break;
            }
            name += '.';
            ++m_pos;
        }
        for (int i = 0; i < (is_array ? 2 : 1); ++i) {
            if (peek() != ']') {
                return syntax_error();
            }
            ++m_pos;
        }
        const std::string_view subject = m_source.substr(begin, m_pos - begin);

        if (is_array) {
            m_table = Table_Kind::other;
        }
        else {
            std::pmr::string qualified("[", m_memory);
            qualified += name;
            qualified += ']';
            if (!m_seen_keys.insert(std::move(qualified)).second) {
                return error(Parse_Error_Code::front_matter_duplicate_key, begin, subject.size(),
                             subject);
            }
            m_table = name == "macros"     ? Table_Kind::macros
                : name == "bibliography" ? Table_Kind::bibliography
                                         : Table_Kind::other;
        }
        m_table_name = std::move(name);
        return expect_line_end();
    }

    Result<void, Parse_Error> match_key_value()
    {
        const Size key_begin = m_pos;
        auto key = match_key();
        if (!key) {
            return key.error();
        }
        const std::string_view key_source = m_source.substr(key_begin, m_pos - key_begin);

        skip_line_space();
        if (peek() != '=') {
            return syntax_error();
        }
        ++m_pos;
        skip_line_space();

        const Size value_begin = m_pos;
        auto value = match_value();
        if (!value) {
            return value.error();
        }
        const Size value_length = m_pos - value_begin;
        if (auto end = expect_line_end(); !end) {
            return end;
        }

        std::pmr::string qualified(m_table_name, m_memory);
        qualified += '.';
        qualified += *key;
        if (!m_seen_keys.insert(std::move(qualified)).second) {
            return error(Parse_Error_Code::front_matter_duplicate_key, key_begin, key_source.size(),
                         key_source);
        }

        if (!assign(*key, std::move(*value))) {
            return error(Parse_Error_Code::front_matter_type, value_begin, value_length,
                         key_source);
        }
        return {};
    }

    Result<std::pmr::string, Parse_Error> match_key()
    {
        if (peek() == '"') {
            return match_basic_string();
        }
        if (peek() == '\'') {
            return match_literal_string();
        }
        const Size begin = m_pos;
        while (is_bare_key_character(peek())) {
            ++m_pos;
        }
        if (m_pos == begin) {
            return syntax_error();
        }
        return std::pmr::string(m_source.substr(begin, m_pos - begin), m_memory);
    }

    Result<Toml_Value, Parse_Error> match_value()
    {
        const std::string_view rest = remaining();
        if (rest.starts_with(R"(""")")) {
            return wrap(match_multiline_basic_string());
        }
        if (rest.starts_with('"')) {
            return wrap(match_basic_string());
        }
        if (rest.starts_with("'''")) {
            return wrap(match_multiline_literal_string());
        }
        if (rest.starts_with('\'')) {
            return wrap(match_literal_string());
        }
        if (rest.starts_with('[')) {
            return match_array();
        }
        if (rest.starts_with('{')) {
            return match_inline_table();
        }
        if (rest.starts_with("true") && !is_bare_key_character(peek(4))) {
            m_pos += 4;
            return Toml_Value { true };
        }
        if (rest.starts_with("false") && !is_bare_key_character(peek(5))) {
            m_pos += 5;
            return Toml_Value { false };
        }
        return match_number_or_date();
    }

    static Result<Toml_Value, Parse_Error> wrap(Result<std::pmr::string, Parse_Error>&& string)
    {
        if (!string) {
            return std::move(string).error();
        }
        return Toml_Value { std::move(*string) };
    }

    /// @brief Matches and decodes an escape sequence, starting at the backslash.
    Result<void, Parse_Error> match_escape(std::pmr::string& out)
    {
        MARKDOWN_ACADEMIC_ASSERT(peek() == '\\');
        const Size begin = m_pos;
        const char c = peek(1);
        m_pos += 2;
        switch (c) {
        case 'b': out += '\b'; return {};
        case 't': out += '\t'; return {};
        case 'n': out += '\n'; return {};
        case 'f': out += '\f'; return {};
        case 'r': out += '\r'; return {};
        case 'e': out += '\x1b'; return {};
        case '"': out += '"'; return {};
        case '\\': out += '\\'; return {};
        case 'u':
        case 'U': {
            const Size digits = c == 'u' ? 4 : 8;
            const std::string_view hex = remaining().substr(0, digits);
            Uint32 code_point = 0;
            const auto [end, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), code_point, 16);
            if (hex.size() != digits || ec != std::errc {} || end != hex.data() + hex.size()
                || code_point > 0x10ffff) {
                return error(Parse_Error_Code::front_matter_syntax, begin, 2 + hex.size());
            }
            m_pos += digits;
            append_utf8(out, char32_t(code_point));
            return {};
        }
        default: return error(Parse_Error_Code::front_matter_syntax, begin, 2);
        }
    }

    Result<std::pmr::string, Parse_Error> match_basic_string()
    {
        MARKDOWN_ACADEMIC_ASSERT(peek() == '"');
        const Size begin = m_pos++;
        std::pmr::string result(m_memory);
        while (true) {
            if (eof() || peek() == '\n') {
                return error(Parse_Error_Code::front_matter_syntax, begin, m_pos - begin);
            }
            if (peek() == '"') {
                ++m_pos;
                return result;
            }
            if (peek() == '\\') {
                if (auto escape = match_escape(result); !escape) {
                    return escape.error();
                }
                continue;
            }
            result += m_source[m_pos++];
        }
    }

    Result<std::pmr::string, Parse_Error> match_literal_string()
    {
        MARKDOWN_ACADEMIC_ASSERT(peek() == '\'');
        const Size begin = m_pos++;
        const Size close = remaining().find_first_of("'\n");
        if (close == std::string_view::npos || peek(close) != '\'') {
            return error(Parse_Error_Code::front_matter_syntax, begin, 1);
        }
        std::pmr::string result(remaining().substr(0, close), m_memory);
        m_pos += close + 1;
        return result;
    }

    /// @brief Skips a newline directly following the opening delimiter of a multi-line string.
    void skip_leading_newline()
    {
        if (peek() == '\r' && peek(1) == '\n') {
            m_pos += 2;
        }
        else if (peek() == '\n') {
            ++m_pos;
        }
    }

    Result<std::pmr::string, Parse_Error> match_multiline_basic_string()
    {
        const Size begin = m_pos;
        m_pos += 3;
        skip_leading_newline();
        std::pmr::string result(m_memory);
        while (true) {
            if (eof()) {
                return error(Parse_Error_Code::front_matter_syntax, begin, 3);
            }
            if (remaining().starts_with(R"(""")")) {
                m_pos += 3;
                return result;
            }
            if (peek() == '\\') {
                // A line-ending backslash trims all whitespace up to the next content.
                Size after = m_pos + 1;
                while (after < m_end && is_line_space(m_source[after])) {
                    ++after;
                }
                if (after < m_end && (m_source[after] == '\n' || m_source[after] == '\r')) {
                    m_pos = after;
                    while (!eof() && is_ascii_whitespace(peek())) {
                        ++m_pos;
                    }
                    continue;
                }
                if (auto escape = match_escape(result); !escape) {
                    return escape.error();
                }
                continue;
            }
            result += m_source[m_pos++];
        }
    }

    Result<std::pmr::string, Parse_Error> match_multiline_literal_string()
    {
        const Size begin = m_pos;
        m_pos += 3;
        skip_leading_newline();
        const Size close = remaining().find("'''");
        if (close == std::string_view::npos) {
            return error(Parse_Error_Code::front_matter_syntax, begin, 3);
        }
        std::pmr::string result(remaining().substr(0, close), m_memory);
        m_pos += close + 3;
        return result;
    }

    Result<Toml_Value, Parse_Error> match_array()
    {
        MARKDOWN_ACADEMIC_ASSERT(peek() == '[');
        const Size begin = m_pos++;
        Toml_Array result(m_memory);
        while (true) {
            skip_blank_and_comments();
            if (eof()) {
                return error(Parse_Error_Code::front_matter_syntax, begin, 1);
            }
            if (peek() == ']') {
                ++m_pos;
                return Toml_Value { std::move(result) };
            }
            auto element = match_value();
            if (!element) {
                return element;
            }
            result.push_back(std::move(*element));
            skip_blank_and_comments();
            if (peek() == ',') {
                ++m_pos;
            }
            else if (peek() != ']') {
                return eof() ? error(Parse_Error_Code::front_matter_syntax, begin, 1)
                             : syntax_error();
            }
        }
    }

    Result<Toml_Value, Parse_Error> match_inline_table()
    {
        MARKDOWN_ACADEMIC_ASSERT(peek() == '{');
        const Size begin = m_pos++;
        Toml_Table result(m_memory);
        skip_line_space();
        if (peek() == '}') {
            ++m_pos;
            return Toml_Value { std::move(result) };
        }
        while (true) {
            skip_line_space();
            const Size key_begin = m_pos;
            auto key = match_key();
            if (!key) {
                return key.error();
            }
            for (const Toml_Entry& entry : result) {
                if (entry.key == *key) {
                    const std::string_view subject = m_source.substr(key_begin, m_pos - key_begin);
                    return error(Parse_Error_Code::front_matter_duplicate_key, key_begin,
                                 subject.size(), subject);
                }
            }
            skip_line_space();
            if (peek() != '=') {
                return syntax_error();
            }
            ++m_pos;
            skip_line_space();
            auto value = match_value();
            if (!value) {
                return value;
            }
            result.push_back({ std::move(*key), std::move(*value) });
            skip_line_space();
            if (peek() == ',') {
                ++m_pos;
                continue;
            }
            if (peek() == '}') {
                ++m_pos;
                return Toml_Value { std::move(result) };
            }
            return eof() || peek() == '\n' ? error(Parse_Error_Code::front_matter_syntax, begin, 1)
                                           : syntax_error();
        }
    }

    Result<Toml_Value, Parse_Error> match_number_or_date()
    {
        const Size begin = m_pos;
        while (is_number_character(peek())
               || (peek() == ' ' && is_date_like(m_source.substr(begin, m_pos - begin))
                   && is_ascii_digit(peek(1)))) {
            ++m_pos;
        }
        const std::string_view token = m_source.substr(begin, m_pos - begin);
        if (token.empty()) {
            return syntax_error();
        }
        if (is_date_like(token)) {
            return Toml_Value { std::pmr::string(token, m_memory) };
        }

        std::pmr::string digits(m_memory);
        for (char c : token) {
            if (c != '_') {
                digits += c;
            }
        }
        if (digits.starts_with('+')) {
            digits.erase(0, 1);
        }
        const char* const first = digits.data();
        const char* const last = digits.data() + digits.size();

        long long integer = 0;
        if (const auto [end, ec] = std::from_chars(first, last, integer);
            ec == std::errc {} && end == last) {
            return Toml_Value { integer };
        }
        double floating = 0;
        if (const auto [end, ec] = std::from_chars(first, last, floating);
            ec == std::errc {} && end == last) {
            return Toml_Value { floating };
        }
        return error(Parse_Error_Code::front_matter_syntax, begin, token.size());
    }

    // ASSIGNMENT ==================================================================================

    /// @brief Stores the value in the metadata.
    /// @return `false` if the key is known, but the value has the wrong type
    [[nodiscard]] bool assign(std::string_view key, Toml_Value&& value)
    {
        switch (m_table) {
        case Table_Kind::root: return assign_root(key, std::move(value));
        case Table_Kind::macros: return assign_macro(key, std::move(value));
        case Table_Kind::bibliography:
            return key != "path" || assign_string(m_metadata.bibliography, std::move(value));
        case Table_Kind::other: return true;
        }
        MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE("Invalid table kind.");
    }

    [[nodiscard]] bool assign_root(std::string_view key, Toml_Value&& value)
    {
        if (key == "title") {
            return assign_string(m_metadata.title, std::move(value));
        }
        if (key == "subtitle") {
            return assign_string(m_metadata.subtitle, std::move(value));
        }
        if (key == "author") {
            return assign_string(m_author, std::move(value));
        }
        if (key == "authors") {
            return assign_string_list(m_metadata.authors, std::move(value));
        }
        if (key == "date") {
            return assign_string(m_metadata.date, std::move(value));
        }
        if (key == "abstract") {
            return assign_string(m_metadata.abstract, std::move(value));
        }
        if (key == "keywords") {
            return assign_string_list(m_metadata.keywords, std::move(value));
        }
        if (key == "institution") {
            return assign_string(m_metadata.institution, std::move(value));
        }
        if (key == "department") {
            return assign_string(m_metadata.department, std::move(value));
        }
        if (key == "advisor") {
            return assign_string(m_metadata.advisor, std::move(value));
        }
        if (key == "lang" || key == "language") {
            return assign_string(m_metadata.language, std::move(value));
        }
        if (key == "bibliography") {
            if (auto* const table = std::get_if<Toml_Table>(&value)) {
                for (Toml_Entry& entry : *table) {
                    if (entry.key == "path"
                        && !assign_string(m_metadata.bibliography, std::move(entry.value))) {
                        return false;
                    }
                }
                return true;
            }
            return assign_string(m_metadata.bibliography, std::move(value));
        }
        if (key == "macros") {
            auto* const table = std::get_if<Toml_Table>(&value);
            if (!table) {
                return false;
            }
            for (Toml_Entry& entry : *table) {
                if (!assign_macro(entry.key, std::move(entry.value))) {
                    return false;
                }
            }
            return true;
        }
        return true;
    }

    [[nodiscard]] bool assign_macro(std::string_view name, Toml_Value&& value)
    {
        auto* const body = std::get_if<std::pmr::string>(&value);
        if (!body) {
            return false;
        }
        const Size arg_count = count_macro_args(*body);
        m_metadata.macros.insert_or_assign(std::pmr::string(name, m_memory),
                                           Macro { arg_count, std::move(*body) });
        return true;
    }

    [[nodiscard]] static bool assign_string(std::optional<std::pmr::string>& out, Toml_Value&& value)
    {
        auto* const string = std::get_if<std::pmr::string>(&value);
        if (!string) {
            return false;
        }
        out = std::move(*string);
        return true;
    }

    [[nodiscard]] static bool assign_string_list(std::pmr::vector<std::pmr::string>& out,
                                                 Toml_Value&& value)
    {
        if (auto* const string = std::get_if<std::pmr::string>(&value)) {
            out.push_back(std::move(*string));
            return true;
        }
        auto* const array = std::get_if<Toml_Array>(&value);
        if (!array) {
            return false;
        }
        for (const Toml_Value& element : *array) {
            if (!std::holds_alternative<std::pmr::string>(element)) {
                return false;
            }
        }
        for (Toml_Value& element : *array) {
            out.push_back(std::move(std::get<std::pmr::string>(element)));
        }
        return true;
    }
};

} // namespace

Size count_macro_args(std::string_view body)
{
    Size result = 0;
    for (Size i = 0; i + 1 < body.size(); ++i) {
        if (body[i] == '#' && is_ascii_digit(body[i + 1])) {
            result = std::max(result, Size(body[i + 1] - '0'));
        }
    }
    return result;
}

Result<Front_Matter, Parse_Error> parse_front_matter(std::string_view source,
                                                     std::pmr::memory_resource* memory)
{
    Front_Matter result { .metadata = Metadata { memory }, .body_begin = 0 };

    const Size open = source.size() - trim_start(source).size();
    if (!source.substr(open).starts_with(front_matter_fence)) {
        return result;
    }
    const Size content_begin = open + front_matter_fence.size();
    const Size close = source.find("\n+++", content_begin);
    if (close == std::string_view::npos) {
        return Parse_Error { .code = Parse_Error_Code::unterminated_front_matter,
                             .pos = { Local_Source_Position::at(source, open),
                                      front_matter_fence.size() },
                             .subject = {} };
    }

    Front_Matter_Parser parser { source, content_begin, close, result.metadata, memory };
    if (auto parsed = parser(); !parsed) {
        return std::move(parsed).error();
    }

    Size body_begin = close + 1 + front_matter_fence.size();
    while (body_begin < source.size() && (source[body_begin] == '\n' || source[body_begin] == '\r')) {
        ++body_begin;
    }
    result.body_begin = body_begin;
    return result;
}

} // namespace markdown_academic::mda
