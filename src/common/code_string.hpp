#ifndef MARKDOWN_ACADEMIC_CODE_STRING_HPP
#define MARKDOWN_ACADEMIC_CODE_STRING_HPP

#include <charconv>
#include <concepts>
#include <memory_resource>
#include <string_view>
#include <system_error>
#include <vector>

#include "common/assert.hpp"
#include "common/code_span_type.hpp"
#include "common/config.hpp"

namespace markdown_academic {

struct Code_String_Span {
    Size begin;
    Size length;
    Code_Span_Type type;

    [[nodiscard]] constexpr Size end() const
    {
        return begin + length;
    }
};

/// @brief A string of text where some ranges are tagged with a `Code_Span_Type`.
/// This is the common output format of all diagnostic printers;
/// `print_code_string` turns it into (optionally colored) terminal output.
struct Code_String {
public:
    using iterator = Code_String_Span*;
    using const_iterator = const Code_String_Span*;

private:
    std::pmr::vector<char> m_text;
    std::pmr::vector<Code_String_Span> m_spans;

public:
    [[nodiscard]] Code_String(std::pmr::memory_resource* memory = std::pmr::get_default_resource())
        : m_text(memory)
        , m_spans(memory)
    {
    }

    [[nodiscard]] std::string_view get_text() const
    {
        return { m_text.data(), m_text.size() };
    }

    /// @brief Appends a raw range of text to the string.
    /// This is typically useful for e.g. whitespace between tagged spans.
    void append(std::string_view text)
    {
        m_text.insert(m_text.end(), text.begin(), text.end());
    }

    /// @brief Appends a raw character of text to the string.
    void append(char c)
    {
        m_text.push_back(c);
    }

    /// @brief Appends a raw character of text multiple times to the string.
    void append(Size amount, char c)
    {
        m_text.insert(m_text.end(), amount, c);
    }

    void append(std::string_view text, Code_Span_Type type)
    {
        if (text.empty()) {
            return;
        }
        m_spans.push_back({ .begin = m_text.size(), .length = text.size(), .type = type });
        m_text.insert(m_text.end(), text.begin(), text.end());
    }

    void append(char c, Code_Span_Type type)
    {
        m_spans.push_back({ .begin = m_text.size(), .length = 1, .type = type });
        m_text.push_back(c);
    }

    template <std::integral T>
    void append_integer(T x, Code_Span_Type type)
    {
        char buffer[24];
        const std::to_chars_result result = std::to_chars(buffer, buffer + sizeof(buffer), x);
        MARKDOWN_ACADEMIC_ASSERT(result.ec == std::errc {});
        append(std::string_view(buffer, Size(result.ptr - buffer)), type);
    }

    struct Scoped_Builder;

    /// @brief Starts building a single span out of multiple parts which will be fused
    /// together.
    /// For example:
    /// ```
    /// string.build(Code_Span_Type::diagnostic_code_position)
    ///     .append(file)
    ///     .append(':');
    /// ```
    /// @param type the type of the appended span as a whole
    Scoped_Builder build(Code_Span_Type type) &;

    [[nodiscard]] iterator begin()
    {
        return m_spans.data();
    }

    [[nodiscard]] iterator end()
    {
        return m_spans.data() + Difference(m_spans.size());
    }

    [[nodiscard]] const_iterator begin() const
    {
        return m_spans.data();
    }

    [[nodiscard]] const_iterator end() const
    {
        return m_spans.data() + Difference(m_spans.size());
    }
};

struct [[nodiscard]] Code_String::Scoped_Builder {
private:
    Code_String& self;
    Size initial_size;
    Code_Span_Type type;

public:
    Scoped_Builder(Code_String& self, Code_Span_Type type)
        : self { self }
        , initial_size { self.m_text.size() }
        , type { type }
    {
    }

    ~Scoped_Builder() noexcept(false)
    {
        MARKDOWN_ACADEMIC_ASSERT(self.m_text.size() >= initial_size);
        const Size length = self.m_text.size() - initial_size;
        if (length != 0) {
            self.m_spans.push_back({ .begin = initial_size, .length = length, .type = type });
        }
    }

    Scoped_Builder(const Scoped_Builder&) = delete;
    Scoped_Builder& operator=(const Scoped_Builder&) = delete;

    Scoped_Builder& append(char c)
    {
        self.append(c);
        return *this;
    }

    Scoped_Builder& append(std::string_view text)
    {
        self.append(text);
        return *this;
    }

    template <std::integral T>
    Scoped_Builder& append_integer(T x)
    {
        char buffer[24];
        const std::to_chars_result result = std::to_chars(buffer, buffer + sizeof(buffer), x);
        MARKDOWN_ACADEMIC_ASSERT(result.ec == std::errc {});
        self.append(std::string_view(buffer, Size(result.ptr - buffer)));
        return *this;
    }
};

inline Code_String::Scoped_Builder Code_String::build(Code_Span_Type type) &
{
    return { *this, type };
}

} // namespace markdown_academic

#endif
