#include <memory_resource>
#include <variant>

#include <gtest/gtest.h>

#include "mda/ast.hpp"
#include "mda/parsing/parse.hpp"

namespace markdown_academic {
namespace {

using namespace mda;

struct Parse_Inlines_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;

    std::pmr::vector<ast::Inline> parse(std::string_view text)
    {
        return parse_inlines(text, &memory);
    }

    std::pmr::string plain(std::span<const ast::Inline> content)
    {
        return ast::to_plain_text(content, &memory);
    }
};

TEST_F(Parse_Inlines_Test, plain_text)
{
    const auto inlines = parse("Just some words.");
    ASSERT_EQ(inlines.size(), 1u);
    EXPECT_EQ(std::get<ast::Text>(inlines[0]).text, "Just some words.");
}

TEST_F(Parse_Inlines_Test, emphasis_and_strong)
{
    const auto inlines = parse("*a* **b** __c__");
    ASSERT_EQ(inlines.size(), 5u);
    EXPECT_EQ(plain(std::get<ast::Emphasis>(inlines[0]).content), "a");
    EXPECT_EQ(std::get<ast::Text>(inlines[1]).text, " ");
    EXPECT_EQ(plain(std::get<ast::Strong>(inlines[2]).content), "b");
    EXPECT_EQ(plain(std::get<ast::Strong>(inlines[4]).content), "c");
}

TEST_F(Parse_Inlines_Test, nested_emphasis)
{
    const auto inlines = parse("*a **b** c*");
    ASSERT_EQ(inlines.size(), 1u);
    const auto& emphasis = std::get<ast::Emphasis>(inlines[0]);
    ASSERT_EQ(emphasis.content.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<ast::Strong>(emphasis.content[1]));
}

TEST_F(Parse_Inlines_Test, unmatched_delimiters_are_text)
{
    const auto unclosed = parse("*unclosed");
    ASSERT_EQ(unclosed.size(), 1u);
    EXPECT_EQ(std::get<ast::Text>(unclosed[0]).text, "*unclosed");

    const auto snake = parse("snake_case_name");
    ASSERT_EQ(snake.size(), 1u);
    EXPECT_EQ(std::get<ast::Text>(snake[0]).text, "snake_case_name");

    const auto ticks = parse("a ``b");
    ASSERT_EQ(ticks.size(), 1u);
    EXPECT_EQ(std::get<ast::Text>(ticks[0]).text, "a ``b");
}

TEST_F(Parse_Inlines_Test, escapes)
{
    const auto inlines = parse("\\*not emphasis\\*");
    ASSERT_EQ(inlines.size(), 1u);
    EXPECT_EQ(std::get<ast::Text>(inlines[0]).text, "*not emphasis*");
}

TEST_F(Parse_Inlines_Test, sub_and_superscript)
{
    const auto water = parse("H~2~O");
    ASSERT_EQ(water.size(), 3u);
    EXPECT_EQ(plain(std::get<ast::Subscript>(water[1]).content), "2");

    const auto square = parse("x^2^");
    ASSERT_EQ(square.size(), 2u);
    EXPECT_EQ(plain(std::get<ast::Superscript>(square[1]).content), "2");

    const auto struck = parse("~~gone~~");
    ASSERT_EQ(struck.size(), 1u);
    EXPECT_EQ(plain(std::get<ast::Strikethrough>(struck[0]).content), "gone");
}

TEST_F(Parse_Inlines_Test, math)
{
    const auto inlines = parse("Let $x^2$ be");
    ASSERT_EQ(inlines.size(), 3u);
    EXPECT_EQ(std::get<ast::Inline_Math>(inlines[1]).source, "x^2");

    const auto money = parse("$5 and $6");
    ASSERT_EQ(money.size(), 1u);
    EXPECT_EQ(std::get<ast::Text>(money[0]).text, "$5 and $6");
}

TEST_F(Parse_Inlines_Test, code)
{
    const auto inlines = parse("Call `f(x)` now");
    ASSERT_EQ(inlines.size(), 3u);
    EXPECT_EQ(std::get<ast::Code>(inlines[1]).code, "f(x)");
}

TEST_F(Parse_Inlines_Test, citation)
{
    const auto inlines = parse("[@knuth1984, p. 42]");
    ASSERT_EQ(inlines.size(), 1u);
    const auto& citation = std::get<ast::Citation>(inlines[0]);
    ASSERT_EQ(citation.keys.size(), 1u);
    EXPECT_EQ(citation.keys[0], "knuth1984");
    EXPECT_EQ(citation.style, Citation_Style::parenthetical);
    EXPECT_EQ(citation.locator, "p. 42");
    EXPECT_FALSE(citation.prefix);
}

TEST_F(Parse_Inlines_Test, citation_variants)
{
    const auto year = parse("[-@doe2020]");
    EXPECT_EQ(std::get<ast::Citation>(year.at(0)).style, Citation_Style::year_only);

    const auto prefixed = parse("[see @a; @b]");
    const auto& citation = std::get<ast::Citation>(prefixed.at(0));
    EXPECT_EQ(citation.prefix, "see");
    ASSERT_EQ(citation.keys.size(), 2u);
    EXPECT_EQ(citation.keys[1], "b");
}

TEST_F(Parse_Inlines_Test, reference)
{
    const auto inlines = parse("See @fig:plot.");
    ASSERT_EQ(inlines.size(), 3u);
    const auto& reference = std::get<ast::Reference>(inlines[1]);
    EXPECT_EQ(reference.label, "fig:plot");
    EXPECT_FALSE(reference.resolved);
    EXPECT_EQ(std::get<ast::Text>(inlines[2]).text, ".");
}

TEST_F(Parse_Inlines_Test, email_is_not_reference)
{
    const auto inlines = parse("user@example.com");
    ASSERT_EQ(inlines.size(), 1u);
    EXPECT_EQ(std::get<ast::Text>(inlines[0]).text, "user@example.com");
}

TEST_F(Parse_Inlines_Test, footnotes)
{
    const auto inlines = parse("a^[inline *note*] b[^1]");
    ASSERT_EQ(inlines.size(), 4u);

    const auto& inline_note = std::get<ast::Footnote>(inlines[1]);
    EXPECT_TRUE(inline_note.is_inline());
    ASSERT_EQ(inline_note.content.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<ast::Emphasis>(inline_note.content[1]));

    const auto& reference = std::get<ast::Footnote>(inlines[3]);
    EXPECT_FALSE(reference.is_inline());
    EXPECT_EQ(reference.id, "1");
    EXPECT_TRUE(reference.content.empty());
}

TEST_F(Parse_Inlines_Test, links_and_images)
{
    const auto link = parse("[*a*](http://a.b \"Title\")");
    ASSERT_EQ(link.size(), 1u);
    const auto& l = std::get<ast::Link>(link[0]);
    EXPECT_EQ(l.url, "http://a.b");
    EXPECT_EQ(l.title, "Title");
    ASSERT_EQ(l.content.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<ast::Emphasis>(l.content[0]));

    const auto image = parse("![alt text](img.png)");
    ASSERT_EQ(image.size(), 1u);
    const auto& i = std::get<ast::Image>(image[0]);
    EXPECT_EQ(i.url, "img.png");
    EXPECT_EQ(i.alt, "alt text");
    EXPECT_FALSE(i.title);

    const auto autolink = parse("<https://x.org>");
    ASSERT_EQ(autolink.size(), 1u);
    EXPECT_EQ(std::get<ast::Link>(autolink[0]).url, "https://x.org");
}

TEST_F(Parse_Inlines_Test, small_caps)
{
    const auto inlines = parse("[sc]Name[/sc]");
    ASSERT_EQ(inlines.size(), 1u);
    EXPECT_EQ(plain(std::get<ast::Small_Caps>(inlines[0]).content), "Name");
}

TEST_F(Parse_Inlines_Test, inline_html)
{
    const auto inlines = parse("<span>x</span>");
    ASSERT_EQ(inlines.size(), 3u);
    EXPECT_EQ(std::get<ast::Inline_Html>(inlines[0]).html, "<span>");
    EXPECT_EQ(std::get<ast::Inline_Html>(inlines[2]).html, "</span>");
}

TEST_F(Parse_Inlines_Test, stray_label_is_dropped)
{
    const auto inlines = parse("a{#x}b");
    ASSERT_EQ(inlines.size(), 1u);
    EXPECT_EQ(std::get<ast::Text>(inlines[0]).text, "ab");
}

TEST_F(Parse_Inlines_Test, line_breaks)
{
    const auto soft = parse("a\nb");
    ASSERT_EQ(soft.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<ast::Soft_Break>(soft[1]));

    const auto hard = parse("a  \nb");
    ASSERT_EQ(hard.size(), 3u);
    EXPECT_EQ(std::get<ast::Text>(hard[0]).text, "a");
    EXPECT_TRUE(std::holds_alternative<ast::Hard_Break>(hard[1]));

    const auto backslash = parse("a\\\nb");
    ASSERT_EQ(backslash.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<ast::Hard_Break>(backslash[1]));
}

} // namespace
} // namespace markdown_academic
