#include <memory_resource>
#include <variant>

#include <gtest/gtest.h>

#include "mda/ast.hpp"
#include "mda/parsing/parse.hpp"

namespace markdown_academic {
namespace {

using namespace mda;

struct Parse_Blocks_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;

    std::pmr::vector<ast::Block> parse(std::string_view text)
    {
        return parse_blocks(text, &memory);
    }

    std::pmr::string plain(std::span<const ast::Inline> content)
    {
        return ast::to_plain_text(content, &memory);
    }
};

TEST_F(Parse_Blocks_Test, headings)
{
    const auto blocks = parse("# Introduction {#sec:intro}\n\n### Details");
    ASSERT_EQ(blocks.size(), 2u);

    const auto& first = std::get<ast::Heading>(blocks[0]);
    EXPECT_EQ(first.level, 1);
    EXPECT_EQ(plain(first.content), "Introduction");
    EXPECT_EQ(first.label, "sec:intro");

    const auto& second = std::get<ast::Heading>(blocks[1]);
    EXPECT_EQ(second.level, 3);
    EXPECT_FALSE(second.label);
}

TEST_F(Parse_Blocks_Test, paragraph_interrupted_by_heading)
{
    const auto blocks = parse("first line\nsecond line\n# Heading\n");
    ASSERT_EQ(blocks.size(), 2u);
    const auto& paragraph = std::get<ast::Paragraph>(blocks[0]);
    ASSERT_EQ(paragraph.content.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<ast::Soft_Break>(paragraph.content[1]));
    EXPECT_TRUE(std::holds_alternative<ast::Heading>(blocks[1]));
}

TEST_F(Parse_Blocks_Test, single_line_markers)
{
    const auto blocks = parse("---\n\n\\pagebreak\n\n[[toc]]\n\n\\appendix");
    ASSERT_EQ(blocks.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<ast::Thematic_Break>(blocks[0]));
    EXPECT_TRUE(std::holds_alternative<ast::Page_Break>(blocks[1]));
    EXPECT_TRUE(std::holds_alternative<ast::Table_Of_Contents>(blocks[2]));
    EXPECT_TRUE(std::holds_alternative<ast::Appendix_Marker>(blocks[3]));
}

TEST_F(Parse_Blocks_Test, code_block)
{
    const auto blocks = parse("```cpp\nint x;\n\nint y;\n```\nafter");
    ASSERT_EQ(blocks.size(), 2u);
    const auto& code = std::get<ast::Code_Block>(blocks[0]);
    EXPECT_EQ(code.language, "cpp");
    EXPECT_EQ(code.code, "int x;\n\nint y;");
    EXPECT_TRUE(std::holds_alternative<ast::Paragraph>(blocks[1]));
}

TEST_F(Parse_Blocks_Test, unterminated_code_block)
{
    const auto blocks = parse("```python\nx = 1\ny = 2");
    ASSERT_EQ(blocks.size(), 1u);
    const auto& code = std::get<ast::Code_Block>(blocks[0]);
    EXPECT_EQ(code.language, "python");
    EXPECT_EQ(code.code, "x = 1\ny = 2");
}

TEST_F(Parse_Blocks_Test, display_math)
{
    const auto blocks = parse("$$ E = mc^2 $$ {#eq:e}\n\n$$\nx = 1\n$$ {#eq:one}\n\n$$\na + b\n$$");
    ASSERT_EQ(blocks.size(), 3u);

    const auto& single = std::get<ast::Display_Math>(blocks[0]);
    EXPECT_EQ(single.source, "E = mc^2");
    EXPECT_EQ(single.label, "eq:e");

    const auto& multi = std::get<ast::Display_Math>(blocks[1]);
    EXPECT_EQ(multi.source, "x = 1");
    EXPECT_EQ(multi.label, "eq:one");

    const auto& unlabeled = std::get<ast::Display_Math>(blocks[2]);
    EXPECT_EQ(unlabeled.source, "a + b");
    EXPECT_FALSE(unlabeled.label);
}

TEST_F(Parse_Blocks_Test, theorem_environment)
{
    const auto blocks = parse("::: theorem {#thm:x}\nBody\n:::");
    ASSERT_EQ(blocks.size(), 1u);
    const auto& environment = std::get<ast::Environment>(blocks[0]);
    EXPECT_EQ(environment.kind.type, Environment_Type::theorem);
    EXPECT_EQ(environment.label, "thm:x");
    ASSERT_EQ(environment.content.size(), 1u);
    EXPECT_EQ(plain(std::get<ast::Paragraph>(environment.content[0]).content), "Body");
    EXPECT_FALSE(environment.caption);
}

TEST_F(Parse_Blocks_Test, nested_environments)
{
    const auto blocks = parse("::: proof\n::: case\nA\n:::\nDone.\n:::\nafter");
    ASSERT_EQ(blocks.size(), 2u);
    const auto& proof = std::get<ast::Environment>(blocks[0]);
    EXPECT_EQ(proof.kind.type, Environment_Type::proof);
    ASSERT_EQ(proof.content.size(), 2u);
    EXPECT_EQ(std::get<ast::Environment>(proof.content[0]).kind.type, Environment_Type::case_);
    EXPECT_TRUE(std::holds_alternative<ast::Paragraph>(proof.content[1]));
}

TEST_F(Parse_Blocks_Test, custom_environment)
{
    const auto blocks = parse("::: claim\nText\n:::");
    const auto& environment = std::get<ast::Environment>(blocks.at(0));
    EXPECT_EQ(environment.kind.type, Environment_Type::custom);
    EXPECT_EQ(environment.kind.custom_name, "claim");
}

TEST_F(Parse_Blocks_Test, figure_caption)
{
    const auto blocks = parse("::: figure {#fig:a}\n![alt](img.png)\n\nA caption.\n:::");
    const auto& figure = std::get<ast::Environment>(blocks.at(0));
    ASSERT_EQ(figure.content.size(), 1u);
    ASSERT_TRUE(figure.caption);
    EXPECT_EQ(plain(*figure.caption), "A caption.");
}

TEST_F(Parse_Blocks_Test, abstract)
{
    const auto blocks = parse("::: abstract\nWe study things.\n:::");
    ASSERT_EQ(blocks.size(), 1u);
    const auto& abstract = std::get<ast::Abstract>(blocks[0]);
    EXPECT_EQ(abstract.content.size(), 1u);

    const auto labeled = parse("::: abstract {#abs}\nText\n:::");
    EXPECT_TRUE(std::holds_alternative<ast::Environment>(labeled.at(0)));
}

TEST_F(Parse_Blocks_Test, block_quote)
{
    const auto blocks = parse("> a\n> b\n\nafter");
    ASSERT_EQ(blocks.size(), 2u);
    const auto& quote = std::get<ast::Block_Quote>(blocks[0]);
    ASSERT_EQ(quote.content.size(), 1u);
    EXPECT_EQ(plain(std::get<ast::Paragraph>(quote.content[0]).content), "a b");
}

TEST_F(Parse_Blocks_Test, nested_list)
{
    const auto blocks = parse("- a\n- b\n  - c\n- d");
    ASSERT_EQ(blocks.size(), 1u);
    const auto& list = std::get<ast::List>(blocks[0]);
    EXPECT_FALSE(list.ordered);
    EXPECT_FALSE(list.start);
    ASSERT_EQ(list.items.size(), 3u);

    const auto& second = list.items[1].content;
    ASSERT_EQ(second.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<ast::Paragraph>(second[0]));
    const auto& inner = std::get<ast::List>(second[1]);
    EXPECT_EQ(inner.items.size(), 1u);
}

TEST_F(Parse_Blocks_Test, list_item_continued_after_blank_line)
{
    const auto blocks = parse("- first\n\n  continued\n- second\n\nafter");
    ASSERT_EQ(blocks.size(), 2u);
    const auto& list = std::get<ast::List>(blocks[0]);
    ASSERT_EQ(list.items.size(), 2u);

    const auto& first = list.items[0].content;
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(plain(std::get<ast::Paragraph>(first[0]).content), "first");
    EXPECT_EQ(plain(std::get<ast::Paragraph>(first[1]).content), "continued");
    EXPECT_EQ(plain(std::get<ast::Paragraph>(blocks[1]).content), "after");
}

TEST_F(Parse_Blocks_Test, list_ends_at_blank_line_without_deeper_content)
{
    const auto blocks = parse("- a\n\nnot part of the list");
    ASSERT_EQ(blocks.size(), 2u);
    const auto& list = std::get<ast::List>(blocks[0]);
    ASSERT_EQ(list.items.size(), 1u);
    EXPECT_EQ(list.items[0].content.size(), 1u);
    EXPECT_EQ(plain(std::get<ast::Paragraph>(blocks[1]).content), "not part of the list");
}

TEST_F(Parse_Blocks_Test, ordered_and_task_lists)
{
    const auto ordered = parse("3. x\n4. y");
    const auto& list = std::get<ast::List>(ordered.at(0));
    EXPECT_TRUE(list.ordered);
    EXPECT_EQ(list.start, 3u);
    EXPECT_EQ(list.items.size(), 2u);

    const auto tasks = parse("- [x] done\n- [ ] open");
    const auto& task_list = std::get<ast::List>(tasks.at(0));
    ASSERT_EQ(task_list.items.size(), 2u);
    EXPECT_EQ(task_list.items[0].checked, true);
    EXPECT_EQ(task_list.items[1].checked, false);
}

TEST_F(Parse_Blocks_Test, table)
{
    const auto blocks = parse("| H1 | H2 |\n|----|:--:|\n| a  | b  |");
    ASSERT_EQ(blocks.size(), 1u);
    const auto& table = std::get<ast::Table>(blocks[0]);

    ASSERT_EQ(table.headers.size(), 2u);
    EXPECT_EQ(plain(table.headers[0]), "H1");
    EXPECT_EQ(plain(table.headers[1]), "H2");

    ASSERT_EQ(table.alignments.size(), 2u);
    EXPECT_EQ(table.alignments[0], Alignment::left);
    EXPECT_EQ(table.alignments[1], Alignment::center);

    ASSERT_EQ(table.rows.size(), 1u);
    ASSERT_EQ(table.rows[0].size(), 2u);
    EXPECT_EQ(plain(table.rows[0][0]), "a");
    EXPECT_EQ(plain(table.rows[0][1]), "b");
    EXPECT_FALSE(table.label);
}

TEST_F(Parse_Blocks_Test, table_caption)
{
    const auto blocks = parse("| a |\n| - |\n| 1 |\nTable: Results {#tbl:r}\n\nafter");
    ASSERT_EQ(blocks.size(), 2u);
    const auto& table = std::get<ast::Table>(blocks[0]);
    EXPECT_EQ(table.label, "tbl:r");
    ASSERT_TRUE(table.caption);
    EXPECT_EQ(plain(*table.caption), "Results");

    const auto alternative = parse("| a |\n| - |\nCaption: Other");
    ASSERT_EQ(alternative.size(), 1u);
    EXPECT_EQ(plain(*std::get<ast::Table>(alternative[0]).caption), "Other");
}

TEST_F(Parse_Blocks_Test, table_caption_after_blank_line_is_paragraph)
{
    const auto blocks = parse("| a |\n| - |\n| 1 |\n\nTable: Late {#tbl:late}");
    ASSERT_EQ(blocks.size(), 2u);
    const auto& table = std::get<ast::Table>(blocks[0]);
    EXPECT_FALSE(table.caption);
    EXPECT_FALSE(table.label);
    EXPECT_TRUE(std::holds_alternative<ast::Paragraph>(blocks[1]));
}

TEST_F(Parse_Blocks_Test, description_list)
{
    const auto blocks = parse("Term\n: Definition\n\nOther\n: More");
    ASSERT_EQ(blocks.size(), 1u);
    const auto& list = std::get<ast::Description_List>(blocks[0]);
    ASSERT_EQ(list.items.size(), 2u);
    EXPECT_EQ(plain(list.items[0].term), "Term");
    ASSERT_EQ(list.items[0].details.size(), 1u);
    EXPECT_EQ(plain(std::get<ast::Paragraph>(list.items[0].details[0]).content), "Definition");
    EXPECT_EQ(plain(list.items[1].term), "Other");
}

TEST_F(Parse_Blocks_Test, description_list_continuation)
{
    const auto blocks = parse("Term\n: first line\n: second line\n\n: new paragraph\n\nNext\n: x");
    ASSERT_EQ(blocks.size(), 1u);
    const auto& list = std::get<ast::Description_List>(blocks[0]);
    ASSERT_EQ(list.items.size(), 2u);

    const auto& details = list.items[0].details;
    ASSERT_EQ(details.size(), 2u);
    EXPECT_EQ(plain(std::get<ast::Paragraph>(details[0]).content), "first line second line");
    EXPECT_EQ(plain(std::get<ast::Paragraph>(details[1]).content), "new paragraph");
    EXPECT_EQ(plain(list.items[1].term), "Next");
}

TEST_F(Parse_Blocks_Test, description_list_ends_at_indented_line)
{
    const auto blocks = parse("Term\n: definition\n  indented text");
    ASSERT_EQ(blocks.size(), 2u);
    const auto& list = std::get<ast::Description_List>(blocks[0]);
    ASSERT_EQ(list.items.size(), 1u);
    ASSERT_EQ(list.items[0].details.size(), 1u);
    EXPECT_EQ(plain(std::get<ast::Paragraph>(list.items[0].details[0]).content), "definition");
    EXPECT_EQ(plain(std::get<ast::Paragraph>(blocks[1]).content), "indented text");
}

TEST_F(Parse_Blocks_Test, footnote_definition)
{
    const auto blocks = parse("[^note]: The note\n    continues here.");
    ASSERT_EQ(blocks.size(), 1u);
    const auto& definition = std::get<ast::Footnote_Definition>(blocks[0]);
    EXPECT_EQ(definition.id, "note");
    EXPECT_EQ(plain(definition.content), "The note continues here.");
}

TEST_F(Parse_Blocks_Test, html_block)
{
    const auto blocks = parse("<div class=\"x\">\ncontent\n</div>\n\ntext");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(std::get<ast::Html_Block>(blocks[0]).html, "<div class=\"x\">\ncontent\n</div>");
}

TEST_F(Parse_Blocks_Test, blank_input)
{
    EXPECT_TRUE(parse("").empty());
    EXPECT_TRUE(parse("\n\n   \n").empty());
}

} // namespace
} // namespace markdown_academic
