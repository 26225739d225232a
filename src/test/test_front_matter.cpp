#include <memory_resource>

#include <gtest/gtest.h>

#include "mda/parsing/front_matter.hpp"
#include "mda/parsing/parse.hpp"

namespace markdown_academic {
namespace {

using namespace mda;

struct Front_Matter_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;

    Result<Front_Matter, Parse_Error> parse(std::string_view source)
    {
        return parse_front_matter(source, &memory);
    }
};

TEST_F(Front_Matter_Test, absent)
{
    const auto result = parse("# Hello\n\nWorld");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->body_begin, 0u);
    EXPECT_FALSE(result->metadata.title);
    EXPECT_TRUE(result->metadata.authors.empty());
    EXPECT_TRUE(result->metadata.macros.empty());
}

TEST_F(Front_Matter_Test, basic_fields)
{
    constexpr std::string_view source = R"mda(+++
title = "A Paper"
subtitle = 'On Things'
authors = ["Ada", "Grace"]
date = 2024-01-15
keywords = ["x", "y"]
lang = "en"
# comments are ignored
institution = "University" # as are trailing comments
+++

# Intro
)mda";
    const auto result = parse(source);
    ASSERT_TRUE(result);
    const Metadata& metadata = result->metadata;
    EXPECT_EQ(metadata.title, "A Paper");
    EXPECT_EQ(metadata.subtitle, "On Things");
    ASSERT_EQ(metadata.authors.size(), 2u);
    EXPECT_EQ(metadata.authors[0], "Ada");
    EXPECT_EQ(metadata.authors[1], "Grace");
    EXPECT_EQ(metadata.date, "2024-01-15");
    EXPECT_EQ(metadata.keywords.size(), 2u);
    EXPECT_EQ(metadata.language, "en");
    EXPECT_EQ(metadata.institution, "University");
    EXPECT_EQ(source.substr(result->body_begin), "# Intro\n");
}

TEST_F(Front_Matter_Test, leading_whitespace)
{
    const auto result = parse("\n\n+++\ntitle = \"x\"\n+++\nbody");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->metadata.title, "x");
}

TEST_F(Front_Matter_Test, single_author)
{
    const auto single = parse("+++\nauthor = \"Solo\"\n+++\n");
    ASSERT_TRUE(single);
    ASSERT_EQ(single->metadata.authors.size(), 1u);
    EXPECT_EQ(single->metadata.authors[0], "Solo");

    const auto both = parse("+++\nauthor = \"Solo\"\nauthors = [\"A\", \"B\"]\n+++\n");
    ASSERT_TRUE(both);
    EXPECT_EQ(both->metadata.authors.size(), 2u);
}

TEST_F(Front_Matter_Test, macros)
{
    constexpr std::string_view source = R"mda(+++
[macros]
R = '\mathbb{R}'
norm = '\left\| #1 \right\|'
+++
)mda";
    const auto result = parse(source);
    ASSERT_TRUE(result);
    const Macro_Table& macros = result->metadata.macros;
    ASSERT_EQ(macros.size(), 2u);
    EXPECT_EQ(macros.at("R").arg_count, 0u);
    EXPECT_EQ(macros.at("R").body, R"(\mathbb{R})");
    EXPECT_EQ(macros.at("norm").arg_count, 1u);
}

TEST_F(Front_Matter_Test, bibliography)
{
    const auto inline_table = parse("+++\nbibliography = { path = \"refs.bib\" }\n+++\n");
    ASSERT_TRUE(inline_table);
    EXPECT_EQ(inline_table->metadata.bibliography, "refs.bib");

    const auto table = parse("+++\n[bibliography]\npath = \"other.bib\"\nstyle = \"apa\"\n+++\n");
    ASSERT_TRUE(table);
    EXPECT_EQ(table->metadata.bibliography, "other.bib");

    const auto plain = parse("+++\nbibliography = \"plain.bib\"\n+++\n");
    ASSERT_TRUE(plain);
    EXPECT_EQ(plain->metadata.bibliography, "plain.bib");
}

TEST_F(Front_Matter_Test, strings)
{
    const auto escapes = parse("+++\ntitle = \"caf\\u00e9 \\\"q\\\"\"\n+++\n");
    ASSERT_TRUE(escapes);
    EXPECT_EQ(escapes->metadata.title, "caf\xc3\xa9 \"q\"");

    const auto multiline = parse("+++\nabstract = \"\"\"\nLine one.\nLine two.\"\"\"\n+++\n");
    ASSERT_TRUE(multiline);
    EXPECT_EQ(multiline->metadata.abstract, "Line one.\nLine two.");
}

TEST_F(Front_Matter_Test, unknown_keys_are_ignored)
{
    const auto result = parse("+++\ncustom = 3\nflag = true\n[extra]\nfoo = 1.5\n+++\n");
    ASSERT_TRUE(result);
    EXPECT_FALSE(result->metadata.title);
}

TEST_F(Front_Matter_Test, same_key_in_different_tables)
{
    const auto result = parse("+++\ntitle = \"a\"\n[macros]\ntitle = 'x'\n+++\n");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->metadata.title, "a");
    EXPECT_EQ(result->metadata.macros.size(), 1u);
}

TEST_F(Front_Matter_Test, unterminated)
{
    const auto result = parse("+++\ntitle = \"x\"\n");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Parse_Error_Code::unterminated_front_matter);
    EXPECT_EQ(result.error().pos.line, 0u);
}

TEST_F(Front_Matter_Test, syntax_error)
{
    const auto missing_equals = parse("+++\ntitle \"x\"\n+++\n");
    ASSERT_FALSE(missing_equals);
    EXPECT_EQ(missing_equals.error().code, Parse_Error_Code::front_matter_syntax);
    EXPECT_EQ(missing_equals.error().pos.line, 1u);
    EXPECT_EQ(missing_equals.error().pos.column, 6u);

    const auto unterminated_string = parse("+++\ntitle = \"x\n+++\n");
    ASSERT_FALSE(unterminated_string);
    EXPECT_EQ(unterminated_string.error().code, Parse_Error_Code::front_matter_syntax);

    const auto unterminated_array = parse("+++\nauthors = [\"a\",\n+++\n");
    ASSERT_FALSE(unterminated_array);
    EXPECT_EQ(unterminated_array.error().code, Parse_Error_Code::front_matter_syntax);
}

TEST_F(Front_Matter_Test, type_error)
{
    const auto result = parse("+++\ntitle = 42\n+++");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Parse_Error_Code::front_matter_type);
    EXPECT_EQ(result.error().subject, "title");
    EXPECT_EQ(result.error().pos.line, 1u);
    EXPECT_EQ(result.error().pos.column, 8u);

    const auto list = parse("+++\nauthors = [\"a\", 1]\n+++");
    ASSERT_FALSE(list);
    EXPECT_EQ(list.error().code, Parse_Error_Code::front_matter_type);
}

TEST_F(Front_Matter_Test, duplicate_key)
{
    const auto result = parse("+++\ntitle = \"a\"\ntitle = \"b\"\n+++");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Parse_Error_Code::front_matter_duplicate_key);
    EXPECT_EQ(result.error().subject, "title");
    EXPECT_EQ(result.error().pos.line, 2u);
}

TEST_F(Front_Matter_Test, document_parse_propagates_errors)
{
    const auto document = mda::parse("+++\ntitle = 42\n+++\n# Body", &memory);
    ASSERT_FALSE(document);
    EXPECT_EQ(document.error().code, Parse_Error_Code::front_matter_type);

    const auto valid = mda::parse("+++\ntitle = \"T\"\n+++\n# Body", &memory);
    ASSERT_TRUE(valid);
    EXPECT_EQ(valid->metadata.title, "T");
    EXPECT_EQ(valid->blocks.size(), 1u);
}

TEST(MDA_Macro_Args, count)
{
    EXPECT_EQ(count_macro_args(R"(\mathbb{R})"), 0u);
    EXPECT_EQ(count_macro_args("#1 + #3"), 3u);
    EXPECT_EQ(count_macro_args("#2#1"), 2u);
    EXPECT_EQ(count_macro_args("#"), 0u);
}

} // namespace
} // namespace markdown_academic
