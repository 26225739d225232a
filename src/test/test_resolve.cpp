#include <memory_resource>

#include <gtest/gtest.h>

#include "mda/diagnostic.hpp"
#include "mda/parsing/parse.hpp"
#include "mda/resolution/resolve.hpp"

namespace markdown_academic {
namespace {

using namespace mda;

/// @brief Parses a minimal bibliography format with one `key type` pair per line.
Result<Bibliography, std::pmr::string> parse_key_list(std::string_view text,
                                                      std::pmr::memory_resource* memory)
{
    Bibliography result(memory);
    while (!text.empty()) {
        const Size line_end = text.find('\n');
        const std::string_view line = text.substr(0, line_end);
        text = line_end == std::string_view::npos ? std::string_view {} : text.substr(line_end + 1);
        if (line.empty()) {
            continue;
        }
        const Size space = line.find(' ');
        if (space == std::string_view::npos) {
            std::pmr::string message("expected \"key type\", got \"", memory);
            message += line;
            message += '"';
            return message;
        }
        const std::string_view key = line.substr(0, space);
        result.emplace(std::pmr::string(key, memory), Bib_Entry(key, line.substr(space + 1), memory));
    }
    return result;
}

struct Resolve_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory, Severity::info };
    Resolve_Config config { .logger = &logger };

    Result<Resolved_Document, Resolution_Error> run(std::string_view source)
    {
        Result<Document, Parse_Error> document = parse(source, &memory);
        return resolve(std::move(*document), config, &memory);
    }
};

constexpr std::string_view full_document = R"mda(+++
title = "On Everything"
authors = ["Ada"]
[macros]
R = '\mathbb{R}'
+++

# Introduction {#sec:intro}

We work in $\R$, following [@knuth1984, p. 3].^[A remark.]

$$
f: \R \to \R
$$ {#eq:f}

::: theorem {#thm:main}
By @eq:f, see @sec:intro and [^note].
:::

[^note]: A defined note.
)mda";

TEST_F(Resolve_Test, full_pipeline)
{
    Bibliography bibliography(&memory);
    bibliography.emplace(std::pmr::string("knuth1984", &memory),
                         Bib_Entry("knuth1984", "book", &memory));
    config.bibliography = &bibliography;
    config.strict_citations = true;
    config.strict_references = true;

    const auto resolved = run(full_document);
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->metadata().title, "On Everything");
    EXPECT_EQ(resolved->labels().at("sec:intro").display, "Section 1");
    EXPECT_EQ(resolved->labels().at("eq:f").display, "(1)");
    EXPECT_EQ(resolved->labels().at("thm:main").display, "Theorem 1");
    EXPECT_EQ(resolved->section_numbers().at("sec:intro"), "1");
    EXPECT_EQ(resolved->env_numbers().at("thm:main"), 1u);
    EXPECT_TRUE(resolved->citations().contains("knuth1984"));
    ASSERT_EQ(resolved->footnotes().size(), 2u);
    EXPECT_EQ(resolved->footnotes().entries()[0].id, "fn-1");
    EXPECT_EQ(resolved->footnotes().entries()[1].id, "note");

    const auto& math = std::get<ast::Display_Math>(resolved->document().blocks.at(2));
    EXPECT_EQ(math.source, R"(f: \mathbb{R} \to \mathbb{R})");

    const auto& theorem = std::get<ast::Environment>(resolved->document().blocks.at(3));
    const auto& content = std::get<ast::Paragraph>(theorem.content.at(0)).content;
    EXPECT_EQ(ast::to_plain_text(content, &memory), "By (1), see Section 1 and .");
    EXPECT_TRUE(logger.diagnostics.empty());
}

TEST_F(Resolve_Test, footnote_table_is_resolved)
{
    Bibliography bibliography(&memory);
    bibliography.emplace(std::pmr::string("knuth1984", &memory),
                         Bib_Entry("knuth1984", "book", &memory));
    config.bibliography = &bibliography;
    config.strict_references = true;

    const auto resolved
        = run("# A {#sec:a}\n\nText^[see @sec:a].\n\n[^d]: also @sec:a and @knuth1984\n");
    ASSERT_TRUE(resolved);
    ASSERT_EQ(resolved->footnotes().size(), 2u);

    const Footnote_Entry* const inline_note = resolved->footnotes().find("fn-1");
    ASSERT_NE(inline_note, nullptr);
    const auto& inline_reference = std::get<ast::Reference>(inline_note->content.at(1));
    EXPECT_EQ(inline_reference.resolved, "Section 1");

    const Footnote_Entry* const definition = resolved->footnotes().find("d");
    ASSERT_NE(definition, nullptr);
    const auto& defined_reference = std::get<ast::Reference>(definition->content.at(1));
    EXPECT_EQ(defined_reference.resolved, "Section 1");
    const auto& citation = std::get<ast::Citation>(definition->content.at(3));
    EXPECT_EQ(citation.style, Citation_Style::textual);
    ASSERT_EQ(citation.keys.size(), 1u);
    EXPECT_EQ(citation.keys[0], "knuth1984");
}

TEST_F(Resolve_Test, lenient_by_default)
{
    const auto resolved = run("See @sec:none and [@nobody] and [^x].");
    ASSERT_TRUE(resolved);
    const auto& content = std::get<ast::Paragraph>(resolved->document().blocks.at(0)).content;
    EXPECT_EQ(std::get<ast::Reference>(content.at(1)).resolved, "??sec:none");
    EXPECT_EQ(logger.count("reference.unresolved"), 1u);
    EXPECT_EQ(logger.count("citation.unknown"), 1u);
    EXPECT_EQ(logger.count("footnote.undefined"), 1u);
}

TEST_F(Resolve_Test, strict_references)
{
    config.strict_references = true;
    const auto resolved = run("See @sec:none.");
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().code, Resolution_Error_Code::unknown_reference);
    EXPECT_EQ(resolved.error().subject, "sec:none");
}

TEST_F(Resolve_Test, strict_references_do_not_affect_citations)
{
    config.strict_references = true;
    const auto resolved = run("As in [@nobody].");
    ASSERT_TRUE(resolved);
    EXPECT_EQ(logger.count("citation.unknown"), 1u);
}

TEST_F(Resolve_Test, strict_citations)
{
    config.strict_citations = true;
    const auto resolved = run("As in [@nobody].");
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().code, Resolution_Error_Code::unknown_citation);
    EXPECT_EQ(resolved.error().subject, "nobody");
}

TEST_F(Resolve_Test, duplicate_label)
{
    const auto resolved = run("# A {#x}\n\n# B {#x}");
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().code, Resolution_Error_Code::duplicate_label);
}

TEST_F(Resolve_Test, bibliography_file)
{
    config.base_path = "test/mda";
    config.parse_bibliography = &parse_key_list;
    config.strict_citations = true;
    const auto resolved = run("+++\nbibliography = \"refs.bib\"\n+++\n[@knuth1984; @lamport1994]");
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->citations().size(), 2u);
    EXPECT_EQ(resolved->citations().at("lamport1994").entry_type, "book");
}

TEST_F(Resolve_Test, bibliography_parser_from_lambda)
{
    config.base_path = "test/mda";
    config.parse_bibliography = [](std::string_view text, std::pmr::memory_resource* memory) {
        return parse_key_list(text, memory);
    };
    const auto resolved = run("+++\nbibliography = \"refs.bib\"\n+++\nText.");
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->citations().size(), 2u);
}

TEST_F(Resolve_Test, bibliography_unreadable)
{
    config.base_path = "test/mda";
    config.parse_bibliography = &parse_key_list;
    const auto resolved = run("+++\nbibliography = \"missing.bib\"\n+++\nText.");
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().code, Resolution_Error_Code::bibliography_unreadable);
    EXPECT_EQ(resolved.error().subject, "test/mda/missing.bib");
}

TEST_F(Resolve_Test, bibliography_invalid)
{
    config.base_path = "test/mda";
    config.parse_bibliography = &parse_key_list;
    const auto resolved = run("+++\nbibliography = \"broken.bib\"\n+++\nText.");
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().code, Resolution_Error_Code::bibliography_invalid);
    EXPECT_EQ(resolved.error().subject, "test/mda/broken.bib");
    EXPECT_EQ(resolved.error().detail, "expected \"key type\", got \"broken\"");
}

TEST_F(Resolve_Test, bibliography_without_parser)
{
    config.base_path = "test/mda";
    const auto resolved = run("+++\nbibliography = \"refs.bib\"\n+++\n[@knuth1984]");
    ASSERT_TRUE(resolved);
    EXPECT_TRUE(resolved->citations().empty());
    EXPECT_EQ(logger.count("bibliography.no_parser"), 1u);
    EXPECT_EQ(logger.count("citation.unknown"), 1u);
}

TEST_F(Resolve_Test, bibliography_without_parser_checks_references_only)
{
    config.base_path = "test/mda";
    config.strict_references = true;
    const auto resolved
        = run("+++\nbibliography = \"refs.bib\"\n+++\n# A {#sec:a}\n\n@sec:a and [@knuth1984]");
    ASSERT_TRUE(resolved);
    EXPECT_EQ(logger.count("bibliography.no_parser"), 1u);
    EXPECT_EQ(logger.count("citation.unknown"), 1u);

    const auto broken = run("+++\nbibliography = \"refs.bib\"\n+++\n@sec:none and [@knuth1984]");
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().code, Resolution_Error_Code::unknown_reference);
}

TEST_F(Resolve_Test, given_bibliography_overrides_metadata)
{
    Bibliography bibliography(&memory);
    bibliography.emplace(std::pmr::string("given", &memory), Bib_Entry("given", "misc", &memory));
    config.bibliography = &bibliography;
    config.strict_citations = true;
    const auto resolved = run("+++\nbibliography = \"missing.bib\"\n+++\n[@given]");
    ASSERT_TRUE(resolved);
    EXPECT_TRUE(resolved->citations().contains("given"));
}

TEST_F(Resolve_Test, pass_order)
{
    logger.min_severity = Severity::debug;
    ASSERT_TRUE(run("Text."));
    ASSERT_EQ(logger.count("resolve.pass"), 7u);
    constexpr std::string_view expected[] {
        "Completed pass: bibliography", "Completed pass: macros",     "Completed pass: numbering",
        "Completed pass: labels",       "Completed pass: references", "Completed pass: footnotes",
        "Completed pass: citations",
    };
    for (Size i = 0; i < std::size(expected); ++i) {
        EXPECT_EQ(logger.diagnostics[i].severity, Severity::debug);
        EXPECT_EQ(logger.diagnostics[i].message, expected[i]);
    }
}

} // namespace
} // namespace markdown_academic
