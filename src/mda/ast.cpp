#include "common/assert.hpp"
#include "common/meta.hpp"

#include "mda/ast.hpp"

namespace markdown_academic::mda {

std::string_view alignment_name(Alignment alignment)
{
    using enum Alignment;
    switch (alignment) {
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(left);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(center);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(right);
    }
    MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE("Invalid alignment.");
}

std::string_view citation_style_name(Citation_Style style)
{
    using enum Citation_Style;
    switch (style) {
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(parenthetical);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(textual);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(author_only);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(year_only);
    }
    MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE("Invalid citation style.");
}

namespace ast {

std::string_view get_node_name(const Block& block)
{
    return std::visit(Overloaded {
                          [](const Paragraph&) { return "Paragraph"; },
                          [](const Heading&) { return "Heading"; },
                          [](const Code_Block&) { return "Code_Block"; },
                          [](const Block_Quote&) { return "Block_Quote"; },
                          [](const List&) { return "List"; },
                          [](const Thematic_Break&) { return "Thematic_Break"; },
                          [](const Display_Math&) { return "Display_Math"; },
                          [](const Environment&) { return "Environment"; },
                          [](const Table_Of_Contents&) { return "Table_Of_Contents"; },
                          [](const Html_Block&) { return "Html_Block"; },
                          [](const Table&) { return "Table"; },
                          [](const Description_List&) { return "Description_List"; },
                          [](const Page_Break&) { return "Page_Break"; },
                          [](const Abstract&) { return "Abstract"; },
                          [](const Appendix_Marker&) { return "Appendix_Marker"; },
                          [](const Footnote_Definition&) { return "Footnote_Definition"; },
                      },
                      block);
}

std::string_view get_node_name(const Inline& node)
{
    return std::visit(Overloaded {
                          [](const Text&) { return "Text"; },
                          [](const Emphasis&) { return "Emphasis"; },
                          [](const Strong&) { return "Strong"; },
                          [](const Strikethrough&) { return "Strikethrough"; },
                          [](const Subscript&) { return "Subscript"; },
                          [](const Superscript&) { return "Superscript"; },
                          [](const Small_Caps&) { return "Small_Caps"; },
                          [](const Code&) { return "Code"; },
                          [](const Link&) { return "Link"; },
                          [](const Image&) { return "Image"; },
                          [](const Inline_Math&) { return "Inline_Math"; },
                          [](const Citation&) { return "Citation"; },
                          [](const Reference&) { return "Reference"; },
                          [](const Footnote&) { return "Footnote"; },
                          [](const Soft_Break&) { return "Soft_Break"; },
                          [](const Hard_Break&) { return "Hard_Break"; },
                          [](const Inline_Html&) { return "Inline_Html"; },
                      },
                      node);
}

const std::optional<std::pmr::string>* get_label(const Block& block)
{
    return std::visit(
        []<typename T>(const T& b) -> const std::optional<std::pmr::string>* {
            if constexpr (requires { b.label; }) {
                return &b.label;
            }
            else {
                return nullptr;
            }
        },
        block);
}

void append_plain_text(std::pmr::string& out, std::span<const Inline> content)
{
    for (const Inline& node : content) {
        std::visit(Overloaded {
                       [&](const Text& t) { out += t.text; },
                       [&](const Code& c) { out += c.code; },
                       [&](const Inline_Math& m) { out += m.source; },
                       [&](const Image& i) { out += i.alt; },
                       [&](const Reference& r) { out += r.resolved ? *r.resolved : r.label; },
                       [&](const Soft_Break&) { out += ' '; },
                       [&](const Hard_Break&) { out += ' '; },
                       // Footnotes and citations are not part of the running text.
                       [&](const Footnote&) { },
                       [&](const Citation&) { },
                       [&](const Inline_Html&) { },
                       [&]<typename T>(const T& n)
                           requires requires { n.content; }
                       { append_plain_text(out, n.content); },
                   },
                   node);
    }
}

std::pmr::string to_plain_text(std::span<const Inline> content, std::pmr::memory_resource* memory)
{
    std::pmr::string result(memory);
    append_plain_text(result, content);
    return result;
}

} // namespace ast

} // namespace markdown_academic::mda
