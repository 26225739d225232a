#include <algorithm>

#include "common/assert.hpp"

#include "mda/environment_kind.hpp"

namespace markdown_academic::mda {

namespace {

struct Environment_Alias {
    std::string_view name;
    Environment_Type type;
};

constexpr Environment_Alias environment_aliases[] {
    { "theorem", Environment_Type::theorem },
    { "thm", Environment_Type::theorem },
    { "lemma", Environment_Type::lemma },
    { "lem", Environment_Type::lemma },
    { "proposition", Environment_Type::proposition },
    { "prop", Environment_Type::proposition },
    { "corollary", Environment_Type::corollary },
    { "cor", Environment_Type::corollary },
    { "definition", Environment_Type::definition },
    { "def", Environment_Type::definition },
    { "example", Environment_Type::example },
    { "ex", Environment_Type::example },
    { "remark", Environment_Type::remark },
    { "rem", Environment_Type::remark },
    { "proof", Environment_Type::proof },
    { "pf", Environment_Type::proof },
    { "figure", Environment_Type::figure },
    { "fig", Environment_Type::figure },
    { "table", Environment_Type::table },
    { "tab", Environment_Type::table },
    { "algorithm", Environment_Type::algorithm },
    { "algo", Environment_Type::algorithm },
    { "abstract", Environment_Type::abstract },
    { "abs", Environment_Type::abstract },
    { "note", Environment_Type::note },
    { "warning", Environment_Type::warning },
    { "caution", Environment_Type::warning },
    { "quote", Environment_Type::quote },
    { "blockquote", Environment_Type::quote },
    { "conjecture", Environment_Type::conjecture },
    { "conj", Environment_Type::conjecture },
    { "axiom", Environment_Type::axiom },
    { "ax", Environment_Type::axiom },
    { "exercise", Environment_Type::exercise },
    { "solution", Environment_Type::solution },
    { "sol", Environment_Type::solution },
    { "case", Environment_Type::case_ },
};

[[nodiscard]] constexpr char to_ascii_lower(char c)
{
    return c >= 'A' && c <= 'Z' ? char(c - 'A' + 'a') : c;
}

[[nodiscard]] bool equals_ignore_case(std::string_view a, std::string_view b)
{
    return std::ranges::equal(a, b, [](char x, char y) { //
        return to_ascii_lower(x) == to_ascii_lower(y);
    });
}

} // namespace

std::string_view environment_type_name(Environment_Type type)
{
    using enum Environment_Type;
    switch (type) {
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(theorem);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(lemma);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(proposition);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(corollary);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(definition);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(example);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(remark);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(proof);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(figure);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(table);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(algorithm);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(abstract);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(note);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(warning);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(quote);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(conjecture);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(axiom);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(exercise);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(solution);
    case case_: return "case";
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(custom);
    }
    MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE("Invalid environment type.");
}

std::optional<Environment_Type> environment_type_by_name(std::string_view name)
{
    for (const Environment_Alias& alias : environment_aliases) {
        if (equals_ignore_case(alias.name, name)) {
            return alias.type;
        }
    }
    return std::nullopt;
}

Environment_Kind environment_kind_by_name(std::string_view name,
                                          std::pmr::memory_resource* memory)
{
    if (const std::optional<Environment_Type> type = environment_type_by_name(name)) {
        return { .type = *type, .custom_name = std::pmr::string(memory) };
    }
    return { .type = Environment_Type::custom, .custom_name = std::pmr::string(name, memory) };
}

std::string_view display_name(const Environment_Kind& kind)
{
    using enum Environment_Type;
    switch (kind.type) {
    case theorem: return "Theorem";
    case lemma: return "Lemma";
    case proposition: return "Proposition";
    case corollary: return "Corollary";
    case definition: return "Definition";
    case example: return "Example";
    case remark: return "Remark";
    case proof: return "Proof";
    case figure: return "Figure";
    case table: return "Table";
    case algorithm: return "Algorithm";
    case abstract: return "Abstract";
    case note: return "Note";
    case warning: return "Warning";
    case quote: return "Quote";
    case conjecture: return "Conjecture";
    case axiom: return "Axiom";
    case exercise: return "Exercise";
    case solution: return "Solution";
    case case_: return "Case";
    case custom: return kind.custom_name;
    }
    MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE("Invalid environment type.");
}

bool is_numbered(Environment_Type type)
{
    using enum Environment_Type;
    switch (type) {
    case proof:
    case abstract:
    case note:
    case warning:
    case quote:
    case case_:
    case custom: return false;
    default: return true;
    }
}

} // namespace markdown_academic::mda
