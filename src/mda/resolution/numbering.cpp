#include <algorithm>
#include <charconv>

#include "common/assert.hpp"

#include "mda/ast.hpp"
#include "mda/resolution/numbering.hpp"

namespace markdown_academic::mda {

namespace {

void append_number(std::pmr::string& out, Uint64 n)
{
    char buffer[24];
    const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), n);
    MARKDOWN_ACADEMIC_ASSERT(ec == std::errc {});
    out.append(buffer, end);
}

struct Numbering_Visitor final : ast::Const_Visitor {
    Numbering_State state;
    Numbering& result;
    std::pmr::memory_resource* memory;

    Numbering_Visitor(Numbering& result, std::pmr::memory_resource* memory)
        : result { result }
        , memory { memory }
    {
    }

    void visit(const ast::Block& block) override
    {
        if (const auto* const heading = std::get_if<ast::Heading>(&block)) {
            const int level = std::clamp(heading->level, 1, int(heading_level_count));
            state.advance_section(level);
            if (heading->label) {
                result.section_numbers.emplace(*heading->label, state.section_number(level, memory));
            }
        }
        else if (const auto* const math = std::get_if<ast::Display_Math>(&block)) {
            record(math->label, ++state.equations);
        }
        else if (const auto* const table = std::get_if<ast::Table>(&block)) {
            record(table->label, ++state.tables);
        }
        else if (const auto* const environment = std::get_if<ast::Environment>(&block)) {
            if (Uint64* const counter = state.environment_counter(environment->kind.type)) {
                record(environment->label, ++*counter);
            }
        }
        else if (std::holds_alternative<ast::Appendix_Marker>(block)) {
            state.enter_appendix();
        }
        visit_children(block);
    }

    void visit(const ast::Inline&) override { }

    void record(const std::optional<std::pmr::string>& label, Uint64 number)
    {
        if (label) {
            result.env_numbers.emplace(*label, number);
        }
    }
};

} // namespace

Uint64* Numbering_State::environment_counter(Environment_Type type)
{
    using enum Environment_Type;
    switch (type) {
    case theorem:
    case proposition:
    case corollary: return &theorems;
    case lemma: return &lemmas;
    case definition: return &definitions;
    case example:
    case remark: return &examples;
    case figure: return &figures;
    case table: return &tables;
    case algorithm: return &algorithms;
    case conjecture: return &conjectures;
    case axiom: return &axioms;
    case exercise: return &exercises;
    case solution: return &solutions;
    case proof:
    case abstract:
    case note:
    case warning:
    case quote:
    case case_:
    case custom: return nullptr;
    }
    MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE("Invalid environment type.");
}

void Numbering_State::advance_section(int level)
{
    MARKDOWN_ACADEMIC_ASSERT(level >= 1 && level <= int(heading_level_count));
    const auto index = Size(level - 1);
    ++sections[index];
    std::fill(sections.begin() + Difference(index) + 1, sections.end(), 0);
}

void Numbering_State::enter_appendix()
{
    in_appendix = true;
    sections.fill(0);
}

std::pmr::string Numbering_State::section_number(int level, std::pmr::memory_resource* memory) const
{
    MARKDOWN_ACADEMIC_ASSERT(level >= 1 && level <= int(heading_level_count));
    std::pmr::string result(memory);
    for (Size i = 0; i < Size(level); ++i) {
        if (i != 0) {
            result += '.';
        }
        if (i == 0 && in_appendix && sections[0] != 0) {
            result += appendix_letter(sections[0], memory);
        }
        else {
            append_number(result, sections[i]);
        }
    }
    return result;
}

std::pmr::string appendix_letter(Uint64 n, std::pmr::memory_resource* memory)
{
    MARKDOWN_ACADEMIC_ASSERT(n != 0);
    std::pmr::string result(memory);
    // Bijective base-26, so that Z is followed by AA rather than BA.
    while (n != 0) {
        --n;
        result.insert(result.begin(), char('A' + n % 26));
        n /= 26;
    }
    return result;
}

Numbering assign_numbers(const Document& document, std::pmr::memory_resource* memory)
{
    Numbering result { .section_numbers = Section_Numbers(memory),
                       .env_numbers = Environment_Numbers(memory) };
    Numbering_Visitor visitor { result, memory };
    visitor.visit_blocks(document.blocks);
    return result;
}

} // namespace markdown_academic::mda
