#include <charconv>
#include <optional>

#include "common/assert.hpp"

#include "mda/diagnostic.hpp"
#include "mda/resolution/footnotes.hpp"

namespace markdown_academic::mda {

namespace {

struct Footnote_Collector final : ast::Const_Visitor {
    Footnote_Table& table;
    std::pmr::memory_resource* memory;
    Size inline_count = 0;
    std::optional<Resolution_Error> error;

    Footnote_Collector(Footnote_Table& table, std::pmr::memory_resource* memory)
        : table { table }
        , memory { memory }
    {
    }

    void visit(const ast::Block& block) override
    {
        if (error) {
            return;
        }
        if (const auto* const definition = std::get_if<ast::Footnote_Definition>(&block)) {
            add(definition->id, definition->content);
        }
        visit_children(block);
    }

    void visit(const ast::Inline& node) override
    {
        if (error) {
            return;
        }
        if (const auto* const footnote = std::get_if<ast::Footnote>(&node);
            footnote && footnote->is_inline()) {
            char id[32] = "fn-";
            const auto [end, ec] = std::to_chars(id + 3, id + sizeof(id), ++inline_count);
            MARKDOWN_ACADEMIC_ASSERT(ec == std::errc {});
            add(std::string_view(id, end), footnote->content);
        }
        visit_children(node);
    }

    void add(std::string_view id, const std::pmr::vector<ast::Inline>& content)
    {
        if (!table.insert(id, std::pmr::vector<ast::Inline>(content, memory))) {
            error = Resolution_Error { .code = Resolution_Error_Code::duplicate_footnote,
                                       .subject = std::pmr::string(id, memory) };
        }
    }
};

struct Footnote_Reference_Checker final : ast::Const_Visitor {
    const Footnote_Table& table;
    const Footnote_Options& options;
    std::pmr::memory_resource* memory;
    std::optional<Resolution_Error> error;

    Footnote_Reference_Checker(const Footnote_Table& table,
                               const Footnote_Options& options,
                               std::pmr::memory_resource* memory)
        : table { table }
        , options { options }
        , memory { memory }
    {
    }

    using ast::Const_Visitor::visit;

    void visit(const ast::Inline& node) override
    {
        if (error) {
            return;
        }
        if (const auto* const footnote = std::get_if<ast::Footnote>(&node);
            footnote && !footnote->is_inline() && !table.contains(*footnote->id)) {
            report(*footnote->id);
        }
        visit_children(node);
    }

    void report(std::string_view id)
    {
        if (options.strict) {
            error = Resolution_Error { .code = Resolution_Error_Code::undefined_footnote,
                                       .subject = std::pmr::string(id, memory) };
            return;
        }
        if (options.logger.can_log(Severity::warning)) {
            std::pmr::string message("Footnote \"", memory);
            message += id;
            message += "\" is referenced, but never defined.";
            options.logger(Diagnostic { Severity::warning, "footnote.undefined", std::move(message) });
        }
    }
};

} // namespace

bool Footnote_Table::insert(std::string_view id, std::pmr::vector<ast::Inline>&& content)
{
    std::pmr::memory_resource* const memory = m_entries.get_allocator().resource();
    if (!m_indices.try_emplace(std::pmr::string(id, memory), m_entries.size()).second) {
        return false;
    }
    m_entries.push_back(Footnote_Entry { std::pmr::string(id, memory), std::move(content) });
    return true;
}

const Footnote_Entry* Footnote_Table::find(std::string_view id) const
{
    const auto it = m_indices.find(id);
    return it == m_indices.end() ? nullptr : &m_entries[it->second];
}

Result<Footnote_Table, Resolution_Error> collect_footnotes(const Document& document,
                                                           const Footnote_Options& options,
                                                           std::pmr::memory_resource* memory)
{
    Footnote_Table table(memory);
    {
        Footnote_Collector collector { table, memory };
        collector.visit_blocks(document.blocks);
        if (collector.error) {
            return std::move(*collector.error);
        }
    }
    Footnote_Reference_Checker checker { table, options, memory };
    checker.visit_blocks(document.blocks);
    if (checker.error) {
        return std::move(*checker.error);
    }
    return table;
}

} // namespace markdown_academic::mda
