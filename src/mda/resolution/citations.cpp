#include <unordered_set>

#include "common/hash.hpp"

#include "mda/ast.hpp"
#include "mda/diagnostic.hpp"
#include "mda/resolution/citations.hpp"

namespace markdown_academic::mda {

namespace {

struct Citation_Key_Collector final : ast::Const_Visitor {
    std::pmr::vector<std::pmr::string>& keys;
    std::pmr::unordered_set<std::pmr::string, String_Hash, std::equal_to<>> seen;

    Citation_Key_Collector(std::pmr::vector<std::pmr::string>& keys,
                           std::pmr::memory_resource* memory)
        : keys { keys }
        , seen { memory }
    {
    }

    using ast::Const_Visitor::visit;

    void visit(const ast::Inline& node) override
    {
        if (const auto* const citation = std::get_if<ast::Citation>(&node)) {
            for (const std::pmr::string& key : citation->keys) {
                if (seen.insert(key).second) {
                    keys.push_back(key);
                }
            }
        }
        visit_children(node);
    }
};

} // namespace

std::pmr::vector<std::pmr::string> citation_order(const Document& document,
                                                  std::pmr::memory_resource* memory)
{
    std::pmr::vector<std::pmr::string> result(memory);
    Citation_Key_Collector collector { result, memory };
    collector.visit_blocks(document.blocks);
    return result;
}

Result<void, Resolution_Error> validate_citations(const Document& document,
                                                  const Bibliography& bibliography,
                                                  const Citation_Options& options,
                                                  std::pmr::memory_resource* memory)
{
    for (const std::pmr::string& key : citation_order(document, memory)) {
        if (bibliography.contains(key)) {
            continue;
        }
        if (options.strict) {
            return Resolution_Error { .code = Resolution_Error_Code::unknown_citation,
                                      .subject = std::pmr::string(key, memory) };
        }
        if (options.logger.can_log(Severity::warning)) {
            std::pmr::string message("Citation of \"", memory);
            message += key;
            message += "\", which is not in the bibliography.";
            options.logger(Diagnostic { Severity::warning, "citation.unknown", std::move(message) });
        }
    }
    return {};
}

} // namespace markdown_academic::mda
