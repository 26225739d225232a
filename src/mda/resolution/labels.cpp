#include <charconv>
#include <optional>

#include "common/assert.hpp"

#include "mda/ast.hpp"
#include "mda/diagnostic.hpp"
#include "mda/parsing/tokenize.hpp"
#include "mda/resolution/labels.hpp"

namespace markdown_academic::mda {

namespace {

void append_number(std::pmr::string& out, Uint64 n)
{
    char buffer[24];
    const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), n);
    MARKDOWN_ACADEMIC_ASSERT(ec == std::errc {});
    out.append(buffer, end);
}

struct Label_Collector final : ast::Const_Visitor {
    const Numbering& numbering;
    Label_Registry& labels;
    std::pmr::memory_resource* memory;
    std::optional<Resolution_Error> error;

    Label_Collector(const Numbering& numbering,
                    Label_Registry& labels,
                    std::pmr::memory_resource* memory)
        : numbering { numbering }
        , labels { labels }
        , memory { memory }
    {
    }

    void visit(const ast::Block& block) override
    {
        if (error) {
            return;
        }
        if (const std::optional<std::pmr::string>* const label = ast::get_label(block);
            label && *label) {
            if (!insert(**label, display_text(block, **label))) {
                return;
            }
        }
        visit_children(block);
    }

    void visit(const ast::Inline&) override { }

    [[nodiscard]] std::pmr::string display_text(const ast::Block& block, std::string_view label) const
    {
        std::pmr::string result(memory);
        if (const auto* const heading = std::get_if<ast::Heading>(&block)) {
            if (const auto it = numbering.section_numbers.find(label);
                it != numbering.section_numbers.end()) {
                result += "Section ";
                result += it->second;
            }
            else {
                ast::append_plain_text(result, heading->content);
            }
            return result;
        }

        const auto number = numbering.env_numbers.find(label);
        const bool numbered = number != numbering.env_numbers.end();
        if (std::holds_alternative<ast::Display_Math>(block)) {
            result += '(';
            if (numbered) {
                append_number(result, number->second);
            }
            else {
                result += '?';
            }
            result += ')';
            return result;
        }
        if (const auto* const environment = std::get_if<ast::Environment>(&block)) {
            result += display_name(environment->kind);
        }
        else {
            MARKDOWN_ACADEMIC_ASSERT(std::holds_alternative<ast::Table>(block));
            result += "Table";
        }
        if (numbered) {
            result += ' ';
            append_number(result, number->second);
        }
        return result;
    }

    bool insert(std::string_view label, std::pmr::string&& display)
    {
        Label_Info info { .display = std::move(display), .id = label_to_id(label, memory) };
        const bool inserted = labels.try_emplace(std::pmr::string(label, memory), std::move(info)).second;
        if (!inserted) {
            error = Resolution_Error { .code = Resolution_Error_Code::duplicate_label,
                                       .subject = std::pmr::string(label, memory) };
        }
        return inserted;
    }
};

struct Reference_Resolver final : ast::Visitor {
    const Label_Registry& labels;
    const Reference_Options& options;
    std::pmr::memory_resource* memory;
    std::optional<Resolution_Error> error;

    Reference_Resolver(const Label_Registry& labels,
                       const Reference_Options& options,
                       std::pmr::memory_resource* memory)
        : labels { labels }
        , options { options }
        , memory { memory }
    {
    }

    void visit(ast::Block& block) override
    {
        if (!error) {
            visit_children(block);
        }
    }

    void visit(ast::Inline& node) override
    {
        if (error) {
            return;
        }
        if (auto* const reference = std::get_if<ast::Reference>(&node)) {
            resolve(node, *reference);
            return;
        }
        visit_children(node);
    }

    void resolve(ast::Inline& node, ast::Reference& reference)
    {
        MARKDOWN_ACADEMIC_ASSERT(!reference.resolved);

        if (const auto it = labels.find(reference.label); it != labels.end()) {
            reference.resolved = it->second.display;
            return;
        }
        const std::string_view label = reference.label;
        if (options.bibliography.contains(label)) {
            node = make_citation(label, Citation_Style::textual);
            return;
        }
        if (label.ends_with('-') && options.bibliography.contains(label.substr(0, label.size() - 1))) {
            node = make_citation(label.substr(0, label.size() - 1), Citation_Style::author_only);
            return;
        }

        if (options.strict) {
            error = Resolution_Error { .code = Resolution_Error_Code::unknown_reference,
                                       .subject = std::pmr::string(label, memory) };
            return;
        }
        if (options.logger.can_log(Severity::warning)) {
            std::pmr::string message("Reference to unknown label \"", memory);
            message += label;
            message += "\".";
            options.logger(Diagnostic { Severity::warning, "reference.unresolved", std::move(message) });
        }
        std::pmr::string placeholder("??", memory);
        placeholder += label;
        reference.resolved = std::move(placeholder);
    }

    [[nodiscard]] ast::Citation make_citation(std::string_view key, Citation_Style style) const
    {
        ast::Citation result { .keys = std::pmr::vector<std::pmr::string>(memory),
                               .style = style,
                               .prefix = {},
                               .locator = {} };
        result.keys.emplace_back(key);
        return result;
    }
};

} // namespace

std::pmr::string label_to_id(std::string_view label, std::pmr::memory_resource* memory)
{
    std::pmr::string result(memory);
    result.reserve(label.size());
    for (const char c : label) {
        // UTF-8 continuation bytes belong to the code point already replaced.
        if ((static_cast<unsigned char>(c) & 0xc0) == 0x80) {
            continue;
        }
        result += is_ascii_alphanumeric(c) || c == '-' || c == '_' ? c : '-';
    }
    return result;
}

Result<Label_Registry, Resolution_Error> build_label_registry(const Document& document,
                                                              const Numbering& numbering,
                                                              std::pmr::memory_resource* memory)
{
    Label_Registry labels(memory);
    Label_Collector collector { numbering, labels, memory };
    collector.visit_blocks(document.blocks);
    if (collector.error) {
        return std::move(*collector.error);
    }
    return labels;
}

Result<void, Resolution_Error> resolve_references(Document& document,
                                                  const Label_Registry& labels,
                                                  const Reference_Options& options,
                                                  std::pmr::memory_resource* memory)
{
    Reference_Resolver resolver { labels, options, memory };
    resolver.visit_blocks(document.blocks);
    if (resolver.error) {
        return std::move(*resolver.error);
    }
    return {};
}

} // namespace markdown_academic::mda
