#include <optional>
#include <span>
#include <vector>

#include "common/assert.hpp"

#include "mda/ast.hpp"
#include "mda/diagnostic.hpp"
#include "mda/parsing/tokenize.hpp"
#include "mda/resolution/macros.hpp"

namespace markdown_academic::mda {

namespace {

/// @brief Returns `true` if the backslash at `text[index]` is itself escaped by an odd number
/// of preceding backslashes, as in `\\name`.
[[nodiscard]] bool is_escaped(std::string_view text, Size index)
{
    Size backslashes = 0;
    while (index > backslashes && text[index - backslashes - 1] == '\\') {
        ++backslashes;
    }
    return backslashes % 2 == 1;
}

/// @brief Matches `count` brace groups at the start of `text`, each optionally preceded by
/// whitespace.
/// @param[out] args the contents of the groups, without the outer braces
/// @return the number of characters consumed, or `std::nullopt` if the groups are incomplete
[[nodiscard]] std::optional<Size>
match_brace_groups(std::string_view text, Size count, std::pmr::vector<std::string_view>& args)
{
    Size pos = 0;
    for (Size i = 0; i < count; ++i) {
        while (pos < text.size() && is_ascii_whitespace(text[pos])) {
            ++pos;
        }
        if (pos == text.size() || text[pos] != '{') {
            return std::nullopt;
        }
        const Size open = pos;
        int depth = 0;
        for (; pos < text.size(); ++pos) {
            if (text[pos] == '\\') {
                ++pos;
            }
            else if (text[pos] == '{') {
                ++depth;
            }
            else if (text[pos] == '}' && --depth == 0) {
                break;
            }
        }
        if (pos >= text.size()) {
            return std::nullopt;
        }
        args.push_back(text.substr(open + 1, pos - open - 1));
        ++pos;
    }
    return pos;
}

/// @brief Replaces `#1` through `#9` in `body` with the corresponding argument.
void substitute(std::pmr::string& out, std::string_view body, std::span<const std::string_view> args)
{
    for (Size i = 0; i < body.size(); ++i) {
        if (body[i] == '#' && i + 1 < body.size() && is_ascii_digit(body[i + 1])) {
            const Size index = Size(body[i + 1] - '0');
            if (index >= 1 && index <= args.size()) {
                out += args[index - 1];
                ++i;
                continue;
            }
        }
        out += body[i];
    }
}

/// @brief Performs a single left-to-right substitution pass for one macro.
/// @return `true` if any invocation was expanded
bool expand_single_macro(std::pmr::string& out,
                         std::string_view text,
                         std::string_view name,
                         const Macro& macro,
                         std::pmr::memory_resource* memory)
{
    bool changed = false;
    std::pmr::vector<std::string_view> args(memory);

    Size pos = 0;
    while (true) {
        const Size backslash = text.find('\\', pos);
        if (backslash == std::string_view::npos) {
            out += text.substr(pos);
            return changed;
        }
        out += text.substr(pos, backslash - pos);

        const std::string_view after_backslash = text.substr(backslash + 1);
        const Size name_end = backslash + 1 + name.size();
        const bool is_invocation = after_backslash.starts_with(name) && !is_escaped(text, backslash)
            && (name_end == text.size() || !is_ascii_alpha(text[name_end]));
        if (!is_invocation) {
            out += '\\';
            pos = backslash + 1;
            continue;
        }

        const std::string_view rest = text.substr(name_end);
        if (macro.arg_count == 0) {
            if (rest.starts_with('{')) {
                out += text.substr(backslash, name_end - backslash);
                pos = name_end;
                continue;
            }
            out += macro.body;
            changed = true;
            pos = name_end;
            continue;
        }

        args.clear();
        const std::optional<Size> consumed = match_brace_groups(rest, macro.arg_count, args);
        if (!consumed) {
            out += text.substr(backslash, name_end - backslash);
            pos = name_end;
            continue;
        }
        substitute(out, macro.body, args);
        changed = true;
        pos = name_end + *consumed;
    }
}

struct Macro_Expander final : ast::Visitor {
    const Macro_Table& macros;
    Logger& logger;
    std::pmr::memory_resource* memory;

    Macro_Expander(const Macro_Table& macros, Logger& logger, std::pmr::memory_resource* memory)
        : macros { macros }
        , logger { logger }
        , memory { memory }
    {
    }

    void visit(ast::Block& block) override
    {
        if (auto* const math = std::get_if<ast::Display_Math>(&block)) {
            expand(math->source);
        }
        visit_children(block);
    }

    void visit(ast::Inline& node) override
    {
        if (auto* const math = std::get_if<ast::Inline_Math>(&node)) {
            expand(math->source);
        }
        visit_children(node);
    }

    void expand(std::pmr::string& source)
    {
        Macro_Expansion result = expand_macros(source, macros, memory);
        if (!result.converged && logger.can_log(Severity::warning)) {
            std::pmr::string message(
                "Macro expansion did not reach a fixed point; the math is left partially "
                "expanded: ",
                memory);
            message += source;
            logger(Diagnostic { Severity::warning, "macro.limit", std::move(message) });
        }
        source = std::move(result.text);
    }
};

} // namespace

Macro_Expansion
expand_macros(std::string_view math, const Macro_Table& macros, std::pmr::memory_resource* memory)
{
    Macro_Expansion result { .text = std::pmr::string(math, memory), .converged = true };
    if (macros.empty()) {
        return result;
    }
    std::pmr::string buffer(memory);

    for (Size iteration = 0; iteration < macro_expansion_limit; ++iteration) {
        bool changed = false;
        for (const auto& [name, macro] : macros) {
            buffer.clear();
            if (expand_single_macro(buffer, result.text, name, macro, memory)) {
                changed = true;
                result.text.swap(buffer);
            }
        }
        if (!changed) {
            return result;
        }
    }
    result.converged = false;
    return result;
}

void expand_document_macros(Document& document, Logger& logger, std::pmr::memory_resource* memory)
{
    if (document.metadata.macros.empty()) {
        return;
    }
    Macro_Expander expander { document.metadata.macros, logger, memory };
    expander.visit_blocks(document.blocks);
}

} // namespace markdown_academic::mda
