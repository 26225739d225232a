#ifndef MARKDOWN_ACADEMIC_MDA_MACROS_HPP
#define MARKDOWN_ACADEMIC_MDA_MACROS_HPP

#include <memory_resource>
#include <string>
#include <string_view>

#include "mda/document.hpp"
#include "mda/fwd.hpp"

namespace markdown_academic::mda {

struct Macro_Expansion {
    std::pmr::string text;
    /// @brief `true` if a full substitution pass left the text unchanged within
    /// `macro_expansion_limit` passes.
    bool converged;
};

/// @brief Expands all invocations of `macros` within the math source `math`.
/// Substitution passes over all macros (in name order) are repeated until the text no longer
/// changes, but at most `macro_expansion_limit` times.
/// An invocation `\name` is only recognized if `name` is not followed by another letter.
/// For macros without arguments, an invocation directly followed by `{` is left untouched.
/// For macros with `N` arguments, the invocation must be followed by `N` brace-balanced groups,
/// optionally separated by whitespace; otherwise the invocation is left untouched.
[[nodiscard]] Macro_Expansion
expand_macros(std::string_view math, const Macro_Table& macros, std::pmr::memory_resource* memory);

/// @brief Expands the macros of the document metadata within all inline and display math of
/// the document.
/// Math which does not reach a fixed point is left partially expanded, and a `macro.limit`
/// warning is logged.
void expand_document_macros(Document& document, Logger& logger, std::pmr::memory_resource* memory);

} // namespace markdown_academic::mda

#endif
