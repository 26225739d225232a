#ifndef MARKDOWN_ACADEMIC_MDA_LABELS_HPP
#define MARKDOWN_ACADEMIC_MDA_LABELS_HPP

#include <functional>
#include <memory_resource>
#include <string>
#include <string_view>
#include <unordered_map>

#include "common/hash.hpp"
#include "common/result.hpp"

#include "mda/document.hpp"
#include "mda/resolution/bibliography.hpp"
#include "mda/resolution/numbering.hpp"
#include "mda/resolution/resolution_error.hpp"

namespace markdown_academic::mda {

struct Label_Info {
    /// @brief The text which references to the label are replaced with, such as `"Theorem 2"`.
    std::pmr::string display;
    /// @brief An identifier derived from the label, usable as an HTML id or anchor name.
    std::pmr::string id;
};

using Label_Registry
    = std::pmr::unordered_map<std::pmr::string, Label_Info, String_Hash, std::equal_to<>>;

/// @brief Converts a label into a stable identifier by replacing every character other than
/// ASCII alphanumerics, `-`, and `_` with `-`.
/// A non-ASCII character is replaced by a single `-`, regardless of its UTF-8 length.
[[nodiscard]] std::pmr::string label_to_id(std::string_view label, std::pmr::memory_resource* memory);

/// @brief Collects all labels of headings, display math, environments, and tables.
/// Labels are unique across the whole document; the first repeated label in document order
/// results in a `duplicate_label` error.
[[nodiscard]] Result<Label_Registry, Resolution_Error> build_label_registry(
    const Document& document, const Numbering& numbering, std::pmr::memory_resource* memory);

struct Reference_Options {
    /// @brief If `true`, a reference to an unknown label is an error.
    bool strict;
    /// @brief Bibliography keys, which bare `@key` references may cite textually.
    const Bibliography& bibliography;
    Logger& logger;
};

/// @brief Fills in the display text of every `Reference` in the document.
/// A reference whose label is not registered, but which names a bibliography key, is replaced
/// with a textual citation; if it ends in `-` and its stem is a key, with an author-only citation.
/// Any other unknown reference is an error in strict mode, and resolves to `"??label"` otherwise.
[[nodiscard]] Result<void, Resolution_Error> resolve_references(Document& document,
                                                                const Label_Registry& labels,
                                                                const Reference_Options& options,
                                                                std::pmr::memory_resource* memory);

} // namespace markdown_academic::mda

#endif
