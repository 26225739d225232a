#ifndef MARKDOWN_ACADEMIC_MDA_FOOTNOTES_HPP
#define MARKDOWN_ACADEMIC_MDA_FOOTNOTES_HPP

#include <functional>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "common/hash.hpp"
#include "common/result.hpp"

#include "mda/ast.hpp"
#include "mda/document.hpp"
#include "mda/resolution/resolution_error.hpp"

namespace markdown_academic::mda {

struct Footnote_Entry {
    std::pmr::string id;
    std::pmr::vector<ast::Inline> content;
};

/// @brief The footnotes of a document, in the order in which they were collected.
struct Footnote_Table {
private:
    std::pmr::vector<Footnote_Entry> m_entries;
    std::pmr::unordered_map<std::pmr::string, Size, String_Hash, std::equal_to<>> m_indices;

public:
    [[nodiscard]] explicit Footnote_Table(std::pmr::memory_resource* memory)
        : m_entries(memory)
        , m_indices(memory)
    {
    }

    /// @brief Adds a footnote.
    /// @return `false` if a footnote with the same id already exists, in which case the table
    /// is not modified
    bool insert(std::string_view id, std::pmr::vector<ast::Inline>&& content);

    /// @brief Returns the footnote with the given id, or `nullptr` if there is none.
    [[nodiscard]] const Footnote_Entry* find(std::string_view id) const;

    [[nodiscard]] bool contains(std::string_view id) const
    {
        return m_indices.contains(id);
    }

    [[nodiscard]] Size size() const noexcept
    {
        return m_entries.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_entries.empty();
    }

    [[nodiscard]] std::span<const Footnote_Entry> entries() const noexcept
    {
        return m_entries;
    }

    [[nodiscard]] auto begin() const noexcept
    {
        return m_entries.begin();
    }

    [[nodiscard]] auto end() const noexcept
    {
        return m_entries.end();
    }
};

struct Footnote_Options {
    /// @brief If `true`, a reference `[^id]` without a definition is an error.
    bool strict;
    Logger& logger;
};

/// @brief Collects the footnotes of the document in document order.
/// Inline footnotes `^[...]` receive the ids `fn-1`, `fn-2`, and so forth,
/// while definitions `[^id]: ...` are stored under their own id.
/// Afterwards, every footnote reference `[^id]` is checked against the collected ids.
[[nodiscard]] Result<Footnote_Table, Resolution_Error> collect_footnotes(
    const Document& document, const Footnote_Options& options, std::pmr::memory_resource* memory);

} // namespace markdown_academic::mda

#endif
