#ifndef MARKDOWN_ACADEMIC_MDA_BIBLIOGRAPHY_HPP
#define MARKDOWN_ACADEMIC_MDA_BIBLIOGRAPHY_HPP

#include <functional>
#include <map>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "common/hash.hpp"

#include "mda/fwd.hpp"

namespace markdown_academic::mda {

/// @brief A single bibliography entry, as produced by an external bibliography parser.
/// This library only ever reads entries.
struct Bib_Entry {
    std::pmr::string key;
    /// @brief The entry type, such as `"article"` or `"book"`.
    std::pmr::string entry_type;
    std::optional<std::pmr::string> title;
    std::pmr::vector<std::pmr::string> authors;
    std::optional<std::pmr::string> year;
    std::optional<std::pmr::string> journal;
    std::optional<std::pmr::string> booktitle;
    std::optional<std::pmr::string> publisher;
    std::optional<std::pmr::string> volume;
    std::optional<std::pmr::string> number;
    std::optional<std::pmr::string> pages;
    std::optional<std::pmr::string> doi;
    std::optional<std::pmr::string> url;
    /// @brief All other fields.
    std::pmr::map<std::pmr::string, std::pmr::string, std::less<>> extra;

    [[nodiscard]] Bib_Entry(std::string_view key,
                            std::string_view entry_type,
                            std::pmr::memory_resource* memory)
        : key(key, memory)
        , entry_type(entry_type, memory)
        , authors(memory)
        , extra(memory)
    {
    }
};

/// @brief Maps citation keys to bibliography entries.
/// Lookup with `std::string_view` keys does not allocate.
using Bibliography
    = std::pmr::unordered_map<std::pmr::string, Bib_Entry, String_Hash, std::equal_to<>>;

} // namespace markdown_academic::mda

#endif
