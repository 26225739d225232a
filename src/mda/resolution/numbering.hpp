#ifndef MARKDOWN_ACADEMIC_MDA_NUMBERING_HPP
#define MARKDOWN_ACADEMIC_MDA_NUMBERING_HPP

#include <array>
#include <functional>
#include <memory_resource>
#include <string>
#include <unordered_map>

#include "common/hash.hpp"

#include "mda/document.hpp"
#include "mda/environment_kind.hpp"

namespace markdown_academic::mda {

/// @brief Maps heading labels to dotted section numbers such as `"1.2"` or `"A.1"`.
using Section_Numbers
    = std::pmr::unordered_map<std::pmr::string, std::pmr::string, String_Hash, std::equal_to<>>;

/// @brief Maps labels of equations, environments, and tables to their number.
using Environment_Numbers = std::pmr::unordered_map<std::pmr::string, Uint64, String_Hash, std::equal_to<>>;

/// @brief The counters which are advanced by a walk over the document.
struct Numbering_State {
    std::array<Uint64, heading_level_count> sections {};
    /// @brief If `true`, the first component of section numbers is a letter.
    bool in_appendix = false;

    Uint64 equations = 0;
    Uint64 figures = 0;
    /// @brief Shared by `Table` blocks and table environments.
    Uint64 tables = 0;
    /// @brief Shared by theorems, propositions, and corollaries.
    Uint64 theorems = 0;
    Uint64 lemmas = 0;
    Uint64 definitions = 0;
    /// @brief Shared by examples and remarks.
    Uint64 examples = 0;
    Uint64 algorithms = 0;
    Uint64 conjectures = 0;
    Uint64 axioms = 0;
    Uint64 exercises = 0;
    Uint64 solutions = 0;

    /// @brief Returns the counter which environments of the given type advance,
    /// or `nullptr` if they are not numbered.
    [[nodiscard]] Uint64* environment_counter(Environment_Type type);

    /// @brief Advances the counter of the heading level and resets all deeper levels.
    /// @param level the heading level in range `[1, 6]`
    void advance_section(int level);

    /// @brief Restarts section numbering for the appendix.
    void enter_appendix();

    /// @brief Returns the number of the most recent section at `level`, such as `"1.2"`.
    [[nodiscard]] std::pmr::string section_number(int level, std::pmr::memory_resource* memory) const;
};

struct Numbering {
    Section_Numbers section_numbers;
    Environment_Numbers env_numbers;
};

/// @brief Returns the appendix letter for a one-based counter:
/// `A` through `Z`, followed by `AA`, `AB`, and so forth.
[[nodiscard]] std::pmr::string appendix_letter(Uint64 n, std::pmr::memory_resource* memory);

/// @brief Walks the document depth-first and numbers all headings, display math, tables,
/// and numbered environments.
/// Only labeled elements are recorded in the result, but unlabeled ones still advance
/// the counters.
[[nodiscard]] Numbering assign_numbers(const Document& document, std::pmr::memory_resource* memory);

} // namespace markdown_academic::mda

#endif
