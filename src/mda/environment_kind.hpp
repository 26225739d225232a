#ifndef MARKDOWN_ACADEMIC_MDA_ENVIRONMENT_KIND_HPP
#define MARKDOWN_ACADEMIC_MDA_ENVIRONMENT_KIND_HPP

#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include "mda/fwd.hpp"

namespace markdown_academic::mda {

/// @brief The closed catalogue of environment kinds, plus `custom` for any other fence keyword.
enum struct Environment_Type : Default_Underlying {
    theorem,
    lemma,
    proposition,
    corollary,
    definition,
    example,
    remark,
    proof,
    figure,
    table,
    algorithm,
    abstract,
    note,
    warning,
    quote,
    conjecture,
    axiom,
    exercise,
    solution,
    case_,
    custom,
};

/// @brief The kind of an `::: environment`.
/// For `Environment_Type::custom`, `custom_name` holds the keyword as written in the fence;
/// otherwise it is empty.
struct Environment_Kind {
    Environment_Type type;
    std::pmr::string custom_name;
};

/// @brief Returns the name of the enumerator, such as `"theorem"`.
[[nodiscard]] std::string_view environment_type_name(Environment_Type type);

/// @brief Looks up a built-in environment type by a fence keyword.
/// Matching is case-insensitive, and common abbreviations such as `thm`, `lem`, or `def`
/// are recognized.
/// @return the type, or `std::nullopt` if the keyword names no built-in type
[[nodiscard]] std::optional<Environment_Type> environment_type_by_name(std::string_view name);

/// @brief Like `environment_type_by_name`, but falls back onto a custom kind named `name`.
[[nodiscard]] Environment_Kind environment_kind_by_name(std::string_view name,
                                                        std::pmr::memory_resource* memory);

/// @brief Returns the human-readable name of the kind, such as `"Theorem"`.
/// For custom kinds, this is the keyword as written.
[[nodiscard]] std::string_view display_name(const Environment_Kind& kind);

/// @brief Returns `true` if environments of this type receive a number.
/// Proofs, abstracts, notes, warnings, quotes, cases, and custom environments do not.
[[nodiscard]] bool is_numbered(Environment_Type type);

[[nodiscard]] inline bool is_numbered(const Environment_Kind& kind)
{
    return is_numbered(kind.type);
}

} // namespace markdown_academic::mda

#endif
