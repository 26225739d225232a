#ifndef MARKDOWN_ACADEMIC_MDA_FRONT_MATTER_HPP
#define MARKDOWN_ACADEMIC_MDA_FRONT_MATTER_HPP

#include <memory_resource>
#include <string_view>

#include "common/result.hpp"

#include "mda/document.hpp"
#include "mda/parsing/parse_error.hpp"

namespace markdown_academic::mda {

struct Front_Matter {
    Metadata metadata;
    /// @brief The index in the source at which the document body begins.
    Size body_begin;
};

/// @brief Parses the optional front matter at the start of `source`.
/// Front matter is a block of TOML, opened by `+++` (possibly preceded by whitespace)
/// and closed by a line starting with `+++`.
/// If the source does not start with `+++`, the result has default metadata and
/// `body_begin == 0`.
[[nodiscard]] Result<Front_Matter, Parse_Error> parse_front_matter(std::string_view source,
                                                                   std::pmr::memory_resource* memory);

/// @brief Returns the greatest `N` such that `#N` appears in `body`, where `N` is a single digit.
[[nodiscard]] Size count_macro_args(std::string_view body);

} // namespace markdown_academic::mda

#endif
