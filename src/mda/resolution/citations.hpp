#ifndef MARKDOWN_ACADEMIC_MDA_CITATIONS_HPP
#define MARKDOWN_ACADEMIC_MDA_CITATIONS_HPP

#include <memory_resource>
#include <string>
#include <vector>

#include "common/result.hpp"

#include "mda/document.hpp"
#include "mda/resolution/bibliography.hpp"
#include "mda/resolution/resolution_error.hpp"

namespace markdown_academic::mda {

/// @brief Returns every cited key once, in the order of first appearance in the document.
[[nodiscard]] std::pmr::vector<std::pmr::string> citation_order(const Document& document,
                                                                std::pmr::memory_resource* memory);

struct Citation_Options {
    /// @brief If `true`, citing a key which is not in the bibliography is an error.
    bool strict;
    Logger& logger;
};

/// @brief Checks all cited keys against the bibliography, in order of first appearance.
/// In strict mode, the first missing key is an `unknown_citation` error.
/// Otherwise, a `citation.unknown` warning is logged once for every missing key.
[[nodiscard]] Result<void, Resolution_Error> validate_citations(const Document& document,
                                                                const Bibliography& bibliography,
                                                                const Citation_Options& options,
                                                                std::pmr::memory_resource* memory);

} // namespace markdown_academic::mda

#endif
