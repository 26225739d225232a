#ifndef MARKDOWN_ACADEMIC_MDA_DOCUMENT_HPP
#define MARKDOWN_ACADEMIC_MDA_DOCUMENT_HPP

#include <functional>
#include <map>
#include <memory_resource>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "mda/ast.hpp"
#include "mda/fwd.hpp"

namespace markdown_academic::mda {

/// @brief A user-defined math macro.
/// `body` contains the placeholders `#1` through `#<arg_count>`.
struct Macro {
    Size arg_count;
    std::pmr::string body;
};

using Macro_Table = std::pmr::map<std::pmr::string, Macro, std::less<>>;

/// @brief Document properties, taken from the front matter.
struct Metadata {
    std::optional<std::pmr::string> title;
    std::optional<std::pmr::string> subtitle;
    std::pmr::vector<std::pmr::string> authors;
    std::optional<std::pmr::string> date;
    std::optional<std::pmr::string> abstract;
    std::pmr::vector<std::pmr::string> keywords;
    std::optional<std::pmr::string> institution;
    std::optional<std::pmr::string> department;
    std::optional<std::pmr::string> advisor;
    std::optional<std::pmr::string> language;
    /// @brief Path of the bibliography file, relative to the resolution base path.
    std::optional<std::pmr::string> bibliography;
    Macro_Table macros;

    [[nodiscard]] explicit Metadata(std::pmr::memory_resource* memory)
        : authors(memory)
        , keywords(memory)
        , macros(memory)
    {
    }
};

struct Document {
    Metadata metadata;
    std::pmr::vector<ast::Block> blocks;

    [[nodiscard]] explicit Document(std::pmr::memory_resource* memory)
        : metadata(memory)
        , blocks(memory)
    {
    }

    [[nodiscard]] Document(Metadata&& metadata, std::pmr::vector<ast::Block>&& blocks)
        : metadata(std::move(metadata))
        , blocks(std::move(blocks))
    {
    }
};

} // namespace markdown_academic::mda

#endif
