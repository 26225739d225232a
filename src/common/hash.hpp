#ifndef MARKDOWN_ACADEMIC_HASH_HPP
#define MARKDOWN_ACADEMIC_HASH_HPP

#include <functional>
#include <string_view>

#include "common/config.hpp"

namespace markdown_academic {

/// @brief A transparent string hash, which enables heterogeneous lookup in unordered containers
/// keyed by strings.
struct String_Hash {
    using is_transparent = void;

    [[nodiscard]] Size operator()(std::string_view s) const noexcept
    {
        return std::hash<std::string_view> {}(s);
    }
};

} // namespace markdown_academic

#endif
