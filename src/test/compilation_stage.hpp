#ifndef MARKDOWN_ACADEMIC_COMPILATION_STAGE_HPP
#define MARKDOWN_ACADEMIC_COMPILATION_STAGE_HPP

#include "common/config.hpp"

namespace markdown_academic {

enum struct MDA_Stage : Default_Underlying { //
    load_file,
    parse,
    resolve
};

constexpr auto operator<=>(MDA_Stage a, MDA_Stage b)
{
    return static_cast<Default_Underlying>(a) <=> static_cast<Default_Underlying>(b);
}

} // namespace markdown_academic

#endif
