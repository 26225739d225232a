#ifndef MARKDOWN_ACADEMIC_FWD_HPP
#define MARKDOWN_ACADEMIC_FWD_HPP

#include "common/config.hpp"

namespace markdown_academic {

enum struct Code_Span_Type : Default_Underlying;
enum struct IO_Error_Code : Default_Underlying;

struct Local_Source_Position;
struct Local_Source_Span;
struct Code_String;

template <typename T, typename Error>
struct Result;

} // namespace markdown_academic

#endif
