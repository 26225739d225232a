#ifndef MARKDOWN_ACADEMIC_MDA_FWD_HPP
#define MARKDOWN_ACADEMIC_MDA_FWD_HPP

#include "common/fwd.hpp"

namespace markdown_academic::mda {

enum struct Alignment : Default_Underlying;
enum struct Citation_Style : Default_Underlying;
enum struct Environment_Type : Default_Underlying;
enum struct Parse_Error_Code : Default_Underlying;
enum struct Resolution_Error_Code : Default_Underlying;
enum struct Severity : Default_Underlying;

struct Environment_Kind;
struct Macro;
struct Metadata;
struct Document;
struct Resolved_Document;
struct Resolve_Config;
struct Bib_Entry;
struct Label_Info;
struct Footnote_Table;

struct Parse_Error;
struct Resolution_Error;

struct Diagnostic;
struct Logger;

namespace ast {

struct Inline;
struct Block;

} // namespace ast

} // namespace markdown_academic::mda

#endif
