#include "common/assert.hpp"

#include "mda/parsing/front_matter.hpp"
#include "mda/parsing/parse.hpp"

namespace markdown_academic::mda {

std::string_view parse_error_code_name(Parse_Error_Code code)
{
    using enum Parse_Error_Code;
    switch (code) {
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(unterminated_front_matter);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(front_matter_syntax);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(front_matter_type);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(front_matter_duplicate_key);
    }
    MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE("Invalid parse error code.");
}

Result<Document, Parse_Error> parse(std::string_view source, std::pmr::memory_resource* memory)
{
    Result<Front_Matter, Parse_Error> front_matter = parse_front_matter(source, memory);
    if (!front_matter) {
        return std::move(front_matter).error();
    }
    MARKDOWN_ACADEMIC_ASSERT(front_matter->body_begin <= source.size());
    std::pmr::vector<ast::Block> blocks
        = parse_blocks(source.substr(front_matter->body_begin), memory);
    return Document { std::move(front_matter->metadata), std::move(blocks) };
}

} // namespace markdown_academic::mda
