#include "common/assert.hpp"

#include "mda/diagnostic.hpp"

namespace markdown_academic::mda {

std::string_view severity_name(Severity severity)
{
    using enum Severity;
    switch (severity) {
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(debug);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(info);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(warning);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(error);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(none);
    }
    MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE("Invalid severity.");
}

} // namespace markdown_academic::mda
