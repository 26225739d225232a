#ifndef MARKDOWN_ACADEMIC_TEST_DOCUMENT_FILE_TESTING_HPP
#define MARKDOWN_ACADEMIC_TEST_DOCUMENT_FILE_TESTING_HPP

#include <string_view>

#include "mda/parsing/parse_error.hpp"
#include "mda/resolution/resolution_error.hpp"

#include "test/compilation_stage.hpp"

namespace markdown_academic {

/// @brief Loads the document at `test/<file>` and processes it in strict mode up to and
/// including `until_stage`.
/// @return `true` if no stage failed
bool test_for_success(std::string_view file, MDA_Stage until_stage = MDA_Stage::resolve);

/// @brief Like `test_for_success`, but expects parsing to fail with the given error code.
bool test_for_diagnostic(std::string_view file, mda::Parse_Error_Code expected);

/// @brief Like `test_for_success`, but expects strict resolution to fail with the given error
/// code.
bool test_for_diagnostic(std::string_view file, mda::Resolution_Error_Code expected);

} // namespace markdown_academic

#endif
