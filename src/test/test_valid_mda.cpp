#include <gtest/gtest.h>

#include "mda/parsing/parse_error.hpp"
#include "mda/resolution/resolution_error.hpp"

#include "test/document_file_testing.hpp"

namespace markdown_academic {
namespace {

TEST(MDA_Valid, paper)
{
    EXPECT_TRUE(test_for_success("mda/valid/paper.mda"));
}

TEST(MDA_Valid, lists_and_quotes)
{
    EXPECT_TRUE(test_for_success("mda/valid/lists_and_quotes.mda"));
}

TEST(MDA_Valid, empty)
{
    EXPECT_TRUE(test_for_success("mda/valid/empty.mda"));
}

TEST(MDA_Valid, front_matter_only)
{
    EXPECT_TRUE(test_for_success("mda/valid/front_matter_only.mda"));
}

TEST(MDA_Valid, parse_only)
{
    EXPECT_TRUE(test_for_success("mda/invalid/unknown_reference.mda", MDA_Stage::parse));
}

TEST(MDA_Parse_Error, unterminated_front_matter)
{
    EXPECT_TRUE(test_for_diagnostic("mda/invalid/unterminated_front_matter.mda",
                                    mda::Parse_Error_Code::unterminated_front_matter));
}

TEST(MDA_Parse_Error, front_matter_syntax)
{
    EXPECT_TRUE(test_for_diagnostic("mda/invalid/front_matter_syntax.mda",
                                    mda::Parse_Error_Code::front_matter_syntax));
}

TEST(MDA_Parse_Error, front_matter_type)
{
    EXPECT_TRUE(test_for_diagnostic("mda/invalid/front_matter_type.mda",
                                    mda::Parse_Error_Code::front_matter_type));
}

TEST(MDA_Parse_Error, front_matter_duplicate_key)
{
    EXPECT_TRUE(test_for_diagnostic("mda/invalid/front_matter_duplicate_key.mda",
                                    mda::Parse_Error_Code::front_matter_duplicate_key));
}

TEST(MDA_Resolution_Error, duplicate_label)
{
    EXPECT_TRUE(test_for_diagnostic("mda/invalid/duplicate_label.mda",
                                    mda::Resolution_Error_Code::duplicate_label));
}

TEST(MDA_Resolution_Error, unknown_reference)
{
    EXPECT_TRUE(test_for_diagnostic("mda/invalid/unknown_reference.mda",
                                    mda::Resolution_Error_Code::unknown_reference));
}

TEST(MDA_Resolution_Error, unknown_citation)
{
    EXPECT_TRUE(test_for_diagnostic("mda/invalid/unknown_citation.mda",
                                    mda::Resolution_Error_Code::unknown_citation));
}

TEST(MDA_Resolution_Error, undefined_footnote)
{
    EXPECT_TRUE(test_for_diagnostic("mda/invalid/undefined_footnote.mda",
                                    mda::Resolution_Error_Code::undefined_footnote));
}

TEST(MDA_Resolution_Error, duplicate_footnote)
{
    EXPECT_TRUE(test_for_diagnostic("mda/invalid/duplicate_footnote.mda",
                                    mda::Resolution_Error_Code::duplicate_footnote));
}

TEST(MDA_Resolution_Error, bibliography_unreadable)
{
    EXPECT_TRUE(test_for_diagnostic("mda/invalid/missing_bibliography.mda",
                                    mda::Resolution_Error_Code::bibliography_unreadable));
}

} // namespace
} // namespace markdown_academic
