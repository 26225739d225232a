#include <iostream>
#include <memory_resource>
#include <string>
#include <type_traits>

#include "common/ansi.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/io.hpp"
#include "common/tty.hpp"

#include "mda/parsing/parse.hpp"
#include "mda/resolution/resolve.hpp"

#include "test/diagnostic_policy.hpp"
#include "test/document_file_testing.hpp"

namespace markdown_academic {
namespace {

const bool should_print_colors = is_stdout_tty;

struct Printing_MDA_Diagnostic_Policy : MDA_Diagnostic_Policy {
    std::string_view file;
    std::string_view source;
};

bool test_validity(std::string_view file, Printing_MDA_Diagnostic_Policy& policy)
{
#define MARKDOWN_ACADEMIC_SWITCH_ON_POLICY_ACTION(...)                                             \
    switch (__VA_ARGS__) {                                                                         \
    case Policy_Action::success: return true;                                                      \
    case Policy_Action::failure: return false;                                                     \
    case Policy_Action::keep_going: break;                                                         \
    }

    const auto full_path = "test/" + std::string(file);
    policy.file = full_path;

    std::pmr::monotonic_buffer_resource memory;
    Result<std::pmr::vector<char>, IO_Error_Code> source_data = file_to_bytes(full_path, &memory);
    if (!source_data) {
        return policy.error(source_data.error()) == Policy_Action::success;
    }
    MARKDOWN_ACADEMIC_SWITCH_ON_POLICY_ACTION(policy.done(MDA_Stage::load_file));
    const std::string_view source { source_data->data(), source_data->size() };
    policy.source = source;

    Result<mda::Document, mda::Parse_Error> document = mda::parse(source, &memory);
    if (!document) {
        return policy.error(document.error()) == Policy_Action::success;
    }
    MARKDOWN_ACADEMIC_SWITCH_ON_POLICY_ACTION(policy.done(MDA_Stage::parse));

    const auto slash = full_path.find_last_of('/');
    const std::string base_path = full_path.substr(0, slash);
    const mda::Resolve_Config config { .base_path = base_path,
                                       .strict_citations = true,
                                       .strict_references = true };
    Result<mda::Resolved_Document, mda::Resolution_Error> resolved
        = mda::resolve(std::move(*document), config, &memory);
    if (!resolved) {
        return policy.error(resolved.error()) == Policy_Action::success;
    }
    MARKDOWN_ACADEMIC_SWITCH_ON_POLICY_ACTION(policy.done(MDA_Stage::resolve));

    return policy.is_success();
#undef MARKDOWN_ACADEMIC_SWITCH_ON_POLICY_ACTION
}

struct Expect_Success_Diagnostic_Policy final : Printing_MDA_Diagnostic_Policy {
private:
    MDA_Stage m_until_stage;
    Policy_Action m_action = Policy_Action::keep_going;

public:
    explicit Expect_Success_Diagnostic_Policy(MDA_Stage until_stage)
        : m_until_stage { until_stage }
    {
    }

    bool is_success() const final
    {
        return m_action == Policy_Action::success;
    }

    Policy_Action error(IO_Error_Code e) final
    {
        Code_String out;
        print_io_error(out, file, e);
        print_code_string(std::cout, out, should_print_colors);
        return m_action = Policy_Action::failure;
    }

    Policy_Action error(const mda::Parse_Error& e) final
    {
        Code_String out;
        print_parse_error(out, file, source, e);
        print_code_string(std::cout, out, should_print_colors);
        return m_action = Policy_Action::failure;
    }

    Policy_Action error(const mda::Resolution_Error& e) final
    {
        Code_String out;
        print_resolution_error(out, file, e);
        print_code_string(std::cout, out, should_print_colors);
        return m_action = Policy_Action::failure;
    }

    Policy_Action done(MDA_Stage stage) final
    {
        if (stage < m_until_stage) {
            return Policy_Action::keep_going;
        }
        return m_action = Policy_Action::success;
    }
};

template <typename Code>
struct Expect_Diagnostic_Policy final : Printing_MDA_Diagnostic_Policy {
private:
    Code m_expected;
    Policy_Action m_action = Policy_Action::keep_going;

    Policy_Action fail_unexpectedly()
    {
        std::cout << ansi::red << "Test failed because a different diagnostic was raised.\n"
                  << ansi::reset;
        return m_action = Policy_Action::failure;
    }

public:
    explicit Expect_Diagnostic_Policy(Code expected)
        : m_expected { expected }
    {
    }

    bool is_success() const final
    {
        return m_action == Policy_Action::success;
    }

    Policy_Action error(IO_Error_Code e) final
    {
        Code_String out;
        print_io_error(out, file, e);
        print_code_string(std::cout, out, should_print_colors);
        return m_action = Policy_Action::failure;
    }

    Policy_Action error(const mda::Parse_Error& e) final
    {
        if constexpr (std::is_same_v<Code, mda::Parse_Error_Code>) {
            if (e.code == m_expected) {
                return m_action = Policy_Action::success;
            }
        }
        Code_String out;
        print_parse_error(out, file, source, e);
        print_code_string(std::cout, out, should_print_colors);
        return fail_unexpectedly();
    }

    Policy_Action error(const mda::Resolution_Error& e) final
    {
        if constexpr (std::is_same_v<Code, mda::Resolution_Error_Code>) {
            if (e.code == m_expected) {
                return m_action = Policy_Action::success;
            }
        }
        Code_String out;
        print_resolution_error(out, file, e);
        print_code_string(std::cout, out, should_print_colors);
        return fail_unexpectedly();
    }

    Policy_Action done(MDA_Stage stage) final
    {
        if (stage < MDA_Stage::resolve) {
            return Policy_Action::keep_going;
        }
        std::cout << ansi::red << "Test failed because no diagnostic was raised.\n" << ansi::reset;
        return m_action = Policy_Action::failure;
    }
};

} // namespace

bool test_for_success(std::string_view file, MDA_Stage until_stage)
{
    Expect_Success_Diagnostic_Policy policy { until_stage };
    return test_validity(file, policy);
}

bool test_for_diagnostic(std::string_view file, mda::Parse_Error_Code expected)
{
    Expect_Diagnostic_Policy<mda::Parse_Error_Code> policy { expected };
    return test_validity(file, policy);
}

bool test_for_diagnostic(std::string_view file, mda::Resolution_Error_Code expected)
{
    Expect_Diagnostic_Policy<mda::Resolution_Error_Code> policy { expected };
    return test_validity(file, policy);
}

} // namespace markdown_academic
