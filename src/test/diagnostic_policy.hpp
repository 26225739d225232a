#ifndef MARKDOWN_ACADEMIC_DIAGNOSTIC_POLICY_HPP
#define MARKDOWN_ACADEMIC_DIAGNOSTIC_POLICY_HPP

#include "common/io_error.hpp"

#include "mda/fwd.hpp"

#include "test/compilation_stage.hpp"

namespace markdown_academic {

enum struct Policy_Action {
    /// @brief Immediate success.
    success,
    /// @brief Immediate failure.
    failure,
    /// @brief Keep going.
    keep_going
};

constexpr bool is_exit(Policy_Action action)
{
    return action != Policy_Action::keep_going;
}

/// @brief A polymorphic class for deciding which `Policy_Action` to take when various diagnostics
/// are raised throughout testing.
/// Diagnostic policies are stateful, i.e. they are required to remember failures and keep these
/// consistent with `is_success()`.
struct MDA_Diagnostic_Policy {
    virtual ~MDA_Diagnostic_Policy() = default;

    /// @brief Returns `false` if any prior call returned `Policy_Action::failure`,
    /// returns `true` if any prior call returned `Policy_Action::success`,
    /// or some other value if the policy is otherwise not considered to have succeeded.
    virtual bool is_success() const = 0;

    virtual Policy_Action error(IO_Error_Code) = 0;
    virtual Policy_Action error(const mda::Parse_Error&) = 0;
    virtual Policy_Action error(const mda::Resolution_Error&) = 0;

    virtual Policy_Action done(MDA_Stage) = 0;
};

} // namespace markdown_academic

#endif
