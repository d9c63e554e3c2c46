#ifndef SLUGMARK_TEST_DIAGNOSTIC_POLICY_HPP
#define SLUGMARK_TEST_DIAGNOSTIC_POLICY_HPP

#include "common/io_error.hpp"

#include "md/fwd.hpp"

namespace slugmark {

enum struct Policy_Action {
    /// @brief Immediate success.
    success,
    /// @brief Immediate failure.
    failure,
    /// @brief Keep going.
    keep_going
};

enum struct Document_Stage {
    load_file,
    render,
};

/// @brief A polymorphic class for deciding which `Policy_Action` to take when various diagnostics
/// are raised throughout testing.
/// Diagnostic policies are stateful, i.e. they are required to remember failures and keep these
/// consistent with `is_success()`.
struct Document_Diagnostic_Policy {
    /// @brief Returns `false` if any prior call returned `Policy_Action::failure`,
    /// returns `true` if any prior call returned `Policy_Action::success`,
    /// or some other value if the policy is otherwise not considered to have succeeded.
    virtual bool is_success() const = 0;

    virtual Policy_Action error(IO_Error_Code) = 0;
    virtual Policy_Action error(const md::Render_Error&) = 0;

    virtual Policy_Action done(Document_Stage) = 0;

    /// @brief Called with the result of rendering, prior to `done(Document_Stage::render)`.
    virtual Policy_Action rendered(const md::Render_Result&) = 0;
};

} // namespace slugmark

#endif
