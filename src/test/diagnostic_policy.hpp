#ifndef METAMARK_DIAGNOSTIC_POLICY_HPP
#define METAMARK_DIAGNOSTIC_POLICY_HPP

#include "common/io_error.hpp"

#include "mmk/fwd.hpp"

#include "test/compilation_stage.hpp"

namespace metamark {

enum struct Policy_Action {
    /// @brief Immediate success.
    success,
    /// @brief Immediate failure.
    failure,
    /// @brief Keep going.
    keep_going
};

/// @brief A polymorphic class for deciding which `Policy_Action` to take when various diagnostics
/// are raised throughout testing.
/// Diagnostic policies are stateful, i.e. they are required to remember failures and keep these
/// consistent with `is_success()`.
struct Diagnostic_Policy {
    /// @brief Returns `true` if the policy has succeeded.
    [[nodiscard]] virtual bool is_success() const = 0;

    virtual Policy_Action error(IO_Error_Code) = 0;
    virtual Policy_Action error(const mmk::Document_Error&) = 0;
    virtual Policy_Action error(mmk::Write_Error_Code) = 0;

    virtual Policy_Action done(Document_Stage) = 0;

    virtual ~Diagnostic_Policy() = default;
};

} // namespace metamark

#endif
