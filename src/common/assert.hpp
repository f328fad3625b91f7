#ifndef METAMARK_ASSERT_HPP
#define METAMARK_ASSERT_HPP

#include <cstdlib>
#include <source_location>
#include <string_view>

namespace metamark {

enum struct Assertion_Error_Type { expression, unreachable };

struct Assertion_Error {
    Assertion_Error_Type type;
    std::string_view message;
    std::source_location location;
};

#ifdef __EXCEPTIONS
#define METAMARK_RAISE_ASSERTION_ERROR(...) (throw __VA_ARGS__)
#else
#define METAMARK_RAISE_ASSERTION_ERROR(...) ::std::exit(3)
#endif

// Expects an expression.
// If this expression (after contextual conversion to `bool`) is `false`,
// throws an `Assertion_Error` of type `expression`.
#define METAMARK_ASSERT(...)                                                                       \
    ((__VA_ARGS__) ? void()                                                                        \
                   : METAMARK_RAISE_ASSERTION_ERROR(::metamark::Assertion_Error {                  \
                         ::metamark::Assertion_Error_Type::expression, (#__VA_ARGS__),             \
                         ::std::source_location::current() }))

/// Expects a string literal.
/// Unconditionally throws `Assertion_Error` of type `unreachable`.
#define METAMARK_ASSERT_UNREACHABLE(...)                                                           \
    METAMARK_RAISE_ASSERTION_ERROR(::metamark::Assertion_Error {                                   \
        ::metamark::Assertion_Error_Type::unreachable, ::std::string_view(__VA_ARGS__),            \
        ::std::source_location::current() })

} // namespace metamark

#endif
