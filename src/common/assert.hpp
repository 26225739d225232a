#ifndef MARKDOWN_ACADEMIC_ASSERT_HPP
#define MARKDOWN_ACADEMIC_ASSERT_HPP

#include <cstdlib>
#include <source_location>
#include <string_view>

namespace markdown_academic {

enum struct Assertion_Error_Type { expression, unreachable };

struct Assertion_Error {
    Assertion_Error_Type type;
    std::string_view message;
    std::source_location location;
};

#ifdef __EXCEPTIONS
#define MARKDOWN_ACADEMIC_RAISE_ASSERTION_ERROR(...) (throw __VA_ARGS__)
#else
#define MARKDOWN_ACADEMIC_RAISE_ASSERTION_ERROR(...) ::std::exit(3)
#endif

// Expects an expression.
// If this expression (after contextual conversion to `bool`) is `false`,
// throws an `Assertion_Error` of type `expression`.
#define MARKDOWN_ACADEMIC_ASSERT(...)                                                              \
    ((__VA_ARGS__) ? void()                                                                        \
                   : MARKDOWN_ACADEMIC_RAISE_ASSERTION_ERROR(::markdown_academic::Assertion_Error { \
                         ::markdown_academic::Assertion_Error_Type::expression, (#__VA_ARGS__),    \
                         ::std::source_location::current() }))

/// Expects a string literal.
/// Unconditionally throws `Assertion_Error` of type `unreachable`.
#define MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE(...)                                                  \
    MARKDOWN_ACADEMIC_RAISE_ASSERTION_ERROR(::markdown_academic::Assertion_Error {                 \
        ::markdown_academic::Assertion_Error_Type::unreachable, ::std::string_view(__VA_ARGS__),   \
        ::std::source_location::current() })

} // namespace markdown_academic

#endif
