#ifndef MARKDOWN_ACADEMIC_META_HPP
#define MARKDOWN_ACADEMIC_META_HPP

#include <type_traits>

namespace markdown_academic {

/// @brief If `C` is true, alias for `const T`, otherwise for `T`.
/// Used to share one visitor implementation between mutable and constant AST traversal.
template <typename T, bool C>
using const_if_t = std::conditional_t<C, const T, T>;

/// @brief Creates an overload set out of multiple lambdas, for use with `std::visit` on
/// `ast::Block` and `ast::Inline`.
template <typename... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};

} // namespace markdown_academic

#endif
