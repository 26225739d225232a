#ifndef MARKDOWN_ACADEMIC_FUNCTION_REF_HPP
#define MARKDOWN_ACADEMIC_FUNCTION_REF_HPP

#include <concepts>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "common/assert.hpp"

namespace markdown_academic {

template <typename F>
struct Function_Ref;

/// @brief A non-owning, type-erased reference to something callable as `R(Args...)`.
/// The referenced callable must outlive the `Function_Ref`.
/// A default-constructed `Function_Ref` is empty and must not be called.
template <typename R, typename... Args>
struct Function_Ref<R(Args...)> {
private:
    R (*m_invoker)(void*, Args...) = nullptr;
    void* m_entity = nullptr;

    template <typename F>
    static R call_object(void* entity, Args... args)
    {
        return std::invoke(*static_cast<F*>(entity), std::forward<Args>(args)...);
    }

    static R call_function(void* entity, Args... args)
    {
        // Function pointers are stored in the object pointer, which is conditionally-supported
        // but fine on all relevant platforms.
        auto* const function = reinterpret_cast<R (*)(Args...)>(entity);
        return function(std::forward<Args>(args)...);
    }

public:
    [[nodiscard]] constexpr Function_Ref() noexcept = default;

    /// @brief Binds to a function pointer, or to anything convertible to one,
    /// such as a captureless lambda.
    /// Both lvalues and rvalues are accepted in that case.
    template <typename F>
        requires std::is_convertible_v<F&&, R (*)(Args...)>
        && (!std::same_as<std::remove_cvref_t<F>, Function_Ref>)
    [[nodiscard]] Function_Ref(F&& f) noexcept
        : m_invoker { &call_function }
        , m_entity { reinterpret_cast<void*>(static_cast<R (*)(Args...)>(f)) }
    {
    }

    /// @brief Binds to a callable lvalue, such as a lambda with captures.
    template <typename F>
        requires(!std::is_convertible_v<F&, R (*)(Args...)>)
        && (!std::same_as<std::remove_cv_t<F>, Function_Ref>)
        && std::is_invocable_r_v<R, F&, Args...>
    [[nodiscard]] Function_Ref(F& f) noexcept
        : m_invoker { &call_object<F> }
        , m_entity { const_cast<void*>(static_cast<const void*>(std::addressof(f))) }
    {
    }

    R operator()(Args... args) const
    {
        MARKDOWN_ACADEMIC_ASSERT(m_invoker);
        return m_invoker(m_entity, std::forward<Args>(args)...);
    }

    [[nodiscard]] constexpr bool has_value() const noexcept
    {
        return m_invoker != nullptr;
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }
};

} // namespace markdown_academic

#endif
