#ifndef MARKDOWN_ACADEMIC_RESULT_HPP
#define MARKDOWN_ACADEMIC_RESULT_HPP

#include <concepts>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace markdown_academic {

struct Bad_Result_Access : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Error_Tag { };
struct Success_Tag { };

inline constexpr Error_Tag error_tag {};
inline constexpr Success_Tag success_tag {};

/// @brief Holds either a value of type `T` or an error of type `Error`.
/// Accessing the side which is not held throws `Bad_Result_Access`.
template <typename T, typename Error>
struct Result {
    static_assert(!std::is_same_v<T, Error>, "Value and error types must be distinguishable.");

private:
    std::variant<T, Error> m_storage;

public:
    [[nodiscard]] constexpr Result(Success_Tag, const T& value)
        requires std::is_copy_constructible_v<T>
        : m_storage(std::in_place_index<0>, value)
    {
    }

    [[nodiscard]] constexpr Result(Success_Tag, T&& value)
        requires std::is_move_constructible_v<T>
        : m_storage(std::in_place_index<0>, std::move(value))
    {
    }

    [[nodiscard]] constexpr Result(Error_Tag, const Error& error)
        requires std::is_copy_constructible_v<Error>
        : m_storage(std::in_place_index<1>, error)
    {
    }

    [[nodiscard]] constexpr Result(Error_Tag, Error&& error)
        requires std::is_move_constructible_v<Error>
        : m_storage(std::in_place_index<1>, std::move(error))
    {
    }

    [[nodiscard]] constexpr Result(const T& value)
        requires std::is_copy_constructible_v<T>
        : m_storage(std::in_place_index<0>, value)
    {
    }

    [[nodiscard]] constexpr Result(T&& value)
        requires std::is_move_constructible_v<T>
        : m_storage(std::in_place_index<0>, std::move(value))
    {
    }

    [[nodiscard]] constexpr Result(const Error& error)
        requires std::is_copy_constructible_v<Error>
        : m_storage(std::in_place_index<1>, error)
    {
    }

    [[nodiscard]] constexpr Result(Error&& error)
        requires std::is_move_constructible_v<Error>
        : m_storage(std::in_place_index<1>, std::move(error))
    {
    }

    [[nodiscard]] constexpr bool has_value() const noexcept
    {
        return m_storage.index() == 0;
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]] constexpr const T* operator->() const
    {
        return std::addressof(checked_value("bad result access in operator->"));
    }

    [[nodiscard]] constexpr T* operator->()
    {
        return std::addressof(checked_value("bad result access in operator->"));
    }

    [[nodiscard]] constexpr const T& operator*() const&
    {
        return checked_value("bad result access in operator*");
    }

    [[nodiscard]] constexpr T& operator*() &
    {
        return checked_value("bad result access in operator*");
    }

    [[nodiscard]] constexpr T&& operator*() &&
    {
        return std::move(checked_value("bad result access in operator*"));
    }

    [[nodiscard]] constexpr const T& value() const&
    {
        return checked_value("bad result access in value()");
    }

    [[nodiscard]] constexpr T& value() &
    {
        return checked_value("bad result access in value()");
    }

    [[nodiscard]] constexpr T&& value() &&
    {
        return std::move(checked_value("bad result access in value()"));
    }

    [[nodiscard]] constexpr const Error& error() const&
    {
        return checked_error();
    }

    [[nodiscard]] constexpr Error& error() &
    {
        return checked_error();
    }

    [[nodiscard]] constexpr Error&& error() &&
    {
        return std::move(checked_error());
    }

private:
    [[nodiscard]] constexpr T& checked_value(const char* message)
    {
        if (T* const result = std::get_if<0>(&m_storage)) {
            return *result;
        }
        throw Bad_Result_Access { message };
    }

    [[nodiscard]] constexpr const T& checked_value(const char* message) const
    {
        if (const T* const result = std::get_if<0>(&m_storage)) {
            return *result;
        }
        throw Bad_Result_Access { message };
    }

    [[nodiscard]] constexpr Error& checked_error()
    {
        if (Error* const result = std::get_if<1>(&m_storage)) {
            return *result;
        }
        throw Bad_Result_Access { "bad result access in error()" };
    }

    [[nodiscard]] constexpr const Error& checked_error() const
    {
        if (const Error* const result = std::get_if<1>(&m_storage)) {
            return *result;
        }
        throw Bad_Result_Access { "bad result access in error()" };
    }
};

// =================================================================================================

template <typename Error>
struct Result<void, Error> {
private:
    std::optional<Error> m_error;

public:
    [[nodiscard]] constexpr Result() noexcept = default;

    [[nodiscard]] constexpr Result(const Error& error)
        requires std::is_copy_constructible_v<Error>
        : m_error(error)
    {
    }

    [[nodiscard]] constexpr Result(Error&& error)
        requires std::is_move_constructible_v<Error>
        : m_error(std::move(error))
    {
    }

    [[nodiscard]] constexpr bool has_value() const noexcept
    {
        return !m_error.has_value();
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    constexpr void value() const
    {
        if (m_error) {
            throw Bad_Result_Access { "bad result access in value()" };
        }
    }

    [[nodiscard]] constexpr const Error& error() const&
    {
        if (!m_error) {
            throw Bad_Result_Access { "bad result access in error()" };
        }
        return *m_error;
    }

    [[nodiscard]] constexpr Error& error() &
    {
        if (!m_error) {
            throw Bad_Result_Access { "bad result access in error()" };
        }
        return *m_error;
    }

    [[nodiscard]] constexpr Error&& error() &&
    {
        if (!m_error) {
            throw Bad_Result_Access { "bad result access in error()" };
        }
        return std::move(*m_error);
    }
};

} // namespace markdown_academic

#endif
