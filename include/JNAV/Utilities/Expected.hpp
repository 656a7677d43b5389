/// @file Expected.hpp
/// @brief `JNAV::Utilities::Expected<T, E>`: the value-or-error return type used across the library.
#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace JNAV::Utilities
{
    /// @brief Wrapper used to explicitly construct an error value for `Expected<T, E>`.
    ///
    /// @tparam E Error type.
    template<class E>
    class Unexpected
    {
    public:
        /// @brief Error type.
        using ErrorType = E;

        constexpr explicit Unexpected(const E& error) noexcept(std::is_nothrow_copy_constructible_v<E>)
            : m_error {error}
        {
        }

        constexpr explicit Unexpected(E&& error) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_error {std::move(error)}
        {
        }

        [[nodiscard]] constexpr E&       Error() & noexcept { return m_error; }
        [[nodiscard]] constexpr const E& Error() const& noexcept { return m_error; }
        [[nodiscard]] constexpr E&&      Error() && noexcept { return std::move(m_error); }

    private:
        E m_error;
    };

    /// @brief Holds either a value of type `T` or an error of type `E`.
    ///
    /// `Value()` and `Error()` throw `std::bad_variant_access` when the other alternative is active.
    /// `ValueUnsafe()` and `ErrorUnsafe()` skip that check and require the caller to test `HasValue()` first.
    ///
    /// @tparam T Value type.
    /// @tparam E Error type.
    template<class T, class E>
    class [[nodiscard]] Expected
    {
        static_assert(!std::is_reference_v<T>, "Expected<T&,...> is not supported.");
        static_assert(!std::is_reference_v<E>, "Expected<...,E&> is not supported.");
        static_assert(!std::is_same_v<T, E>, "Expected<T,T> is ambiguous.");

    public:
        using ValueType = T;
        using ErrorType = E;

        constexpr explicit Expected(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
            : m_storage {std::in_place_index<0>, value}
        {
        }

        constexpr explicit Expected(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
            : m_storage {std::in_place_index<0>, std::move(value)}
        {
        }

        constexpr explicit Expected(Unexpected<E>&& unexpected) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_storage {std::in_place_index<1>, std::move(unexpected).Error()}
        {
        }

        constexpr explicit Expected(const Unexpected<E>& unexpected) noexcept(std::is_nothrow_copy_constructible_v<E>)
            : m_storage {std::in_place_index<1>, unexpected.Error()}
        {
        }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_storage.index() == 0; }

        constexpr explicit operator bool() const noexcept { return HasValue(); }

        [[nodiscard]] constexpr T&       Value() & { return std::get<0>(m_storage); }
        [[nodiscard]] constexpr const T& Value() const& { return std::get<0>(m_storage); }
        [[nodiscard]] constexpr T&&      Value() && { return std::get<0>(std::move(m_storage)); }

        [[nodiscard]] constexpr E&       Error() & { return std::get<1>(m_storage); }
        [[nodiscard]] constexpr const E& Error() const& { return std::get<1>(m_storage); }
        [[nodiscard]] constexpr E&&      Error() && { return std::get<1>(std::move(m_storage)); }

        [[nodiscard]] constexpr T&       ValueUnsafe() & noexcept { return *std::get_if<0>(&m_storage); }
        [[nodiscard]] constexpr const T& ValueUnsafe() const& noexcept { return *std::get_if<0>(&m_storage); }
        [[nodiscard]] constexpr T&&      ValueUnsafe() && noexcept { return std::move(*std::get_if<0>(&m_storage)); }

        [[nodiscard]] constexpr E&       ErrorUnsafe() & noexcept { return *std::get_if<1>(&m_storage); }
        [[nodiscard]] constexpr const E& ErrorUnsafe() const& noexcept { return *std::get_if<1>(&m_storage); }
        [[nodiscard]] constexpr E&&      ErrorUnsafe() && noexcept { return std::move(*std::get_if<1>(&m_storage)); }

        /// @brief Returns the contained value, or `fallback` when holding an error.
        [[nodiscard]] constexpr T ValueOr(T fallback) const&
        {
            if (HasValue())
                return ValueUnsafe();
            return fallback;
        }

        [[nodiscard]] constexpr T ValueOr(T fallback) &&
        {
            if (HasValue())
                return std::move(ValueUnsafe());
            return fallback;
        }

        [[nodiscard]] constexpr E ErrorOr(E fallback) const&
        {
            if (!HasValue())
                return ErrorUnsafe();
            return fallback;
        }

        constexpr void Swap(Expected& other) noexcept(std::is_nothrow_swappable_v<std::variant<T, E>>)
        {
            m_storage.swap(other.m_storage);
        }

    private:
        std::variant<T, E> m_storage;
    };

    /// @brief `Expected` specialization for operations that produce no value.
    template<class E>
    class [[nodiscard]] Expected<void, E>
    {
    public:
        using ValueType = void;
        using ErrorType = E;

        constexpr Expected() noexcept = default;

        constexpr explicit Expected(Unexpected<E>&& unexpected) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_error {std::move(unexpected).Error()}
        {
        }

        constexpr explicit Expected(const Unexpected<E>& unexpected) noexcept(std::is_nothrow_copy_constructible_v<E>)
            : m_error {unexpected.Error()}
        {
        }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return !m_error.has_value(); }

        constexpr explicit operator bool() const noexcept { return HasValue(); }

        [[nodiscard]] constexpr E&       Error() & { return m_error.value(); }
        [[nodiscard]] constexpr const E& Error() const& { return m_error.value(); }
        [[nodiscard]] constexpr E&&      Error() && { return std::move(m_error).value(); }

        [[nodiscard]] constexpr E&       ErrorUnsafe() & noexcept { return *m_error; }
        [[nodiscard]] constexpr const E& ErrorUnsafe() const& noexcept { return *m_error; }
        [[nodiscard]] constexpr E&&      ErrorUnsafe() && noexcept { return std::move(*m_error); }

        [[nodiscard]] constexpr E ErrorOr(E fallback) const&
        {
            if (m_error.has_value())
                return *m_error;
            return fallback;
        }

        constexpr void Swap(Expected& other) noexcept(std::is_nothrow_swappable_v<std::optional<E>>)
        {
            m_error.swap(other.m_error);
        }

    private:
        std::optional<E> m_error {};
    };
}// namespace JNAV::Utilities
