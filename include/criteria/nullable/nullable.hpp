// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CRITERIA_NULLABLE_NULLABLE_HPP
#define CRITERIA_NULLABLE_NULLABLE_HPP

#include <any>
#include <concepts>
#include <cstddef>
#include <optional>
#include <type_traits>

namespace criteria {

  namespace detail {
    template <typename T> constexpr inline bool is_optional_v = false;

    template <typename U>
    constexpr inline bool is_optional_v<std::optional<U>> = true;
  } // namespace detail

  namespace concepts {

    /**
     * @brief Types whose empty state is observable by comparing against
     * nullptr (raw pointers, smart pointers, std::function, ...).
     */
    template <typename T>
    concept null_comparable = !std::is_array_v<T> && !detail::is_optional_v<T>
                              && std::default_initializable<T>
                              && requires(const T& value) {
        { value == nullptr } -> std::convertible_to<bool>;
      };

  } // namespace concepts

  /**
   * @brief Describes the null-equivalent state of a value type.
   *
   * The primary template covers types that have no null state: is_null()
   * is always false and null() yields the value-initialized object, which
   * is what lookups return for an absent key. Specialize this template to
   * teach the container about a custom nullable type.
   */
  template <typename T> struct nullable_traits {
    static constexpr inline bool is_nullable = false;

    [[nodiscard]] static constexpr bool is_null(const T&) noexcept
    {
      return false;
    }

    [[nodiscard]] static constexpr T null() noexcept(
      std::is_nothrow_default_constructible_v<T>)
      requires std::default_initializable<T>
    {
      return T{};
    }
  };

  template <concepts::null_comparable T> struct nullable_traits<T> {
    static constexpr inline bool is_nullable = true;

    [[nodiscard]] static constexpr bool is_null(const T& value) noexcept
    {
      return value == nullptr;
    }

    [[nodiscard]] static constexpr T null() noexcept(
      std::is_nothrow_default_constructible_v<T>)
    {
      return T{};
    }
  };

  template <typename U> struct nullable_traits<std::optional<U>> {
    static constexpr inline bool is_nullable = true;

    [[nodiscard]] static constexpr bool is_null(
      const std::optional<U>& value) noexcept
    {
      return !value.has_value();
    }

    [[nodiscard]] static constexpr std::optional<U> null() noexcept
    {
      return std::nullopt;
    }
  };

  template <> struct nullable_traits<std::any> {
    static constexpr inline bool is_nullable = true;

    [[nodiscard]] static bool is_null(const std::any& value) noexcept
    {
      return !value.has_value();
    }

    [[nodiscard]] static std::any null() noexcept { return std::any{}; }
  };

  template <typename T>
  constexpr inline bool is_nullable_v =
    nullable_traits<std::decay_t<T>>::is_nullable;

  /// The null-equivalent marker for T.
  template <typename T> [[nodiscard]] constexpr auto null_value() -> T
  {
    return nullable_traits<T>::null();
  }

  /// Arrays decay, so a string literal is a non-null const char*.
  template <typename T>
  [[nodiscard]] constexpr auto is_null_value(const T& value) noexcept -> bool
  {
    return nullable_traits<std::decay_t<T>>::is_null(value);
  }

} // namespace criteria

#endif // CRITERIA_NULLABLE_NULLABLE_HPP
