// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CRITERIA_PREDICATES_PREDICATES_HPP
#define CRITERIA_PREDICATES_PREDICATES_HPP

#include <concepts>
#include <string_view>
#include <type_traits>

#include <criteria/errors/errors.hpp>
#include <criteria/nullable/nullable.hpp>

// clang-format off

namespace criteria {
  // =============================================================================
  // Generic predicates
  // =============================================================================

  constexpr inline struct is_null_fn {
    template<typename T>
    [[nodiscard]] static constexpr bool operator ()(T const &value) noexcept {
      return is_null_value(value);
    }
  } const is_null { };

  constexpr inline struct is_not_null_fn {
    template<typename T>
    [[nodiscard]] static constexpr bool operator ()(T const &value) noexcept {
      return !is_null_value(value);
    }
  } const is_not_null { };

  // =============================================================================
  // String predicates
  // =============================================================================

  namespace concepts {
    template<typename T>
    concept string_like = std::convertible_to<T const &, std::string_view>;

    /**
     * @brief A string, or a nullable handle to one (const char*,
     * std::optional<std::string>, std::shared_ptr<std::string>, ...).
     */
    template<typename T>
    concept nullable_string = string_like<T> || (is_nullable_v<T> && requires(T const &value) {
      { *value } -> string_like;
    });
  }

  namespace detail {
    /// Precondition: !is_null_value(value).
    template<concepts::nullable_string T>
    [[nodiscard]] constexpr std::string_view as_string_view(T const &value) noexcept {
      if constexpr (concepts::string_like<T>) {
        return std::string_view { value };
      } else {
        return std::string_view { *value };
      }
    }

    template<concepts::nullable_string T>
    [[nodiscard]] constexpr std::string_view require_string(std::string_view where, T const &value) {
      if (is_null_value(value)) {
        throw_null_argument(where, "value");
      }
      return as_string_view(value);
    }
  }

  constexpr inline struct string_is_null_fn {
    template<concepts::nullable_string T>
    [[nodiscard]] static constexpr bool operator ()(T const &value) noexcept {
      return is_null_value(value);
    }
  } const string_is_null { };

  constexpr inline struct string_not_null_fn {
    template<concepts::nullable_string T>
    [[nodiscard]] static constexpr bool operator ()(T const &value) noexcept {
      return !is_null_value(value);
    }
  } const string_not_null { };

  /// @throws std::invalid_argument if the value is null.
  constexpr inline struct string_is_empty_fn {
    template<concepts::nullable_string T>
    [[nodiscard]] static constexpr bool operator ()(T const &value) {
      return detail::require_string("string_is_empty", value).empty();
    }
  } const string_is_empty { };

  /// @throws std::invalid_argument if the value is null.
  constexpr inline struct string_not_empty_fn {
    template<concepts::nullable_string T>
    [[nodiscard]] static constexpr bool operator ()(T const &value) {
      return !detail::require_string("string_not_empty", value).empty();
    }
  } const string_not_empty { };

  constexpr inline struct string_not_null_not_empty_fn {
    template<concepts::nullable_string T>
    [[nodiscard]] static constexpr bool operator ()(T const &value) noexcept {
      return !is_null_value(value) && !detail::as_string_view(value).empty();
    }
  } const string_not_null_not_empty { };

  constexpr inline struct string_not_null_but_empty_fn {
    template<concepts::nullable_string T>
    [[nodiscard]] static constexpr bool operator ()(T const &value) noexcept {
      return !is_null_value(value) && detail::as_string_view(value).empty();
    }
  } const string_not_null_but_empty { };
}

// clang-format on

#endif // CRITERIA_PREDICATES_PREDICATES_HPP
