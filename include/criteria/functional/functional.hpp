// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CRITERIA_FUNCTIONAL_FUNCTIONAL_HPP
#define CRITERIA_FUNCTIONAL_FUNCTIONAL_HPP

#include <concepts>
#include <functional>
#include <ranges>
#include <string_view>
#include <type_traits>

#include <function2/function2.hpp>

#include <criteria/errors/errors.hpp>

// clang-format off

namespace criteria {
  /// Type-erased admission condition. A default-constructed predicate is null.
  template<typename T>
  using predicate = fu2::function<bool(T const &) const>;

  /// Type-erased side-effecting callback. A default-constructed action is null.
  template<typename T>
  using action = fu2::function<void(T const &)>;

  namespace concepts {
    // nullptr is accepted wherever a callable is, so that passing it
    // reaches the null check instead of failing overload resolution.

    template<typename P, typename T>
    concept predicate_for = std::is_null_pointer_v<std::remove_cvref_t<P>>
      || std::predicate<P const &, T const &>;

    template<typename A, typename... Args>
    concept action_for = std::is_null_pointer_v<std::remove_cvref_t<A>>
      || std::invocable<A &, Args const &...>;

    template<typename R, typename T>
    concept predicate_range = std::ranges::input_range<R const>
      && predicate_for<std::ranges::range_value_t<R const>, T>;
  }

  /**
   * @brief True if a callable is in its null state: nullptr, a null
   * function pointer, or a type-erased wrapper whose explicit operator
   * bool reports empty. Lambdas and ordinary function objects are never
   * null.
   */
  constexpr inline struct is_null_callable_fn {
    template<typename F>
    [[nodiscard]] static constexpr bool operator ()(F const &callable) noexcept {
      if constexpr (std::is_null_pointer_v<F>) {
        return true;
      } else if constexpr (std::is_pointer_v<F> || std::is_member_pointer_v<F>) {
        return callable == nullptr;
      } else if constexpr (std::is_constructible_v<bool, F const &>
                           && !std::is_convertible_v<F const &, bool>) {
        return !static_cast<bool>(callable);
      } else {
        return false;
      }
    }
  } const is_null_callable { };

  namespace detail {
    template<typename F>
    void require_callable(std::string_view where, std::string_view parameter, F const &callable) {
      if (is_null_callable(callable)) {
        throw_null_argument(where, parameter);
      }
    }

    /// Upfront pass: every predicate is checked before any is evaluated.
    template<typename... Ps>
    void require_predicates(std::string_view where, Ps const &...predicates) {
      (require_callable(where, "predicate", predicates), ...);
    }

    template<std::ranges::input_range R>
    void require_predicate_range(std::string_view where, R const &predicates) {
      for (auto const &predicate : predicates) {
        require_callable(where, "predicate", predicate);
      }
    }

    template<typename T, typename P>
    [[nodiscard]] bool test_one(std::string_view where, P const &predicate, T const &value) {
      require_callable(where, "predicate", predicate);

      if constexpr (std::is_null_pointer_v<P>) {
        return false;
      } else {
        return static_cast<bool>(std::invoke(predicate, value));
      }
    }

    /**
     * @brief Logical AND over the predicates, left to right.
     *
     * Each predicate is null-checked immediately before it is invoked and
     * evaluation stops at the first false result, so a null predicate
     * after a failing one is never seen.
     */
    template<typename T, typename... Ps>
    [[nodiscard]] bool test_all(std::string_view where, T const &value, Ps const &...predicates) {
      return (test_one(where, predicates, value) && ...);
    }

    template<typename T, std::ranges::input_range R>
    [[nodiscard]] bool test_range(std::string_view where, T const &value, R const &predicates) {
      for (auto const &predicate : predicates) {
        if (!test_one(where, predicate, value)) {
          return false;
        }
      }

      return true;
    }
  }
}

// clang-format on

#endif // CRITERIA_FUNCTIONAL_FUNCTIONAL_HPP
