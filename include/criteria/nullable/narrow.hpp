// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CRITERIA_NULLABLE_NARROW_HPP
#define CRITERIA_NULLABLE_NARROW_HPP

#include <any>
#include <concepts>
#include <memory>
#include <type_traits>
#include <typeinfo>

#include <criteria/errors/errors.hpp>
#include <criteria/nullable/nullable.hpp>

namespace criteria {

  /**
   * @brief Checked conversion of a stored value of type From to a
   * narrower type To.
   *
   * Provided for the identity conversion, for std::any, and for
   * std::shared_ptr downcasts along a polymorphic hierarchy. A null value
   * narrows to the null marker of To; a non-null value of the wrong
   * dynamic type raises type_mismatch.
   */
  template <typename From, typename To> struct narrow_traits;

  template <typename T> struct narrow_traits<T, T> {
    [[nodiscard]] static constexpr auto narrow(const T& value) noexcept
      -> const T&
    {
      return value;
    }
  };

  template <typename To>
    requires(!std::same_as<To, std::any>) && std::copy_constructible<To>
  struct narrow_traits<std::any, To> {
    [[nodiscard]] static auto narrow(const std::any& value) -> To
    {
      if (!value.has_value()) {
        if constexpr (is_nullable_v<To>) {
          return null_value<To>();
        } else {
          detail::throw_type_mismatch(typeid(void), typeid(To));
        }
      }

      if (const auto* held = std::any_cast<To>(&value)) {
        return *held;
      }

      detail::throw_type_mismatch(value.type(), typeid(To));
    }
  };

  template <typename From, typename To>
    requires(!std::same_as<From, To>) && std::derived_from<To, From>
            && std::is_polymorphic_v<From>
  struct narrow_traits<std::shared_ptr<From>, std::shared_ptr<To>> {
    [[nodiscard]] static auto narrow(const std::shared_ptr<From>& value)
      -> std::shared_ptr<To>
    {
      if (value == nullptr) {
        return nullptr;
      }

      if (auto narrowed = std::dynamic_pointer_cast<To>(value)) {
        return narrowed;
      }

      const auto& held = *value;
      detail::throw_type_mismatch(typeid(held), typeid(To));
    }
  };

  namespace concepts {

    template <typename From, typename To>
    concept narrowable_to = requires(const From& value) {
      { narrow_traits<From, To>::narrow(value) } -> std::convertible_to<To>;
    };

  } // namespace concepts

  template <typename To, typename From>
    requires concepts::narrowable_to<From, To>
  [[nodiscard]] constexpr decltype(auto) narrow(const From& value)
  {
    return narrow_traits<From, To>::narrow(value);
  }

} // namespace criteria

#endif // CRITERIA_NULLABLE_NARROW_HPP
