// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CRITERIA_CONTAINER_KEY_REF_HPP
#define CRITERIA_CONTAINER_KEY_REF_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <criteria/errors/errors.hpp>

namespace criteria {

  /**
   * @brief Non-owning, nullable reference to a container key.
   *
   * Keys stored in a criteria_container are never null, but callers may
   * hold keys in nullable forms (a C string, an optional). key_ref carries
   * that null state to the container so it can reject it.
   *
   * The referenced characters must outlive the key_ref; it is meant to be
   * used as a by-value function parameter only.
   */
  class key_ref {
  public:
    constexpr key_ref(std::nullptr_t) noexcept {}

    constexpr key_ref(std::nullopt_t) noexcept {}

    constexpr key_ref(const char* key) noexcept
    {
      if (key != nullptr) {
        key_ = std::string_view{key};
      }
    }

    constexpr key_ref(std::string_view key) noexcept
        : key_{key}
    {}

    constexpr key_ref(const std::string& key) noexcept
        : key_{std::string_view{key}}
    {}

    constexpr key_ref(std::optional<std::string_view> key) noexcept
        : key_{key}
    {}

    constexpr key_ref(const std::optional<std::string>& key) noexcept
    {
      if (key.has_value()) {
        key_ = std::string_view{*key};
      }
    }

    [[nodiscard]] constexpr auto is_null() const noexcept -> bool
    {
      return !key_.has_value();
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept
    {
      return key_.has_value();
    }

    /// Precondition: !is_null().
    [[nodiscard]] constexpr auto operator*() const noexcept -> std::string_view
    {
      return *key_;
    }

    /**
     * @brief Returns the referenced key, rejecting the null key.
     * @throws std::invalid_argument naming @p where if the key is null.
     */
    [[nodiscard]] auto value(std::string_view where) const -> std::string_view
    {
      if (!key_.has_value()) {
        detail::throw_null_argument(where, "key");
      }
      return *key_;
    }

  private:
    std::optional<std::string_view> key_;
  };

} // namespace criteria

#endif // CRITERIA_CONTAINER_KEY_REF_HPP
