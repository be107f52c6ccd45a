// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CRITERIA_ERRORS_ERRORS_HPP
#define CRITERIA_ERRORS_ERRORS_HPP

#include <string>
#include <string_view>
#include <typeinfo>

namespace criteria {

  /**
   * @brief Thrown when a stored value cannot be narrowed to the type
   * requested by a conditional lookup.
   */
  class type_mismatch : public std::bad_cast {
  public:
    explicit type_mismatch(std::string message);

    [[nodiscard]] auto what() const noexcept -> const char* override;

  private:
    std::string message_;
  };

  namespace detail {
    // Throw sites live in one translation unit so the container headers
    // stay free of message formatting.

    [[noreturn]] void throw_null_argument(
      std::string_view where, std::string_view parameter);

    [[noreturn]] void throw_null_source_key(std::string_view where);

    [[noreturn]] void throw_key_not_found(
      std::string_view where, std::string_view key);

    [[noreturn]] void throw_type_mismatch(
      const std::type_info& from, const std::type_info& to);
  } // namespace detail

} // namespace criteria

#endif // CRITERIA_ERRORS_ERRORS_HPP
