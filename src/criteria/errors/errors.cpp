// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <stdexcept>
#include <string>
#include <utility>

#include <boost/core/demangle.hpp>

#include <criteria/errors/errors.hpp>

namespace criteria {

  type_mismatch::type_mismatch(std::string message)
      : message_(std::move(message))
  {}

  auto type_mismatch::what() const noexcept -> const char*
  {
    return message_.c_str();
  }

  namespace detail {

    void throw_null_argument(std::string_view where, std::string_view parameter)
    {
      auto message = std::string{where};
      message += " - parameter '";
      message += parameter;
      message += "' cannot be null";
      throw std::invalid_argument(message);
    }

    void throw_null_source_key(std::string_view where)
    {
      auto message = std::string{where};
      message += " - source cannot contain null keys";
      throw std::invalid_argument(message);
    }

    void throw_key_not_found(std::string_view where, std::string_view key)
    {
      auto message = std::string{where};
      message += " - key not found: ";
      message += key;
      throw std::out_of_range(message);
    }

    void throw_type_mismatch(const std::type_info& from, const std::type_info& to)
    {
      throw type_mismatch("cannot narrow " + boost::core::demangle(from.name())
                          + " to " + boost::core::demangle(to.name()));
    }

  } // namespace detail

} // namespace criteria
