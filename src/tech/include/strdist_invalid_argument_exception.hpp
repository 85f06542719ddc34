#pragma once

#include <utility>

#include "strdist_exception.hpp"
#include "strdist_format.hpp"

namespace strdist {

/// Thrown when a caller supplied value cannot be accepted (negative cost, null string, unknown name...).
class invalid_argument : public exception {
 public:
  template <int N>
  explicit invalid_argument(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
      : exception(str) {}

  template <typename... Args>
  explicit invalid_argument(format_string<Args...> fmt, Args&&... args) : exception(fmt, std::forward<Args>(args)...) {}
};

}  // namespace strdist
