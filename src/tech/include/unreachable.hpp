#pragma once

#include "strdist_config.hpp"

namespace strdist {

[[noreturn]] STRDIST_ALWAYS_INLINE void unreachable() {
#if defined(__GNUC__)
  __builtin_unreachable();
#elif defined(STRDIST_MSVC)
  __assume(0);
#else
#error "To be implemented"
#endif
}

}  // namespace strdist
