#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export

namespace strdist::json {

using glz::error_ctx;
using glz::format_error;
using glz::opts;
using glz::read;

}  // namespace strdist::json
