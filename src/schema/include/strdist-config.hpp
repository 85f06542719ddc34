#pragma once

#include "edit-costs-config.hpp"
#include "log-config.hpp"

namespace strdist {
namespace schema {

/// Root of the json configuration. Every field is optional and defaults to the values below.
struct StrdistConfig {
  EditCostsConfig costs;
  LogConfig log;
};

}  // namespace schema
}  // namespace strdist
