#pragma once

#include "editcosts.hpp"

namespace strdist {
namespace schema {

struct EditCostsConfig {
  double addCost{EditCosts::kDefaultAddCost};
  double removeCost{EditCosts::kDefaultRemoveCost};
  double changeCost{EditCosts::kDefaultChangeCost};
};

}  // namespace schema
}  // namespace strdist
