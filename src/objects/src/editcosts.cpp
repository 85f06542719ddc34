#include "editcosts.hpp"

#include <cmath>
#include <ostream>
#include <string_view>

#include "strdist_invalid_argument_exception.hpp"

namespace strdist {

namespace {
double CheckCost(double cost, std::string_view costName) {
  // Negative edges would break the optimality of the recurrence, NaN would break any comparison
  if (!std::isfinite(cost) || cost < 0) {
    throw invalid_argument("Invalid {} cost {}, it should be a finite non negative number", costName, cost);
  }
  return cost;
}
}  // namespace

EditCosts::EditCosts(double addCost, double removeCost, double changeCost)
    : _addCost(CheckCost(addCost, "add")),
      _removeCost(CheckCost(removeCost, "remove")),
      _changeCost(CheckCost(changeCost, "change")) {}

std::ostream &operator<<(std::ostream &os, const EditCosts &editCosts) {
  os << format("{}", editCosts);
  return os;
}

}  // namespace strdist
