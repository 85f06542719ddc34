#pragma once

#include <ostream>

#include "strdist_format.hpp"

namespace strdist {

/// Weights of the three single character edit operations used to transform a string A into a string B:
///  - add: insert a character of B
///  - remove: delete a character of A
///  - change: substitute a character of A by a different character of B
/// All costs are finite and non negative, they cannot be modified once the object is built.
class EditCosts {
 public:
  static constexpr double kDefaultAddCost = 1;
  static constexpr double kDefaultRemoveCost = 1;
  static constexpr double kDefaultChangeCost = 1.5;

  /// Builds the default cost model (add 1, remove 1, change 1.5).
  constexpr EditCosts() noexcept = default;

  /// Builds a cost model from given values.
  /// Throws invalid_argument if any of them is negative or not finite.
  EditCosts(double addCost, double removeCost, double changeCost);

  double addCost() const { return _addCost; }
  double removeCost() const { return _removeCost; }
  double changeCost() const { return _changeCost; }

  /// Get the cost model obtained by exchanging add and remove costs.
  /// Transforming B into A with the returned model costs as much as transforming A into B with this one.
  [[nodiscard]] EditCosts withAddRemoveSwapped() const { return {_removeCost, _addCost, _changeCost}; }

  bool operator==(const EditCosts &) const noexcept = default;

  friend std::ostream &operator<<(std::ostream &os, const EditCosts &editCosts);

 private:
  double _addCost = kDefaultAddCost;
  double _removeCost = kDefaultRemoveCost;
  double _changeCost = kDefaultChangeCost;
};

}  // namespace strdist

template <>
struct fmt::formatter<strdist::EditCosts> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    const auto end = ctx.end();
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const strdist::EditCosts &editCosts, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "add {} remove {} change {}", editCosts.addCost(), editCosts.removeCost(),
                          editCosts.changeCost());
  }
};
