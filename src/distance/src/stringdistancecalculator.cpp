#include "stringdistancecalculator.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "distancealgorithm.hpp"
#include "editcosts.hpp"
#include "strdist_config.hpp"
#include "strdist_hash.hpp"
#include "strdist_invalid_argument_exception.hpp"
#include "strdist_log.hpp"
#include "unreachable.hpp"

namespace strdist {

namespace {

std::string_view CheckedWord(const char *word, std::string_view wordName) {
  if (STRDIST_UNLIKELY(word == nullptr)) {
    throw invalid_argument("Null {} word given to string distance calculator", wordName);
  }
  return word;
}

/// Cost of the remaining characters when at least one of the words is fully consumed.
/// Should only be called if one of them is empty.
double ConsumedWordDistance(std::string_view word1Suffix, std::string_view word2Suffix, const EditCosts &editCosts) {
  if (word1Suffix.empty()) {
    return static_cast<double>(word2Suffix.size()) * editCosts.addCost();
  }
  return static_cast<double>(word1Suffix.size()) * editCosts.removeCost();
}

double NaiveDistance(std::string_view word1Suffix, std::string_view word2Suffix, const EditCosts &editCosts) {
  if (word1Suffix.empty() || word2Suffix.empty()) {
    return ConsumedWordDistance(word1Suffix, word2Suffix, editCosts);
  }
  if (word1Suffix.front() == word2Suffix.front()) {
    return NaiveDistance(word1Suffix.substr(1), word2Suffix.substr(1), editCosts);
  }
  return std::min({editCosts.addCost() + NaiveDistance(word1Suffix, word2Suffix.substr(1), editCosts),
                   editCosts.removeCost() + NaiveDistance(word1Suffix.substr(1), word2Suffix, editCosts),
                   editCosts.changeCost() + NaiveDistance(word1Suffix.substr(1), word2Suffix.substr(1), editCosts)});
}

}  // namespace

std::size_t StringDistanceCalculator::SuffixPairHash::operator()(SuffixPairView suffixPairView) const noexcept {
  std::hash<std::string_view> hasher;
  return HashCombine(hasher(suffixPairView.word1Suffix), hasher(suffixPairView.word2Suffix));
}

StringDistanceCalculator::StringDistanceCalculator(EditCosts editCosts) : _editCosts(editCosts) {
  log::debug("String distance calculator created with costs {}", _editCosts);
}

double StringDistanceCalculator::distanceNaive(std::string_view word1, std::string_view word2) const {
  if (word1.size() + word2.size() > kNaiveRecommendedMaxTotalLength) {
    log::warn("Naive distance evaluation of words of sizes {} and {} may be very slow, prefer the {} evaluator",
              word1.size(), word2.size(), kDistanceAlgorithmIterativeStr);
  }
  return NaiveDistance(word1, word2, _editCosts);
}

double StringDistanceCalculator::distanceNaive(const char *word1, const char *word2) const {
  return distanceNaive(CheckedWord(word1, "first"), CheckedWord(word2, "second"));
}

double StringDistanceCalculator::distanceMemoized(std::string_view word1, std::string_view word2) {
  const auto nbFreshComputationsBefore = _nbFreshComputations;
  const double cost = memoizedDistance(word1, word2);
  log::trace("Memoized distance {} computed with {} new suffix pairs, {} in cache", cost,
             _nbFreshComputations - nbFreshComputationsBefore, _cache.size());
  return cost;
}

double StringDistanceCalculator::distanceMemoized(const char *word1, const char *word2) {
  return distanceMemoized(CheckedWord(word1, "first"), CheckedWord(word2, "second"));
}

double StringDistanceCalculator::memoizedDistance(std::string_view word1Suffix, std::string_view word2Suffix) {
  if (word1Suffix.empty() || word2Suffix.empty()) {
    return ConsumedWordDistance(word1Suffix, word2Suffix, _editCosts);
  }

  // Pairs starting with the same character are not stored, their cost is the one of the reduced pair
  if (word1Suffix.front() == word2Suffix.front()) {
    return memoizedDistance(word1Suffix.substr(1), word2Suffix.substr(1));
  }

  auto it = _cache.find(SuffixPairView{word1Suffix, word2Suffix});
  if (it != _cache.end()) {
    return it->second;
  }

  const double cost =
      std::min({_editCosts.addCost() + memoizedDistance(word1Suffix, word2Suffix.substr(1)),
                _editCosts.removeCost() + memoizedDistance(word1Suffix.substr(1), word2Suffix),
                _editCosts.changeCost() + memoizedDistance(word1Suffix.substr(1), word2Suffix.substr(1))});

  _cache.emplace(SuffixPair{std::string(word1Suffix), std::string(word2Suffix)}, cost);
  ++_nbFreshComputations;

  return cost;
}

double StringDistanceCalculator::distanceIterative(std::string_view word1, std::string_view word2) const {
  using size_type = std::string_view::size_type;

  // One column per consumed character of word1, one row per produced character of word2
  const auto nbCols = word1.size() + static_cast<size_type>(1);
  const auto nbRows = word2.size() + static_cast<size_type>(1);

  std::vector<double> costs(nbRows * nbCols);

  auto cell = [&costs, nbCols](size_type row, size_type col) -> double & { return costs[row * nbCols + col]; };

  for (size_type col = 0; col < nbCols; ++col) {
    cell(0, col) = static_cast<double>(col) * _editCosts.removeCost();
  }
  for (size_type row = 1; row < nbRows; ++row) {
    cell(row, 0) = static_cast<double>(row) * _editCosts.addCost();
  }

  for (size_type row = 1; row < nbRows; ++row) {
    for (size_type col = 1; col < nbCols; ++col) {
      const double changeCost = word1[col - 1] == word2[row - 1] ? 0 : _editCosts.changeCost();

      cell(row, col) = std::min({cell(row - 1, col) + _editCosts.addCost(),
                                 cell(row, col - 1) + _editCosts.removeCost(), cell(row - 1, col - 1) + changeCost});
    }
  }

  return cell(nbRows - 1, nbCols - 1);
}

double StringDistanceCalculator::distanceIterative(const char *word1, const char *word2) const {
  return distanceIterative(CheckedWord(word1, "first"), CheckedWord(word2, "second"));
}

double StringDistanceCalculator::distance(std::string_view word1, std::string_view word2,
                                          DistanceAlgorithm algorithm) {
  switch (algorithm) {
    case DistanceAlgorithm::kNaive:
      return distanceNaive(word1, word2);
    case DistanceAlgorithm::kMemoized:
      return distanceMemoized(word1, word2);
    case DistanceAlgorithm::kIterative:
      return distanceIterative(word1, word2);
    default:
      unreachable();
  }
}

void StringDistanceCalculator::clearCache() noexcept {
  log::debug("Clearing {} cached suffix pairs", _cache.size());
  _cache.clear();
  _nbFreshComputations = 0;
}

}  // namespace strdist
