#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

#include "distancealgorithm.hpp"
#include "editcosts.hpp"

namespace strdist {

/// Computes the minimal cost to transform a word into another one with single character additions, removals and
/// changes, each of them weighted by the EditCosts given at construction.
/// Three evaluators are proposed, they all return the same value and only differ in their complexity:
///  - naive: plain recursion on the words prefixes, exponential in time. Only suitable for small words.
///  - memoized: same recursion, with results of suffix pairs cached in this object. The cache is kept between calls
///    and is never evicted automatically, use clearCache() to release it.
///  - iterative: bottom-up filling of a (|word2| + 1) x (|word1| + 1) matrix, in O(|word1| * |word2|) time and space.
/// Naive and iterative evaluators are const and can be called concurrently. The memoized one modifies the cache and
/// calls on the same object should be externally synchronized.
class StringDistanceCalculator {
 public:
  /// Above this total length of both words, the naive evaluator logs a warning suggesting the iterative one.
  static constexpr std::size_t kNaiveRecommendedMaxTotalLength = 24;

  explicit StringDistanceCalculator(EditCosts editCosts = EditCosts());

  /// Computes the distance between word1 and word2 with the naive recursive evaluator.
  double distanceNaive(std::string_view word1, std::string_view word2) const;

  /// Same as above, throws invalid_argument if one of the words is null.
  double distanceNaive(const char *word1, const char *word2) const;

  /// Computes the distance between word1 and word2 with the memoized recursive evaluator.
  double distanceMemoized(std::string_view word1, std::string_view word2);

  /// Same as above, throws invalid_argument if one of the words is null.
  double distanceMemoized(const char *word1, const char *word2);

  /// Computes the distance between word1 and word2 with the iterative matrix evaluator.
  double distanceIterative(std::string_view word1, std::string_view word2) const;

  /// Same as above, throws invalid_argument if one of the words is null.
  double distanceIterative(const char *word1, const char *word2) const;

  /// Computes the distance between word1 and word2 with given evaluator.
  double distance(std::string_view word1, std::string_view word2, DistanceAlgorithm algorithm);

  const EditCosts &editCosts() const { return _editCosts; }

  /// Number of suffix pairs currently stored in the memoization cache.
  std::size_t cacheSize() const { return _cache.size(); }

  /// Number of suffix pairs that the memoized evaluator had to compute (cache misses on differing first characters)
  /// since construction or last cache clear.
  int64_t nbFreshComputations() const { return _nbFreshComputations; }

  void clearCache() noexcept;

 private:
  struct SuffixPair {
    std::string word1Suffix;
    std::string word2Suffix;
  };

  struct SuffixPairView {
    std::string_view word1Suffix;
    std::string_view word2Suffix;
  };

  // Hash and equality are transparent so that lookups are made from views without allocating the key
  struct SuffixPairHash {
    using is_transparent = void;

    std::size_t operator()(const SuffixPair &suffixPair) const noexcept {
      return (*this)(SuffixPairView{suffixPair.word1Suffix, suffixPair.word2Suffix});
    }

    std::size_t operator()(SuffixPairView suffixPairView) const noexcept;
  };

  struct SuffixPairEqual {
    using is_transparent = void;

    bool operator()(const auto &lhs, const auto &rhs) const noexcept {
      return std::string_view(lhs.word1Suffix) == std::string_view(rhs.word1Suffix) &&
             std::string_view(lhs.word2Suffix) == std::string_view(rhs.word2Suffix);
    }
  };

  using Cache = std::unordered_map<SuffixPair, double, SuffixPairHash, SuffixPairEqual>;

  double memoizedDistance(std::string_view word1Suffix, std::string_view word2Suffix);

  EditCosts _editCosts;
  Cache _cache;
  int64_t _nbFreshComputations = 0;
};

}  // namespace strdist
