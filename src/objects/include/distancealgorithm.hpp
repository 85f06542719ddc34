#pragma once

#include <cstdint>
#include <string_view>

namespace strdist {
enum class DistanceAlgorithm : int8_t {
  kNaive,      // plain recursion, exponential time
  kMemoized,   // recursion with a per calculator suffix pair cache
  kIterative,  // bottom-up matrix filling, O(|A|.|B|) time and space
};

static constexpr std::string_view kDistanceAlgorithmNaiveStr = "naive";
static constexpr std::string_view kDistanceAlgorithmMemoizedStr = "memoized";
static constexpr std::string_view kDistanceAlgorithmIterativeStr = "iterative";

std::string_view DistanceAlgorithmToString(DistanceAlgorithm algorithm);

/// Case insensitive parsing of a distance algorithm name.
/// Throws invalid_argument if it is not recognized.
DistanceAlgorithm DistanceAlgorithmFromString(std::string_view str);
}  // namespace strdist
