#include "distancealgorithm.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include "strdist_invalid_argument_exception.hpp"
#include "unreachable.hpp"

namespace strdist {
std::string_view DistanceAlgorithmToString(DistanceAlgorithm algorithm) {
  switch (algorithm) {
    case DistanceAlgorithm::kNaive:
      return kDistanceAlgorithmNaiveStr;
    case DistanceAlgorithm::kMemoized:
      return kDistanceAlgorithmMemoizedStr;
    case DistanceAlgorithm::kIterative:
      return kDistanceAlgorithmIterativeStr;
    default:
      unreachable();
  }
}

DistanceAlgorithm DistanceAlgorithmFromString(std::string_view str) {
  std::string lowerStr(str);
  std::ranges::transform(lowerStr, lowerStr.begin(), [](unsigned char ch) { return std::tolower(ch); });
  if (lowerStr == kDistanceAlgorithmNaiveStr) {
    return DistanceAlgorithm::kNaive;
  }
  if (lowerStr == kDistanceAlgorithmMemoizedStr) {
    return DistanceAlgorithm::kMemoized;
  }
  if (lowerStr == kDistanceAlgorithmIterativeStr) {
    return DistanceAlgorithm::kIterative;
  }
  throw invalid_argument("Unrecognized distance algorithm {}", str);
}
}  // namespace strdist
