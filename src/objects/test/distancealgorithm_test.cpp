#include "distancealgorithm.hpp"

#include <gtest/gtest.h>

#include "strdist_invalid_argument_exception.hpp"

namespace strdist {

TEST(DistanceAlgorithmTest, ToString) {
  EXPECT_EQ(DistanceAlgorithmToString(DistanceAlgorithm::kNaive), "naive");
  EXPECT_EQ(DistanceAlgorithmToString(DistanceAlgorithm::kMemoized), "memoized");
  EXPECT_EQ(DistanceAlgorithmToString(DistanceAlgorithm::kIterative), "iterative");
}

TEST(DistanceAlgorithmTest, FromString) {
  EXPECT_EQ(DistanceAlgorithmFromString("naive"), DistanceAlgorithm::kNaive);
  EXPECT_EQ(DistanceAlgorithmFromString("Memoized"), DistanceAlgorithm::kMemoized);
  EXPECT_EQ(DistanceAlgorithmFromString("ITERATIVE"), DistanceAlgorithm::kIterative);
}

TEST(DistanceAlgorithmTest, FromStringInvalid) {
  EXPECT_THROW(DistanceAlgorithmFromString(""), invalid_argument);
  EXPECT_THROW(DistanceAlgorithmFromString("recursive"), invalid_argument);
}

}  // namespace strdist
