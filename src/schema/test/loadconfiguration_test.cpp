#include "loadconfiguration.hpp"

#include <gtest/gtest.h>

#include "editcosts.hpp"
#include "strdist-config.hpp"
#include "strdist_exception.hpp"
#include "strdist_invalid_argument_exception.hpp"
#include "stringdistancecalculator.hpp"

namespace strdist {

TEST(LoadConfiguration, EmptyContentGivesDefaults) {
  schema::StrdistConfig config = ReadStrdistConfig("");

  EXPECT_EQ(EditCostsFromConfig(config.costs), EditCosts());
  EXPECT_EQ(config.log.consoleLevel, "info");
  EXPECT_EQ(config.log.fileLevel, "off");
}

TEST(LoadConfiguration, FullConfig) {
  schema::StrdistConfig config = ReadStrdistConfig(R"(
{
  "costs": {
    "addCost": 2,
    "removeCost": 0.5,
    "changeCost": 1.5
  },
  "log": {
    "consoleLevel": "debug",
    "fileLevel": "trace",
    "logFile": "distances.log",
    "maxFileSize": 1024,
    "maxNbFiles": 2
  }
}
)");

  EXPECT_EQ(EditCostsFromConfig(config.costs), EditCosts(2, 0.5, 1.5));
  EXPECT_EQ(config.log.consoleLevel, "debug");
  EXPECT_EQ(config.log.fileLevel, "trace");
  EXPECT_EQ(config.log.logFile, "distances.log");
  EXPECT_EQ(config.log.maxFileSize, 1024);
  EXPECT_EQ(config.log.maxNbFiles, 2);
}

TEST(LoadConfiguration, PartialConfigKeepsDefaults) {
  schema::StrdistConfig config = ReadStrdistConfig(R"({"costs": {"changeCost": 3}})");

  EXPECT_EQ(EditCostsFromConfig(config.costs), EditCosts(1, 1, 3));
  EXPECT_EQ(config.log.maxNbFiles, 10);

  StringDistanceCalculator calc(EditCostsFromConfig(config.costs));
  EXPECT_DOUBLE_EQ(calc.distanceIterative("book", "back"), 4);
}

TEST(LoadConfiguration, UnknownKey) {
  EXPECT_THROW(ReadStrdistConfig(R"({"costs": {"insertCost": 3}})"), exception);
}

TEST(LoadConfiguration, MalformedContent) { EXPECT_THROW(ReadStrdistConfig(R"({"costs": )"), exception); }

TEST(LoadConfiguration, NegativeCost) {
  schema::StrdistConfig config = ReadStrdistConfig(R"({"costs": {"removeCost": -1}})");

  EXPECT_THROW(EditCostsFromConfig(config.costs), invalid_argument);
}

TEST(LoadConfiguration, MissingFile) {
  schema::StrdistConfig config = ReadStrdistConfigFile("this-file-does-not-exist.json");

  EXPECT_EQ(EditCostsFromConfig(config.costs), EditCosts());
}

}  // namespace strdist
