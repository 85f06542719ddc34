#include "loadconfiguration.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

#include "edit-costs-config.hpp"
#include "editcosts.hpp"
#include "read-json.hpp"
#include "strdist-config.hpp"
#include "strdist_exception.hpp"
#include "strdist_log.hpp"

namespace strdist {

schema::StrdistConfig ReadStrdistConfig(std::string_view jsonContent) {
  return ReadJsonOrThrow<schema::StrdistConfig>(jsonContent);
}

schema::StrdistConfig ReadStrdistConfigFile(std::string_view filePath) {
  const std::filesystem::path path(filePath);
  if (!std::filesystem::exists(path)) {
    log::info("No configuration file {}, using default configuration", filePath);
    return {};
  }

  std::ifstream file(path);
  if (!file) {
    throw exception("Unable to open configuration file {}", filePath);
  }

  const std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};

  log::debug("Reading configuration file {}", filePath);
  return ReadStrdistConfig(content);
}

EditCosts EditCostsFromConfig(const schema::EditCostsConfig &editCostsConfig) {
  return {editCostsConfig.addCost, editCostsConfig.removeCost, editCostsConfig.changeCost};
}

}  // namespace strdist
