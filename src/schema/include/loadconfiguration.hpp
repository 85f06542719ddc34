#pragma once

#include <string_view>

#include "edit-costs-config.hpp"
#include "editcosts.hpp"
#include "strdist-config.hpp"

namespace strdist {

static constexpr std::string_view kDefaultConfigFileName = "strdist.json";

/// Parses given json content. Missing fields keep their default values, unknown fields are an error.
/// An empty content gives the default configuration.
schema::StrdistConfig ReadStrdistConfig(std::string_view jsonContent);

/// Reads the json configuration stored at given path.
/// If the file does not exist, the default configuration is returned.
schema::StrdistConfig ReadStrdistConfigFile(std::string_view filePath = kDefaultConfigFileName);

/// Builds the cost model from its configuration. Throws invalid_argument for negative costs.
EditCosts EditCostsFromConfig(const schema::EditCostsConfig &editCostsConfig);

}  // namespace strdist
