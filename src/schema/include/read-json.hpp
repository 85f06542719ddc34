#pragma once

#include <algorithm>
#include <cstddef>
#include <string_view>

#include "strdist_exception.hpp"
#include "strdist_json-serialization.hpp"

namespace strdist {

static constexpr auto kExactJsonOptions =
    json::opts{.error_on_unknown_keys = true};  // NOLINT(readability-implicit-bool-conversion)

static constexpr auto kPartialJsonOptions =
    json::opts{.error_on_unknown_keys = false};  // NOLINT(readability-implicit-bool-conversion)

template <json::opts opts>
void ReadJsonOrThrow(std::string_view strContent, auto &outObject) {
  if (strContent.empty()) {
    return;
  }

  auto ec = json::read<opts>(outObject, strContent);

  if (ec) {
    std::string_view prefixJsonContent = strContent.substr(0, std::min<std::size_t>(strContent.size(), 20));
    throw exception("Error while reading json content '{}{}': {}", prefixJsonContent,
                    prefixJsonContent.size() < strContent.size() ? "..." : "", json::format_error(ec, strContent));
  }
}

/**
 * Read json content from a string raising an error for unknown keys
 */
template <class T, json::opts opts = kExactJsonOptions>
T ReadJsonOrThrow(std::string_view strContent) {
  T outObject;
  ReadJsonOrThrow<opts>(strContent, outObject);
  return outObject;
}

}  // namespace strdist
