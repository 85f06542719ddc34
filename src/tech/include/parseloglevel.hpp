#pragma once

#include <cstdint>
#include <string_view>

#include "strdist_log.hpp"

namespace strdist {

/// Number of log level positions, from 0 ('off') to 6 ('trace').
inline constexpr int8_t kNbLogLevelPositions = 7;

/// Returns the position of given log level name, from 0 (off) to 6 (trace).
/// Accepts either a single digit or one of off|critical|error|warning|info|debug|trace.
int8_t LogPosFromLogStr(std::string_view logStr);

constexpr log::level::level_enum LevelFromPos(int8_t levelPos) {
  return static_cast<log::level::level_enum>(static_cast<int8_t>(log::level::off) - levelPos);
}

constexpr int8_t PosFromLevel(log::level::level_enum level) {
  return static_cast<int8_t>(log::level::off) - static_cast<int8_t>(level);
}

}  // namespace strdist
