#pragma once

#include <cstdint>
#include <string>

namespace strdist {
namespace schema {

struct LogConfig {
  std::string consoleLevel{"info"};
  std::string fileLevel{"off"};
  std::string logFile{"strdist.log"};
  int64_t maxFileSize{5L * 1024 * 1024};  // 5Mi
  int32_t maxNbFiles{10};
};

}  // namespace schema
}  // namespace strdist
