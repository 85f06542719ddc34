#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "log-config.hpp"
#include "parseloglevel.hpp"
#include "strdist_log.hpp"

namespace strdist {

/// @brief Encapsulates loggers lifetime and set-up.
/// When loggers are created, the previous default logger is restored at destruction.
class LoggingInfo {
 public:
  static constexpr int64_t kDefaultFileSizeInBytes = 5L * 1024 * 1024;
  static constexpr int32_t kDefaultNbMaxFiles = 10;
  static constexpr char const *const kLoggerName = "strdist";

  enum class WithLoggersCreation : int8_t { kNo, kYes };

  /// Creates a default logging info, with level 'info' on standard error.
  explicit LoggingInfo(WithLoggersCreation withLoggersCreation = WithLoggersCreation::kNo);

  /// Creates a logging info from the log part of the json configuration.
  LoggingInfo(WithLoggersCreation withLoggersCreation, const schema::LogConfig &logConfig);

  LoggingInfo(const LoggingInfo &) = delete;
  LoggingInfo(LoggingInfo &&rhs) noexcept;
  LoggingInfo &operator=(const LoggingInfo &) = delete;
  LoggingInfo &operator=(LoggingInfo &&rhs) noexcept;

  ~LoggingInfo();

  int64_t maxFileSizeLogFileInBytes() const { return _maxFileSizeLogFileInBytes; }

  int32_t maxNbLogFiles() const { return _maxNbLogFiles; }

  const std::string &logFile() const { return _logFile; }

  log::level::level_enum logConsole() const { return LevelFromPos(_logLevelConsolePos); }
  log::level::level_enum logFileLevel() const { return LevelFromPos(_logLevelFilePos); }

  void swap(LoggingInfo &rhs) noexcept;

 private:
  void createLoggers();

  std::string _logFile;
  std::shared_ptr<log::logger> _previousDefaultLogger;
  int64_t _maxFileSizeLogFileInBytes = kDefaultFileSizeInBytes;
  int32_t _maxNbLogFiles = kDefaultNbMaxFiles;
  int8_t _logLevelConsolePos = PosFromLevel(log::level::info);
  int8_t _logLevelFilePos = PosFromLevel(log::level::off);
};

}  // namespace strdist
