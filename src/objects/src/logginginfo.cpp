#include "logginginfo.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include "log-config.hpp"
#include "parseloglevel.hpp"
#include "strdist_invalid_argument_exception.hpp"
#include "strdist_log.hpp"

namespace strdist {

LoggingInfo::LoggingInfo(WithLoggersCreation withLoggersCreation) : _logFile(schema::LogConfig{}.logFile) {
  if (withLoggersCreation == WithLoggersCreation::kYes) {
    createLoggers();
  }
}

LoggingInfo::LoggingInfo(WithLoggersCreation withLoggersCreation, const schema::LogConfig &logConfig)
    : _logFile(logConfig.logFile),
      _maxFileSizeLogFileInBytes(logConfig.maxFileSize),
      _maxNbLogFiles(logConfig.maxNbFiles),
      _logLevelConsolePos(LogPosFromLogStr(logConfig.consoleLevel)),
      _logLevelFilePos(LogPosFromLogStr(logConfig.fileLevel)) {
  if (_maxFileSizeLogFileInBytes <= 0 || _maxNbLogFiles <= 0) {
    throw invalid_argument("Invalid log file rotation {} bytes x {} files", _maxFileSizeLogFileInBytes,
                           _maxNbLogFiles);
  }
  if (withLoggersCreation == WithLoggersCreation::kYes) {
    createLoggers();
  }
}

LoggingInfo::LoggingInfo(LoggingInfo &&rhs) noexcept
    : _logFile(std::move(rhs._logFile)),
      _previousDefaultLogger(std::move(rhs._previousDefaultLogger)),
      _maxFileSizeLogFileInBytes(rhs._maxFileSizeLogFileInBytes),
      _maxNbLogFiles(rhs._maxNbLogFiles),
      _logLevelConsolePos(rhs._logLevelConsolePos),
      _logLevelFilePos(rhs._logLevelFilePos) {}

LoggingInfo &LoggingInfo::operator=(LoggingInfo &&rhs) noexcept {
  if (&rhs != this) {
    swap(rhs);
  }
  return *this;
}

LoggingInfo::~LoggingInfo() {
  if (_previousDefaultLogger) {
    log::set_default_logger(std::move(_previousDefaultLogger));
  }
}

void LoggingInfo::createLoggers() {
  std::vector<log::sink_ptr> sinks;

  if (_logLevelConsolePos != 0) {
    auto &consoleSink = sinks.emplace_back(std::make_shared<log::sinks::stderr_color_sink_mt>());
    consoleSink->set_level(LevelFromPos(_logLevelConsolePos));
  }

  if (_logLevelFilePos != 0) {
    auto &rotatingSink = sinks.emplace_back(std::make_shared<log::sinks::rotating_file_sink_mt>(
        log::filename_t(_logFile), static_cast<std::size_t>(_maxFileSizeLogFileInBytes),
        static_cast<std::size_t>(_maxNbLogFiles)));

    rotatingSink->set_level(LevelFromPos(_logLevelFilePos));
  }

  auto logger = std::make_shared<log::logger>(kLoggerName, sinks.begin(), sinks.end());

  // Sinks filter on their own level, the logger level should let the most verbose of them through
  logger->set_level(LevelFromPos(std::max(_logLevelConsolePos, _logLevelFilePos)));

  _previousDefaultLogger = log::default_logger();
  log::set_default_logger(std::move(logger));
}

void LoggingInfo::swap(LoggingInfo &rhs) noexcept {
  using std::swap;

  _logFile.swap(rhs._logFile);
  _previousDefaultLogger.swap(rhs._previousDefaultLogger);
  swap(_maxFileSizeLogFileInBytes, rhs._maxFileSizeLogFileInBytes);
  swap(_maxNbLogFiles, rhs._maxNbLogFiles);
  swap(_logLevelConsolePos, rhs._logLevelConsolePos);
  swap(_logLevelFilePos, rhs._logLevelFilePos);
}

}  // namespace strdist
