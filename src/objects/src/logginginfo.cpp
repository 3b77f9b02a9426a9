#include "logginginfo.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <memory>
#include <string_view>
#include <utility>

#include "fxt_log.hpp"
#include "fxt_vector.hpp"
#include "log-config.hpp"
#include "parseloglevel.hpp"

namespace fxt {

LoggingInfo::LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view dataDir) : _dataDir(dataDir) {
  if (withLoggersCreation == WithLoggersCreation::kYes) {
    createLoggers();
  }
}

LoggingInfo::LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view dataDir,
                         const schema::LogConfig &logConfig)
    : _dataDir(dataDir),
      _maxFileSizeLogFileInBytes(logConfig.maxFileSize),
      _maxNbLogFiles(logConfig.maxNbFiles),
      _logLevelConsolePos(LogPosFromLogStr(logConfig.consoleLevel)),
      _logLevelFilePos(LogPosFromLogStr(logConfig.fileLevel)) {
  if (withLoggersCreation == WithLoggersCreation::kYes) {
    createLoggers();
  }
}

LoggingInfo::LoggingInfo(LoggingInfo &&rhs) noexcept
    : _dataDir(std::move(rhs._dataDir)),
      _maxFileSizeLogFileInBytes(rhs._maxFileSizeLogFileInBytes),
      _maxNbLogFiles(rhs._maxNbLogFiles),
      _logLevelConsolePos(rhs._logLevelConsolePos),
      _logLevelFilePos(rhs._logLevelFilePos),
      _destroyOutputLogger(std::exchange(rhs._destroyOutputLogger, false)) {}

LoggingInfo &LoggingInfo::operator=(LoggingInfo &&rhs) noexcept {
  if (&rhs != this) {
    swap(rhs);
  }
  return *this;
}

LoggingInfo::~LoggingInfo() {
  if (_destroyOutputLogger) {
    log::drop(kOutputLoggerName);
  }
}

void LoggingInfo::createLoggers() {
  vector<log::sink_ptr> sinks;

  if (_logLevelConsolePos != 0) {
    auto &consoleSink = sinks.emplace_back(std::make_shared<log::sinks::stderr_color_sink_mt>());
    consoleSink->set_level(LevelFromPos(_logLevelConsolePos));
  }

  if (_logLevelFilePos != 0) {
    log::filename_t logFileName = log::filename_t(_dataDir) + log::filename_t("/log/log.txt");
    auto &rotatingSink = sinks.emplace_back(std::make_shared<log::sinks::rotating_file_sink_mt>(
        std::move(logFileName), static_cast<std::size_t>(_maxFileSizeLogFileInBytes),
        static_cast<std::size_t>(_maxNbLogFiles)));

    rotatingSink->set_level(LevelFromPos(_logLevelFilePos));
  }

  if (!sinks.empty()) {
    constexpr int nbThreads = 1;  // only one logger thread is important to keep order between output logger and others
    log::init_thread_pool(8192, nbThreads);
    auto logger = std::make_shared<log::async_logger>("", sinks.begin(), sinks.end(), log::thread_pool(),
                                                      log::async_overflow_policy::block);

    // in addition of the levels of each sink, we need to set the main level of the logger based on the max log level of
    // both
    logger->set_level(LevelFromPos(std::max(_logLevelConsolePos, _logLevelFilePos)));

    log::set_default_logger(logger);
  }

  createOutputLogger();
}

void LoggingInfo::swap(LoggingInfo &rhs) noexcept {
  using std::swap;

  _dataDir.swap(rhs._dataDir);
  swap(_maxFileSizeLogFileInBytes, rhs._maxFileSizeLogFileInBytes);
  swap(_maxNbLogFiles, rhs._maxNbLogFiles);
  swap(_logLevelConsolePos, rhs._logLevelConsolePos);
  swap(_logLevelFilePos, rhs._logLevelFilePos);
  swap(_destroyOutputLogger, rhs._destroyOutputLogger);
}

void LoggingInfo::createOutputLogger() {
  if (log::thread_pool() == nullptr) {
    log::init_thread_pool(8192, 1);
  }
  auto outputLogger =
      std::make_shared<log::async_logger>(kOutputLoggerName, std::make_shared<log::sinks::stdout_color_sink_mt>(),
                                          log::thread_pool(), log::async_overflow_policy::block);
  outputLogger->set_level(log::level::level_enum::info);
  outputLogger->set_pattern("%v");

  log::register_logger(outputLogger);
  _destroyOutputLogger = true;
}

}  // namespace fxt
