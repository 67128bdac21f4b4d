#ifndef LOGGER_H
#define LOGGER_H

#include "core/log_writer.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4
};

enum class LogCategory {
  SYSTEM = 0,
  DATABASE = 1,
  CONFIG = 2,
  NORMALIZATION = 3,
  QUALITY = 4,
  CACHE = 5,
  VALIDATION = 6,
  UNKNOWN = 99
};

// Process-wide logger. Nothing is written until initialize() attaches the
// configured sinks (service database, rotating file, stderr). Entries logged
// inside a LogContextScope carry its session id and database path.
class Logger {
private:
  static std::vector<std::unique_ptr<ILogWriter>> writers_;
  static std::mutex logMutex;

  static LogLevel currentLogLevel;
  static bool consoleOutput;
  // Guarded by logMutex.
  static size_t droppedEntries;
  static std::mutex configMutex;

  static const std::unordered_map<std::string, LogLevel> levelMap;

  static std::string getCurrentTimestamp();
  static std::string getLevelString(LogLevel level);
  static std::string getCategoryString(LogCategory category);
  static LogLevel stringToLogLevel(const std::string &levelStr);

  static void writeLog(LogLevel level, LogCategory category,
                       const std::string &function, const std::string &message);

public:
  static void initialize();
  static void shutdown();

  static void addWriter(std::unique_ptr<ILogWriter> writer);
  static void setConsoleOutput(bool enabled);

  static void debug(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::DEBUG, category, function, message);
  }

  static void info(LogCategory category, const std::string &function,
                   const std::string &message) {
    writeLog(LogLevel::INFO, category, function, message);
  }

  static void warning(LogCategory category, const std::string &function,
                      const std::string &message) {
    writeLog(LogLevel::WARNING, category, function, message);
  }

  static void error(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::ERROR, category, function, message);
  }

  static void critical(LogCategory category, const std::string &function,
                       const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, function, message);
  }

  static void log(LogLevel level, LogCategory category,
                  const std::string &function, const std::string &message) {
    writeLog(level, category, function, message);
  }

  static void loadLevelFromDatabase();
  static void setLogLevel(LogLevel level);
  static void setLogLevel(const std::string &levelStr);
  static LogLevel getCurrentLogLevel();
};

#endif
