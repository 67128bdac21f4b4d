#include "core/logger.h"
#include "core/database_config.h"
#include "core/database_log_writer.h"
#include "core/engine_config.h"
#include "core/file_log_writer.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <iostream>
#include <pqxx/pqxx>
#include <sstream>
#include <thread>

namespace {
thread_local int64_t contextSessionId = 0;
thread_local std::string contextDatabasePath;
} // namespace

LogContextScope::LogContextScope(int64_t sessionId, std::string databasePath)
    : previousSessionId_(contextSessionId),
      previousDatabasePath_(std::move(contextDatabasePath)) {
  contextSessionId = sessionId;
  contextDatabasePath = std::move(databasePath);
}

LogContextScope::~LogContextScope() {
  contextSessionId = previousSessionId_;
  contextDatabasePath = std::move(previousDatabasePath_);
}

int64_t LogContextScope::currentSessionId() { return contextSessionId; }

std::string LogContextScope::currentDatabasePath() {
  return contextDatabasePath;
}

std::vector<std::unique_ptr<ILogWriter>> Logger::writers_;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
bool Logger::consoleOutput = false;
size_t Logger::droppedEntries = 0;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

std::string Logger::getCurrentTimestamp() {
  return TimeUtils::getCurrentTimestamp();
}

std::string Logger::getLevelString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

std::string Logger::getCategoryString(LogCategory category) {
  switch (category) {
  case LogCategory::SYSTEM:
    return "SYSTEM";
  case LogCategory::DATABASE:
    return "DATABASE";
  case LogCategory::CONFIG:
    return "CONFIG";
  case LogCategory::NORMALIZATION:
    return "NORMALIZATION";
  case LogCategory::QUALITY:
    return "QUALITY";
  case LogCategory::CACHE:
    return "CACHE";
  case LogCategory::VALIDATION:
    return "VALIDATION";
  case LogCategory::UNKNOWN:
    break;
  }
  return "UNKNOWN";
}

LogLevel Logger::stringToLogLevel(const std::string &levelStr) {
  auto it = levelMap.find(StringUtils::toUpper(levelStr));
  return (it != levelMap.end()) ? it->second : LogLevel::INFO;
}

void Logger::writeLog(LogLevel level, LogCategory category,
                      const std::string &function,
                      const std::string &message) {
  bool toConsole;
  {
    std::lock_guard<std::mutex> configLock(configMutex);
    if (level < currentLogLevel) {
      return;
    }
    toConsole = consoleOutput;
  }

  LogEntry entry;
  entry.timestamp = getCurrentTimestamp();
  entry.level = getLevelString(level);
  entry.category = getCategoryString(category);
  entry.function = function;
  entry.message = message;
  entry.sessionId = contextSessionId;
  entry.databasePath = contextDatabasePath;

  std::ostringstream oss;
  oss << "[" << entry.timestamp << "] [" << entry.level << "] ["
      << entry.category << "]";
  if (entry.hasSession()) {
    oss << " [session " << entry.sessionId << "]";
  }
  if (!function.empty()) {
    oss << " [" << function << "]";
  }
  oss << " " << message;
  entry.formatted = oss.str();

  std::lock_guard<std::mutex> lock(logMutex);
  for (auto &writer : writers_) {
    if (writer->isOpen() && !writer->write(entry)) {
      ++droppedEntries;
    }
  }
  if (toConsole) {
    std::cerr << entry.formatted << std::endl;
  }
}

// Attaches the sinks named by the configuration: the metadata.logs table when
// a service database is configured and database logging is on, a rotating
// file when engine.log_file is set, and stderr when engine.log_to_console is
// set. A sink that fails to open is reported on stderr and skipped.
void Logger::initialize() {
  setLogLevel(EngineConfig::getLogLevel());
  setConsoleOutput(EngineConfig::getLogToConsole());

  if (EngineConfig::getDatabaseLogging() && DatabaseConfig::isInitialized()) {
    loadLevelFromDatabase();
    try {
      auto dbWriter = std::make_unique<DatabaseLogWriter>(
          DatabaseConfig::getPostgresConnectionString());
      if (dbWriter->isOpen()) {
        addWriter(std::move(dbWriter));
      } else {
        std::cerr << "Warning: Database log writer initialization failed. "
                     "Logging to database will be disabled."
                  << std::endl;
      }
    } catch (const std::exception &e) {
      std::cerr << "Error initializing database log writer: " << e.what()
                << std::endl;
    }
  }

  std::string logFile = EngineConfig::getLogFile();
  if (!logFile.empty()) {
    FileRotationPolicy policy;
    policy.maxFileBytes = EngineConfig::getLogMaxFileMb() * 1024 * 1024;
    policy.backupFiles = static_cast<int>(EngineConfig::getLogBackupFiles());
    auto fileWriter = std::make_unique<FileLogWriter>(logFile, policy);
    if (fileWriter->isOpen()) {
      addWriter(std::move(fileWriter));
    } else {
      std::cerr << "Warning: Could not open log file '" << logFile << "'"
                << std::endl;
    }
  }
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(logMutex);
  if (droppedEntries > 0) {
    std::cerr << "Logger: " << droppedEntries
              << " entries were rejected by a sink" << std::endl;
    droppedEntries = 0;
  }
  for (auto &writer : writers_) {
    writer->flush();
    writer->close();
  }
  writers_.clear();
}

void Logger::addWriter(std::unique_ptr<ILogWriter> writer) {
  if (!writer) {
    return;
  }
  std::lock_guard<std::mutex> lock(logMutex);
  writers_.push_back(std::move(writer));
}

void Logger::setConsoleOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(configMutex);
  consoleOutput = enabled;
}

// Reads metadata.config.debug_level, which lets operators raise or lower
// verbosity without touching config.json. Missing table or key keeps the
// current level.
void Logger::loadLevelFromDatabase() {
  try {
    pqxx::connection conn(DatabaseConfig::getPostgresConnectionString());
    pqxx::work txn(conn);
    auto tableCheck = txn.exec(
        "SELECT to_regclass('metadata.config') IS NOT NULL");
    if (tableCheck.empty() || !tableCheck[0][0].as<bool>()) {
      return;
    }
    auto result =
        txn.exec("SELECT value FROM metadata.config WHERE key = 'debug_level'");
    txn.commit();
    if (!result.empty() && !result[0][0].is_null()) {
      setLogLevel(result[0][0].as<std::string>());
    }
  } catch (const std::exception &e) {
    std::cerr << "Logger: could not load debug_level from database: "
              << e.what() << std::endl;
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

// Unknown level names are ignored so a typo in configuration never silences
// the log.
void Logger::setLogLevel(const std::string &levelStr) {
  if (levelStr.empty()) {
    return;
  }
  if (levelMap.find(StringUtils::toUpper(levelStr)) == levelMap.end()) {
    return;
  }
  setLogLevel(stringToLogLevel(levelStr));
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex);
  return currentLogLevel;
}
