#include "core/engine_config.h"
#include "core/logger.h"
#include <cstdlib>
#include <fstream>
#include <functional>

using json = nlohmann::json;

std::atomic<size_t> EngineConfig::BATCH_SIZE = EngineConfig::DEFAULT_BATCH_SIZE;
std::atomic<size_t> EngineConfig::MAX_WORKERS =
    EngineConfig::DEFAULT_MAX_WORKERS;
std::atomic<size_t> EngineConfig::AGGREGATOR_WORKERS =
    EngineConfig::DEFAULT_AGGREGATOR_WORKERS;
std::atomic<size_t> EngineConfig::CACHE_TTL_SECONDS =
    EngineConfig::DEFAULT_CACHE_TTL_SECONDS;
std::atomic<size_t> EngineConfig::CACHE_MAX_ENTRIES =
    EngineConfig::DEFAULT_CACHE_MAX_ENTRIES;
std::atomic<size_t> EngineConfig::SESSION_TIMEOUT_SECONDS =
    EngineConfig::DEFAULT_SESSION_TIMEOUT_SECONDS;
std::atomic<size_t> EngineConfig::LOG_MAX_FILE_MB =
    EngineConfig::DEFAULT_LOG_MAX_FILE_MB;
std::atomic<size_t> EngineConfig::LOG_BACKUP_FILES =
    EngineConfig::DEFAULT_LOG_BACKUP_FILES;
std::atomic<bool> EngineConfig::CACHE_ENABLED{true};
std::atomic<bool> EngineConfig::DATABASE_LOGGING{true};
std::atomic<bool> EngineConfig::LOG_TO_CONSOLE{false};

std::mutex EngineConfig::stringMutex_;
std::string EngineConfig::logFile_;
std::string EngineConfig::logLevel_ = "INFO";

namespace {
void applySize(const json &section, const char *key,
               const std::function<void(size_t)> &setter) {
  if (!section.contains(key))
    return;
  const json &value = section[key];
  if (!value.is_number_unsigned() && !value.is_number_integer()) {
    Logger::warning(LogCategory::CONFIG, "EngineConfig::loadFromJson",
                    std::string("Ignoring non-numeric value for ") + key);
    return;
  }
  long long raw = value.get<long long>();
  if (raw < 0) {
    Logger::warning(LogCategory::CONFIG, "EngineConfig::loadFromJson",
                    std::string("Ignoring negative value for ") + key);
    return;
  }
  try {
    setter(static_cast<size_t>(raw));
  } catch (const std::invalid_argument &e) {
    Logger::warning(LogCategory::CONFIG, "EngineConfig::loadFromJson",
                    std::string("Ignoring ") + key + ": " + e.what());
  }
}

void applyBool(const json &section, const char *key,
               const std::function<void(bool)> &setter) {
  if (section.contains(key) && section[key].is_boolean())
    setter(section[key].get<bool>());
}

void applyEnvSize(const char *name,
                  const std::function<void(size_t)> &setter) {
  const char *raw = std::getenv(name);
  if (!raw || *raw == '\0')
    return;
  try {
    size_t pos = 0;
    unsigned long long v = std::stoull(raw, &pos);
    if (pos != std::string(raw).size())
      throw std::invalid_argument("trailing characters");
    setter(static_cast<size_t>(v));
  } catch (const std::exception &e) {
    Logger::warning(LogCategory::CONFIG, "EngineConfig::loadFromEnv",
                    std::string("Ignoring ") + name + "='" + raw +
                        "': " + e.what());
  }
}
} // namespace

void EngineConfig::setLogFile(const std::string &path) {
  std::lock_guard<std::mutex> lock(stringMutex_);
  logFile_ = path;
}

std::string EngineConfig::getLogFile() {
  std::lock_guard<std::mutex> lock(stringMutex_);
  return logFile_;
}

void EngineConfig::setLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(stringMutex_);
  logLevel_ = level;
}

std::string EngineConfig::getLogLevel() {
  std::lock_guard<std::mutex> lock(stringMutex_);
  return logLevel_;
}

void EngineConfig::loadFromJson(const json &config) {
  if (!config.contains("engine") || !config["engine"].is_object())
    return;
  const json &engine = config["engine"];

  applySize(engine, "batch_size", setBatchSize);
  applySize(engine, "max_workers", setMaxWorkers);
  applySize(engine, "aggregator_workers", setAggregatorWorkers);
  applySize(engine, "cache_ttl_seconds", setCacheTtlSeconds);
  applySize(engine, "cache_max_entries", setCacheMaxEntries);
  applySize(engine, "session_timeout_seconds", setSessionTimeoutSeconds);
  applySize(engine, "log_max_file_mb", setLogMaxFileMb);
  applySize(engine, "log_backup_files", setLogBackupFiles);
  applyBool(engine, "cache_enabled", setCacheEnabled);
  applyBool(engine, "database_logging", setDatabaseLogging);
  applyBool(engine, "log_to_console", setLogToConsole);

  if (engine.contains("log_file") && engine["log_file"].is_string())
    setLogFile(engine["log_file"].get<std::string>());
  if (engine.contains("log_level") && engine["log_level"].is_string())
    setLogLevel(engine["log_level"].get<std::string>());
}

void EngineConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (configFile.is_open()) {
    try {
      json config;
      configFile >> config;
      loadFromJson(config);
    } catch (const json::exception &e) {
      Logger::error(LogCategory::CONFIG, "EngineConfig::loadFromFile",
                    "Error parsing '" + configPath + "': " + e.what());
    }
  }
  loadFromEnv();
}

void EngineConfig::loadFromEnv() {
  applyEnvSize("CQ_BATCH_SIZE", setBatchSize);
  applyEnvSize("CQ_MAX_WORKERS", setMaxWorkers);
  applyEnvSize("CQ_AGGREGATOR_WORKERS", setAggregatorWorkers);
  applyEnvSize("CQ_CACHE_TTL_SECONDS", setCacheTtlSeconds);
  applyEnvSize("CQ_SESSION_TIMEOUT_SECONDS", setSessionTimeoutSeconds);

  const char *logFile = std::getenv("CQ_LOG_FILE");
  if (logFile && *logFile != '\0')
    setLogFile(logFile);
  const char *logLevel = std::getenv("CQ_LOG_LEVEL");
  if (logLevel && *logLevel != '\0')
    setLogLevel(logLevel);
}

void EngineConfig::resetToDefaults() {
  BATCH_SIZE = DEFAULT_BATCH_SIZE;
  MAX_WORKERS = DEFAULT_MAX_WORKERS;
  AGGREGATOR_WORKERS = DEFAULT_AGGREGATOR_WORKERS;
  CACHE_TTL_SECONDS = DEFAULT_CACHE_TTL_SECONDS;
  CACHE_MAX_ENTRIES = DEFAULT_CACHE_MAX_ENTRIES;
  SESSION_TIMEOUT_SECONDS = DEFAULT_SESSION_TIMEOUT_SECONDS;
  LOG_MAX_FILE_MB = DEFAULT_LOG_MAX_FILE_MB;
  LOG_BACKUP_FILES = DEFAULT_LOG_BACKUP_FILES;
  CACHE_ENABLED = true;
  DATABASE_LOGGING = true;
  LOG_TO_CONSOLE = false;
  std::lock_guard<std::mutex> lock(stringMutex_);
  logFile_.clear();
  logLevel_ = "INFO";
}
