#ifndef ENGINE_CONFIG_H
#define ENGINE_CONFIG_H

#include <atomic>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

// Runtime tunables of the normalization and quality engine. Numeric values are
// atomics so running workers can read them without locking; every setter
// validates its range and throws std::invalid_argument.
struct EngineConfig {
  static std::atomic<size_t> BATCH_SIZE;
  static std::atomic<size_t> MAX_WORKERS;
  static std::atomic<size_t> AGGREGATOR_WORKERS;
  static std::atomic<size_t> CACHE_TTL_SECONDS;
  static std::atomic<size_t> CACHE_MAX_ENTRIES;
  static std::atomic<size_t> SESSION_TIMEOUT_SECONDS;
  static std::atomic<size_t> LOG_MAX_FILE_MB;
  static std::atomic<size_t> LOG_BACKUP_FILES;
  static std::atomic<bool> CACHE_ENABLED;
  static std::atomic<bool> DATABASE_LOGGING;
  static std::atomic<bool> LOG_TO_CONSOLE;

  static constexpr size_t DEFAULT_BATCH_SIZE = 500;
  static constexpr size_t DEFAULT_MAX_WORKERS = 4;
  static constexpr size_t DEFAULT_AGGREGATOR_WORKERS = 5;
  static constexpr size_t DEFAULT_CACHE_TTL_SECONDS = 300;
  static constexpr size_t DEFAULT_CACHE_MAX_ENTRIES = 1000;
  static constexpr size_t DEFAULT_SESSION_TIMEOUT_SECONDS = 3600;
  static constexpr size_t DEFAULT_LOG_MAX_FILE_MB = 10;
  static constexpr size_t DEFAULT_LOG_BACKUP_FILES = 5;

  static constexpr size_t MIN_BATCH_SIZE = 10;
  static constexpr size_t MAX_BATCH_SIZE = 100000;
  static constexpr size_t MIN_MAX_WORKERS = 1;
  static constexpr size_t MAX_MAX_WORKERS = 32;
  static constexpr size_t MIN_CACHE_TTL = 1;
  static constexpr size_t MAX_CACHE_TTL = 86400;
  static constexpr size_t MIN_CACHE_MAX_ENTRIES = 1;
  static constexpr size_t MAX_CACHE_MAX_ENTRIES = 100000;
  static constexpr size_t MIN_SESSION_TIMEOUT = 10;
  static constexpr size_t MAX_SESSION_TIMEOUT = 86400;
  static constexpr size_t MAX_LOG_FILE_MB = 1024;
  static constexpr size_t MAX_LOG_BACKUP_FILES = 50;

  static void setBatchSize(size_t v) {
    checkRange("BATCH_SIZE", v, MIN_BATCH_SIZE, MAX_BATCH_SIZE);
    BATCH_SIZE = v;
  }
  static size_t getBatchSize() { return BATCH_SIZE; }

  static void setMaxWorkers(size_t v) {
    checkRange("MAX_WORKERS", v, MIN_MAX_WORKERS, MAX_MAX_WORKERS);
    MAX_WORKERS = v;
  }
  static size_t getMaxWorkers() { return MAX_WORKERS; }

  static void setAggregatorWorkers(size_t v) {
    checkRange("AGGREGATOR_WORKERS", v, MIN_MAX_WORKERS, MAX_MAX_WORKERS);
    AGGREGATOR_WORKERS = v;
  }
  static size_t getAggregatorWorkers() { return AGGREGATOR_WORKERS; }

  static void setCacheTtlSeconds(size_t v) {
    checkRange("CACHE_TTL_SECONDS", v, MIN_CACHE_TTL, MAX_CACHE_TTL);
    CACHE_TTL_SECONDS = v;
  }
  static size_t getCacheTtlSeconds() { return CACHE_TTL_SECONDS; }

  static void setCacheMaxEntries(size_t v) {
    checkRange("CACHE_MAX_ENTRIES", v, MIN_CACHE_MAX_ENTRIES,
               MAX_CACHE_MAX_ENTRIES);
    CACHE_MAX_ENTRIES = v;
  }
  static size_t getCacheMaxEntries() { return CACHE_MAX_ENTRIES; }

  static void setSessionTimeoutSeconds(size_t v) {
    checkRange("SESSION_TIMEOUT_SECONDS", v, MIN_SESSION_TIMEOUT,
               MAX_SESSION_TIMEOUT);
    SESSION_TIMEOUT_SECONDS = v;
  }
  static size_t getSessionTimeoutSeconds() { return SESSION_TIMEOUT_SECONDS; }

  static void setLogMaxFileMb(size_t v) {
    checkRange("LOG_MAX_FILE_MB", v, 1, MAX_LOG_FILE_MB);
    LOG_MAX_FILE_MB = v;
  }
  static size_t getLogMaxFileMb() { return LOG_MAX_FILE_MB; }

  static void setLogBackupFiles(size_t v) {
    checkRange("LOG_BACKUP_FILES", v, 1, MAX_LOG_BACKUP_FILES);
    LOG_BACKUP_FILES = v;
  }
  static size_t getLogBackupFiles() { return LOG_BACKUP_FILES; }

  static void setCacheEnabled(bool v) { CACHE_ENABLED = v; }
  static bool getCacheEnabled() { return CACHE_ENABLED; }

  static void setDatabaseLogging(bool v) { DATABASE_LOGGING = v; }
  static bool getDatabaseLogging() { return DATABASE_LOGGING; }

  static void setLogToConsole(bool v) { LOG_TO_CONSOLE = v; }
  static bool getLogToConsole() { return LOG_TO_CONSOLE; }

  static void setLogFile(const std::string &path);
  static std::string getLogFile();
  static void setLogLevel(const std::string &level);
  static std::string getLogLevel();

  // Applies the "engine" object of config.json. Invalid values are reported
  // and leave the previous setting in place.
  static void loadFromJson(const nlohmann::json &config);
  static void loadFromFile(const std::string &configPath = "config.json");
  // CQ_BATCH_SIZE, CQ_MAX_WORKERS, CQ_AGGREGATOR_WORKERS, CQ_CACHE_TTL_SECONDS,
  // CQ_SESSION_TIMEOUT_SECONDS, CQ_LOG_FILE, CQ_LOG_LEVEL.
  static void loadFromEnv();

  static void resetToDefaults();

private:
  static std::mutex stringMutex_;
  static std::string logFile_;
  static std::string logLevel_;

  static void checkRange(const char *name, size_t v, size_t lo, size_t hi) {
    if (v < lo || v > hi) {
      throw std::invalid_argument(std::string(name) + " must be between " +
                                  std::to_string(lo) + " and " +
                                  std::to_string(hi));
    }
  }
};

#endif
