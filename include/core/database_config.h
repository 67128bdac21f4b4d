#ifndef DATABASE_CONFIG_H
#define DATABASE_CONFIG_H

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

struct PostgresSettings {
  std::string host = "localhost";
  std::string port = "5432";
  std::string database = "catalog_quality";
  std::string user = "postgres";
  std::string password;
  // Reported in pg_stat_activity so service connections are easy to find.
  std::string applicationName = "catalog_quality";
  int connectTimeoutSeconds = 10;
};

// Connection settings for the PostgreSQL service database that holds
// normalization sessions, the project database registry and metadata.logs.
// Sources in increasing priority: built-in defaults, database.postgres in
// config.json, POSTGRES_* environment variables.
class DatabaseConfig {
private:
  static PostgresSettings settings_;
  static bool initialized_;
  static std::mutex configMutex_;

  static std::string escapeConnectionParam(const std::string &param);
  static std::string buildConnectionString(const PostgresSettings &settings,
                                           bool maskPassword);
  static void loadFromEnvUnlocked();
  static void loadFromJsonUnlocked(const nlohmann::json &config);

public:
  static void loadFromFile(const std::string &configPath = "config.json");
  static void loadFromJson(const nlohmann::json &config);
  static void loadFromEnv();

  static void setForTesting(const PostgresSettings &settings);

  static PostgresSettings getSettings() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return settings_;
  }
  static std::string getPostgresHost() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return settings_.host;
  }
  static std::string getPostgresDB() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return settings_.database;
  }

  static std::string getPostgresConnectionString() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return buildConnectionString(settings_, false);
  }
  static std::string getPostgresConnectionStringForLogging() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return buildConnectionString(settings_, true);
  }

  static bool isInitialized() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return initialized_;
  }
};

#endif
