#include "core/database_config.h"
#include "core/logger.h"
#include <cctype>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

PostgresSettings DatabaseConfig::settings_;
bool DatabaseConfig::initialized_ = false;
std::mutex DatabaseConfig::configMutex_;

namespace {
bool validateAndSetPort(const std::string &portStr, std::string &targetPort) {
  if (portStr.empty() || portStr.length() > 5)
    return false;

  for (char c : portStr) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }

  int portNum = std::atoi(portStr.c_str());
  if (portNum > 0 && portNum <= 65535) {
    targetPort = portStr;
    return true;
  }
  return false;
}

// Ports are accepted as JSON strings or numbers.
std::string portToString(const json &value) {
  if (value.is_number_integer())
    return std::to_string(value.get<long long>());
  if (value.is_string())
    return value.get<std::string>();
  return "";
}

constexpr int MAX_CONNECT_TIMEOUT_SECONDS = 300;

bool validateAndSetTimeout(long long seconds, int &target) {
  if (seconds < 1 || seconds > MAX_CONNECT_TIMEOUT_SECONDS)
    return false;
  target = static_cast<int>(seconds);
  return true;
}
} // namespace

// libpq keyword/value syntax: values containing spaces, quotes or backslashes
// must be single-quoted with quotes and backslashes escaped.
std::string DatabaseConfig::escapeConnectionParam(const std::string &param) {
  bool needsQuoting = param.empty();
  for (char c : param) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '\'' ||
        c == '\\') {
      needsQuoting = true;
      break;
    }
  }
  if (!needsQuoting)
    return param;

  std::string escaped = "'";
  for (char c : param) {
    if (c == '\'' || c == '\\')
      escaped += '\\';
    escaped += c;
  }
  escaped += "'";
  return escaped;
}

std::string DatabaseConfig::buildConnectionString(
    const PostgresSettings &settings, bool maskPassword) {
  std::string result = "host=" + escapeConnectionParam(settings.host) +
                       " port=" + escapeConnectionParam(settings.port) +
                       " dbname=" + escapeConnectionParam(settings.database) +
                       " user=" + escapeConnectionParam(settings.user);
  result += maskPassword ? std::string(" password=***")
                         : " password=" + escapeConnectionParam(settings.password);
  result += " application_name=" +
            escapeConnectionParam(settings.applicationName) +
            " connect_timeout=" +
            std::to_string(settings.connectTimeoutSeconds);
  return result;
}

// Reads database.postgres from config.json. A missing or malformed file falls
// back to POSTGRES_* environment variables. Environment variables always win
// over the file so deployments can override single values.
void DatabaseConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    "Could not open config file '" + configPath +
                        "', using defaults or environment variables");
    loadFromEnv();
    return;
  }

  try {
    json config;
    configFile >> config;
    loadFromJson(config);
  } catch (const std::exception &e) {
    Logger::error(LogCategory::CONFIG, "DatabaseConfig",
                  "Error loading config from file: " + std::string(e.what()) +
                      ", falling back to environment variables");
    loadFromEnv();
  }
}

void DatabaseConfig::loadFromJson(const json &config) {
  std::lock_guard<std::mutex> lock(configMutex_);
  loadFromJsonUnlocked(config);
  loadFromEnvUnlocked();
}

void DatabaseConfig::loadFromJsonUnlocked(const json &config) {
  if (!config.contains("database") ||
      !config["database"].contains("postgres")) {
    return;
  }
  const json &pg = config["database"]["postgres"];

  auto readString = [&pg](const char *key, std::string &target,
                          bool allowEmpty) {
    if (!pg.contains(key) || !pg[key].is_string())
      return;
    std::string value = pg[key].get<std::string>();
    if (allowEmpty || !value.empty())
      target = value;
  };
  readString("host", settings_.host, false);
  readString("database", settings_.database, false);
  readString("user", settings_.user, false);
  readString("password", settings_.password, true);
  readString("application_name", settings_.applicationName, false);

  if (pg.contains("port")) {
    std::string port = portToString(pg["port"]);
    if (!validateAndSetPort(port, settings_.port) && !port.empty()) {
      Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                      "Invalid port number: " + port + ", using default: " +
                          settings_.port);
    }
  }
  if (pg.contains("connect_timeout_seconds")) {
    const json &timeout = pg["connect_timeout_seconds"];
    if (!timeout.is_number_integer() ||
        !validateAndSetTimeout(timeout.get<long long>(),
                               settings_.connectTimeoutSeconds)) {
      Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                      "Invalid connect_timeout_seconds, using " +
                          std::to_string(settings_.connectTimeoutSeconds));
    }
  }
}

void DatabaseConfig::loadFromEnv() {
  std::lock_guard<std::mutex> lock(configMutex_);
  loadFromEnvUnlocked();
}

void DatabaseConfig::loadFromEnvUnlocked() {
  auto readEnv = [](const char *name) -> std::string {
    const char *value = std::getenv(name);
    return value ? std::string(value) : std::string();
  };

  std::string host = readEnv("POSTGRES_HOST");
  std::string port = readEnv("POSTGRES_PORT");
  std::string db = readEnv("POSTGRES_DB");
  std::string user = readEnv("POSTGRES_USER");
  std::string timeout = readEnv("POSTGRES_CONNECT_TIMEOUT");

  if (!host.empty())
    settings_.host = host;
  if (!port.empty() && !validateAndSetPort(port, settings_.port)) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    "Invalid port number: " + port + ", using default: " +
                        settings_.port);
  }
  if (!db.empty())
    settings_.database = db;
  if (!user.empty())
    settings_.user = user;
  if (std::getenv("POSTGRES_PASSWORD"))
    settings_.password = readEnv("POSTGRES_PASSWORD");
  if (!timeout.empty()) {
    char *end = nullptr;
    long long seconds = std::strtoll(timeout.c_str(), &end, 10);
    if (*end != '\0' ||
        !validateAndSetTimeout(seconds, settings_.connectTimeoutSeconds)) {
      Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                      "Invalid POSTGRES_CONNECT_TIMEOUT: " + timeout);
    }
  }

  if (settings_.password.empty()) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    "POSTGRES_PASSWORD not set in config.json or environment. "
                    "Database connections may fail.");
  }

  initialized_ = true;
}

void DatabaseConfig::setForTesting(const PostgresSettings &settings) {
  std::lock_guard<std::mutex> lock(configMutex_);
  settings_ = settings;
  initialized_ = true;
}
