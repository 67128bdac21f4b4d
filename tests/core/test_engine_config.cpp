#include "../support/test_runner.h"
#include "core/database_config.h"
#include "core/engine_config.h"
#include "core/errors.h"
#include <cstdlib>
#include <stdexcept>

using json = nlohmann::json;

int main() {
  TestRunner runner;

  runner.runTest("Defaults are in place", [&]() {
    EngineConfig::resetToDefaults();
    runner.assertEquals(int64_t{500},
                        static_cast<int64_t>(EngineConfig::getBatchSize()),
                        "default batch size");
    runner.assertEquals(int64_t{4},
                        static_cast<int64_t>(EngineConfig::getMaxWorkers()),
                        "default worker count");
    runner.assertEquals(int64_t{300},
                        static_cast<int64_t>(EngineConfig::getCacheTtlSeconds()),
                        "default cache ttl");
    runner.assertTrue(EngineConfig::getCacheEnabled(), "cache enabled");
  });

  runner.runTest("Setters reject values out of range", [&]() {
    EngineConfig::resetToDefaults();
    runner.assertThrows<std::invalid_argument>(
        []() { EngineConfig::setBatchSize(5); }, "batch size below minimum");
    runner.assertThrows<std::invalid_argument>(
        []() { EngineConfig::setMaxWorkers(0); }, "zero workers");
    runner.assertThrows<std::invalid_argument>(
        []() { EngineConfig::setMaxWorkers(33); }, "too many workers");
    runner.assertThrows<std::invalid_argument>(
        []() { EngineConfig::setCacheTtlSeconds(0); }, "zero ttl");
    runner.assertThrows<std::invalid_argument>(
        []() { EngineConfig::setSessionTimeoutSeconds(5); }, "short timeout");
    runner.assertEquals(int64_t{500},
                        static_cast<int64_t>(EngineConfig::getBatchSize()),
                        "batch size untouched after rejection");
  });

  runner.runTest("loadFromJson applies valid values and skips invalid ones",
                 [&]() {
                   EngineConfig::resetToDefaults();
                   json config = {{"engine",
                                   {{"batch_size", 2000},
                                    {"max_workers", 99},
                                    {"cache_ttl_seconds", 60},
                                    {"session_timeout_seconds", -1},
                                    {"cache_enabled", false},
                                    {"log_level", "DEBUG"}}}};
                   EngineConfig::loadFromJson(config);
                   runner.assertEquals(
                       int64_t{2000},
                       static_cast<int64_t>(EngineConfig::getBatchSize()),
                       "batch size applied");
                   runner.assertEquals(
                       int64_t{4},
                       static_cast<int64_t>(EngineConfig::getMaxWorkers()),
                       "out of range worker count ignored");
                   runner.assertEquals(
                       int64_t{60},
                       static_cast<int64_t>(EngineConfig::getCacheTtlSeconds()),
                       "ttl applied");
                   runner.assertEquals(
                       int64_t{3600},
                       static_cast<int64_t>(
                           EngineConfig::getSessionTimeoutSeconds()),
                       "negative timeout ignored");
                   runner.assertFalse(EngineConfig::getCacheEnabled(),
                                      "cache disabled");
                   runner.assertEquals("DEBUG", EngineConfig::getLogLevel(),
                                       "log level applied");
                 });

  runner.runTest("Missing engine section leaves settings alone", [&]() {
    EngineConfig::resetToDefaults();
    EngineConfig::loadFromJson(json{{"database", json::object()}});
    runner.assertEquals(int64_t{500},
                        static_cast<int64_t>(EngineConfig::getBatchSize()),
                        "batch size unchanged");
  });

  runner.runTest("resetToDefaults restores every value", [&]() {
    EngineConfig::setBatchSize(10);
    EngineConfig::setCacheEnabled(false);
    EngineConfig::setLogFile("/tmp/cq.log");
    EngineConfig::resetToDefaults();
    runner.assertEquals(int64_t{500},
                        static_cast<int64_t>(EngineConfig::getBatchSize()),
                        "batch size");
    runner.assertTrue(EngineConfig::getCacheEnabled(), "cache enabled");
    runner.assertEquals("", EngineConfig::getLogFile(), "log file cleared");
  });

  runner.runTest("Error types carry their wire names", [&]() {
    ValidationError validation("bad");
    NotFoundError notFound("missing");
    ConflictError conflict("busy");
    UpstreamError upstream("down");
    InternalError internal("bug");
    runner.assertEquals("validation", validation.typeName(), "validation");
    runner.assertEquals("not_found", notFound.typeName(), "not found");
    runner.assertEquals("conflict", conflict.typeName(), "conflict");
    runner.assertEquals("upstream", upstream.typeName(), "upstream");
    runner.assertEquals("internal", internal.typeName(), "internal");
    runner.assertEquals("missing", notFound.what(), "message kept");
  });

  runner.runTest("Connection string for logging hides the password", [&]() {
    PostgresSettings settings;
    settings.host = "db.local";
    settings.database = "quality";
    settings.user = "svc";
    settings.password = "s3cret";
    settings.port = "5433";
    settings.applicationName = "quality worker";
    DatabaseConfig::setForTesting(settings);
    runner.assertTrue(DatabaseConfig::isInitialized(), "initialized");
    std::string full = DatabaseConfig::getPostgresConnectionString();
    std::string masked = DatabaseConfig::getPostgresConnectionStringForLogging();
    runner.assertTrue(full.find("s3cret") != std::string::npos,
                      "real string has the password");
    runner.assertTrue(masked.find("s3cret") == std::string::npos,
                      "masked string drops the password");
    runner.assertTrue(masked.find("password=***") != std::string::npos,
                      "masked placeholder present");
    runner.assertTrue(masked.find("port=5433") != std::string::npos,
                      "port kept");
    runner.assertTrue(full.find("application_name='quality worker'") !=
                          std::string::npos,
                      "application name quoted");
    runner.assertTrue(full.find("connect_timeout=10") != std::string::npos,
                      "default connect timeout");
  });

  runner.runTest("Service database settings load from JSON", [&]() {
    DatabaseConfig::loadFromJson(nlohmann::json::parse(R"({
      "database": {"postgres": {"host": "pg.internal", "port": 6543,
                                "database": "catalog", "password": "pw",
                                "connect_timeout_seconds": 3}}})"));
    PostgresSettings loaded = DatabaseConfig::getSettings();
    if (std::getenv("POSTGRES_HOST") == nullptr)
      runner.assertEquals("pg.internal", loaded.host, "host");
    if (std::getenv("POSTGRES_CONNECT_TIMEOUT") == nullptr)
      runner.assertEquals(int64_t{3}, int64_t{loaded.connectTimeoutSeconds},
                          "timeout");
    int before = loaded.connectTimeoutSeconds;
    DatabaseConfig::loadFromJson(nlohmann::json::parse(
        R"({"database": {"postgres": {"connect_timeout_seconds": 0}}})"));
    runner.assertEquals(int64_t{before},
                        int64_t{DatabaseConfig::getSettings().connectTimeoutSeconds},
                        "out of range timeout ignored");
  });

  runner.printSummary();
  return 0;
}
