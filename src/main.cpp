#include "core/database_config.h"
#include "core/engine_config.h"
#include "core/logger.h"
#include "normalization/normalization_worker_pool.h"
#include "service/quality_service.h"
#include "storage/postgres_session_store.h"
#include "storage/project_database_lookup.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_OPERATION_FAILED = 1;
constexpr int EXIT_USAGE_ERROR = 2;
constexpr int EXIT_INIT_ERROR = 3;
constexpr int EXIT_CRITICAL_ERROR = 4;
constexpr int EXIT_CONFIG_ERROR = 6;
constexpr int EXIT_SIGNAL_ERROR = 7;

constexpr auto PROGRESS_INTERVAL = std::chrono::seconds(2);

std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdownRequested.store(true);
  }
}

void cleanupLogger() {
  try {
    Logger::shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Error flushing logs: " << e.what() << std::endl;
  }
}

void printUsage() {
  std::cerr << "Usage: CatalogQuality [--config <path>] <operation> "
               "['<json request>']\n\nOperations:\n";
  for (const auto &name : QualityService::operations()) {
    std::cerr << "  " << name << "\n";
  }
  std::cerr << "\n'start' stays attached until its sessions finish; SIGINT or "
               "SIGTERM stops them at the next batch.\n";
}

// Keeps the process alive while the started sessions run, since they live in
// this process's worker pool.
void followSessions(QualityService &service, const nlohmann::json &scope,
                    NormalizationWorkerPool &pool) {
  bool stopSent = false;
  while (!pool.waitForIdle(PROGRESS_INTERVAL)) {
    if (g_shutdownRequested.load() && !stopSent) {
      std::cerr << "Stop requested, finishing the current batch..."
                << std::endl;
      nlohmann::json stopped = service.handle("stop", scope);
      if (!stopped.value("success", false)) {
        std::cerr << "Stop failed: " << stopped.dump() << std::endl;
      }
      stopSent = true;
    }
    nlohmann::json status = service.handle("status", scope);
    std::cerr << "[" << status.value("current_step", std::string("idle"))
              << "] " << status.value("processed", 0) << "/"
              << status.value("total", 0) << std::endl;
  }
}
} // namespace

int main(int argc, char *argv[]) {
  std::string configPath = "config.json";
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      printUsage();
      return EXIT_SUCCESS_CODE;
    } else {
      args.push_back(arg);
    }
  }
  if (args.empty() || args.size() > 2) {
    printUsage();
    return EXIT_USAGE_ERROR;
  }

  const std::string operation = args[0];
  nlohmann::json request = nlohmann::json::object();
  if (args.size() == 2) {
    request = nlohmann::json::parse(args[1], nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
      std::cerr << "Error: request must be a JSON object" << std::endl;
      return EXIT_USAGE_ERROR;
    }
  }

  try {
    DatabaseConfig::loadFromFile(configPath);
    EngineConfig::loadFromFile(configPath);

    if (!DatabaseConfig::isInitialized()) {
      std::cerr << "Error: Database configuration failed to initialize. "
                   "Please check "
                << configPath << " or environment variables." << std::endl;
      return EXIT_CONFIG_ERROR;
    }

    Logger::initialize();

    if (std::signal(SIGINT, signalHandler) == SIG_ERR) {
      std::cerr << "Error: Failed to register SIGINT handler" << std::endl;
      cleanupLogger();
      return EXIT_SIGNAL_ERROR;
    }
    if (std::signal(SIGTERM, signalHandler) == SIG_ERR) {
      std::cerr << "Error: Failed to register SIGTERM handler" << std::endl;
      cleanupLogger();
      return EXIT_SIGNAL_ERROR;
    }

    Logger::info(LogCategory::SYSTEM, "main",
                 "CatalogQuality " + operation + " (DB: " +
                     DatabaseConfig::getPostgresDB() + "@" +
                     DatabaseConfig::getPostgresHost() + ")");

    std::shared_ptr<PostgresSessionStore> store;
    std::shared_ptr<PostgresProjectDatabaseLookup> lookup;
    std::shared_ptr<NormalizationWorkerPool> pool;
    std::unique_ptr<QualityService> service;
    try {
      const std::string connection =
          DatabaseConfig::getPostgresConnectionString();
      store = std::make_shared<PostgresSessionStore>(connection);
      store->initializeSchema();
      lookup = std::make_shared<PostgresProjectDatabaseLookup>(connection);
      lookup->initializeSchema();
      pool = std::make_shared<NormalizationWorkerPool>(store, lookup);
      service = std::make_unique<QualityService>(pool, lookup);
    } catch (const std::exception &e) {
      Logger::error(LogCategory::SYSTEM, "main",
                    "Initialization failed: " + std::string(e.what()));
      std::cerr << "Initialization error: " << e.what() << std::endl;
      cleanupLogger();
      return EXIT_INIT_ERROR;
    }

    nlohmann::json response = service->handle(operation, request);
    bool failed = response.is_object() && response.contains("success") &&
                  response["success"].is_boolean() &&
                  !response["success"].get<bool>();

    if (operation == "start" && !failed) {
      std::cout << response.dump(2) << std::endl;
      followSessions(*service, request, *pool);
      response = service->handle("status", request);
    }
    std::cout << response.dump(2) << std::endl;

    pool->shutdown();
    cleanupLogger();
    return failed ? EXIT_OPERATION_FAILED : EXIT_SUCCESS_CODE;

  } catch (const std::exception &e) {
    std::cerr << "Critical error in main: " << e.what() << std::endl;
    cleanupLogger();
    return EXIT_CRITICAL_ERROR;
  }
}
