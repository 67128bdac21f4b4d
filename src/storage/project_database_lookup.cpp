#include "storage/project_database_lookup.h"
#include "core/errors.h"
#include "core/logger.h"

namespace {
ProjectDatabase readRow(const pqxx::row &row) {
  ProjectDatabase db;
  db.id = row[0].as<int64_t>();
  db.projectId = row[1].as<int64_t>();
  db.name = row[2].is_null() ? std::string() : row[2].as<std::string>();
  db.filePath = row[3].as<std::string>();
  db.isActive = row[4].as<bool>();
  return db;
}
} // namespace

PostgresProjectDatabaseLookup::PostgresProjectDatabaseLookup(
    std::string connectionString)
    : connectionString_(std::move(connectionString)) {}

pqxx::connection PostgresProjectDatabaseLookup::getConnection() {
  return pqxx::connection(connectionString_);
}

void PostgresProjectDatabaseLookup::initializeSchema() {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    txn.exec("CREATE SCHEMA IF NOT EXISTS metadata");
    txn.exec("CREATE TABLE IF NOT EXISTS metadata.projects ("
             "id BIGSERIAL PRIMARY KEY,"
             "name VARCHAR(255) NOT NULL)");
    txn.exec("CREATE TABLE IF NOT EXISTS metadata.project_databases ("
             "id BIGSERIAL PRIMARY KEY,"
             "project_id BIGINT NOT NULL REFERENCES metadata.projects(id),"
             "name VARCHAR(255),"
             "file_path TEXT NOT NULL,"
             "is_active BOOLEAN NOT NULL DEFAULT true)");
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "PostgresProjectDatabaseLookup",
                  "Error creating lookup schema: " + std::string(e.what()));
    throw UpstreamError("Cannot initialize project schema: " +
                        std::string(e.what()));
  }
}

std::vector<ProjectDatabase>
PostgresProjectDatabaseLookup::activeDatabases(int64_t projectId) {
  std::vector<ProjectDatabase> databases;
  bool projectExists = false;
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    auto exists = txn.exec_params(
        "SELECT EXISTS (SELECT 1 FROM metadata.projects WHERE id = $1)",
        projectId);
    projectExists = exists[0][0].as<bool>();
    if (projectExists) {
      auto results = txn.exec_params(
          "SELECT id, project_id, name, file_path, is_active "
          "FROM metadata.project_databases "
          "WHERE project_id = $1 AND is_active = true ORDER BY id",
          projectId);
      for (const auto &row : results) {
        databases.push_back(readRow(row));
      }
    }
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "PostgresProjectDatabaseLookup",
                  "Error listing databases of project " +
                      std::to_string(projectId) + ": " + e.what());
    throw UpstreamError("Cannot list project databases: " +
                        std::string(e.what()));
  }

  if (!projectExists) {
    throw NotFoundError("Project " + std::to_string(projectId) +
                        " not found");
  }
  return databases;
}

std::optional<ProjectDatabase>
PostgresProjectDatabaseLookup::findByPath(const std::string &filePath) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    auto results = txn.exec_params(
        "SELECT id, project_id, name, file_path, is_active "
        "FROM metadata.project_databases WHERE file_path = $1 "
        "ORDER BY is_active DESC, id LIMIT 1",
        filePath);
    txn.commit();
    if (results.empty())
      return std::nullopt;
    return readRow(results[0]);
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "PostgresProjectDatabaseLookup",
                  "Error looking up database '" + filePath +
                      "': " + e.what());
    throw UpstreamError("Cannot look up database: " + std::string(e.what()));
  }
}
