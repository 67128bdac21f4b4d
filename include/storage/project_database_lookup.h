#ifndef PROJECT_DATABASE_LOOKUP_H
#define PROJECT_DATABASE_LOOKUP_H

#include <cstdint>
#include <optional>
#include <pqxx/pqxx>
#include <string>
#include <vector>

struct ProjectDatabase {
  int64_t id = 0;
  int64_t projectId = 0;
  std::string name;
  std::string filePath;
  bool isActive = true;
};

// Read-only view of the project administration data owned by another module.
class IProjectDatabaseLookup {
public:
  virtual ~IProjectDatabaseLookup() = default;

  // Active databases of the project ordered by id. Throws NotFoundError for an
  // unknown project.
  virtual std::vector<ProjectDatabase> activeDatabases(int64_t projectId) = 0;

  virtual std::optional<ProjectDatabase>
  findByPath(const std::string &filePath) = 0;
};

// Reads metadata.projects and metadata.project_databases.
class PostgresProjectDatabaseLookup : public IProjectDatabaseLookup {
  std::string connectionString_;

  pqxx::connection getConnection();

public:
  explicit PostgresProjectDatabaseLookup(std::string connectionString);

  // Creates the lookup tables when the administration module has not yet.
  void initializeSchema();

  std::vector<ProjectDatabase> activeDatabases(int64_t projectId) override;
  std::optional<ProjectDatabase>
  findByPath(const std::string &filePath) override;
};

#endif
