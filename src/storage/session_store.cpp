#include "storage/session_store.h"
#include "core/errors.h"

using json = nlohmann::json;

std::string toString(SessionStatus status) {
  switch (status) {
  case SessionStatus::RUNNING:
    return "running";
  case SessionStatus::STOPPED:
    return "stopped";
  case SessionStatus::COMPLETED:
    return "completed";
  case SessionStatus::FAILED:
    return "failed";
  }
  return "failed";
}

SessionStatus sessionStatusFromString(const std::string &value) {
  if (value == "running")
    return SessionStatus::RUNNING;
  if (value == "stopped")
    return SessionStatus::STOPPED;
  if (value == "completed")
    return SessionStatus::COMPLETED;
  if (value == "failed")
    return SessionStatus::FAILED;
  throw ValidationError("Unknown session status: " + value);
}

void to_json(json &j, const NormalizationSession &session) {
  j = json{{"id", session.id},
           {"database_path", session.databasePath},
           {"status", toString(session.status)},
           {"processed", session.processed},
           {"total", session.total},
           {"failed_items", session.failedItems},
           {"current_step", session.currentStep},
           {"duplicates_found", session.duplicatesFound},
           {"violations_found", session.violationsFound},
           {"suggestions_found", session.suggestionsFound},
           {"started_at", session.startedAt},
           {"last_activity_at", session.lastActivityAt},
           {"timeout_seconds", session.timeoutSeconds}};
  j["database_id"] = session.databaseId ? json(*session.databaseId) : json();
  j["project_id"] = session.projectId ? json(*session.projectId) : json();
  j["ended_at"] = session.endedAt ? json(*session.endedAt) : json();
  if (!session.errorMessage.empty())
    j["error"] = session.errorMessage;
}
