#include "concurrency/run_registry.h"

std::optional<std::string>
RunRegistry::reserve(const std::vector<std::string> &paths,
                     std::optional<int64_t> projectId) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &path : paths) {
    if (runs_.count(path))
      return path;
  }
  for (const auto &path : paths) {
    RunEntry entry;
    entry.projectId = projectId;
    entry.token = std::make_shared<CancellationToken>();
    runs_.emplace(path, std::move(entry));
  }
  return std::nullopt;
}

std::shared_ptr<CancellationToken> RunRegistry::attach(const std::string &path,
                                                       int64_t sessionId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(path);
  if (it == runs_.end())
    return nullptr;
  it->second.sessionId = sessionId;
  return it->second.token;
}

void RunRegistry::release(const std::string &path) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    runs_.erase(path);
  }
  released_.notify_all();
}

void RunRegistry::release(const std::vector<std::string> &paths) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &path : paths) {
      runs_.erase(path);
    }
  }
  released_.notify_all();
}

size_t RunRegistry::cancel(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(path);
  if (it == runs_.end())
    return 0;
  it->second.token->cancel();
  return 1;
}

size_t RunRegistry::cancelProject(int64_t projectId) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t cancelled = 0;
  for (auto &entry : runs_) {
    if (entry.second.projectId == projectId) {
      entry.second.token->cancel();
      cancelled++;
    }
  }
  return cancelled;
}

size_t RunRegistry::cancelAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &entry : runs_) {
    entry.second.token->cancel();
  }
  return runs_.size();
}

bool RunRegistry::isRunning(const std::string &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return runs_.count(path) > 0;
}

std::optional<RunEntry> RunRegistry::find(const std::string &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(path);
  if (it == runs_.end())
    return std::nullopt;
  return it->second;
}

std::vector<RunEntry> RunRegistry::runsForProject(int64_t projectId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RunEntry> runs;
  for (const auto &entry : runs_) {
    if (entry.second.projectId == projectId)
      runs.push_back(entry.second);
  }
  return runs;
}

std::vector<RunEntry> RunRegistry::allRuns() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RunEntry> runs;
  for (const auto &entry : runs_) {
    runs.push_back(entry.second);
  }
  return runs;
}

size_t RunRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return runs_.size();
}

bool RunRegistry::waitUntilEmpty(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return released_.wait_for(lock, timeout, [this] { return runs_.empty(); });
}
