#include "concurrency/task_thread_pool.h"
#include <algorithm>

// A worker count of 0 falls back to the hardware concurrency.
TaskThreadPool::TaskThreadPool(const std::string &name, size_t numWorkers)
    : name_(name) {
  if (numWorkers == 0) {
    numWorkers = std::max<size_t>(1, std::thread::hardware_concurrency());
    Logger::warning(LogCategory::SYSTEM, "TaskThreadPool",
                    name_ + ": numWorkers was 0, using hardware_concurrency: " +
                        std::to_string(numWorkers));
  }

  workers_.reserve(numWorkers);
  for (size_t i = 0; i < numWorkers; ++i) {
    workers_.emplace_back(&TaskThreadPool::workerThread, this, i);
  }

  Logger::debug(LogCategory::SYSTEM, "TaskThreadPool",
                "Created pool '" + name_ + "' with " +
                    std::to_string(numWorkers) + " workers");
}

TaskThreadPool::~TaskThreadPool() { shutdown(); }

void TaskThreadPool::workerThread(size_t workerId) {
  PoolTask task;
  while (tasks_.popBlocking(task)) {
    activeWorkers_++;

    try {
      Logger::debug(LogCategory::SYSTEM, "TaskThreadPool",
                    name_ + " worker #" + std::to_string(workerId) +
                        " running: " + task.label);
      task.work();
      completedTasks_++;
    } catch (const std::exception &e) {
      failedTasks_++;
      Logger::error(LogCategory::SYSTEM, "TaskThreadPool",
                    name_ + " worker #" + std::to_string(workerId) +
                        " failed task: " + task.label +
                        " - Error: " + std::string(e.what()));
    }

    activeWorkers_--;
    task = PoolTask{};
    taskFinished();
  }
}

void TaskThreadPool::taskFinished() {
  std::lock_guard<std::mutex> lock(idleMutex_);
  if (outstanding_ > 0) {
    --outstanding_;
  }
  if (outstanding_ == 0) {
    idleCv_.notify_all();
  }
}

bool TaskThreadPool::submit(const std::string &label,
                            std::function<void()> work) {
  if (shutdown_.load()) {
    Logger::warning(LogCategory::SYSTEM, "TaskThreadPool::submit",
                    "Cannot submit task - pool '" + name_ +
                        "' is shutting down: " + label);
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(idleMutex_);
    ++outstanding_;
  }
  if (!tasks_.push(PoolTask{label, std::move(work)})) {
    taskFinished();
    return false;
  }
  return true;
}

bool TaskThreadPool::waitForIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(idleMutex_);
  return idleCv_.wait_for(lock, timeout, [this] { return outstanding_ == 0; });
}

// Idempotent. Queued tasks are still executed before the workers exit.
void TaskThreadPool::shutdown() {
  if (shutdown_.exchange(true)) {
    return;
  }

  tasks_.finish();

  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  Logger::debug(LogCategory::SYSTEM, "TaskThreadPool",
                "Pool '" + name_ + "' shut down - Completed: " +
                    std::to_string(completedTasks_.load()) +
                    " | Failed: " + std::to_string(failedTasks_.load()));
}
