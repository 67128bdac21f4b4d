#ifndef TASK_THREAD_POOL_H
#define TASK_THREAD_POOL_H

#include "core/logger.h"
#include "utils/thread_safe_queue.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct PoolTask {
  std::string label;
  std::function<void()> work;
};

// Fixed set of worker threads consuming a shared task queue. At most
// totalWorkers() tasks run at once; the rest wait in the queue. A task that
// throws is counted as failed and logged; the worker keeps running.
class TaskThreadPool {
private:
  std::string name_;
  std::vector<std::thread> workers_;
  ThreadSafeQueue<PoolTask> tasks_;
  std::atomic<size_t> activeWorkers_{0};
  std::atomic<size_t> completedTasks_{0};
  std::atomic<size_t> failedTasks_{0};
  std::atomic<bool> shutdown_{false};

  std::mutex idleMutex_;
  std::condition_variable idleCv_;
  size_t outstanding_ = 0;

  void workerThread(size_t workerId);
  void taskFinished();

public:
  TaskThreadPool(const std::string &name, size_t numWorkers);
  ~TaskThreadPool();

  TaskThreadPool(const TaskThreadPool &) = delete;
  TaskThreadPool &operator=(const TaskThreadPool &) = delete;

  // Returns false when the pool is shutting down and the task was dropped.
  bool submit(const std::string &label, std::function<void()> work);

  // Blocks until every submitted task has finished or the timeout expires.
  bool waitForIdle(std::chrono::milliseconds timeout);

  // Stops accepting tasks, lets queued tasks run, joins all workers.
  void shutdown();

  size_t activeWorkers() const { return activeWorkers_.load(); }
  size_t completedTasks() const { return completedTasks_.load(); }
  size_t failedTasks() const { return failedTasks_.load(); }
  size_t pendingTasks() const { return tasks_.size(); }
  size_t totalWorkers() const { return workers_.size(); }
};

#endif
