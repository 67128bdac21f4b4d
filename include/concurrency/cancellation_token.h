#ifndef CANCELLATION_TOKEN_H
#define CANCELLATION_TOKEN_H

#include <atomic>

// Cooperative stop signal shared between the controller and one worker. The
// worker polls it at batch and step boundaries only.
class CancellationToken {
private:
  std::atomic<bool> cancelled_{false};

public:
  void cancel() { cancelled_.store(true); }
  bool isCancelled() const { return cancelled_.load(); }
};

#endif
