#ifndef LOG_WRITER_H
#define LOG_WRITER_H

#include <cstdint>
#include <string>

// One log line as handed to every sink. sessionId and databasePath come from
// the LogContextScope active on the logging thread; both are empty outside a
// normalization or analysis run.
struct LogEntry {
  std::string timestamp;
  std::string level;
  std::string category;
  std::string function;
  std::string message;
  int64_t sessionId = 0;
  std::string databasePath;
  std::string formatted;

  bool hasSession() const { return sessionId > 0; }
};

class ILogWriter {
public:
  virtual ~ILogWriter() = default;

  // Returns false when the entry was dropped; sinks never throw.
  virtual bool write(const LogEntry &entry) = 0;
  virtual void flush() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
  virtual std::string name() const = 0;
};

// Tags every entry logged on the current thread with the run it belongs to
// until the scope ends. Scopes nest; the innermost one wins.
class LogContextScope {
public:
  LogContextScope(int64_t sessionId, std::string databasePath);
  ~LogContextScope();

  LogContextScope(const LogContextScope &) = delete;
  LogContextScope &operator=(const LogContextScope &) = delete;

  static int64_t currentSessionId();
  static std::string currentDatabasePath();

private:
  int64_t previousSessionId_;
  std::string previousDatabasePath_;
};

#endif
