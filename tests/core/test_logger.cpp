#include "../support/temp_database.h"
#include "../support/test_runner.h"
#include "core/file_log_writer.h"
#include "core/logger.h"
#include <filesystem>
#include <thread>

class CapturingWriter : public ILogWriter {
public:
  explicit CapturingWriter(std::vector<LogEntry> *sink) : sink_(sink) {}

  bool write(const LogEntry &entry) override {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_->push_back(entry);
    return true;
  }
  void flush() override {}
  void close() override {}
  bool isOpen() const override { return true; }
  std::string name() const override { return "capture"; }

private:
  std::vector<LogEntry> *sink_;
  std::mutex mutex_;
};

int main() {
  TestRunner runner;
  std::vector<LogEntry> captured;
  Logger::addWriter(std::make_unique<CapturingWriter>(&captured));

  runner.runTest("Entries below the level are dropped", [&]() {
    captured.clear();
    Logger::setLogLevel("warning");
    Logger::info(LogCategory::SYSTEM, "test", "quiet");
    Logger::warning(LogCategory::SYSTEM, "test", "loud");
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(captured.size()),
                        "only the warning");
    runner.assertEquals("WARNING", captured[0].level, "level name");

    Logger::setLogLevel("verbose");
    runner.assertTrue(Logger::getCurrentLogLevel() == LogLevel::WARNING,
                      "unknown level name ignored");
    Logger::setLogLevel(LogLevel::INFO);
  });

  runner.runTest("Run context tags entries on its thread only", [&]() {
    captured.clear();
    {
      LogContextScope outer(12, "/data/a.db");
      Logger::info(LogCategory::NORMALIZATION, "run", "inside");
      {
        LogContextScope inner(13, "/data/b.db");
        Logger::info(LogCategory::NORMALIZATION, "run", "nested");
      }
      std::thread other([]() {
        Logger::info(LogCategory::NORMALIZATION, "run", "other thread");
      });
      other.join();
      Logger::info(LogCategory::NORMALIZATION, "run", "restored");
    }
    Logger::info(LogCategory::SYSTEM, "run", "outside");

    runner.assertEquals(int64_t{5}, static_cast<int64_t>(captured.size()),
                        "all entries written");
    runner.assertEquals(int64_t{12}, captured[0].sessionId, "outer session");
    runner.assertEquals("/data/a.db", captured[0].databasePath, "outer path");
    runner.assertTrue(captured[0].formatted.find("[session 12]") !=
                          std::string::npos,
                      "session in the line");
    runner.assertEquals(int64_t{13}, captured[1].sessionId, "inner session");
    runner.assertFalse(captured[2].hasSession(), "other thread untagged");
    runner.assertEquals(int64_t{12}, captured[3].sessionId, "outer restored");
    runner.assertFalse(captured[4].hasSession(), "cleared after scope");
    runner.assertEquals("", captured[4].databasePath, "path cleared");
  });

  runner.runTest("File writer rotates at the size limit", [&]() {
    TempDirectory dir;
    std::string path = dir.file("logs/quality.log");
    FileRotationPolicy policy;
    policy.maxFileBytes = 64;
    policy.backupFiles = 2;
    FileLogWriter writer(path, policy);
    runner.assertTrue(writer.isOpen(), "opened with parent directory");

    LogEntry entry;
    entry.formatted = std::string(40, 'x');
    for (int i = 0; i < 7; ++i) {
      runner.assertTrue(writer.write(entry), "written");
    }
    writer.flush();

    runner.assertTrue(std::filesystem::exists(path + ".1"), "first backup");
    runner.assertTrue(std::filesystem::exists(path + ".2"), "second backup");
    runner.assertFalse(std::filesystem::exists(path + ".3"),
                       "backups beyond the policy removed");
    runner.assertTrue(std::filesystem::file_size(path) < 128,
                      "current file restarted");

    writer.close();
    runner.assertFalse(writer.isOpen(), "closed");
    runner.assertFalse(writer.write(entry), "closed writer rejects entries");
  });

  Logger::shutdown();
  runner.printSummary();
  return 0;
}
