#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include "core/log_writer.h"
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

struct FileRotationPolicy {
  size_t maxFileBytes = 10 * 1024 * 1024;
  int backupFiles = 5;
};

// Appends formatted lines to engine.log_file and rotates it to .1 ... .N once
// it reaches the policy size.
class FileLogWriter : public ILogWriter {
private:
  std::ofstream file_;
  std::string path_;
  FileRotationPolicy policy_;
  size_t bytesWritten_ = 0;
  mutable std::mutex mutex_;

public:
  explicit FileLogWriter(const std::string &path,
                         FileRotationPolicy policy = FileRotationPolicy());
  ~FileLogWriter() override { close(); }

  bool write(const LogEntry &entry) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;
  std::string name() const override { return "file:" + path_; }

private:
  void openUnlocked();
  void rotateUnlocked();
};

#endif
