#include "core/file_log_writer.h"
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

FileLogWriter::FileLogWriter(const std::string &path, FileRotationPolicy policy)
    : path_(path), policy_(policy) {
  if (policy_.backupFiles < 1)
    policy_.backupFiles = 1;
  if (policy_.maxFileBytes == 0)
    policy_.maxFileBytes = FileRotationPolicy().maxFileBytes;

  fs::path parent = fs::path(path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      std::cerr << "FileLogWriter: cannot create " << parent.string() << ": "
                << ec.message() << std::endl;
    }
  }
  openUnlocked();
}

// The size is tracked in memory from the size found at open, so a write never
// has to stat the file.
void FileLogWriter::openUnlocked() {
  file_.open(path_, std::ios::app);
  std::error_code ec;
  auto existing = fs::file_size(path_, ec);
  bytesWritten_ = ec ? 0 : static_cast<size_t>(existing);
}

bool FileLogWriter::write(const LogEntry &entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open())
    return false;

  if (bytesWritten_ >= policy_.maxFileBytes) {
    rotateUnlocked();
    if (!file_.is_open())
      return false;
  }

  file_ << entry.formatted << '\n';
  bytesWritten_ += entry.formatted.size() + 1;
  return file_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

void FileLogWriter::rotateUnlocked() {
  file_.close();

  std::error_code ec;
  fs::remove(path_ + "." + std::to_string(policy_.backupFiles), ec);
  for (int i = policy_.backupFiles - 1; i > 0; --i) {
    std::string from = path_ + "." + std::to_string(i);
    if (fs::exists(from, ec))
      fs::rename(from, path_ + "." + std::to_string(i + 1), ec);
  }
  fs::rename(path_, path_ + ".1", ec);
  if (ec) {
    std::cerr << "FileLogWriter: rotation of " << path_
              << " failed: " << ec.message() << std::endl;
  }

  openUnlocked();
}
