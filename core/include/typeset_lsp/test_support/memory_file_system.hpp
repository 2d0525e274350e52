// typeset_lsp/test_support/memory_file_system.hpp - In-memory FileSystem for tests
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "typeset_lsp/workspace/file_system.hpp"

namespace typeset_lsp::test_support
{

/**
 * FileSystem backed by a map. Counts reads per path and can delay every read
 * to widen race windows.
 */
class MemoryFileSystem final : public workspace::FileSystem
{
public:
  void write(const std::filesystem::path & path, std::string content)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    files_[path.generic_string()] = Entry{std::move(content), false};
  }

  void remove(const std::filesystem::path & path)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    files_.erase(path.generic_string());
  }

  /// Reads of `path` fail with access-denied
  void deny(const std::filesystem::path & path)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    files_[path.generic_string()].denied = true;
  }

  void set_read_delay(std::chrono::milliseconds delay) { delay_ = delay; }

  [[nodiscard]] int read_count(const std::filesystem::path & path) const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = reads_.find(path.generic_string());
    return it == reads_.end() ? 0 : it->second;
  }

  [[nodiscard]] int total_reads() const { return total_reads_.load(); }

  FileResult<std::string> read_to_string(const std::filesystem::path & path) override
  {
    const std::string key = path.generic_string();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++reads_[key];
    }
    ++total_reads_;

    if (delay_.count() > 0) {
      std::this_thread::sleep_for(delay_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = files_.find(key);
    if (it == files_.end()) {
      return FileResult<std::string>::fail(FileError::not_found(path));
    }
    if (it->second.denied) {
      return FileResult<std::string>::fail(FileError::access_denied(path));
    }
    return FileResult<std::string>::ok(it->second.content);
  }

  FileResult<Bytes> read_bytes(const std::filesystem::path & path) override
  {
    auto text = read_to_string(path);
    if (!text) {
      return FileResult<Bytes>::fail(text.error());
    }
    return FileResult<Bytes>::ok(Bytes::from_string(text.value()));
  }

private:
  struct Entry
  {
    std::string content;
    bool denied = false;
  };

  mutable std::mutex mutex_;
  std::map<std::string, Entry> files_;
  std::map<std::string, int> reads_;
  std::atomic<int> total_reads_{0};
  std::chrono::milliseconds delay_{0};
};

}  // namespace typeset_lsp::test_support
