// typeset_lsp/test_support/recording_client.hpp - lsp::Client that records notifications
#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "typeset_lsp/lsp/client.hpp"

namespace typeset_lsp::test_support
{

class RecordingClient final : public lsp::Client
{
public:
  struct LogEntry
  {
    lsp::MessageType type;
    std::string message;
  };

  void log_message(lsp::MessageType type, std::string message) override
  {
    std::lock_guard<std::mutex> lock(mutex_);
    logs_.push_back(LogEntry{type, std::move(message)});
  }

  void publish_diagnostics(const Uri & uri, std::vector<Diagnostic> diagnostics) override
  {
    std::lock_guard<std::mutex> lock(mutex_);
    published_[uri] = std::move(diagnostics);
    ++publish_count_;
  }

  [[nodiscard]] std::vector<LogEntry> logs() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return logs_;
  }

  /// Latest diagnostics published for `uri`, if any were
  [[nodiscard]] std::optional<std::vector<Diagnostic>> published(const Uri & uri) const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = published_.find(uri);
    if (it == published_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  [[nodiscard]] int publish_count() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return publish_count_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<LogEntry> logs_;
  std::map<Uri, std::vector<Diagnostic>> published_;
  int publish_count_ = 0;
};

}  // namespace typeset_lsp::test_support
