// typeset_lsp/lsp/client.cpp - Outbound channel to the editor
#include "typeset_lsp/lsp/client.hpp"

#include "typeset_lsp/lsp/protocol.hpp"

namespace typeset_lsp::lsp
{

const char * to_string(MessageType type) noexcept
{
  switch (type) {
    case MessageType::Error:
      return "error";
    case MessageType::Warning:
      return "warning";
    case MessageType::Info:
      return "info";
    case MessageType::Log:
      return "log";
  }
  return "unknown";
}

JsonClient::JsonClient(Writer writer) : writer_(std::move(writer)) {}

void JsonClient::log_message(MessageType type, std::string message)
{
  const auto notif = make_log_message(static_cast<int>(type), message);
  std::lock_guard<std::mutex> lock(mutex_);
  writer_(notif);
}

void JsonClient::publish_diagnostics(const Uri & uri, std::vector<Diagnostic> diagnostics)
{
  const auto notif = make_publish_diagnostics(uri, diagnostics);
  std::lock_guard<std::mutex> lock(mutex_);
  writer_(notif);
}

}  // namespace typeset_lsp::lsp
