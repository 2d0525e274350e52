// typeset_lsp/lsp/client.hpp - Outbound channel to the editor
#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "typeset_lsp/basic/diagnostic.hpp"
#include "typeset_lsp/basic/uri.hpp"

namespace typeset_lsp::lsp
{

/// Numeric values match the LSP MessageType enumeration
enum class MessageType : uint8_t {
  Error = 1,
  Warning = 2,
  Info = 3,
  Log = 4,
};

[[nodiscard]] const char * to_string(MessageType type) noexcept;

/**
 * Notifications the server sends without a request.
 *
 * Implementations must be safe to call from several threads at once: passes
 * publish from the executor while editor events log from the caller's thread.
 */
class Client
{
public:
  virtual ~Client() = default;

  virtual void log_message(MessageType type, std::string message) = 0;

  /// Replace the diagnostics shown for `uri`
  virtual void publish_diagnostics(const Uri & uri, std::vector<Diagnostic> diagnostics) = 0;
};

/**
 * Client that encodes notifications as JSON-RPC messages and hands them to a
 * writer supplied by the transport (which owns framing). Calls to the writer
 * are serialized.
 */
class JsonClient final : public Client
{
public:
  using Writer = std::function<void(const nlohmann::json &)>;

  explicit JsonClient(Writer writer);

  void log_message(MessageType type, std::string message) override;
  void publish_diagnostics(const Uri & uri, std::vector<Diagnostic> diagnostics) override;

private:
  std::mutex mutex_;
  Writer writer_;
};

}  // namespace typeset_lsp::lsp
