// typeset_lsp/server/server.hpp - Editor events to workspace updates and passes
#pragma once

#include <asio/thread_pool.hpp>

#include <future>
#include <string>
#include <vector>

#include "typeset_lsp/basic/diagnostic.hpp"
#include "typeset_lsp/basic/uri.hpp"
#include "typeset_lsp/config/server_config.hpp"
#include "typeset_lsp/engine/engine.hpp"
#include "typeset_lsp/lsp/protocol.hpp"
#include "typeset_lsp/server/compiler_invocation.hpp"
#include "typeset_lsp/workspace/workspace.hpp"

namespace typeset_lsp::server
{

/**
 * Glue between decoded protocol notifications and the workspace.
 *
 * Notification handlers run on the caller's thread and return once the
 * workspace reflects the event. Diagnostics passes run on a thread pool whose
 * threads may block; the returned futures complete once their diagnostics have
 * been published. Destruction waits for queued passes.
 */
class Server
{
public:
  Server(workspace::Workspace & ws, engine::Engine & engine, ServerConfig config);
  ~Server();

  Server(const Server &) = delete;
  Server & operator=(const Server &) = delete;

  std::future<void> did_open(const Uri & uri, std::string text);

  /// Apply changes in order: ranged changes edit, the others replace the text
  std::future<void> did_change(const Uri & uri, const std::vector<lsp::ContentChange> & changes);

  void did_close(const Uri & uri);

  void did_change_watched_files(const std::vector<Uri> & uris);

  /// Run the configured pass for `id` and publish its diagnostics
  std::future<void> run_diagnostics(SourceId id);

  /// Publish `diagnostics`, adding an empty list for every open document without any
  void update_all_diagnostics(DiagnosticsByUri diagnostics);

  [[nodiscard]] const ServerConfig & config() const noexcept { return config_; }

private:
  workspace::Workspace & ws_;
  ServerConfig config_;
  CompilerInvocation invocation_;
  // Declared last: joined before the members its tasks use are destroyed
  asio::thread_pool pool_;
};

}  // namespace typeset_lsp::server
