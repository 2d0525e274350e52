// typeset_lsp/server/server.cpp - Editor events to workspace updates and passes
#include "typeset_lsp/server/server.hpp"

#include <algorithm>

#include <asio/post.hpp>
#include <asio/use_future.hpp>
#include <fmt/format.h>

#include "typeset_lsp/basic/log.hpp"

namespace typeset_lsp::server
{

namespace
{

std::future<void> ready_future()
{
  std::promise<void> done;
  done.set_value();
  return done.get_future();
}

}  // namespace

Server::Server(workspace::Workspace & ws, engine::Engine & engine, ServerConfig config)
: ws_(ws),
  config_(std::move(config)),
  invocation_(ws, engine, config_.memo_max_age, config_.position_encoding),
  pool_(std::max<size_t>(config_.compile_threads, 1))
{
}

Server::~Server()
{
  // join() lets queued passes finish; the pool's own destructor would drop them
  pool_.join();
}

std::future<void> Server::did_open(const Uri & uri, std::string text)
{
  const SourceId id = ws_.sources().open(uri, std::move(text));
  return run_diagnostics(id);
}

std::future<void> Server::did_change(
  const Uri & uri, const std::vector<lsp::ContentChange> & changes)
{
  SourceId id;
  {
    auto source = ws_.sources().get_mut_source(uri);
    if (!source) {
      const std::string message =
        fmt::format("unable to apply changes to {}: {}", uri.str(), source.error().message());
      log::logger()->warn("{}", message);
      ws_.client().log_message(lsp::MessageType::Warning, message);
      return ready_future();
    }

    auto & guard = source.value();
    for (const auto & change : changes) {
      if (change.range) {
        guard->edit(*change.range, change.text, config_.position_encoding);
      } else {
        guard->replace(change.text);
      }
    }
    id = guard->id();
  }

  if (ws_.sources().status(id) != workspace::CacheStatus::Open) {
    // Edits to a closed slot last only until the next watched-file change
    const std::string message =
      fmt::format("changes to {} were applied to a document that is not open", uri.str());
    log::logger()->warn("{}", message);
    ws_.client().log_message(lsp::MessageType::Warning, message);
  }
  return run_diagnostics(id);
}

void Server::did_close(const Uri & uri)
{
  ws_.sources().close(uri);
  ws_.client().publish_diagnostics(uri, {});
}

void Server::did_change_watched_files(const std::vector<Uri> & uris)
{
  for (const auto & uri : uris) {
    ws_.sources().mark_changed(uri);
    ws_.resources().invalidate(uri);
  }
}

std::future<void> Server::run_diagnostics(SourceId id)
{
  return asio::post(pool_, asio::use_future([this, id] {
    DiagnosticsByUri diagnostics;
    if (config_.diagnostic_pass == DiagnosticPass::Compile) {
      diagnostics = invocation_.compile(id).diagnostics;
    } else {
      diagnostics = invocation_.evaluate(id).diagnostics;
    }
    update_all_diagnostics(std::move(diagnostics));
  }));
}

void Server::update_all_diagnostics(DiagnosticsByUri diagnostics)
{
  // Clear stale results on open documents the pass did not mention
  for (const auto & uri : ws_.sources().list_open_uris()) {
    diagnostics.try_emplace(uri);
  }

  for (auto & [uri, list] : diagnostics) {
    ws_.client().publish_diagnostics(uri, std::move(list));
  }
}

}  // namespace typeset_lsp::server
