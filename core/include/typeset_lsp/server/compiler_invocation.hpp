// typeset_lsp/server/compiler_invocation.hpp - One engine pass over the workspace
#pragma once

#include <cstdint>
#include <optional>

#include "typeset_lsp/basic/diagnostic.hpp"
#include "typeset_lsp/basic/position.hpp"
#include "typeset_lsp/basic/source_id.hpp"
#include "typeset_lsp/engine/engine.hpp"
#include "typeset_lsp/workspace/workspace.hpp"

namespace typeset_lsp::server
{

template <typename T>
struct PassOutcome
{
  std::optional<T> output;
  DiagnosticsByUri diagnostics;
};

/**
 * Runs the engine against a fresh world snapshot.
 *
 * Each pass:
 * 1. builds a WorkspaceWorld and targets it at the requested source,
 * 2. runs the engine on the calling thread (which must be allowed to block),
 * 3. converts errors to diagnostics while the snapshot is still pinned,
 * 4. releases the snapshot, then evicts stale memo entries.
 *
 * Eviction happens after every pass, whether it succeeded or not.
 */
class CompilerInvocation
{
public:
  CompilerInvocation(
    workspace::Workspace & ws, engine::Engine & engine, uint32_t memo_max_age,
    PositionEncoding encoding);

  [[nodiscard]] PassOutcome<engine::Document> compile(SourceId target);

  [[nodiscard]] PassOutcome<engine::Module> evaluate(SourceId target);

  [[nodiscard]] uint32_t memo_max_age() const noexcept { return memo_max_age_; }

private:
  workspace::Workspace & ws_;
  engine::Engine & engine_;
  uint32_t memo_max_age_;
  PositionEncoding encoding_;
};

}  // namespace typeset_lsp::server
