// typeset_lsp/bridge/diagnostic_conversion.hpp - Engine errors to editor diagnostics
#pragma once

#include "typeset_lsp/basic/diagnostic.hpp"
#include "typeset_lsp/basic/position.hpp"
#include "typeset_lsp/bridge/workspace_world.hpp"
#include "typeset_lsp/engine/engine.hpp"

namespace typeset_lsp::bridge
{

/**
 * Group engine errors by document URI, with spans converted to editor ranges.
 *
 * Spans are resolved against the snapshots `world` pinned during the pass, so
 * this must run before the world is destroyed. Errors pointing at the
 * detached source or at an id the workspace does not know are logged and
 * dropped.
 */
[[nodiscard]] DiagnosticsByUri to_diagnostics(
  const engine::SourceErrors & errors, const WorkspaceWorld & world, PositionEncoding encoding);

}  // namespace typeset_lsp::bridge
