// typeset_lsp/bridge/diagnostic_conversion.cpp - Engine errors to editor diagnostics
#include "typeset_lsp/bridge/diagnostic_conversion.hpp"

#include "typeset_lsp/basic/log.hpp"

namespace typeset_lsp::bridge
{

namespace
{

/// Snapshot the span should be measured against
std::shared_ptr<const engine::SourceFile> source_for(const WorkspaceWorld & world, SourceId id)
{
  if (auto pinned = world.pinned(id)) {
    return pinned;
  }
  // Not fetched during the pass (e.g. an error raised before the fetch)
  auto guard = world.workspace().sources().get_source(id);
  if (!guard) {
    return nullptr;
  }
  return guard.value()->snapshot();
}

}  // namespace

DiagnosticsByUri to_diagnostics(
  const engine::SourceErrors & errors, const WorkspaceWorld & world, PositionEncoding encoding)
{
  DiagnosticsByUri out;

  for (const auto & error : errors) {
    if (error.source.is_detached()) {
      log::logger()->debug("dropping diagnostic on detached source: {}", error.message);
      continue;
    }

    const auto uri = world.workspace().sources().uri_of(error.source);
    const auto file = uri ? source_for(world, error.source) : nullptr;
    if (!uri || !file) {
      log::logger()->warn(
        "dropping diagnostic on unknown source id {}: {}", error.source.value, error.message);
      continue;
    }

    Diagnostic diag;
    diag.range = to_lsp_range(file->text(), file->line_offsets(), error.span, encoding);
    diag.severity = error.severity;
    diag.message = error.message;
    diag.hints = error.hints;
    out[*uri].push_back(std::move(diag));
  }

  return out;
}

}  // namespace typeset_lsp::bridge
