// typeset_lsp/server/compiler_invocation.cpp - One engine pass over the workspace
#include "typeset_lsp/server/compiler_invocation.hpp"

#include <chrono>

#include <gsl/gsl>

#include "typeset_lsp/basic/log.hpp"
#include "typeset_lsp/bridge/diagnostic_conversion.hpp"
#include "typeset_lsp/bridge/workspace_world.hpp"
#include "typeset_lsp/engine/memo.hpp"

namespace typeset_lsp::server
{

namespace
{

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point start)
{
  return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

}  // namespace

CompilerInvocation::CompilerInvocation(
  workspace::Workspace & ws, engine::Engine & engine, uint32_t memo_max_age,
  PositionEncoding encoding)
: ws_(ws), engine_(engine), memo_max_age_(memo_max_age), encoding_(encoding)
{
}

PassOutcome<engine::Document> CompilerInvocation::compile(SourceId target)
{
  const auto start = Clock::now();
  // Runs after the world below is released, also when the pass throws
  const auto evict_memo = gsl::finally([this] { engine::memo::evict(memo_max_age_); });
  PassOutcome<engine::Document> outcome;
  {
    bridge::WorkspaceWorld world(ws_);
    const bridge::TargetedWorld targeted(world, target);
    auto result = engine_.compile(targeted);
    outcome.output = std::move(result.output);
    outcome.diagnostics = bridge::to_diagnostics(result.errors, world, encoding_);
  }

  log::logger()->debug(
    "compile of id {} finished in {:.1f} ms ({} documents with diagnostics)", target.value,
    elapsed_ms(start), outcome.diagnostics.size());
  return outcome;
}

PassOutcome<engine::Module> CompilerInvocation::evaluate(SourceId target)
{
  const auto start = Clock::now();
  // Runs after the world below is released, also when the pass throws
  const auto evict_memo = gsl::finally([this] { engine::memo::evict(memo_max_age_); });
  PassOutcome<engine::Module> outcome;
  {
    bridge::WorkspaceWorld world(ws_);
    const bridge::TargetedWorld targeted(world, target);
    auto result = engine_.evaluate(targeted, targeted.main_source());
    outcome.output = std::move(result.output);
    outcome.diagnostics = bridge::to_diagnostics(result.errors, world, encoding_);
  }

  log::logger()->debug(
    "evaluate of id {} finished in {:.1f} ms ({} documents with diagnostics)", target.value,
    elapsed_ms(start), outcome.diagnostics.size());
  return outcome;
}

}  // namespace typeset_lsp::server
