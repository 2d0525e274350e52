// typeset_lsp/bridge/workspace_world.cpp - Workspace as the engine's World
#include "typeset_lsp/bridge/workspace_world.hpp"

#include <fmt/format.h>

#include "typeset_lsp/basic/log.hpp"

namespace typeset_lsp::bridge
{

WorkspaceWorld::WorkspaceWorld(workspace::Workspace & ws) : ws_(ws) {}

const engine::Library & WorkspaceWorld::library() const { return ws_.library(); }

const engine::FontBook & WorkspaceWorld::font_book() const { return ws_.fonts().book(); }

const engine::SourceFile & WorkspaceWorld::main_source() const
{
  throw ContractViolation(
    "main_source() called on a WorkspaceWorld; a workspace has no main file, use a "
    "TargetedWorld");
}

FileResult<SourceId> WorkspaceWorld::resolve(const std::filesystem::path & path) const
{
  if (!path.is_absolute()) {
    return FileResult<SourceId>::fail(FileError::not_found(path));
  }

  auto id = ws_.sources().register_or_lookup(Uri::from_path(path));
  if (!id) {
    return id;
  }
  if (auto cached = ws_.sources().cache(id.value()); !cached) {
    return FileResult<SourceId>::fail(cached.error());
  }
  return id;
}

const engine::SourceFile & WorkspaceWorld::fetch_text(SourceId id) const
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto it = pinned_.find(id); it != pinned_.end()) {
      return *it->second;
    }
  }

  std::shared_ptr<const engine::SourceFile> snapshot;
  {
    auto guard = ws_.sources().get_source(id);
    if (!guard) {
      const std::string message = fmt::format(
        "unable to get source id {} because an error occurred: {}", id.value,
        guard.error().message());
      log::logger()->error("{}", message);
      ws_.client().log_message(lsp::MessageType::Error, message);
      return ws_.detached_source();
    }
    snapshot = guard.value()->snapshot();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  // Another engine thread may have pinned the same id first; keep its snapshot
  const auto it = pinned_.emplace(id, std::move(snapshot)).first;
  return *it->second;
}

FileResult<Bytes> WorkspaceWorld::fetch_binary_resource(const std::filesystem::path & path) const
{
  if (!path.is_absolute()) {
    return FileResult<Bytes>::fail(FileError::not_found(path));
  }
  return ws_.resources().get_or_insert(Uri::from_path(path));
}

std::optional<engine::Font> WorkspaceWorld::fetch_font(size_t index) const
{
  return ws_.fonts().font(index, ws_.resources());
}

std::shared_ptr<const engine::SourceFile> WorkspaceWorld::pinned(SourceId id) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = pinned_.find(id);
  return it != pinned_.end() ? it->second : nullptr;
}

}  // namespace typeset_lsp::bridge
