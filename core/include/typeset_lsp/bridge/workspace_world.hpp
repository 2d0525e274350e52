// typeset_lsp/bridge/workspace_world.hpp - Workspace as the engine's World
//
// WorkspaceWorld answers engine queries from the workspace managers. It is
// created per pass: every source fetched during the pass is pinned, so the
// references handed to the engine stay valid and unchanged until the world is
// destroyed, even if the editor edits the file meanwhile.
//
#pragma once

#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

#include "typeset_lsp/engine/world.hpp"
#include "typeset_lsp/workspace/workspace.hpp"

namespace typeset_lsp::bridge
{

/// A World query that the receiving world cannot answer by construction
class ContractViolation : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

class WorkspaceWorld final : public engine::World
{
public:
  explicit WorkspaceWorld(workspace::Workspace & ws);

  WorkspaceWorld(const WorkspaceWorld &) = delete;
  WorkspaceWorld & operator=(const WorkspaceWorld &) = delete;

  [[nodiscard]] const engine::Library & library() const override;
  [[nodiscard]] const engine::FontBook & font_book() const override;

  /// A workspace has no single main file. Always throws ContractViolation;
  /// wrap the world in a TargetedWorld instead.
  [[nodiscard]] const engine::SourceFile & main_source() const override;

  /// Register the file if needed and cache it so fetch_text() will not fail
  [[nodiscard]] FileResult<SourceId> resolve(const std::filesystem::path & path) const override;

  /**
   * Pinned snapshot of source `id`.
   *
   * Falls back to the workspace's detached source when the file cannot be
   * produced; the failure is reported to the client and logged.
   */
  [[nodiscard]] const engine::SourceFile & fetch_text(SourceId id) const override;

  [[nodiscard]] FileResult<Bytes> fetch_binary_resource(
    const std::filesystem::path & path) const override;

  [[nodiscard]] std::optional<engine::Font> fetch_font(size_t index) const override;

  /// Snapshot pinned for `id` by an earlier fetch_text(), if any
  [[nodiscard]] std::shared_ptr<const engine::SourceFile> pinned(SourceId id) const;

  [[nodiscard]] workspace::Workspace & workspace() const noexcept { return ws_; }

private:
  workspace::Workspace & ws_;

  mutable std::mutex mutex_;
  mutable std::unordered_map<SourceId, std::shared_ptr<const engine::SourceFile>> pinned_;
};

/**
 * A WorkspaceWorld together with the file a pass is about.
 */
class TargetedWorld final : public engine::World
{
public:
  TargetedWorld(const WorkspaceWorld & base, SourceId target) : base_(base), target_(target) {}

  [[nodiscard]] SourceId target() const noexcept { return target_; }

  [[nodiscard]] const engine::Library & library() const override { return base_.library(); }
  [[nodiscard]] const engine::FontBook & font_book() const override { return base_.font_book(); }

  [[nodiscard]] const engine::SourceFile & main_source() const override
  {
    return base_.fetch_text(target_);
  }

  [[nodiscard]] FileResult<SourceId> resolve(const std::filesystem::path & path) const override
  {
    return base_.resolve(path);
  }

  [[nodiscard]] const engine::SourceFile & fetch_text(SourceId id) const override
  {
    return base_.fetch_text(id);
  }

  [[nodiscard]] FileResult<Bytes> fetch_binary_resource(
    const std::filesystem::path & path) const override
  {
    return base_.fetch_binary_resource(path);
  }

  [[nodiscard]] std::optional<engine::Font> fetch_font(size_t index) const override
  {
    return base_.fetch_font(index);
  }

private:
  const WorkspaceWorld & base_;
  SourceId target_;
};

}  // namespace typeset_lsp::bridge
