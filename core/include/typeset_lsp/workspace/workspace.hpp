// typeset_lsp/workspace/workspace.hpp - Everything the server knows about the user's files
#pragma once

#include <memory>

#include "typeset_lsp/engine/library.hpp"
#include "typeset_lsp/engine/source_file.hpp"
#include "typeset_lsp/lsp/client.hpp"
#include "typeset_lsp/workspace/file_system.hpp"
#include "typeset_lsp/workspace/font_manager.hpp"
#include "typeset_lsp/workspace/resource_manager.hpp"
#include "typeset_lsp/workspace/source_manager.hpp"

namespace typeset_lsp::workspace
{

/**
 * Aggregate of the managers plus the immutable values a compiler pass needs.
 *
 * One Workspace lives for the whole server session and is shared between
 * editor event handlers and running passes.
 */
class Workspace
{
public:
  Workspace(
    std::shared_ptr<FileSystem> fs, FontManager fonts, std::shared_ptr<lsp::Client> client);

  Workspace(const Workspace &) = delete;
  Workspace & operator=(const Workspace &) = delete;

  [[nodiscard]] SourceManager & sources() noexcept { return sources_; }
  [[nodiscard]] const SourceManager & sources() const noexcept { return sources_; }

  [[nodiscard]] ResourceManager & resources() noexcept { return resources_; }
  [[nodiscard]] const FontManager & fonts() const noexcept { return fonts_; }
  [[nodiscard]] const engine::Library & library() const noexcept { return library_; }

  /// Empty placeholder returned when a source cannot be produced
  [[nodiscard]] const engine::SourceFile & detached_source() const noexcept { return detached_; }

  [[nodiscard]] lsp::Client & client() const noexcept { return *client_; }

private:
  SourceManager sources_;
  ResourceManager resources_;
  FontManager fonts_;
  engine::Library library_;
  engine::SourceFile detached_;
  std::shared_ptr<lsp::Client> client_;
};

}  // namespace typeset_lsp::workspace
