// typeset_lsp/workspace/source.hpp - One editor document and its compiler view
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "typeset_lsp/basic/file_error.hpp"
#include "typeset_lsp/basic/position.hpp"
#include "typeset_lsp/basic/source_id.hpp"
#include "typeset_lsp/basic/uri.hpp"
#include "typeset_lsp/engine/source_file.hpp"
#include "typeset_lsp/workspace/file_system.hpp"

namespace typeset_lsp::workspace
{

/**
 * A source file known to the workspace: its URI plus the engine-facing
 * SourceFile.
 *
 * The SourceFile is held through a shared pointer and replaced on every
 * mutation, so snapshots handed out earlier keep their content.
 */
class Source
{
public:
  Source(SourceId id, Uri uri, std::string text);

  /// Read and validate the text of the file behind `uri`
  [[nodiscard]] static FileResult<std::string> read(const Uri & uri, FileSystem & fs);

  /// read() wrapped into a Source
  [[nodiscard]] static FileResult<Source> load(SourceId id, const Uri & uri, FileSystem & fs);

  [[nodiscard]] SourceId id() const noexcept { return file_->id(); }
  [[nodiscard]] const Uri & uri() const noexcept { return uri_; }
  [[nodiscard]] std::string_view text() const noexcept { return file_->text(); }
  [[nodiscard]] const engine::SourceFile & file() const noexcept { return *file_; }

  /// The current content, kept alive independently of later edits
  [[nodiscard]] std::shared_ptr<const engine::SourceFile> snapshot() const noexcept { return file_; }

  /// Replace the text covered by an editor range, given in `encoding` code units
  void edit(const LspRange & range, std::string_view with, PositionEncoding encoding);

  /// Replace the whole document
  void replace(std::string text);

private:
  Uri uri_;
  std::shared_ptr<const engine::SourceFile> file_;
};

}  // namespace typeset_lsp::workspace
