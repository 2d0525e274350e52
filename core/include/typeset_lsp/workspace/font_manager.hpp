// typeset_lsp/workspace/font_manager.hpp - Font catalog and loading
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

#include "typeset_lsp/engine/font.hpp"
#include "typeset_lsp/workspace/resource_manager.hpp"

namespace typeset_lsp::workspace
{

/**
 * Fixed catalog of fonts, built once at startup. Font data is read lazily
 * through the resource manager on first use.
 */
class FontManager
{
public:
  class Builder
  {
  public:
    /// Add one font file; its family is the file stem
    Builder & with_font_file(const std::filesystem::path & path);

    /// Add every .ttf/.otf/.ttc/.otc file below each directory (sorted by path)
    Builder & with_font_dirs(const std::vector<std::filesystem::path> & dirs);

    /// Files are added as fonts, directories are scanned
    Builder & with_font_paths(const std::vector<std::filesystem::path> & paths);

    [[nodiscard]] FontManager build();

  private:
    engine::FontBook book_;
  };

  FontManager() = default;

  [[nodiscard]] static Builder builder() { return Builder{}; }

  [[nodiscard]] const engine::FontBook & book() const noexcept { return book_; }

  /// Load font `index`; nullopt if the index is unknown or its file unreadable
  [[nodiscard]] std::optional<engine::Font> font(size_t index, ResourceManager & resources) const;

private:
  explicit FontManager(engine::FontBook book) : book_(std::move(book)) {}

  engine::FontBook book_;
};

}  // namespace typeset_lsp::workspace
