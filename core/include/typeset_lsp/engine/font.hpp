// typeset_lsp/engine/font.hpp - Font catalog types consumed by the engine
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "typeset_lsp/basic/bytes.hpp"

namespace typeset_lsp::engine
{

struct FontInfo
{
  std::string family;
  std::filesystem::path path;
};

/**
 * Catalog of available fonts. Indices into the book are the font ids
 * accepted by World::fetch_font.
 */
class FontBook
{
public:
  void push(FontInfo info) { infos_.push_back(std::move(info)); }

  [[nodiscard]] size_t size() const noexcept { return infos_.size(); }
  [[nodiscard]] bool empty() const noexcept { return infos_.empty(); }
  [[nodiscard]] const FontInfo * info(size_t index) const noexcept
  {
    return index < infos_.size() ? &infos_[index] : nullptr;
  }

  /// First font whose family matches `family` (ASCII case-insensitive)
  [[nodiscard]] std::optional<size_t> select_family(std::string_view family) const;

private:
  std::vector<FontInfo> infos_;
};

struct Font
{
  size_t index = 0;
  FontInfo info;
  Bytes data;
};

}  // namespace typeset_lsp::engine
