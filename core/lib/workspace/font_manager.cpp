// typeset_lsp/workspace/font_manager.cpp - Font catalog and loading
#include "typeset_lsp/workspace/font_manager.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <system_error>

#include "typeset_lsp/basic/log.hpp"

namespace typeset_lsp::workspace
{

namespace
{

bool is_font_file(const std::filesystem::path & path)
{
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext == ".ttf" || ext == ".otf" || ext == ".ttc" || ext == ".otc";
}

}  // namespace

FontManager::Builder & FontManager::Builder::with_font_file(const std::filesystem::path & path)
{
  book_.push(engine::FontInfo{path.stem().string(), path});
  return *this;
}

FontManager::Builder & FontManager::Builder::with_font_dirs(
  const std::vector<std::filesystem::path> & dirs)
{
  for (const auto & dir : dirs) {
    std::error_code ec;
    std::vector<std::filesystem::path> found;
    for (std::filesystem::recursive_directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec)) {
      if (it->is_regular_file(ec) && is_font_file(it->path())) {
        found.push_back(it->path());
      }
    }
    if (ec) {
      log::logger()->warn("failed to scan font directory {}: {}", dir.string(), ec.message());
    }

    std::sort(found.begin(), found.end());
    for (const auto & path : found) {
      with_font_file(path);
    }
  }
  return *this;
}

FontManager::Builder & FontManager::Builder::with_font_paths(
  const std::vector<std::filesystem::path> & paths)
{
  for (const auto & path : paths) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
      with_font_dirs({path});
    } else {
      with_font_file(path);
    }
  }
  return *this;
}

FontManager FontManager::Builder::build()
{
  log::logger()->debug("font book has {} fonts", book_.size());
  return FontManager(std::move(book_));
}

std::optional<engine::Font> FontManager::font(size_t index, ResourceManager & resources) const
{
  const engine::FontInfo * info = book_.info(index);
  if (info == nullptr) {
    return std::nullopt;
  }

  auto data = resources.get_or_insert(Uri::from_path(info->path));
  if (!data) {
    log::logger()->warn("failed to load font {}: {}", info->family, data.error().message());
    return std::nullopt;
  }
  return engine::Font{index, *info, std::move(data).value()};
}

}  // namespace typeset_lsp::workspace
