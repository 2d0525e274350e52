// typeset_lsp/engine/source_file.hpp - Compiler-facing source file
//
// The representation the engine sees for one file: id, path, UTF-8 text and
// a line table. Byte offsets are the only coordinates used here.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

#include "typeset_lsp/basic/position.hpp"
#include "typeset_lsp/basic/source_id.hpp"

namespace typeset_lsp::engine
{

/**
 * Human-readable line and column position (1-indexed, byte columns).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/**
 * One source file as seen by the engine.
 *
 * Features:
 * - Pre-computes line start offsets for efficient lookup
 * - Carries a content fingerprint used as a memoization key
 * - Supports byte-range edits and whole-text replacement
 */
class SourceFile
{
public:
  SourceFile(SourceId id, std::filesystem::path path, std::string text);

  /// A source that belongs to no file (placeholder for failed loads)
  [[nodiscard]] static SourceFile detached(std::string text);

  [[nodiscard]] SourceId id() const noexcept { return id_; }
  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view text() const noexcept { return text_; }
  [[nodiscard]] size_t size() const noexcept { return text_.size(); }

  /// Hash of id and text; equal fingerprints mean equal content
  [[nodiscard]] uint64_t fingerprint() const noexcept { return fingerprint_; }

  [[nodiscard]] gsl::span<const uint32_t> line_offsets() const noexcept { return line_offsets_; }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Convert byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Get the content of a specific line (0-indexed), without its terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Get a slice of the text, clamped to its bounds
  [[nodiscard]] std::string_view get_slice(ByteRange range) const noexcept;

  /// Replace the bytes in `range` (clamped to the text) with `with`
  void edit(ByteRange range, std::string_view with);

  /// Replace the whole text
  void replace(std::string text);

private:
  void build_line_table();
  void update_fingerprint() noexcept;

  SourceId id_;
  std::filesystem::path path_;
  std::string text_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
  uint64_t fingerprint_ = 0;
};

/// 64-bit FNV-1a hash, the fingerprint function used by the engine
[[nodiscard]] uint64_t fingerprint_bytes(std::string_view bytes, uint64_t seed = 0) noexcept;

}  // namespace typeset_lsp::engine
