// typeset_lsp/basic/position.hpp - Editor positions and byte offset conversion
//
// Editors address text by (line, character) where `character` counts code
// units of the negotiated position encoding. Storage and the compiler work
// on UTF-8 byte offsets. These helpers translate between the two.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>

namespace typeset_lsp
{

enum class PositionEncoding : uint8_t {
  Utf8,   ///< character = bytes
  Utf16,  ///< character = UTF-16 code units (LSP default)
  Utf32,  ///< character = code points
};

/// Parse "utf-8" / "utf-16" / "utf-32"
[[nodiscard]] std::optional<PositionEncoding> parse_position_encoding(std::string_view s);

[[nodiscard]] const char * to_string(PositionEncoding encoding) noexcept;

/// Zero-based editor position
struct LspPosition
{
  uint32_t line = 0;
  uint32_t character = 0;

  [[nodiscard]] constexpr bool operator==(const LspPosition & o) const noexcept
  {
    return line == o.line && character == o.character;
  }
  [[nodiscard]] constexpr bool operator!=(const LspPosition & o) const noexcept
  {
    return !(*this == o);
  }
};

/// Half-open editor range [start, end)
struct LspRange
{
  LspPosition start;
  LspPosition end;

  [[nodiscard]] constexpr bool operator==(const LspRange & o) const noexcept
  {
    return start == o.start && end == o.end;
  }
  [[nodiscard]] constexpr bool operator!=(const LspRange & o) const noexcept
  {
    return !(*this == o);
  }
};

/// Half-open UTF-8 byte range [start, end)
struct ByteRange
{
  uint32_t start = 0;
  uint32_t end = 0;

  [[nodiscard]] constexpr uint32_t size() const noexcept { return end > start ? end - start : 0; }
  [[nodiscard]] constexpr bool operator==(const ByteRange & o) const noexcept
  {
    return start == o.start && end == o.end;
  }
};

/**
 * Convert an editor position to a byte offset.
 *
 * `line_offsets` holds the byte offset of each line start (first entry 0).
 * A line past the end maps to the end of the text; a character past the end
 * of its line is clamped to the line end (before the line terminator); a
 * character inside a multi-unit code point is clamped to its first byte.
 */
[[nodiscard]] uint32_t to_byte_offset(
  std::string_view text, gsl::span<const uint32_t> line_offsets, LspPosition pos,
  PositionEncoding encoding) noexcept;

/// Convert a byte offset to an editor position (offsets are clamped to the text)
[[nodiscard]] LspPosition to_lsp_position(
  std::string_view text, gsl::span<const uint32_t> line_offsets, uint32_t byte_offset,
  PositionEncoding encoding) noexcept;

/// Range variant of to_byte_offset; the result is ordered (start <= end)
[[nodiscard]] ByteRange to_byte_range(
  std::string_view text, gsl::span<const uint32_t> line_offsets, const LspRange & range,
  PositionEncoding encoding) noexcept;

[[nodiscard]] LspRange to_lsp_range(
  std::string_view text, gsl::span<const uint32_t> line_offsets, ByteRange range,
  PositionEncoding encoding) noexcept;

}  // namespace typeset_lsp
