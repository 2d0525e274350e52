// typeset_lsp/basic/position.cpp - Editor position <-> byte offset conversion
#include "typeset_lsp/basic/position.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "typeset_lsp/basic/utf8.hpp"

namespace typeset_lsp
{

namespace
{

uint32_t code_units(uint32_t cp, size_t utf8_len, PositionEncoding encoding) noexcept
{
  switch (encoding) {
    case PositionEncoding::Utf8:
      return static_cast<uint32_t>(utf8_len);
    case PositionEncoding::Utf16:
      return (cp > 0xFFFFu) ? 2U : 1U;
    case PositionEncoding::Utf32:
      return 1U;
  }
  return 1U;
}

/// Byte range of a line's content, excluding "\n" or "\r\n"
std::pair<uint32_t, uint32_t> line_content(
  std::string_view text, gsl::span<const uint32_t> line_offsets, size_t line) noexcept
{
  const uint32_t start = line_offsets[line];
  uint32_t end = (line + 1 < line_offsets.size()) ? line_offsets[line + 1]
                                                   : static_cast<uint32_t>(text.size());
  if (end > start && text[end - 1] == '\n') {
    --end;
    if (end > start && text[end - 1] == '\r') {
      --end;
    }
  }
  return {start, end};
}

}  // namespace

std::optional<PositionEncoding> parse_position_encoding(std::string_view s)
{
  if (s == "utf-8") return PositionEncoding::Utf8;
  if (s == "utf-16") return PositionEncoding::Utf16;
  if (s == "utf-32") return PositionEncoding::Utf32;
  return std::nullopt;
}

const char * to_string(PositionEncoding encoding) noexcept
{
  switch (encoding) {
    case PositionEncoding::Utf8:
      return "utf-8";
    case PositionEncoding::Utf16:
      return "utf-16";
    case PositionEncoding::Utf32:
      return "utf-32";
  }
  return "utf-16";
}

uint32_t to_byte_offset(
  std::string_view text, gsl::span<const uint32_t> line_offsets, LspPosition pos,
  PositionEncoding encoding) noexcept
{
  if (line_offsets.empty() || pos.line >= line_offsets.size()) {
    return static_cast<uint32_t>(text.size());
  }

  const auto [line_start, line_end] = line_content(text, line_offsets, pos.line);

  uint32_t units = 0;
  uint32_t byte = line_start;
  while (byte < line_end && units < pos.character) {
    const auto [cp, len] = utf8::decode(text, byte);
    const uint32_t n = code_units(cp, len, encoding);
    if (units + n > pos.character) {
      // Target is inside this code point.
      break;
    }
    units += n;
    byte += static_cast<uint32_t>(len);
  }

  return std::min(byte, line_end);
}

LspPosition to_lsp_position(
  std::string_view text, gsl::span<const uint32_t> line_offsets, uint32_t byte_offset,
  PositionEncoding encoding) noexcept
{
  if (line_offsets.empty()) {
    return {};
  }

  byte_offset = std::min(byte_offset, static_cast<uint32_t>(text.size()));

  auto it = std::upper_bound(line_offsets.begin(), line_offsets.end(), byte_offset);
  const auto line = static_cast<uint32_t>(std::distance(line_offsets.begin(), it) - 1);
  const auto [line_start, line_end] = line_content(text, line_offsets, line);
  const uint32_t target = std::min(byte_offset, line_end);

  uint32_t units = 0;
  uint32_t byte = line_start;
  while (byte < target) {
    const auto [cp, len] = utf8::decode(text, byte);
    if (byte + len > target) {
      break;
    }
    units += code_units(cp, len, encoding);
    byte += static_cast<uint32_t>(len);
  }

  return {line, units};
}

ByteRange to_byte_range(
  std::string_view text, gsl::span<const uint32_t> line_offsets, const LspRange & range,
  PositionEncoding encoding) noexcept
{
  uint32_t start = to_byte_offset(text, line_offsets, range.start, encoding);
  uint32_t end = to_byte_offset(text, line_offsets, range.end, encoding);
  if (end < start) {
    std::swap(start, end);
  }
  return {start, end};
}

LspRange to_lsp_range(
  std::string_view text, gsl::span<const uint32_t> line_offsets, ByteRange range,
  PositionEncoding encoding) noexcept
{
  return {
    to_lsp_position(text, line_offsets, range.start, encoding),
    to_lsp_position(text, line_offsets, range.end, encoding),
  };
}

}  // namespace typeset_lsp
