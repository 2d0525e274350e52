// typeset_lsp/basic/utf8.cpp
#include "typeset_lsp/basic/utf8.hpp"

namespace typeset_lsp::utf8
{

namespace
{

bool is_continuation(unsigned char b) { return (b & 0xC0) == 0x80; }

}  // namespace

std::pair<uint32_t, size_t> decode(std::string_view s, size_t i) noexcept
{
  const auto b0 = static_cast<unsigned char>(s[i]);
  if (b0 < 0x80) return {b0, 1};
  if ((b0 & 0xE0) == 0xC0 && i + 1 < s.size()) {
    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    if (is_continuation(b1)) {
      return {((b0 & 0x1Fu) << 6) | (b1 & 0x3Fu), 2};
    }
  }
  if ((b0 & 0xF0) == 0xE0 && i + 2 < s.size()) {
    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    const auto b2 = static_cast<unsigned char>(s[i + 2]);
    if (is_continuation(b1) && is_continuation(b2)) {
      return {((b0 & 0x0Fu) << 12) | ((b1 & 0x3Fu) << 6) | (b2 & 0x3Fu), 3};
    }
  }
  if ((b0 & 0xF8) == 0xF0 && i + 3 < s.size()) {
    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    const auto b2 = static_cast<unsigned char>(s[i + 2]);
    const auto b3 = static_cast<unsigned char>(s[i + 3]);
    if (is_continuation(b1) && is_continuation(b2) && is_continuation(b3)) {
      const uint32_t cp =
        ((b0 & 0x07u) << 18) | ((b1 & 0x3Fu) << 12) | ((b2 & 0x3Fu) << 6) | (b3 & 0x3Fu);
      return {cp, 4};
    }
  }
  return {k_replacement_char, 1};
}

bool is_valid(std::string_view s) noexcept
{
  size_t i = 0;
  while (i < s.size()) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) {
      ++i;
      continue;
    }

    size_t len = 0;
    uint32_t min = 0;
    if ((b0 & 0xE0) == 0xC0) {
      len = 2;
      min = 0x80;
    } else if ((b0 & 0xF0) == 0xE0) {
      len = 3;
      min = 0x800;
    } else if ((b0 & 0xF8) == 0xF0) {
      len = 4;
      min = 0x10000;
    } else {
      return false;
    }

    if (i + len > s.size()) return false;
    for (size_t k = 1; k < len; ++k) {
      if (!is_continuation(static_cast<unsigned char>(s[i + k]))) return false;
    }

    const auto [cp, consumed] = decode(s, i);
    if (consumed != len || cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += len;
  }
  return true;
}

}  // namespace typeset_lsp::utf8
