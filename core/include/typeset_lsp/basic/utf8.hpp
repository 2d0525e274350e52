// typeset_lsp/basic/utf8.hpp - Minimal UTF-8 decoding helpers
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

namespace typeset_lsp::utf8
{

inline constexpr uint32_t k_replacement_char = 0xFFFDu;

/**
 * Decode one code point starting at byte `i`.
 *
 * Returns {code point, bytes consumed}. Malformed sequences decode as
 * U+FFFD consuming one byte.
 */
[[nodiscard]] std::pair<uint32_t, size_t> decode(std::string_view s, size_t i) noexcept;

/// Strict validation (rejects overlong forms, surrogates and values above U+10FFFF)
[[nodiscard]] bool is_valid(std::string_view s) noexcept;

}  // namespace typeset_lsp::utf8
