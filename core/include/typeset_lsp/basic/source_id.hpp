// typeset_lsp/basic/source_id.hpp - Stable handle for a tracked source file
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace typeset_lsp
{

/**
 * Small integer handle substituting for a URI on hot paths.
 *
 * Ids are handed out in registration order and never reused. The maximum
 * value is reserved for the detached placeholder source.
 */
struct SourceId
{
  static constexpr uint16_t k_detached = UINT16_MAX;

  uint16_t value = k_detached;

  constexpr SourceId() noexcept = default;
  constexpr explicit SourceId(uint16_t v) noexcept : value(v) {}

  [[nodiscard]] static constexpr SourceId detached() noexcept { return SourceId{}; }

  [[nodiscard]] constexpr bool is_detached() const noexcept { return value == k_detached; }
  [[nodiscard]] constexpr size_t index() const noexcept { return static_cast<size_t>(value); }

  [[nodiscard]] constexpr bool operator==(SourceId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(SourceId other) const noexcept
  {
    return value != other.value;
  }
  [[nodiscard]] constexpr bool operator<(SourceId other) const noexcept
  {
    return value < other.value;
  }
};

}  // namespace typeset_lsp

template <>
struct std::hash<typeset_lsp::SourceId>
{
  size_t operator()(typeset_lsp::SourceId id) const noexcept
  {
    return std::hash<uint16_t>{}(id.value);
  }
};
