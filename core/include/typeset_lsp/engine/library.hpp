// typeset_lsp/engine/library.hpp - Immutable standard library value
#pragma once

#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace typeset_lsp::engine
{

/**
 * The set of functions a document may call.
 *
 * Built once per workspace and never mutated, so the engine can key memoized
 * results on its fingerprint.
 */
class Library
{
public:
  explicit Library(std::vector<std::string> functions);

  /// import, include, image, font, pagebreak, heading, emph, strong, link, set
  [[nodiscard]] static Library standard();

  [[nodiscard]] bool has_function(std::string_view name) const;
  [[nodiscard]] const std::set<std::string, std::less<>> & functions() const noexcept
  {
    return functions_;
  }
  [[nodiscard]] uint64_t fingerprint() const noexcept { return fingerprint_; }

private:
  std::set<std::string, std::less<>> functions_;
  uint64_t fingerprint_ = 0;
};

}  // namespace typeset_lsp::engine
