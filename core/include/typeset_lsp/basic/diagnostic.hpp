// typeset_lsp/basic/diagnostic.hpp - Editor-facing diagnostics
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "typeset_lsp/basic/position.hpp"
#include "typeset_lsp/basic/uri.hpp"

namespace typeset_lsp
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 *
 * Numeric values match the LSP DiagnosticSeverity enumeration.
 */
enum class Severity : uint8_t {
  Error = 1,
  Warning = 2,
  Info = 3,
  Hint = 4,
};

[[nodiscard]] const char * to_string(Severity severity) noexcept;

struct Diagnostic
{
  LspRange range;
  Severity severity = Severity::Error;
  std::string message;
  std::string source = "typeset";
  std::vector<std::string> hints;

  [[nodiscard]] bool operator==(const Diagnostic & o) const
  {
    return range == o.range && severity == o.severity && message == o.message &&
           source == o.source && hints == o.hints;
  }
};

/**
 * Diagnostics grouped per document.
 *
 * Publishing replaces a document's list wholesale, so an empty vector clears
 * whatever the editor was showing for that URI.
 */
using DiagnosticsByUri = std::map<Uri, std::vector<Diagnostic>>;

[[nodiscard]] bool has_errors(const DiagnosticsByUri & diagnostics);
[[nodiscard]] size_t count_diagnostics(const DiagnosticsByUri & diagnostics, Severity severity);

}  // namespace typeset_lsp
