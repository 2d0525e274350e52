// typeset_lsp/basic/diagnostic.cpp - Diagnostic implementation
#include "typeset_lsp/basic/diagnostic.hpp"

#include <algorithm>

namespace typeset_lsp
{

const char * to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

bool has_errors(const DiagnosticsByUri & diagnostics)
{
  return count_diagnostics(diagnostics, Severity::Error) > 0;
}

size_t count_diagnostics(const DiagnosticsByUri & diagnostics, Severity severity)
{
  size_t n = 0;
  for (const auto & [uri, list] : diagnostics) {
    n += static_cast<size_t>(std::count_if(list.begin(), list.end(), [&](const Diagnostic & d) {
      return d.severity == severity;
    }));
  }
  return n;
}

}  // namespace typeset_lsp
