// typeset_lsp/workspace/diagnostic_printer.hpp
//
// Prints workspace diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "typeset_lsp/basic/diagnostic.hpp"
#include "typeset_lsp/basic/position.hpp"
#include "typeset_lsp/engine/source_file.hpp"
#include "typeset_lsp/workspace/source_manager.hpp"

namespace typeset_lsp::workspace
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error: unknown function: tabel
 *     --> doc/main.typ:5:1
 *      |
 *    5 | #tabel("x")
 *      | ^^^^^^
 *      |
 *      = hint: only functions of the standard library can be called
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param encoding Encoding the diagnostic ranges were produced in
   * @param use_color Whether to use terminal colors
   */
  DiagnosticPrinter(std::ostream & os, PositionEncoding encoding, bool use_color = true);

  /// Print one diagnostic. `source` may be null, in which case no snippet is shown.
  void print(const Uri & uri, const Diagnostic & diag, const engine::SourceFile * source);

  /// Print every diagnostic, looking sources up in `sources`
  void print_all(const DiagnosticsByUri & diagnostics, SourceManager & sources);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_source_line(
    const engine::SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col);

  void print_hint(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  PositionEncoding encoding_;
  bool use_color_;
};

}  // namespace typeset_lsp::workspace
