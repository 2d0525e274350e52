#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>

#include "typeset_lsp/test_support/memory_file_system.hpp"
#include "typeset_lsp/workspace/diagnostic_printer.hpp"

using namespace typeset_lsp;
using workspace::DiagnosticPrinter;

namespace
{

Diagnostic make_diag(LspRange range, Severity severity, std::string message)
{
  Diagnostic d;
  d.range = range;
  d.severity = severity;
  d.message = std::move(message);
  return d;
}

bool contains(const std::string & haystack, const std::string & needle)
{
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(DiagnosticPrinter, PrintsSnippetWithMarker)
{
  const engine::SourceFile file(SourceId(0), "/doc/a.typ", "text\n#tabel(\"x\")\n");
  auto diag = make_diag(
    LspRange{LspPosition{1, 0}, LspPosition{1, 6}}, Severity::Error, "unknown function: tabel");
  diag.hints.push_back("only functions of the standard library can be called");

  std::ostringstream out;
  DiagnosticPrinter printer(out, PositionEncoding::Utf16, false);
  printer.print(Uri("file:///doc/a.typ"), diag, &file);

  const std::string s = out.str();
  EXPECT_TRUE(contains(s, "error: unknown function: tabel\n")) << s;
  EXPECT_TRUE(contains(s, "a.typ:2:1\n")) << s;
  EXPECT_TRUE(contains(s, "    2 | #tabel(\"x\")\n")) << s;
  EXPECT_TRUE(contains(s, "| ^^^^^^\n")) << s;
  EXPECT_TRUE(contains(s, "= hint: only functions of the standard library can be called")) << s;
}

TEST(DiagnosticPrinter, PrintAllLooksUpSources)
{
  auto fs = std::make_shared<test_support::MemoryFileSystem>();
  workspace::SourceManager sources(fs);
  const Uri open_uri("file:///doc/open.typ");
  sources.open(open_uri, "h\xC3\xA9llo wrld\n");

  DiagnosticsByUri diags;
  diags[open_uri].push_back(make_diag(
    LspRange{LspPosition{0, 6}, LspPosition{0, 10}}, Severity::Warning, "spelling"));
  diags[Uri("file:///doc/gone.typ")].push_back(
    make_diag(LspRange{}, Severity::Error, "gone"));

  std::ostringstream out;
  DiagnosticPrinter printer(out, PositionEncoding::Utf16, false);
  printer.print_all(diags, sources);

  const std::string s = out.str();
  EXPECT_TRUE(contains(s, "warning: spelling\n")) << s;
  // UTF-16 column 6 is byte 7, the eighth column
  EXPECT_TRUE(contains(s, "open.typ:1:8\n")) << s;
  EXPECT_TRUE(contains(s, "error: gone\n")) << s;
  EXPECT_TRUE(contains(s, "gone.typ\n")) << s;
}
