// typeset_lsp/workspace/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "typeset_lsp/workspace/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <filesystem>
#include <memory>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <system_error>

namespace typeset_lsp::workspace
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, PositionEncoding encoding, bool use_color)
: os_(os), encoding_(encoding), use_color_(use_color)
{
  // Configure rang based on use_color setting
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(
  const Uri & uri, const Diagnostic & diag, const engine::SourceFile * source)
{
  // Convert to relative path for cleaner output
  std::string filename = uri.str();
  if (const auto path = uri.to_path()) {
    std::error_code ec;
    auto rel_path = std::filesystem::relative(*path, std::filesystem::current_path(), ec);
    filename = ec ? path->string() : rel_path.string();
  }

  // === Header line: error: message ===
  print_severity_header(diag);

  if (source == nullptr) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  } else {
    const ByteRange bytes =
      to_byte_range(source->text(), source->line_offsets(), diag.range, encoding_);
    const engine::LineColumn start = source->get_line_column(bytes.start);
    const engine::LineColumn end = source->get_line_column(bytes.end);

    // === Location line: --> file:line:col ===
    fmt::print(os_, "{} {}:{}:{}\n", gutter_arrow(), filename, start.line, start.column);
    fmt::print(os_, "{}\n", gutter_pipe());

    const uint32_t end_col =
      (end.line == start.line && end.column > start.column) ? end.column : (start.column + 1);
    print_source_line(*source, start.line - 1, start.column, end_col);
  }

  for (const auto & hint : diag.hints) {
    print_hint(hint);
  }

  // === Trailing empty line for separation ===
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticsByUri & diagnostics, SourceManager & sources)
{
  for (const auto & [uri, list] : diagnostics) {
    std::shared_ptr<const engine::SourceFile> file;
    if (auto guard = sources.get_source(uri)) {
      file = guard.value()->snapshot();
    }
    for (const auto & diag : list) {
      print(uri, diag, file.get());
    }
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << to_string(diag.severity) << rang::fg::reset << ": " << diag.message
        << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}: {}\n", to_string(diag.severity), diag.message);
  }
}

void DiagnosticPrinter::print_source_line(
  const engine::SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col)
{
  const std::string_view line = source.get_line(line_index);

  // Skip empty lines
  if (line.empty()) {
    return;
  }

  const uint32_t line_num = line_index + 1;

  // Build cleaned line (tabs -> spaces)
  std::string cleaned_line;
  cleaned_line.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned_line += "    ";  // 4 spaces per tab
    } else {
      cleaned_line += c;
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "      {} ", gutter_pipe_only());

  // Skip to start column (handle tabs)
  std::string marker_prefix;
  uint32_t visual_col = 1;
  for (size_t char_idx = 0; visual_col < start_col && char_idx < line.size(); ++char_idx) {
    if (line[char_idx] == '\t') {
      marker_prefix += "    ";
    } else {
      marker_prefix += ' ';
    }
    visual_col++;
  }

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;

  fmt::print(os_, "{}", marker_prefix);
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
    fmt::print(os_, "{}", std::string(marker_len, '^'));
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{}", std::string(marker_len, '^'));
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_hint(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "hint: {}\n", message);
  } else {
    fmt::print(os_, "   = hint: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace typeset_lsp::workspace
