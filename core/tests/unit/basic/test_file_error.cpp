#include <gtest/gtest.h>

#include <string>
#include <system_error>

#include "typeset_lsp/basic/diagnostic.hpp"
#include "typeset_lsp/basic/file_error.hpp"
#include "typeset_lsp/basic/utf8.hpp"

using typeset_lsp::FileError;
using typeset_lsp::FileErrorKind;
using typeset_lsp::FileResult;

TEST(FileError, MapsErrorCodes)
{
  const auto not_found =
    FileError::from_error_code(std::make_error_code(std::errc::no_such_file_or_directory), "/x");
  EXPECT_EQ(not_found.kind, FileErrorKind::NotFound);

  const auto denied =
    FileError::from_error_code(std::make_error_code(std::errc::permission_denied), "/x");
  EXPECT_EQ(denied.kind, FileErrorKind::AccessDenied);

  const auto other = FileError::from_error_code(std::make_error_code(std::errc::io_error), "/x");
  EXPECT_EQ(other.kind, FileErrorKind::Other);
  EXPECT_FALSE(other.reason.empty());
}

TEST(FileError, MessagesNameThePath)
{
  EXPECT_EQ(FileError::not_found("/a/b.typ").message(), "file not found (searched at /a/b.typ)");
  EXPECT_EQ(
    FileError::other("too many source files").message(), "failed to load file: too many source files");
  EXPECT_STREQ(typeset_lsp::to_string(FileErrorKind::AccessDenied), "access-denied");
}

TEST(FileResult, CarriesValueOrError)
{
  auto ok = FileResult<int>::ok(42);
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok.value(), 42);

  auto fail = FileResult<int>::fail(FileError::not_found("/nope"));
  ASSERT_FALSE(fail);
  EXPECT_EQ(fail.error().kind, FileErrorKind::NotFound);

  EXPECT_TRUE(FileResult<void>::ok().has_value());
  EXPECT_FALSE(FileResult<void>::fail(FileError::other("x")).has_value());
}

TEST(Utf8, ValidatesStrictly)
{
  EXPECT_TRUE(typeset_lsp::utf8::is_valid("héllo"));
  EXPECT_TRUE(typeset_lsp::utf8::is_valid("\xF0\x9F\x98\x80"));
  EXPECT_FALSE(typeset_lsp::utf8::is_valid("\xC3"));          // truncated
  EXPECT_FALSE(typeset_lsp::utf8::is_valid("\xC0\xAF"));      // overlong
  EXPECT_FALSE(typeset_lsp::utf8::is_valid("\xED\xA0\x80"));  // surrogate
}

TEST(Diagnostics, CountsBySeverity)
{
  typeset_lsp::DiagnosticsByUri diags;
  typeset_lsp::Diagnostic warning;
  warning.severity = typeset_lsp::Severity::Warning;
  diags[typeset_lsp::Uri("file:///a.typ")].push_back(warning);
  EXPECT_FALSE(typeset_lsp::has_errors(diags));

  typeset_lsp::Diagnostic error;
  diags[typeset_lsp::Uri("file:///b.typ")].push_back(error);
  EXPECT_TRUE(typeset_lsp::has_errors(diags));
  EXPECT_EQ(typeset_lsp::count_diagnostics(diags, typeset_lsp::Severity::Warning), 1U);
}
