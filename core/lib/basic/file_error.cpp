// typeset_lsp/basic/file_error.cpp - File error helpers
#include "typeset_lsp/basic/file_error.hpp"

#include <fmt/core.h>

namespace typeset_lsp
{

FileError FileError::not_found(std::filesystem::path p)
{
  return FileError{FileErrorKind::NotFound, std::move(p), {}};
}

FileError FileError::access_denied(std::filesystem::path p)
{
  return FileError{FileErrorKind::AccessDenied, std::move(p), {}};
}

FileError FileError::other(std::string why, std::filesystem::path p)
{
  return FileError{FileErrorKind::Other, std::move(p), std::move(why)};
}

FileError FileError::from_error_code(std::error_code ec, std::filesystem::path p)
{
  if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
    return not_found(std::move(p));
  }
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    return access_denied(std::move(p));
  }
  return other(ec.message(), std::move(p));
}

std::string FileError::message() const
{
  switch (kind) {
    case FileErrorKind::NotFound:
      return fmt::format("file not found (searched at {})", path.string());
    case FileErrorKind::AccessDenied:
      return fmt::format("failed to load file {} (access denied)", path.string());
    case FileErrorKind::Other:
      break;
  }
  if (path.empty()) {
    return fmt::format("failed to load file: {}", reason);
  }
  return fmt::format("failed to load file {}: {}", path.string(), reason);
}

const char * to_string(FileErrorKind kind) noexcept
{
  switch (kind) {
    case FileErrorKind::NotFound:
      return "not-found";
    case FileErrorKind::AccessDenied:
      return "access-denied";
    case FileErrorKind::Other:
      return "other";
  }
  return "other";
}

}  // namespace typeset_lsp
