// typeset_lsp/basic/file_error.hpp - File error taxonomy and result type
//
// All I/O and path resolution failures are reported as FileError values
// carried in a FileResult. Runtime I/O conditions never throw.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

namespace typeset_lsp
{

enum class FileErrorKind : uint8_t {
  NotFound,
  AccessDenied,
  Other,
};

struct FileError
{
  FileErrorKind kind = FileErrorKind::Other;
  std::filesystem::path path;
  std::string reason;  ///< Only meaningful for FileErrorKind::Other

  [[nodiscard]] static FileError not_found(std::filesystem::path p);
  [[nodiscard]] static FileError access_denied(std::filesystem::path p);
  [[nodiscard]] static FileError other(std::string why, std::filesystem::path p = {});

  /// Map an OS error code (errno or std::error_code) onto the taxonomy
  [[nodiscard]] static FileError from_error_code(std::error_code ec, std::filesystem::path p);

  /// Human readable message, e.g. "file not found (searched at /a/b.typ)"
  [[nodiscard]] std::string message() const;

  [[nodiscard]] bool operator==(const FileError & other) const
  {
    return kind == other.kind && path == other.path && reason == other.reason;
  }
};

[[nodiscard]] const char * to_string(FileErrorKind kind) noexcept;

// ============================================================================
// FileResult
// ============================================================================

/**
 * Value-or-FileError result.
 *
 * Construct with FileResult<T>::ok(...) or FileResult<T>::fail(...).
 */
template <typename T>
class FileResult
{
public:
  static FileResult ok(T value) { return FileResult(std::in_place_index<0>, std::move(value)); }
  static FileResult fail(FileError error)
  {
    return FileResult(std::in_place_index<1>, std::move(error));
  }

  [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
  [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

  [[nodiscard]] T & value() & { return std::get<0>(storage_); }
  [[nodiscard]] const T & value() const & { return std::get<0>(storage_); }
  [[nodiscard]] T && value() && { return std::get<0>(std::move(storage_)); }

  T * operator->() { return &value(); }
  const T * operator->() const { return &value(); }

  [[nodiscard]] const FileError & error() const { return std::get<1>(storage_); }

private:
  template <size_t I, typename U>
  FileResult(std::in_place_index_t<I> tag, U && v) : storage_(tag, std::forward<U>(v))
  {
  }

  std::variant<T, FileError> storage_;
};

template <>
class FileResult<void>
{
public:
  static FileResult ok() { return FileResult(std::nullopt); }
  static FileResult fail(FileError error) { return FileResult(std::move(error)); }

  [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
  [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

  [[nodiscard]] const FileError & error() const { return *error_; }

private:
  explicit FileResult(std::optional<FileError> error) : error_(std::move(error)) {}

  std::optional<FileError> error_;
};

}  // namespace typeset_lsp
