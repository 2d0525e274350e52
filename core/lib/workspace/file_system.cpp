// typeset_lsp/workspace/file_system.cpp - Disk access collaborator
#include "typeset_lsp/workspace/file_system.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

namespace typeset_lsp::workspace
{

namespace
{

/// Open `path` for binary reading, mapping failures onto FileError
FileResult<std::ifstream> open_file(const std::filesystem::path & path)
{
  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (ec) {
    return FileResult<std::ifstream>::fail(FileError::from_error_code(ec, path));
  }
  if (std::filesystem::is_directory(status)) {
    return FileResult<std::ifstream>::fail(FileError::other("is a directory", path));
  }

  errno = 0;
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    const int err = errno != 0 ? errno : EIO;
    return FileResult<std::ifstream>::fail(
      FileError::from_error_code(std::error_code(err, std::generic_category()), path));
  }
  return FileResult<std::ifstream>::ok(std::move(in));
}

}  // namespace

FileResult<std::string> LocalFileSystem::read_to_string(const std::filesystem::path & path)
{
  auto in = open_file(path);
  if (!in) {
    return FileResult<std::string>::fail(in.error());
  }

  std::string content(
    (std::istreambuf_iterator<char>(in.value())), std::istreambuf_iterator<char>());
  if (in->bad()) {
    return FileResult<std::string>::fail(FileError::other("read error", path));
  }
  return FileResult<std::string>::ok(std::move(content));
}

FileResult<Bytes> LocalFileSystem::read_bytes(const std::filesystem::path & path)
{
  auto text = read_to_string(path);
  if (!text) {
    return FileResult<Bytes>::fail(text.error());
  }
  return FileResult<Bytes>::ok(Bytes::from_string(text.value()));
}

}  // namespace typeset_lsp::workspace
