// typeset_lsp/workspace/file_system.hpp - Disk access collaborator
#pragma once

#include <filesystem>
#include <string>

#include "typeset_lsp/basic/bytes.hpp"
#include "typeset_lsp/basic/file_error.hpp"

namespace typeset_lsp::workspace
{

/**
 * Blocking file reads. Implementations must be callable from several threads
 * concurrently.
 */
class FileSystem
{
public:
  virtual ~FileSystem() = default;

  [[nodiscard]] virtual FileResult<std::string> read_to_string(const std::filesystem::path & path) = 0;

  [[nodiscard]] virtual FileResult<Bytes> read_bytes(const std::filesystem::path & path) = 0;
};

/// The real file system
class LocalFileSystem final : public FileSystem
{
public:
  [[nodiscard]] FileResult<std::string> read_to_string(const std::filesystem::path & path) override;
  [[nodiscard]] FileResult<Bytes> read_bytes(const std::filesystem::path & path) override;
};

}  // namespace typeset_lsp::workspace
