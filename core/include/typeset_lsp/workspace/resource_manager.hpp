// typeset_lsp/workspace/resource_manager.hpp - Binary resource cache
#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>

#include "typeset_lsp/basic/bytes.hpp"
#include "typeset_lsp/basic/file_error.hpp"
#include "typeset_lsp/basic/uri.hpp"
#include "typeset_lsp/workspace/file_system.hpp"

namespace typeset_lsp::workspace
{

/**
 * Images, fonts and other binary files, read once and shared afterwards.
 * Failed reads are not cached.
 */
class ResourceManager
{
public:
  explicit ResourceManager(std::shared_ptr<FileSystem> fs);

  [[nodiscard]] FileResult<Bytes> get_or_insert(const Uri & uri);

  /// Drop the cached bytes for `uri`; returns true if there were any
  bool invalidate(const Uri & uri);

  [[nodiscard]] size_t size() const;

private:
  std::shared_ptr<FileSystem> fs_;

  mutable std::mutex mutex_;
  std::unordered_map<Uri, Bytes> cache_;
};

}  // namespace typeset_lsp::workspace
