// typeset_lsp/workspace/resource_manager.cpp - Binary resource cache
#include "typeset_lsp/workspace/resource_manager.hpp"

#include "typeset_lsp/basic/log.hpp"

namespace typeset_lsp::workspace
{

ResourceManager::ResourceManager(std::shared_ptr<FileSystem> fs) : fs_(std::move(fs)) {}

FileResult<Bytes> ResourceManager::get_or_insert(const Uri & uri)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto it = cache_.find(uri); it != cache_.end()) {
      return FileResult<Bytes>::ok(it->second);
    }
  }

  const auto path = uri.to_path();
  if (!path) {
    return FileResult<Bytes>::fail(FileError::other("not a local file URI: " + uri.str()));
  }
  auto data = fs_->read_bytes(*path);
  if (!data) {
    return data;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto [it, inserted] = cache_.emplace(uri, data.value());
  if (inserted) {
    log::logger()->debug("loaded resource {} ({} bytes)", uri.str(), it->second.size());
  }
  return FileResult<Bytes>::ok(it->second);
}

bool ResourceManager::invalidate(const Uri & uri)
{
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.erase(uri) > 0;
}

size_t ResourceManager::size() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

}  // namespace typeset_lsp::workspace
