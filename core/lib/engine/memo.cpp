// typeset_lsp/engine/memo.cpp - Process-global memoization cache
#include "typeset_lsp/engine/memo.hpp"

#include "typeset_lsp/basic/log.hpp"

namespace typeset_lsp::engine::memo
{

std::shared_ptr<const void> Cache::lookup(std::string_view function, uint64_t fingerprint)
{
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(Key{std::string(function), fingerprint});
  if (it == entries_.end()) {
    ++stats_.misses;
    return nullptr;
  }
  ++stats_.hits;
  it->second.age = 0;
  return it->second.value;
}

std::shared_ptr<const void> Cache::insert(
  std::string_view function, uint64_t fingerprint, std::shared_ptr<const void> value)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] =
    entries_.try_emplace(Key{std::string(function), fingerprint}, Entry{std::move(value), 0});
  if (!inserted) {
    it->second.age = 0;
  }
  return it->second.value;
}

void Cache::evict(uint32_t max_age)
{
  size_t dropped = 0;
  size_t remaining = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
      it->second.age += 1;
      if (it->second.age > max_age) {
        it = entries_.erase(it);
        ++dropped;
      } else {
        ++it;
      }
    }
    stats_.evicted += dropped;
    remaining = entries_.size();
  }

  if (dropped > 0) {
    log::logger()->debug("memo: evicted {} entries, {} remaining", dropped, remaining);
  }
}

bool Cache::contains(std::string_view function, uint64_t fingerprint) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(Key{std::string(function), fingerprint}) > 0;
}

size_t Cache::size() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

Cache::Stats Cache::stats() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void Cache::clear()
{
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  stats_ = Stats{};
}

Cache & global()
{
  static Cache cache;
  return cache;
}

void evict(uint32_t max_age) { global().evict(max_age); }

}  // namespace typeset_lsp::engine::memo
