// typeset_lsp/engine/memo.hpp - Process-global memoization cache
//
// Engine sub-results are memoized by (function name, input fingerprint).
// Every entry carries an age: using it resets the age to zero, and each call
// to evict() ages all entries by one and drops those older than the limit.
// Callers pair every pass with one evict() so the cache stays bounded.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace typeset_lsp::engine::memo
{

class Cache
{
public:
  struct Stats
  {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evicted = 0;
  };

  Cache() = default;
  Cache(const Cache &) = delete;
  Cache & operator=(const Cache &) = delete;

  /**
   * Return the cached result for (function, fingerprint), computing and
   * storing it on a miss.
   *
   * `compute` runs without the cache lock held. If two threads miss on the
   * same key, both compute and the first insertion wins. A given function
   * name must always be used with the same T.
   */
  template <typename T, typename Compute>
  std::shared_ptr<const T> memoize(std::string_view function, uint64_t fingerprint, Compute && compute)
  {
    if (auto hit = lookup(function, fingerprint)) {
      return std::static_pointer_cast<const T>(hit);
    }
    std::shared_ptr<const void> fresh = std::make_shared<const T>(std::forward<Compute>(compute)());
    return std::static_pointer_cast<const T>(insert(function, fingerprint, std::move(fresh)));
  }

  /// Age every entry by one pass and drop entries unused for more than max_age passes
  void evict(uint32_t max_age);

  [[nodiscard]] bool contains(std::string_view function, uint64_t fingerprint) const;
  [[nodiscard]] size_t size() const;
  [[nodiscard]] Stats stats() const;
  void clear();

private:
  using Key = std::pair<std::string, uint64_t>;

  struct Entry
  {
    std::shared_ptr<const void> value;
    uint32_t age = 0;
  };

  std::shared_ptr<const void> lookup(std::string_view function, uint64_t fingerprint);
  std::shared_ptr<const void> insert(
    std::string_view function, uint64_t fingerprint, std::shared_ptr<const void> value);

  mutable std::mutex mutex_;
  std::map<Key, Entry> entries_;
  Stats stats_;
};

/// The process-wide cache used by engines
[[nodiscard]] Cache & global();

/// Shorthand for global().evict(max_age)
void evict(uint32_t max_age);

}  // namespace typeset_lsp::engine::memo
