// typeset_lsp/workspace/source_manager.hpp - Source registry and cache
//
// Tracks every source file the workspace has seen, assigns each a SourceId,
// and caches its content. Each file's cache state is one of:
//
//   Open              the editor has the file open; editor content wins
//   ClosedUnmodified  not open, last known content still trusted
//   ClosedModified    not open, content presumed stale; reloaded on next use
//
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "typeset_lsp/basic/file_error.hpp"
#include "typeset_lsp/basic/source_id.hpp"
#include "typeset_lsp/basic/uri.hpp"
#include "typeset_lsp/workspace/file_system.hpp"
#include "typeset_lsp/workspace/source.hpp"

namespace typeset_lsp::workspace
{

enum class CacheStatus : uint8_t {
  Open,
  ClosedUnmodified,
  ClosedModified,
};

[[nodiscard]] const char * to_string(CacheStatus status) noexcept;

// ============================================================================
// Guards
// ============================================================================

/// Shared access to a cached Source. Writers on the same file wait until released.
class SourceReadGuard
{
public:
  SourceReadGuard(std::shared_lock<std::shared_mutex> lock, const Source & source)
  : lock_(std::move(lock)), source_(&source)
  {
  }

  [[nodiscard]] const Source & operator*() const noexcept { return *source_; }
  [[nodiscard]] const Source * operator->() const noexcept { return source_; }

private:
  std::shared_lock<std::shared_mutex> lock_;
  const Source * source_;
};

/// Exclusive access to a cached Source
class SourceWriteGuard
{
public:
  SourceWriteGuard(std::unique_lock<std::shared_mutex> lock, Source & source)
  : lock_(std::move(lock)), source_(&source)
  {
  }

  [[nodiscard]] Source & operator*() const noexcept { return *source_; }
  [[nodiscard]] Source * operator->() const noexcept { return source_; }

private:
  std::unique_lock<std::shared_mutex> lock_;
  Source * source_;
};

// ============================================================================
// SourceManager
// ============================================================================

/**
 * Thread-safe registry of source files.
 *
 * Ids are assigned in registration order and never reused; a slot is never
 * moved or freed, so an id stays valid for the manager's lifetime. The id
 * table has one lock held only for lookups and inserts; every slot has its
 * own reader/writer lock guarding its cache state.
 */
class SourceManager
{
public:
  explicit SourceManager(std::shared_ptr<FileSystem> fs);

  SourceManager(const SourceManager &) = delete;
  SourceManager & operator=(const SourceManager &) = delete;

  /**
   * Id for `uri`, loading the file on first sight.
   *
   * A file that cannot be loaded gets no id. The disk read happens without
   * the table lock; if another thread registers the same URI meanwhile, its
   * id is returned and this thread's content is dropped.
   */
  [[nodiscard]] FileResult<SourceId> register_or_lookup(const Uri & uri);

  /// Shared view of a source, reloading it first if it is stale
  [[nodiscard]] FileResult<SourceReadGuard> get_source(SourceId id);
  [[nodiscard]] FileResult<SourceReadGuard> get_source(const Uri & uri);

  /// Exclusive view of a source, reloading it first if it is stale
  [[nodiscard]] FileResult<SourceWriteGuard> get_mut_source(SourceId id);
  [[nodiscard]] FileResult<SourceWriteGuard> get_mut_source(const Uri & uri);

  /// Ensure the source is cached. Concurrent callers trigger a single reload.
  [[nodiscard]] FileResult<void> cache(SourceId id);

  /**
   * Mark `uri` as open with editor-supplied `text`, whatever its prior state.
   *
   * Throws std::length_error if the id space is exhausted.
   */
  SourceId open(const Uri & uri, std::string text);

  /// Editor closed the file; its content is reloaded from disk on next use
  void close(const Uri & uri);

  /// The file changed on disk. Has no effect on open or already stale files.
  void mark_changed(const Uri & uri);

  /// URIs currently open in the editor, in id order
  [[nodiscard]] std::vector<Uri> list_open_uris() const;

  [[nodiscard]] std::optional<SourceId> find(const Uri & uri) const;
  [[nodiscard]] std::optional<Uri> uri_of(SourceId id) const;
  [[nodiscard]] std::optional<CacheStatus> status(SourceId id) const;
  [[nodiscard]] size_t size() const;

  /// Maximum number of files a manager can track
  static constexpr size_t k_max_sources = SourceId::k_detached;

private:
  struct Open
  {
    Source source;
  };
  struct ClosedUnmodified
  {
    Source source;
  };
  struct ClosedModified
  {
    Uri uri;
  };
  using CachedState = std::variant<Open, ClosedUnmodified, ClosedModified>;

  struct Slot
  {
    Slot(Uri u, CachedState s) : uri(std::move(u)), state(std::move(s)) {}

    const Uri uri;
    mutable std::shared_mutex mutex;
    CachedState state;
  };

  [[nodiscard]] static Source * cached_source(CachedState & state) noexcept;
  [[nodiscard]] static const Source * cached_source(const CachedState & state) noexcept;

  /// Reload a stale slot. Caller holds the slot's exclusive lock.
  FileResult<void> cache_locked(Slot & slot, SourceId id);

  [[nodiscard]] Slot * slot_at(SourceId id) const;
  [[nodiscard]] Slot * slot_for(const Uri & uri) const;

  std::shared_ptr<FileSystem> fs_;

  mutable std::shared_mutex table_mutex_;
  std::unordered_map<Uri, SourceId> ids_;
  std::vector<std::unique_ptr<Slot>> slots_;
};

}  // namespace typeset_lsp::workspace
