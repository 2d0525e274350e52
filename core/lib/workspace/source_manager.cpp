// typeset_lsp/workspace/source_manager.cpp - Source registry and cache
#include "typeset_lsp/workspace/source_manager.hpp"

#include <stdexcept>

#include "typeset_lsp/basic/log.hpp"
#include "typeset_lsp/basic/overloaded.hpp"

namespace typeset_lsp::workspace
{

const char * to_string(CacheStatus status) noexcept
{
  switch (status) {
    case CacheStatus::Open:
      return "open";
    case CacheStatus::ClosedUnmodified:
      return "closed-unmodified";
    case CacheStatus::ClosedModified:
      return "closed-modified";
  }
  return "unknown";
}

SourceManager::SourceManager(std::shared_ptr<FileSystem> fs) : fs_(std::move(fs)) {}

// ============================================================================
// State helpers
// ============================================================================

Source * SourceManager::cached_source(CachedState & state) noexcept
{
  return std::visit(
    overloaded{
      [](Open & s) -> Source * { return &s.source; },
      [](ClosedUnmodified & s) -> Source * { return &s.source; },
      [](ClosedModified &) -> Source * { return nullptr; },
    },
    state);
}

const Source * SourceManager::cached_source(const CachedState & state) noexcept
{
  return std::visit(
    overloaded{
      [](const Open & s) -> const Source * { return &s.source; },
      [](const ClosedUnmodified & s) -> const Source * { return &s.source; },
      [](const ClosedModified &) -> const Source * { return nullptr; },
    },
    state);
}

FileResult<void> SourceManager::cache_locked(Slot & slot, SourceId id)
{
  if (!std::holds_alternative<ClosedModified>(slot.state)) {
    return FileResult<void>::ok();
  }

  auto loaded = Source::load(id, slot.uri, *fs_);
  if (!loaded) {
    log::logger()->warn("reload of {} failed: {}", slot.uri.str(), loaded.error().message());
    return FileResult<void>::fail(loaded.error());
  }
  log::logger()->debug("reloaded {} (id {})", slot.uri.str(), id.value);
  slot.state = ClosedUnmodified{std::move(loaded).value()};
  return FileResult<void>::ok();
}

SourceManager::Slot * SourceManager::slot_at(SourceId id) const
{
  std::shared_lock<std::shared_mutex> lock(table_mutex_);
  if (id.index() >= slots_.size()) {
    return nullptr;
  }
  return slots_[id.index()].get();
}

SourceManager::Slot * SourceManager::slot_for(const Uri & uri) const
{
  std::shared_lock<std::shared_mutex> lock(table_mutex_);
  const auto it = ids_.find(uri);
  if (it == ids_.end()) {
    return nullptr;
  }
  return slots_[it->second.index()].get();
}

// ============================================================================
// Registration
// ============================================================================

FileResult<SourceId> SourceManager::register_or_lookup(const Uri & uri)
{
  if (auto id = find(uri)) {
    return FileResult<SourceId>::ok(*id);
  }

  auto text = Source::read(uri, *fs_);
  if (!text) {
    return FileResult<SourceId>::fail(text.error());
  }

  std::unique_lock<std::shared_mutex> lock(table_mutex_);
  if (const auto it = ids_.find(uri); it != ids_.end()) {
    // Registered by another thread while we were reading
    return FileResult<SourceId>::ok(it->second);
  }
  if (slots_.size() >= k_max_sources) {
    return FileResult<SourceId>::fail(FileError::other("too many source files"));
  }

  const SourceId id(static_cast<uint16_t>(slots_.size()));
  slots_.push_back(
    std::make_unique<Slot>(uri, ClosedUnmodified{Source(id, uri, std::move(text).value())}));
  ids_.emplace(uri, id);
  log::logger()->debug("registered {} as id {}", uri.str(), id.value);
  return FileResult<SourceId>::ok(id);
}

SourceId SourceManager::open(const Uri & uri, std::string text)
{
  std::unique_lock<std::shared_mutex> table_lock(table_mutex_);
  if (const auto it = ids_.find(uri); it != ids_.end()) {
    const SourceId id = it->second;
    Slot & slot = *slots_[id.index()];
    table_lock.unlock();

    std::unique_lock<std::shared_mutex> slot_lock(slot.mutex);
    slot.state = Open{Source(id, uri, std::move(text))};
    return id;
  }

  if (slots_.size() >= k_max_sources) {
    throw std::length_error("too many source files");
  }
  const SourceId id(static_cast<uint16_t>(slots_.size()));
  slots_.push_back(std::make_unique<Slot>(uri, Open{Source(id, uri, std::move(text))}));
  ids_.emplace(uri, id);
  log::logger()->debug("opened {} as id {}", uri.str(), id.value);
  return id;
}

// ============================================================================
// Access
// ============================================================================

FileResult<SourceReadGuard> SourceManager::get_source(SourceId id)
{
  Slot * slot = slot_at(id);
  if (slot == nullptr) {
    return FileResult<SourceReadGuard>::fail(
      FileError::other("unknown source id " + std::to_string(id.value)));
  }

  while (true) {
    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    if (const Source * source = cached_source(slot->state)) {
      return FileResult<SourceReadGuard>::ok(SourceReadGuard(std::move(lock), *source));
    }
    lock.unlock();

    // Stale: reload under the exclusive lock, then retry the shared view. A
    // waiter that acquires the exclusive lock after us finds the slot cached.
    std::unique_lock<std::shared_mutex> write_lock(slot->mutex);
    if (auto cached = cache_locked(*slot, id); !cached) {
      return FileResult<SourceReadGuard>::fail(cached.error());
    }
  }
}

FileResult<SourceReadGuard> SourceManager::get_source(const Uri & uri)
{
  auto id = register_or_lookup(uri);
  if (!id) {
    return FileResult<SourceReadGuard>::fail(id.error());
  }
  return get_source(id.value());
}

FileResult<SourceWriteGuard> SourceManager::get_mut_source(SourceId id)
{
  Slot * slot = slot_at(id);
  if (slot == nullptr) {
    return FileResult<SourceWriteGuard>::fail(
      FileError::other("unknown source id " + std::to_string(id.value)));
  }

  std::unique_lock<std::shared_mutex> lock(slot->mutex);
  if (auto cached = cache_locked(*slot, id); !cached) {
    return FileResult<SourceWriteGuard>::fail(cached.error());
  }
  Source * source = cached_source(slot->state);
  return FileResult<SourceWriteGuard>::ok(SourceWriteGuard(std::move(lock), *source));
}

FileResult<SourceWriteGuard> SourceManager::get_mut_source(const Uri & uri)
{
  auto id = register_or_lookup(uri);
  if (!id) {
    return FileResult<SourceWriteGuard>::fail(id.error());
  }
  return get_mut_source(id.value());
}

FileResult<void> SourceManager::cache(SourceId id)
{
  Slot * slot = slot_at(id);
  if (slot == nullptr) {
    return FileResult<void>::fail(FileError::other("unknown source id " + std::to_string(id.value)));
  }

  {
    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    if (cached_source(slot->state) != nullptr) {
      return FileResult<void>::ok();
    }
  }
  std::unique_lock<std::shared_mutex> lock(slot->mutex);
  return cache_locked(*slot, id);
}

// ============================================================================
// Transitions
// ============================================================================

void SourceManager::close(const Uri & uri)
{
  Slot * slot = slot_for(uri);
  if (slot == nullptr) {
    return;
  }
  std::unique_lock<std::shared_mutex> lock(slot->mutex);
  slot->state = ClosedModified{uri};
}

void SourceManager::mark_changed(const Uri & uri)
{
  Slot * slot = slot_for(uri);
  if (slot == nullptr) {
    return;
  }
  std::unique_lock<std::shared_mutex> lock(slot->mutex);
  if (std::holds_alternative<ClosedUnmodified>(slot->state)) {
    slot->state = ClosedModified{uri};
  }
}

// ============================================================================
// Queries
// ============================================================================

std::vector<Uri> SourceManager::list_open_uris() const
{
  std::vector<const Slot *> slots;
  {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    slots.reserve(slots_.size());
    for (const auto & slot : slots_) {
      slots.push_back(slot.get());
    }
  }

  std::vector<Uri> uris;
  for (const Slot * slot : slots) {
    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    if (std::holds_alternative<Open>(slot->state)) {
      uris.push_back(slot->uri);
    }
  }
  return uris;
}

std::optional<SourceId> SourceManager::find(const Uri & uri) const
{
  std::shared_lock<std::shared_mutex> lock(table_mutex_);
  const auto it = ids_.find(uri);
  if (it == ids_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Uri> SourceManager::uri_of(SourceId id) const
{
  const Slot * slot = slot_at(id);
  if (slot == nullptr) {
    return std::nullopt;
  }
  return slot->uri;
}

std::optional<CacheStatus> SourceManager::status(SourceId id) const
{
  const Slot * slot = slot_at(id);
  if (slot == nullptr) {
    return std::nullopt;
  }
  std::shared_lock<std::shared_mutex> lock(slot->mutex);
  return std::visit(
    overloaded{
      [](const Open &) { return CacheStatus::Open; },
      [](const ClosedUnmodified &) { return CacheStatus::ClosedUnmodified; },
      [](const ClosedModified &) { return CacheStatus::ClosedModified; },
    },
    slot->state);
}

size_t SourceManager::size() const
{
  std::shared_lock<std::shared_mutex> lock(table_mutex_);
  return slots_.size();
}

}  // namespace typeset_lsp::workspace
