#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

#include "identity/error.hpp"
#include "identity/schema_document.hpp"

namespace sid::identity {

/// TypeId-keyed store of lazily computed values.
///
/// Each key owns a slot with its own mutex: concurrent first access to one
/// key runs the computation once and every caller sees the stored value. A
/// failed computation stores nothing and releases the key's slot.
template <typename V>
class IdentityCache {
 public:
  template <typename Fn>
  auto get_or_compute(TypeId id, Fn&& compute) -> Expected<V> {
    auto slot = acquire_slot(id);
    std::lock_guard lock(slot->mutex);
    if (slot->value) {
      return *slot->value;
    }
    Expected<V> result = compute();
    if (!result) {
      discard_if_empty(id, slot);
      return result;
    }
    slot->value = *result;
    return result;
  }

  auto find(TypeId id) const -> std::optional<V> {
    std::shared_ptr<Slot> slot;
    {
      std::shared_lock lock(mutex_);
      auto it = slots_.find(id);
      if (it == slots_.end()) {
        return std::nullopt;
      }
      slot = it->second;
    }
    std::lock_guard lock(slot->mutex);
    return slot->value;
  }

  auto contains(TypeId id) const -> bool { return find(id).has_value(); }

  /// Number of keys holding a slot, computed or in progress.
  auto size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return slots_.size();
  }

  /// Drops the entry for `id` only. Returns whether a value was stored.
  auto evict(TypeId id) -> bool {
    std::shared_ptr<Slot> slot;
    {
      std::unique_lock lock(mutex_);
      auto it = slots_.find(id);
      if (it == slots_.end()) {
        return false;
      }
      slot = std::move(it->second);
      slots_.erase(it);
    }
    std::lock_guard lock(slot->mutex);
    return slot->value.has_value();
  }

 private:
  struct Slot {
    std::mutex mutex;
    std::optional<V> value;
  };

  auto acquire_slot(TypeId id) -> std::shared_ptr<Slot> {
    {
      std::shared_lock lock(mutex_);
      auto it = slots_.find(id);
      if (it != slots_.end()) {
        return it->second;
      }
    }
    std::unique_lock lock(mutex_);
    auto [it, inserted] = slots_.try_emplace(id, nullptr);
    if (inserted) {
      it->second = std::make_shared<Slot>();
    }
    return it->second;
  }

  /// Caller holds `slot->mutex`. Slot mutexes are never awaited under `mutex_`.
  auto discard_if_empty(TypeId id, const std::shared_ptr<Slot>& slot) -> void {
    std::unique_lock lock(mutex_);
    auto it = slots_.find(id);
    if (it != slots_.end() && it->second == slot && !slot->value) {
      slots_.erase(it);
    }
  }

  mutable std::shared_mutex mutex_;
  std::unordered_map<TypeId, std::shared_ptr<Slot>> slots_;
};

}  // namespace sid::identity
