// Indexed Ordered Registry
//
// Story:
// Admin listings must page through live entities in the order they first
// appeared, while broker events insert, update and remove entries at a high
// rate. This container gives O(1) keyed mutation and preserves insertion order
// for windowed iteration.
//
// Algorithm:
// - Entries live in an arena of slots addressed by stable indices
// - A hash map indexes key -> slot index
// - Slots carry intrusive prev/next indices forming the insertion-order chain
// - Set() on an existing key overwrites the value in place (position kept)
// - Remove() unlinks the slot in O(1) and recycles it through a free list;
//   re-inserting the same key later appends at the tail
// - Iterate() walks the chain from the head, skipping window_start entries,
//   so its cost is O(window_start + window_size)
//
// Thread Safety:
// NOT thread-safe. The owning registry serializes all access with its own
// mutex so that a whole Iterate() call observes one consistent state.

#pragma once

#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace broker_admin {

/// Keyed container that remembers insertion order.
///
/// Example:
///   IndexedOrderedRegistry<std::string, int> registry;
///   registry.Set("a", 1);
///   registry.Set("b", 2);
///   registry.Set("a", 3);  // Updates in place, "a" stays first
///   registry.Iterate(0, 10, [](const int& v) { ... });  // visits 3, 2
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class IndexedOrderedRegistry {
 public:
  IndexedOrderedRegistry() = default;

  /// Inserts or replaces the value for key.
  ///
  /// An existing key keeps its position; a new key is appended at the tail.
  void Set(const Key& key, Value value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
      slots_[it->second].value = std::move(value);
      return;
    }

    size_t slot_index = AllocateSlot();
    Slot& slot = slots_[slot_index];
    slot.key = key;
    slot.value = std::move(value);
    LinkAtTail(slot_index);
    index_.emplace(key, slot_index);
    ++size_;
  }

  /// Removes the entry for key.
  ///
  /// @return true if an entry was removed, false if key was absent.
  bool Remove(const Key& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      return false;  // Absent key is a no-op
    }
    size_t slot_index = it->second;
    index_.erase(it);
    Unlink(slot_index);
    ReleaseSlot(slot_index);
    --size_;
    return true;
  }

  /// Removes every entry for which pred(key, value) returns true.
  ///
  /// Walks the whole chain, O(size).
  /// @return Number of removed entries.
  template <typename Predicate>
  size_t RemoveIf(Predicate pred) {
    size_t removed = 0;
    size_t current = head_;
    while (current != kNil) {
      size_t next = slots_[current].next;
      if (pred(slots_[current].key, *slots_[current].value)) {
        index_.erase(slots_[current].key);
        Unlink(current);
        ReleaseSlot(current);
        --size_;
        ++removed;
      }
      current = next;
    }
    return removed;
  }

  /// Returns a copy of the value for key, or std::nullopt if absent.
  std::optional<Value> Get(const Key& key) const {
    const Value* value = Find(key);
    if (value == nullptr) {
      return std::nullopt;
    }
    return *value;
  }

  /// Returns a pointer to the stored value, or nullptr if absent.
  /// The pointer is invalidated by the next mutation.
  Value* Find(const Key& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      return nullptr;
    }
    return &*slots_[it->second].value;
  }

  const Value* Find(const Key& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
      return nullptr;
    }
    return &*slots_[it->second].value;
  }

  bool Contains(const Key& key) const { return index_.count(key) != 0; }

  /// Visits up to window_size entries in insertion order, starting at the
  /// window_start-th surviving entry.
  ///
  /// A window_start past the end visits nothing.
  template <typename Visitor>
  void Iterate(size_t window_start, size_t window_size, Visitor&& visit) const {
    if (size_ < window_start || window_size == 0) {
      return;
    }

    size_t current = head_;
    for (size_t skipped = 0; skipped < window_start && current != kNil;
         ++skipped) {
      current = slots_[current].next;
    }

    for (size_t visited = 0; visited < window_size && current != kNil;
         ++visited) {
      visit(*slots_[current].value);
      current = slots_[current].next;
    }
  }

  /// Returns the number of surviving entries.
  size_t Size() const { return size_; }

  bool Empty() const { return size_ == 0; }

  /// Drops every entry and the arena storage.
  void Clear() {
    slots_.clear();
    free_slots_.clear();
    index_.clear();
    head_ = kNil;
    tail_ = kNil;
    size_ = 0;
  }

 private:
  static constexpr size_t kNil = std::numeric_limits<size_t>::max();

  struct Slot {
    Key key{};
    std::optional<Value> value;
    size_t prev = kNil;
    size_t next = kNil;
  };

  size_t AllocateSlot() {
    if (!free_slots_.empty()) {
      size_t slot_index = free_slots_.back();
      free_slots_.pop_back();
      return slot_index;
    }
    slots_.emplace_back();
    return slots_.size() - 1;
  }

  void ReleaseSlot(size_t slot_index) {
    Slot& slot = slots_[slot_index];
    slot.key = Key{};
    slot.value.reset();
    slot.prev = kNil;
    slot.next = kNil;
    free_slots_.push_back(slot_index);
  }

  void LinkAtTail(size_t slot_index) {
    Slot& slot = slots_[slot_index];
    slot.prev = tail_;
    slot.next = kNil;
    if (tail_ != kNil) {
      slots_[tail_].next = slot_index;
    } else {
      head_ = slot_index;
    }
    tail_ = slot_index;
  }

  void Unlink(size_t slot_index) {
    Slot& slot = slots_[slot_index];
    if (slot.prev != kNil) {
      slots_[slot.prev].next = slot.next;
    } else {
      head_ = slot.next;
    }
    if (slot.next != kNil) {
      slots_[slot.next].prev = slot.prev;
    } else {
      tail_ = slot.prev;
    }
  }

  // Arena of entries; indices stay valid until the slot is released
  std::vector<Slot> slots_;
  std::vector<size_t> free_slots_;

  // Key -> slot index
  std::unordered_map<Key, size_t, Hash> index_;

  // Insertion-order chain
  size_t head_ = kNil;
  size_t tail_ = kNil;
  size_t size_ = 0;
};

}  // namespace broker_admin
