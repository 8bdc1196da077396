#pragma once

#include <cstddef>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gardener::common {

/// Bounded least-recently-used map. Not synchronised; owners guard it.
template <typename Key, typename Value> class LruCache {
public:
  explicit LruCache(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  /// Returns a copy and marks the entry most recently used.
  [[nodiscard]] std::optional<Value> get(const Key &key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    order_.splice(order_.begin(), order_, it->second.position);
    return it->second.value;
  }

  /// Pointer into the cache, valid until the next mutation. Marks as used.
  [[nodiscard]] Value *find(const Key &key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return nullptr;
    }
    order_.splice(order_.begin(), order_, it->second.position);
    return &it->second.value;
  }

  /// Inserts or replaces `key`. Returns the entry pushed out, if any.
  std::optional<std::pair<Key, Value>> put(const Key &key, Value value) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      it->second.value = std::move(value);
      order_.splice(order_.begin(), order_, it->second.position);
      return std::nullopt;
    }

    std::optional<std::pair<Key, Value>> evicted;
    if (entries_.size() >= capacity_) {
      const Key lru_key = order_.back();
      order_.pop_back();
      auto lru = entries_.find(lru_key);
      evicted.emplace(lru_key, std::move(lru->second.value));
      entries_.erase(lru);
    }

    order_.push_front(key);
    entries_.emplace(key, Entry{std::move(value), order_.begin()});
    return evicted;
  }

  std::optional<Value> erase(const Key &key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    Value value = std::move(it->second.value);
    order_.erase(it->second.position);
    entries_.erase(it);
    return value;
  }

  [[nodiscard]] bool contains(const Key &key) const { return entries_.contains(key); }
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] std::size_t capacity() const { return capacity_; }

  /// Keys from most to least recently used.
  [[nodiscard]] std::vector<Key> keys() const { return {order_.begin(), order_.end()}; }

  void clear() {
    entries_.clear();
    order_.clear();
  }

private:
  struct Entry {
    Value value;
    typename std::list<Key>::iterator position;
  };

  std::size_t capacity_;
  std::list<Key> order_;
  std::unordered_map<Key, Entry> entries_;
};

} // namespace gardener::common
