#ifndef TTLCACHE_BOUNDED_STORE_HPP
#define TTLCACHE_BOUNDED_STORE_HPP

#include <cstddef>
#include <functional>
#include <iterator>
#include <list>
#include <unordered_map>
#include <utility>

namespace ttlcache {

/**
 * Fixed-capacity key/value container with least-recently-used eviction.
 *
 * Implementations keep every key in a strict recency order (most recently
 * touched first). Only Add may evict, and only the eviction callback set here
 * observes evictions; Remove and Clear never invoke it.
 */
template <typename K, typename V>
class Store {
 public:
  using EvictionCallback = std::function<void(const K&, const V&)>;
  using Visitor = std::function<void(const K&, const V&)>;

  virtual ~Store() = default;

  /** Inserts or replaces \a key and makes it most recently used. Evicts the LRU entry if over capacity. */
  virtual void Add(const K& key, V value) = 0;

  /** Copies the value of \a key into \a value and promotes it. Returns false on miss. */
  virtual bool Get(const K& key, V& value) = 0;

  /** Copies the value of \a key into \a value without touching recency. Returns false on miss. */
  virtual bool Peek(const K& key, V& value) const = 0;

  /** Deletes \a key. Returns false if it was not stored. */
  virtual bool Remove(const K& key) = 0;

  /** Drops every entry. */
  virtual void Clear() = 0;

  virtual size_t Len() const = 0;

  /** Visits entries from most to least recently used. The visitor must not mutate the store. */
  virtual void ForEach(const Visitor& visit) const = 0;

  /** Sets the callback fired synchronously for each capacity eviction. */
  virtual void SetEvictionCallback(EvictionCallback cb) = 0;
};

/** Store backed by a doubly-linked recency list and a hash map of list iterators. Capacity 0 means unbounded. */
template <typename K, typename V>
class LruStore : public Store<K, V> {
 public:
  using typename Store<K, V>::EvictionCallback;
  using typename Store<K, V>::Visitor;

  explicit LruStore(size_t capacity) : capacity_(capacity) {}

  void Add(const K& key, V value) override {
    auto it = index_.find(key);
    if (it != index_.end()) {
      it->second->second = std::move(value);
      touch(it->second);
      return;
    }
    order_.emplace_front(key, std::move(value));
    index_.emplace(key, order_.begin());
    if (capacity_ > 0 && order_.size() > capacity_) evictOldest();
  }

  bool Get(const K& key, V& value) override {
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    touch(it->second);
    value = it->second->second;
    return true;
  }

  bool Peek(const K& key, V& value) const override {
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    value = it->second->second;
    return true;
  }

  bool Remove(const K& key) override {
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    order_.erase(it->second);
    index_.erase(it);
    return true;
  }

  void Clear() override {
    index_.clear();
    order_.clear();
  }

  size_t Len() const override { return order_.size(); }

  void ForEach(const Visitor& visit) const override {
    for (const auto& kv : order_) visit(kv.first, kv.second);
  }

  void SetEvictionCallback(EvictionCallback cb) override {
    onEvicted_ = std::move(cb);
  }

  size_t Capacity() const { return capacity_; }

 private:
  using List = std::list<std::pair<K, V>>;  // MRU at front

  void touch(typename List::iterator it) {
    order_.splice(order_.begin(), order_, it);
  }

  /** Unlinks the tail entry, then hands it to the callback once both structures agree again. */
  void evictOldest() {
    auto last = std::prev(order_.end());
    index_.erase(last->first);
    std::pair<K, V> victim = std::move(*last);
    order_.erase(last);
    if (onEvicted_) onEvicted_(victim.first, victim.second);
  }

  size_t capacity_;
  List order_;
  std::unordered_map<K, typename List::iterator> index_;
  EvictionCallback onEvicted_;
};

}  // namespace ttlcache

#endif  // TTLCACHE_BOUNDED_STORE_HPP
