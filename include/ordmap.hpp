#ifndef ORDMAP_HPP
#define ORDMAP_HPP

#pragma once

#include <map>
#include <optional>
#include <utility>
#include <vector>
#include <types.hpp>

// map that iterates in first-insertion order
template <typename K, typename V>
class ordmap_t {
private:
  std::vector<std::pair<K, V>> entries;
  std::map<K, u64> index;

public:
  typedef typename std::vector<std::pair<K, V>>::const_iterator const_iterator;

  // inserts or overwrites; an overwritten entry keeps its position and the
  // previous value is returned
  std::optional<V> upsert(const K &key, V value) {
    auto it = this->index.find(key);
    if (it == this->index.end()) {
      this->index.emplace(key, this->entries.size());
      this->entries.emplace_back(key, std::move(value));
      return std::nullopt;
    }
    std::optional<V> previous = std::move(this->entries[it->second].second);
    this->entries[it->second].second = std::move(value);
    return previous;
  }

  bool contains(const K &key) const { return this->index.contains(key); }
  const V &at(const K &key) const { return this->entries[this->index.at(key)].second; }
  const V *find(const K &key) const {
    auto it = this->index.find(key);
    return it == this->index.end() ? nullptr : &this->entries[it->second].second;
  }
  u64 size(void) const { return this->entries.size(); }
  bool empty(void) const { return this->entries.empty(); }
  const_iterator begin(void) const { return this->entries.begin(); }
  const_iterator end(void) const { return this->entries.end(); }
};

#endif
