#ifndef TILEBOX_LRU_CACHE_H
#define TILEBOX_LRU_CACHE_H
#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace tilebox {

// Bounded, thread-safe least-recently-used map. Values are shared so callers
// keep using an entry after it was evicted.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LimitedCache {
public:
    explicit LimitedCache(std::size_t capacity) : _capacity(capacity == 0 ? 1 : capacity) {}

    std::shared_ptr<const Value> get(const Key &key) {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _index.find(key);
        if (it == _index.end()) {
            return nullptr;
        }
        _entries.splice(_entries.begin(), _entries, it->second);
        return it->second->second;
    }

    std::shared_ptr<const Value> put(const Key &key, Value value) {
        auto shared = std::make_shared<const Value>(std::move(value));
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _index.find(key);
        if (it != _index.end()) {
            it->second->second = shared;
            _entries.splice(_entries.begin(), _entries, it->second);
            return shared;
        }
        _entries.emplace_front(key, shared);
        _index[key] = _entries.begin();
        while (_entries.size() > _capacity) {
            _index.erase(_entries.back().first);
            _entries.pop_back();
        }
        return shared;
    }

    // Returns the cached value or stores the one produced by load. load runs
    // outside the lock; concurrent misses on one key may both load.
    template <typename Loader>
    std::shared_ptr<const Value> get_or_load(const Key &key, Loader &&load) {
        if (auto cached = get(key)) {
            return cached;
        }
        return put(key, load());
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries.size();
    }

    std::size_t capacity() const noexcept { return _capacity; }

private:
    using Entry = std::pair<Key, std::shared_ptr<const Value>>;

    std::size_t _capacity;
    mutable std::mutex _mutex;
    std::list<Entry> _entries;
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> _index;
};

}  // namespace tilebox

#endif // TILEBOX_LRU_CACHE_H
