#pragma once

#include "mdlive/preview/element.hpp"

#include <cstddef>
#include <list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mdlive::preview
{

template <typename Key, typename Value>
class LruCache
{
public:
    explicit LruCache(std::size_t capacity)
        : maxEntries(capacity == 0 ? 1 : capacity)
    {
    }

    // Marks the entry as most recently used.
    Value *find(const Key &key)
    {
        auto it = index.find(key);
        if (it == index.end())
            return nullptr;
        entries.splice(entries.begin(), entries, it->second);
        return &it->second->second;
    }

    void put(Key key, Value value)
    {
        auto it = index.find(key);
        if (it != index.end())
        {
            it->second->second = std::move(value);
            entries.splice(entries.begin(), entries, it->second);
            return;
        }
        entries.emplace_front(std::move(key), std::move(value));
        index.emplace(entries.front().first, entries.begin());
        evict();
    }

    bool contains(const Key &key) const { return index.find(key) != index.end(); }

    void clear() noexcept
    {
        index.clear();
        entries.clear();
    }

    std::size_t size() const noexcept { return entries.size(); }
    std::size_t capacity() const noexcept { return maxEntries; }

    void setCapacity(std::size_t capacity)
    {
        maxEntries = capacity == 0 ? 1 : capacity;
        evict();
    }

private:
    void evict()
    {
        while (entries.size() > maxEntries)
        {
            index.erase(entries.back().first);
            entries.pop_back();
        }
    }

    std::size_t maxEntries;
    std::list<std::pair<Key, Value>> entries;
    std::unordered_map<Key, typename std::list<std::pair<Key, Value>>::iterator> index;
};

using ElementList = std::vector<Element>;
using ElementListPtr = std::shared_ptr<const ElementList>;

struct CacheStats
{
    std::size_t size = 0;
    std::size_t maxSize = 0;
    std::size_t hits = 0;
    std::size_t misses = 0;
};

// Per-line scan results keyed by line number, line text and the reference
// signature. A hit returns the stored list itself; when the line moved since
// it was stored the elements are shifted to the new offset first.
class LineElementCache
{
public:
    static constexpr std::size_t kDefaultCapacity = 2000;

    explicit LineElementCache(std::size_t capacity = kDefaultCapacity);

    static std::string makeKey(int lineNumber, std::string_view lineText, std::string_view referenceSignature);

    ElementListPtr lookup(const std::string &key, std::size_t lineFrom);
    void store(std::string key, std::size_t lineFrom, ElementListPtr elements);

    void clear() noexcept;
    void setCapacity(std::size_t capacity) { cache.setCapacity(capacity); }
    CacheStats stats() const noexcept;

private:
    struct Entry
    {
        std::size_t lineFrom = 0;
        ElementListPtr elements;
    };

    LruCache<std::string, Entry> cache;
    std::size_t hits = 0;
    std::size_t misses = 0;
};

} // namespace mdlive::preview
