#include "mdlive/preview/line_cache.hpp"

namespace mdlive::preview
{

LineElementCache::LineElementCache(std::size_t capacity)
    : cache(capacity)
{
}

std::string LineElementCache::makeKey(int lineNumber, std::string_view lineText, std::string_view referenceSignature)
{
    std::string key = std::to_string(lineNumber);
    key.reserve(key.size() + lineText.size() + referenceSignature.size() + 2);
    key.push_back(':');
    key.append(lineText);
    key.push_back(':');
    key.append(referenceSignature);
    return key;
}

ElementListPtr LineElementCache::lookup(const std::string &key, std::size_t lineFrom)
{
    Entry *entry = cache.find(key);
    if (!entry)
    {
        ++misses;
        return nullptr;
    }
    ++hits;
    if (entry->lineFrom == lineFrom)
        return entry->elements;

    auto delta = static_cast<std::ptrdiff_t>(lineFrom) - static_cast<std::ptrdiff_t>(entry->lineFrom);
    auto moved = std::make_shared<ElementList>();
    moved->reserve(entry->elements->size());
    for (const Element &element : *entry->elements)
        moved->push_back(shifted(element, delta));
    entry->lineFrom = lineFrom;
    entry->elements = std::move(moved);
    return entry->elements;
}

void LineElementCache::store(std::string key, std::size_t lineFrom, ElementListPtr elements)
{
    cache.put(std::move(key), Entry{lineFrom, std::move(elements)});
}

void LineElementCache::clear() noexcept
{
    cache.clear();
    hits = 0;
    misses = 0;
}

CacheStats LineElementCache::stats() const noexcept
{
    return CacheStats{cache.size(), cache.capacity(), hits, misses};
}

} // namespace mdlive::preview
