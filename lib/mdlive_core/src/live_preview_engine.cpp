#include "mdlive/preview/live_preview_engine.hpp"

#include "mdlive/preview/conflict_resolver.hpp"

#include <algorithm>
#include <exception>
#include <plog/Log.h>

namespace mdlive::preview
{

const ParseResult *SnapshotCache::find(const DocumentSnapshot &snapshot,
                                       const std::optional<Viewport> &scannedLines) const
{
    if (!cached || !cached->snapshot || cached->snapshot->id() != snapshot.id())
        return nullptr;
    if (cached->scannedLines != scannedLines)
        return nullptr;
    return &*cached;
}

const ParseResult &SnapshotCache::store(ParseResult result)
{
    cached = std::move(result);
    return *cached;
}

LivePreviewEngine::LivePreviewEngine(EngineOptions options)
    : settings(options), lineCache(options.lineCacheSize)
{
}

void LivePreviewEngine::setOptions(const EngineOptions &options)
{
    settings = options;
    lineCache.setCapacity(options.lineCacheSize);
}

void LivePreviewEngine::clearCaches() noexcept
{
    resolved.clear();
    snapshots.clear();
    lineCache.clear();
}

std::optional<Viewport> LivePreviewEngine::scanRange(const DocumentSnapshot &snapshot,
                                                     const std::optional<Viewport> &viewport) const
{
    if (!settings.viewportOnly || !viewport || snapshot.lineCount() <= settings.largeDocumentThreshold)
        return std::nullopt;
    Viewport range;
    // A stale viewport may lie past the end of the document.
    range.firstLine = std::clamp(viewport->firstLine - settings.viewportBuffer, 1, snapshot.lineCount());
    range.lastLine = std::clamp(viewport->lastLine + settings.viewportBuffer, range.firstLine, snapshot.lineCount());
    return range;
}

const ParseResult &LivePreviewEngine::parse(const SnapshotPtr &snapshot, const std::optional<Viewport> &viewport)
{
    std::optional<Viewport> range = scanRange(*snapshot, viewport);
    if (const ParseResult *hit = snapshots.find(*snapshot, range))
        return *hit;

    // The previous resolved list points into the parse about to be replaced.
    resolved.clear();
    ++parses;

    ParseResult result;
    result.snapshot = snapshot;
    result.blocks = blockScanner.scan(*snapshot);
    result.scannedLines = range;

    auto combined = std::make_shared<ElementList>(result.blocks.toElements());
    const std::string &signature = result.blocks.references.signature();
    int first = range ? range->firstLine : 1;
    int last = range ? range->lastLine : snapshot->lineCount();
    for (int number = first; number <= last; ++number)
    {
        if (result.blocks.occupied.contains(number))
            continue;
        const DocumentLine &line = snapshot->line(number);
        std::string key = LineElementCache::makeKey(number, line.text, signature);
        ElementListPtr lineElements = lineCache.lookup(key, line.from);
        if (!lineElements)
        {
            lineElements = std::make_shared<const ElementList>(inlineScanner.scanLine(line, result.blocks.references));
            lineCache.store(std::move(key), line.from, lineElements);
        }
        combined->insert(combined->end(), lineElements->begin(), lineElements->end());
    }
    result.elements = std::move(combined);
    return snapshots.store(std::move(result));
}

DecorationSet LivePreviewEngine::decorations(const SnapshotPtr &snapshot, const RevealOracle &oracle,
                                             std::optional<Viewport> viewport)
{
    if (!snapshot)
        return {};
    try
    {
        const ParseResult &result = parse(snapshot, viewport);
        resolved = resolveConflicts(*result.elements);
        DecorationBuilder builder(*result.snapshot, oracle);
        return builder.build(std::span<const Element *const>(resolved));
    }
    catch (const std::exception &error)
    {
        PLOG_ERROR << "Live preview pass failed: " << error.what();
        resolved.clear();
        snapshots.clear();
        return {};
    }
}

ElementListPtr LivePreviewEngine::elements() const
{
    if (const ParseResult *result = snapshots.current())
        return result->elements;
    return std::make_shared<const ElementList>();
}

std::vector<Element> LivePreviewEngine::resolvedElements() const
{
    std::vector<Element> result;
    result.reserve(resolved.size());
    for (const Element *element : resolved)
        result.push_back(*element);
    return result;
}

std::vector<Element> LivePreviewEngine::elementsAt(std::size_t offset) const
{
    std::vector<Element> result;
    for (const Element *element : resolved)
        if (element->from <= offset && offset <= element->to)
            result.push_back(*element);
    std::stable_sort(result.begin(), result.end(),
                     [](const Element &a, const Element &b) { return comparePriority(a.kind, b.kind) < 0; });
    return result;
}

std::vector<OutlineItem> LivePreviewEngine::outline() const
{
    const ParseResult *result = snapshots.current();
    if (!result)
        return {};
    return buildOutline(*result->elements);
}

} // namespace mdlive::preview
