#pragma once

#include "mdlive/preview/block_scanner.hpp"
#include "mdlive/preview/decoration.hpp"
#include "mdlive/preview/document.hpp"
#include "mdlive/preview/inline_scanner.hpp"
#include "mdlive/preview/line_cache.hpp"
#include "mdlive/preview/outline.hpp"
#include "mdlive/preview/reveal.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace mdlive::preview
{

struct EngineOptions
{
    std::size_t lineCacheSize = LineElementCache::kDefaultCapacity;
    bool viewportOnly = false;
    int viewportBuffer = 100;
    int largeDocumentThreshold = 5000;
};

// Visible line range reported by the host, 1-based and inclusive.
struct Viewport
{
    int firstLine = 1;
    int lastLine = 1;

    bool operator==(const Viewport &other) const noexcept = default;
};

struct ParseResult
{
    SnapshotPtr snapshot;
    BlockScanResult blocks;
    ElementListPtr elements;
    // Lines that went through the inline scanner; empty when all of them did.
    std::optional<Viewport> scannedLines;
};

// The parse of the most recent snapshot. A lookup only hits for the very same
// snapshot identity and scanned line range.
class SnapshotCache
{
public:
    const ParseResult *find(const DocumentSnapshot &snapshot, const std::optional<Viewport> &scannedLines) const;
    const ParseResult &store(ParseResult result);
    const ParseResult *current() const noexcept { return cached ? &*cached : nullptr; }
    void clear() noexcept { cached.reset(); }

private:
    std::optional<ParseResult> cached;
};

// Structural parse and decoration pipeline for one open document.
class LivePreviewEngine
{
public:
    explicit LivePreviewEngine(EngineOptions options = {});

    // Never throws: a failing pass is logged and yields an empty set.
    DecorationSet decorations(const SnapshotPtr &snapshot, const RevealOracle &oracle,
                              std::optional<Viewport> viewport = std::nullopt);

    // Combined element list of the last parse, before conflict resolution.
    ElementListPtr elements() const;
    std::vector<Element> resolvedElements() const;
    // Resolved elements whose span contains offset (ends included), highest priority first.
    std::vector<Element> elementsAt(std::size_t offset) const;
    std::vector<OutlineItem> outline() const;

    CacheStats cacheStats() const noexcept { return lineCache.stats(); }
    void clearCaches() noexcept;

    const EngineOptions &options() const noexcept { return settings; }
    void setOptions(const EngineOptions &options);

    std::uint64_t parseCount() const noexcept { return parses; }

private:
    std::optional<Viewport> scanRange(const DocumentSnapshot &snapshot, const std::optional<Viewport> &viewport) const;
    const ParseResult &parse(const SnapshotPtr &snapshot, const std::optional<Viewport> &viewport);

    EngineOptions settings;
    BlockScanner blockScanner;
    InlineScanner inlineScanner;
    SnapshotCache snapshots;
    LineElementCache lineCache;
    std::vector<const Element *> resolved;
    std::uint64_t parses = 0;
};

} // namespace mdlive::preview
