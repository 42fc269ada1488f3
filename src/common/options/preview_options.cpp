#include "mdlive/preview_options.hpp"

namespace mdlive::config
{

void registerPreviewOptions(OptionRegistry &registry)
{
    OptionDefinition cacheSize;
    cacheSize.key = kLineCacheSize;
    cacheSize.kind = OptionKind::Integer;
    cacheSize.defaultValue = OptionValue(static_cast<std::int64_t>(preview::LineElementCache::kDefaultCapacity));
    cacheSize.displayName = "Line cache size";
    cacheSize.description = "Number of scanned lines kept for reuse between edits.";
    cacheSize.minimum = 1;
    registry.registerOption(cacheSize);

    registry.registerOption({kViewportOnly, OptionKind::Boolean, OptionValue(false), "Viewport-limited parsing",
                             "Scan inline syntax only around the visible lines of large documents.", {}, {}, {}});

    OptionDefinition buffer;
    buffer.key = kViewportBuffer;
    buffer.kind = OptionKind::Integer;
    buffer.defaultValue = OptionValue(100);
    buffer.displayName = "Viewport buffer";
    buffer.description = "Lines scanned above and below the visible range.";
    buffer.minimum = 0;
    registry.registerOption(buffer);

    OptionDefinition threshold;
    threshold.key = kLargeDocumentThreshold;
    threshold.kind = OptionKind::Integer;
    threshold.defaultValue = OptionValue(5000);
    threshold.displayName = "Large document threshold";
    threshold.description = "Line count above which viewport-limited parsing applies.";
    threshold.minimum = 1;
    registry.registerOption(threshold);

    OptionDefinition level;
    level.key = kLogLevel;
    level.kind = OptionKind::String;
    level.defaultValue = OptionValue("warning");
    level.displayName = "Log level";
    level.description = "Minimum severity written to the log.";
    level.choices = {"none", "fatal", "error", "warning", "info", "debug", "verbose"};
    registry.registerOption(level);
}

preview::EngineOptions engineOptions(const OptionRegistry &registry)
{
    preview::EngineOptions options;
    options.lineCacheSize = static_cast<std::size_t>(
        registry.getInteger(kLineCacheSize, static_cast<std::int64_t>(options.lineCacheSize)));
    options.viewportOnly = registry.getBool(kViewportOnly, options.viewportOnly);
    options.viewportBuffer = static_cast<int>(registry.getInteger(kViewportBuffer, options.viewportBuffer));
    options.largeDocumentThreshold =
        static_cast<int>(registry.getInteger(kLargeDocumentThreshold, options.largeDocumentThreshold));
    return options;
}

std::string logLevel(const OptionRegistry &registry)
{
    return registry.getString(kLogLevel, "warning");
}

} // namespace mdlive::config
