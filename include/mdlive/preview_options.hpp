#pragma once

#include "mdlive/options.hpp"
#include "mdlive/preview/live_preview_engine.hpp"

#include <string>

namespace mdlive::config
{

inline constexpr const char *kLineCacheSize = "preview.lineCacheSize";
inline constexpr const char *kViewportOnly = "preview.viewportOnly";
inline constexpr const char *kViewportBuffer = "preview.viewportBuffer";
inline constexpr const char *kLargeDocumentThreshold = "preview.largeDocumentThreshold";
inline constexpr const char *kLogLevel = "logging.level";

void registerPreviewOptions(OptionRegistry &registry);

preview::EngineOptions engineOptions(const OptionRegistry &registry);
std::string logLevel(const OptionRegistry &registry);

} // namespace mdlive::config
