#pragma once

#include <plog/Severity.h>

#include <string_view>

namespace mdlive::logging
{

plog::Severity severityFromName(std::string_view name) noexcept;

// Sends log records at or above `severity` to stderr. Calling it again only
// changes the threshold.
void init(plog::Severity severity);
void init(std::string_view severityName);

} // namespace mdlive::logging
