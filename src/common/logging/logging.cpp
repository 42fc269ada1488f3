#include "mdlive/logging.hpp"

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace mdlive::logging
{

plog::Severity severityFromName(std::string_view name) noexcept
{
    if (name == "none")
        return plog::none;
    if (name == "fatal")
        return plog::fatal;
    if (name == "error")
        return plog::error;
    if (name == "info")
        return plog::info;
    if (name == "debug")
        return plog::debug;
    if (name == "verbose")
        return plog::verbose;
    return plog::warning;
}

void init(plog::Severity severity)
{
    static plog::ConsoleAppender<plog::TxtFormatter> appender(plog::streamStdErr);
    if (auto *logger = plog::get())
    {
        logger->setMaxSeverity(severity);
        return;
    }
    plog::init(severity, &appender);
}

void init(std::string_view severityName)
{
    init(severityFromName(severityName));
}

} // namespace mdlive::logging
