#include "mdlive/preview/reference_table.hpp"

#include "mdlive/preview/line_prefix.hpp"

#include <cctype>

namespace mdlive::preview
{

std::string ReferenceTable::normalizeLabel(std::string_view label)
{
    std::string_view trimmed = trimView(label);
    std::string result;
    result.reserve(trimmed.size());
    bool pendingSpace = false;
    for (char ch : trimmed)
    {
        if (std::isspace(static_cast<unsigned char>(ch)))
        {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace)
        {
            result.push_back(' ');
            pendingSpace = false;
        }
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return result;
}

bool ReferenceTable::define(std::string_view label, std::string url, std::string title)
{
    std::string key = normalizeLabel(label);
    if (key.empty())
        return false;
    bool inserted = entries.try_emplace(std::move(key), ReferenceDefinition{std::move(url), std::move(title)}).second;
    if (inserted)
        rebuildSignature();
    return inserted;
}

std::optional<ReferenceDefinition> ReferenceTable::resolve(std::string_view label) const
{
    auto it = entries.find(normalizeLabel(label));
    if (it == entries.end())
        return std::nullopt;
    return it->second;
}

bool ReferenceTable::contains(std::string_view label) const
{
    return entries.find(normalizeLabel(label)) != entries.end();
}

void ReferenceTable::rebuildSignature()
{
    cachedSignature.clear();
    for (const auto &[label, definition] : entries)
    {
        if (!cachedSignature.empty())
            cachedSignature.push_back('\n');
        cachedSignature += label;
        cachedSignature.push_back(':');
        cachedSignature += definition.url;
        cachedSignature.push_back(':');
        cachedSignature += definition.title;
    }
}

} // namespace mdlive::preview
