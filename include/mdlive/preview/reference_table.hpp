#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace mdlive::preview
{

struct ReferenceDefinition
{
    std::string url;
    std::string title;
};

// Link reference definitions of one snapshot, keyed by normalized label.
class ReferenceTable
{
public:
    // Trim, lowercase and collapse internal whitespace runs to one space.
    static std::string normalizeLabel(std::string_view label);

    // Returns false when the label is already defined; the first definition wins.
    bool define(std::string_view label, std::string url, std::string title = std::string());

    std::optional<ReferenceDefinition> resolve(std::string_view label) const;
    bool contains(std::string_view label) const;

    std::size_t size() const noexcept { return entries.size(); }
    bool empty() const noexcept { return entries.empty(); }

    // Sorted "label:url:title" entries joined by newlines. Changes exactly when
    // a resolvable reference would render differently.
    const std::string &signature() const noexcept { return cachedSignature; }

private:
    void rebuildSignature();

    std::map<std::string, ReferenceDefinition> entries;
    std::string cachedSignature;
};

} // namespace mdlive::preview
