#pragma once

#include "mdlive/preview/element.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mdlive::preview
{

struct ListMarker
{
    ListType type = ListType::Bullet;
    std::string marker;
    bool checked = false;
    std::size_t indent = 0;
    // Offsets relative to the start of the line.
    std::size_t from = 0;
    std::size_t to = 0;
};

struct LinePrefix
{
    int quoteDepth = 0;
    std::size_t quoteFrom = 0;
    std::size_t quoteTo = 0;
    std::optional<ListMarker> list;
    std::size_t contentOffset = 0;
};

// Splits nested '>' quotation markers and a bullet, numbered or task list
// marker off the front of a line.
LinePrefix stripLinePrefix(std::string_view line, bool includeList = true);

// Text left after the prefix, with surrounding whitespace removed.
std::string_view prefixedContent(std::string_view line, bool includeList = true);

std::string_view trimView(std::string_view text) noexcept;
std::string trimCopy(std::string_view text);
std::string toLower(std::string_view text);
bool isBlank(std::string_view text) noexcept;

} // namespace mdlive::preview
