#pragma once

#include "mdlive/preview/element.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace mdlive::preview
{

struct OutlineItem
{
    int level = 1;
    std::string text;
    int line = 0;
    std::size_t from = 0;
    std::size_t to = 0;
    std::vector<OutlineItem> children;
};

// Nests headings under the closest preceding heading of a lower level.
std::vector<OutlineItem> buildOutline(std::span<const Element> elements);

} // namespace mdlive::preview
