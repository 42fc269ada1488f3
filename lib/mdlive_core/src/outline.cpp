#include "mdlive/preview/outline.hpp"

#include <algorithm>

namespace mdlive::preview
{

std::vector<OutlineItem> buildOutline(std::span<const Element> elements)
{
    std::vector<const Element *> headings;
    for (const Element &element : elements)
        if (element.kind == ElementKind::Heading && element.as<HeadingData>())
            headings.push_back(&element);
    std::stable_sort(headings.begin(), headings.end(),
                     [](const Element *a, const Element *b) { return a->from < b->from; });

    std::vector<OutlineItem> roots;
    std::vector<OutlineItem *> stack;
    for (const Element *heading : headings)
    {
        const HeadingData &data = *heading->as<HeadingData>();
        OutlineItem item;
        item.level = data.level;
        item.text = data.text;
        item.line = heading->lineNumber;
        item.from = heading->from;
        item.to = heading->to;

        while (!stack.empty() && stack.back()->level >= item.level)
            stack.pop_back();

        std::vector<OutlineItem> &siblings = stack.empty() ? roots : stack.back()->children;
        siblings.push_back(std::move(item));
        stack.push_back(&siblings.back());
    }
    return roots;
}

} // namespace mdlive::preview
