#include "mdlive/preview/conflict_resolver.hpp"

#include <algorithm>

namespace mdlive::preview
{
namespace
{
// Kinds whose content is never parsed further.
bool isLeafKind(ElementKind kind) noexcept
{
    return kind == ElementKind::CodeBlock || kind == ElementKind::MathBlock || kind == ElementKind::InlineCode ||
           kind == ElementKind::InlineMath;
}

// Emphasis renders by hiding its markers, so nested spans stay visible.
bool isEmphasis(const Element &element) noexcept
{
    if (element.kind == ElementKind::Bold || element.kind == ElementKind::Italic)
        return true;
    return element.kind == ElementKind::InlineOther && element.as<FormattedData>() != nullptr;
}

bool replacesWholeSpan(const Element &element) noexcept
{
    return isInlineContainerKind(element.kind) && !isEmphasis(element);
}

ConflictOutcome dropInner(bool firstIsOuter) noexcept
{
    return firstIsOuter ? ConflictOutcome::DropSecond : ConflictOutcome::DropFirst;
}

} // namespace

ConflictOutcome decideConflict(const Element &first, const Element &second) noexcept
{
    bool firstContains = first.contains(second);
    bool secondContains = second.contains(first);

    if (!firstContains && !secondContains)
    {
        // Partial overlap: the higher ranked kind survives, the earlier one on a tie.
        return comparePriority(second.kind, first.kind) < 0 ? ConflictOutcome::DropFirst
                                                            : ConflictOutcome::DropSecond;
    }

    // Identical spans count the earlier-sorted element as the outer one.
    bool firstIsOuter = firstContains;
    const Element &outer = firstIsOuter ? first : second;
    const Element &inner = firstIsOuter ? second : first;

    if (isLeafKind(outer.kind))
        return dropInner(firstIsOuter);
    if (isMultiLineBlockKind(outer.kind) && isMultiLineBlockKind(inner.kind))
        return dropInner(firstIsOuter);
    if (replacesWholeSpan(outer) && (isInlineContainerKind(inner.kind) || inner.kind == ElementKind::Tag))
        return dropInner(firstIsOuter);
    return ConflictOutcome::KeepBoth;
}

std::vector<const Element *> resolveConflicts(std::span<const Element> elements)
{
    std::vector<const Element *> sorted;
    sorted.reserve(elements.size());
    for (const Element &element : elements)
        sorted.push_back(&element);

    std::stable_sort(sorted.begin(), sorted.end(), [](const Element *a, const Element *b) {
        if (a->from != b->from)
            return a->from < b->from;
        if (a->to != b->to)
            return a->to > b->to;
        return priorityRank(a->kind) < priorityRank(b->kind);
    });

    std::vector<bool> dropped(sorted.size(), false);
    std::vector<std::size_t> losers;
    for (std::size_t i = 0; i < sorted.size(); ++i)
    {
        if (dropped[i])
            continue;
        const Element &current = *sorted[i];
        // Drops by `current` only take effect once it has survived all of its own conflicts.
        losers.clear();
        for (std::size_t j = i + 1; j < sorted.size(); ++j)
        {
            const Element &other = *sorted[j];
            if (other.from > current.to)
                break;
            if (dropped[j] || !current.overlaps(other))
                continue;

            ConflictOutcome outcome = decideConflict(current, other);
            if (outcome == ConflictOutcome::DropSecond)
                losers.push_back(j);
            else if (outcome == ConflictOutcome::DropFirst)
            {
                dropped[i] = true;
                break;
            }
        }
        if (!dropped[i])
            for (std::size_t j : losers)
                dropped[j] = true;
    }

    std::vector<const Element *> survivors;
    survivors.reserve(sorted.size());
    for (std::size_t i = 0; i < sorted.size(); ++i)
        if (!dropped[i])
            survivors.push_back(sorted[i]);
    return survivors;
}

std::vector<Element> resolveConflictsCopy(std::span<const Element> elements)
{
    std::vector<Element> result;
    for (const Element *element : resolveConflicts(elements))
        result.push_back(*element);
    return result;
}

} // namespace mdlive::preview
