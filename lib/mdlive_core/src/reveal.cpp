#include "mdlive/preview/reveal.hpp"

namespace mdlive::preview
{

RevealOracle neverReveal()
{
    return [](std::size_t, std::size_t, std::optional<ElementKind>) { return false; };
}

SelectionState::SelectionState(std::size_t caret)
    : selection{SelectionRange{caret, caret}}
{
}

SelectionState::SelectionState(std::vector<SelectionRange> ranges)
    : selection(std::move(ranges))
{
}

bool SelectionState::shouldReveal(std::size_t from, std::size_t to) const noexcept
{
    for (const SelectionRange &range : selection)
    {
        if (range.head >= from && range.head <= to)
            return true;
        if (!range.empty() && range.from() < to && range.to() > from)
            return true;
    }
    return false;
}

RevealOracle SelectionState::oracle() const
{
    return [state = *this](std::size_t from, std::size_t to, std::optional<ElementKind>) {
        return state.shouldReveal(from, to);
    };
}

} // namespace mdlive::preview
