#pragma once

#include "mdlive/preview/element.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace mdlive::preview
{

// Answers whether the raw markup of [from, to] should stay visible.
using RevealOracle = std::function<bool(std::size_t from, std::size_t to, std::optional<ElementKind> kind)>;

RevealOracle neverReveal();

struct SelectionRange
{
    std::size_t anchor = 0;
    std::size_t head = 0;

    std::size_t from() const noexcept { return anchor < head ? anchor : head; }
    std::size_t to() const noexcept { return anchor < head ? head : anchor; }
    bool empty() const noexcept { return anchor == head; }
};

// Carets and selections of one editor view.
class SelectionState
{
public:
    SelectionState() = default;
    explicit SelectionState(std::size_t caret);
    explicit SelectionState(std::vector<SelectionRange> ranges);

    const std::vector<SelectionRange> &ranges() const noexcept { return selection; }
    bool empty() const noexcept { return selection.empty(); }

    // A caret inside [from, to] (ends included) or a non-empty selection that
    // overlaps the span reveals it.
    bool shouldReveal(std::size_t from, std::size_t to) const noexcept;

    RevealOracle oracle() const;

private:
    std::vector<SelectionRange> selection;
};

} // namespace mdlive::preview
