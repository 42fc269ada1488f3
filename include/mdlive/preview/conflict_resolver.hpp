#pragma once

#include "mdlive/preview/element.hpp"

#include <span>
#include <vector>

namespace mdlive::preview
{

enum class ConflictOutcome
{
    KeepBoth,
    DropFirst,
    DropSecond
};

// Decides an overlapping pair. `first` sorts before `second`: it starts no
// later and, at the same start, is at least as long.
ConflictOutcome decideConflict(const Element &first, const Element &second) noexcept;

// Surviving elements, in (from asc, to desc, kind asc) order. The pointers
// refer into `elements`. Any two survivors are either disjoint or nested.
std::vector<const Element *> resolveConflicts(std::span<const Element> elements);

std::vector<Element> resolveConflictsCopy(std::span<const Element> elements);

} // namespace mdlive::preview
