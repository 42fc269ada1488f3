#pragma once

#include "mdlive/preview/decoration.hpp"
#include "mdlive/preview/outline.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace mdlive::view
{

using json = nlohmann::json;

json widgetToJson(const preview::Widget &widget);
json instructionToJson(const preview::RenderInstruction &instruction);
json decorationsToJson(const preview::DecorationSet &decorations);
json outlineToJson(const std::vector<preview::OutlineItem> &outline);

} // namespace mdlive::view
