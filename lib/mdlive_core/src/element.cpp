#include "mdlive/preview/element.hpp"

#include <type_traits>

namespace mdlive::preview
{
namespace
{
std::size_t shift(std::size_t value, std::ptrdiff_t delta) noexcept
{
    return static_cast<std::size_t>(static_cast<std::ptrdiff_t>(value) + delta);
}

void shiftSpan(SpanRange &span, std::ptrdiff_t delta) noexcept
{
    span.syntaxFrom = shift(span.syntaxFrom, delta);
    span.syntaxTo = shift(span.syntaxTo, delta);
    span.contentFrom = shift(span.contentFrom, delta);
    span.contentTo = shift(span.contentTo, delta);
}

} // namespace

int comparePriority(ElementKind a, ElementKind b) noexcept
{
    return priorityRank(a) - priorityRank(b);
}

std::string_view kindName(ElementKind kind) noexcept
{
    switch (kind)
    {
    case ElementKind::CodeBlock:
        return "code-block";
    case ElementKind::MathBlock:
        return "math-block";
    case ElementKind::Table:
        return "table";
    case ElementKind::Callout:
        return "callout";
    case ElementKind::Details:
        return "details";
    case ElementKind::Heading:
        return "heading";
    case ElementKind::Blockquote:
        return "blockquote";
    case ElementKind::ListItem:
        return "list-item";
    case ElementKind::InlineMath:
        return "inline-math";
    case ElementKind::HorizontalRule:
        return "horizontal-rule";
    case ElementKind::Bold:
        return "bold";
    case ElementKind::Italic:
        return "italic";
    case ElementKind::InlineCode:
        return "inline-code";
    case ElementKind::Link:
        return "link";
    case ElementKind::Image:
        return "image";
    case ElementKind::InlineOther:
        return "inline-other";
    case ElementKind::Tag:
        return "tag";
    case ElementKind::FootnoteDefinition:
        return "footnote-definition";
    case ElementKind::LinkReference:
        return "link-reference";
    }
    return "unknown";
}

bool isMultiLineBlockKind(ElementKind kind) noexcept
{
    switch (kind)
    {
    case ElementKind::CodeBlock:
    case ElementKind::MathBlock:
    case ElementKind::Table:
    case ElementKind::Callout:
    case ElementKind::Details:
    case ElementKind::FootnoteDefinition:
        return true;
    default:
        return false;
    }
}

bool isLineLevelKind(ElementKind kind) noexcept
{
    return kind == ElementKind::Heading || kind == ElementKind::Blockquote || kind == ElementKind::ListItem;
}

bool isInlineContainerKind(ElementKind kind) noexcept
{
    switch (kind)
    {
    case ElementKind::InlineMath:
    case ElementKind::Bold:
    case ElementKind::Italic:
    case ElementKind::InlineCode:
    case ElementKind::Link:
    case ElementKind::Image:
    case ElementKind::InlineOther:
        return true;
    default:
        return false;
    }
}

bool Element::overlaps(const Element &other) const noexcept
{
    if (from == to)
        return other.from <= from && from < other.to;
    if (other.from == other.to)
        return from <= other.from && other.from < to;
    return from < other.to && other.from < to;
}

const SpanRange *Element::span() const noexcept
{
    return std::visit(
        [](const auto &data) -> const SpanRange * {
            if constexpr (requires { data.span; })
                return &data.span;
            else
                return nullptr;
        },
        payload);
}

Element shifted(const Element &element, std::ptrdiff_t delta)
{
    Element result = element;
    result.from = shift(result.from, delta);
    result.to = shift(result.to, delta);
    std::visit(
        [delta](auto &data) {
            using T = std::decay_t<decltype(data)>;
            if constexpr (requires { data.span; })
                shiftSpan(data.span, delta);
            if constexpr (std::is_same_v<T, HeadingData> || std::is_same_v<T, BlockquoteData> ||
                          std::is_same_v<T, ListItemData>)
            {
                data.markerFrom = shift(data.markerFrom, delta);
                data.markerTo = shift(data.markerTo, delta);
            }
        },
        result.payload);
    return result;
}

} // namespace mdlive::preview
