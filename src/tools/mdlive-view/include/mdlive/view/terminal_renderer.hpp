#pragma once

#include "mdlive/preview/decoration.hpp"
#include "mdlive/preview/document.hpp"

#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mdlive::view
{

enum class TextRole
{
    Plain,
    Heading,
    Strong,
    Emphasis,
    StrongEmphasis,
    Strikethrough,
    Highlight,
    Code,
    Math,
    Link,
    Image,
    Tag,
    Quote,
    ListMarker,
    Rule,
    Widget,
    Source
};

// Byte range of RenderedLine::text drawn with one role.
struct StyledRun
{
    std::size_t offset = 0;
    std::size_t length = 0;
    TextRole role = TextRole::Plain;
};

inline constexpr std::size_t kNoSource = std::numeric_limits<std::size_t>::max();

struct RenderedLine
{
    std::string text;
    std::vector<StyledRun> runs;
    int sourceLine = 0;
    // Document offset of every byte in text; kNoSource for widget output.
    std::vector<std::size_t> sourceOffsets;
    bool widget = false;

    std::size_t columnFor(std::size_t offset) const noexcept;
};

std::size_t displayWidth(std::string_view text) noexcept;
TextRole roleForClass(std::string_view styleClass) noexcept;
TextRole combineRoles(TextRole current, TextRole mark) noexcept;

// Lays out a document as terminal rows the way the decoration set asks for.
class TerminalRenderer
{
public:
    explicit TerminalRenderer(int width = 80) noexcept;

    int width() const noexcept { return columns; }
    void setWidth(int width) noexcept;

    std::vector<RenderedLine> render(const preview::DocumentSnapshot &snapshot,
                                     const preview::DecorationSet &decorations) const;

    // Inline replacement text of a widget.
    std::string inlineText(const preview::Widget &widget) const;
    // Rows of a block widget.
    std::vector<RenderedLine> blockLines(const preview::Widget &widget, int sourceLine) const;

private:
    RenderedLine renderLine(const preview::DocumentLine &line,
                            std::span<const preview::RenderInstruction> decorations) const;

    int columns;
};

} // namespace mdlive::view
