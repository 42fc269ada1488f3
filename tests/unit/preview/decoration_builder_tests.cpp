#include <gtest/gtest.h>

#include "mdlive/preview/decoration.hpp"

#include <string>
#include <vector>

using namespace mdlive::preview;

namespace
{

Element headingElement(int level, std::size_t to, std::string text)
{
    Element element;
    element.kind = ElementKind::Heading;
    element.from = 0;
    element.to = to;
    element.lineNumber = 1;
    element.content = text;
    element.payload = HeadingData{level, 0, static_cast<std::size_t>(level) + 1, std::move(text)};
    return element;
}

Element formatted(TextStyle style, SpanRange span)
{
    Element element;
    element.kind = style == TextStyle::Italic ? ElementKind::Italic : ElementKind::Bold;
    element.from = span.syntaxFrom;
    element.to = span.syntaxTo;
    element.lineNumber = 1;
    element.payload = FormattedData{span, style};
    return element;
}

Element codeBlock(std::size_t from, std::size_t to, int startLine, int endLine)
{
    Element element;
    element.kind = ElementKind::CodeBlock;
    element.from = from;
    element.to = to;
    element.lineNumber = startLine;
    element.startLine = startLine;
    element.endLine = endLine;
    element.content = "x";
    element.payload = CodeBlockData{"cpp", "x", "```"};
    return element;
}

// "kind@from-to" with the class or widget, one per instruction.
std::vector<std::string> describe(const DecorationSet &set)
{
    std::vector<std::string> out;
    for (const RenderInstruction &item : set)
    {
        std::string text = std::string(instructionName(item)) + "@" + std::to_string(item.from) + "-" +
                           std::to_string(item.to);
        if (const auto *line = item.as<LineAttribute>())
            text += " " + line->styleClass;
        else if (const auto *mark = item.as<SpanMark>())
            text += " " + mark->styleClass;
        else if (const auto *replace = item.as<SpanReplace>())
            text += " " + std::string(widgetName(replace->widget));
        else if (const auto *anchor = item.as<WidgetAnchor>())
            text += " " + std::string(widgetName(anchor->widget));
        out.push_back(std::move(text));
    }
    return out;
}

} // namespace

TEST(SelectionState, CaretRevealsInclusiveSpan)
{
    SelectionState state(5);
    EXPECT_TRUE(state.shouldReveal(5, 9));
    EXPECT_TRUE(state.shouldReveal(0, 5));
    EXPECT_FALSE(state.shouldReveal(6, 9));
}

TEST(SelectionState, SelectionOverlapReveals)
{
    SelectionState state(std::vector<SelectionRange>{SelectionRange{10, 2}});
    EXPECT_TRUE(state.shouldReveal(0, 4));
    EXPECT_TRUE(state.shouldReveal(8, 20));
    EXPECT_FALSE(state.shouldReveal(11, 20));
    EXPECT_FALSE(SelectionState().shouldReveal(0, 100));
    EXPECT_FALSE(neverReveal()(0, 100, ElementKind::Bold));
}

TEST(DecorationBuilder, HeadingStylesLineAndHidesMarker)
{
    auto snapshot = DocumentSnapshot::create("## Title");
    std::vector<Element> elements{headingElement(2, 8, "Title")};

    DecorationBuilder hidden(*snapshot, neverReveal());
    EXPECT_EQ(describe(hidden.build(elements)),
              (std::vector<std::string>{"line-attribute@0-0 cm-heading cm-heading-2", "span-replace@0-3 hidden-marker"}));

    // Only a caret on the marker itself shows the hashes again.
    DecorationBuilder inText(*snapshot, SelectionState(6).oracle());
    EXPECT_EQ(inText.build(elements).size(), 2u);

    DecorationBuilder onMarker(*snapshot, SelectionState(1).oracle());
    EXPECT_EQ(describe(onMarker.build(elements)),
              (std::vector<std::string>{"line-attribute@0-0 cm-heading cm-heading-2"}));
}

TEST(DecorationBuilder, EmptyHeadingKeepsMarkerVisible)
{
    auto snapshot = DocumentSnapshot::create("#");
    std::vector<Element> elements{headingElement(1, 1, "")};
    DecorationBuilder builder(*snapshot, neverReveal());
    EXPECT_EQ(builder.build(elements).size(), 1u);
}

TEST(DecorationBuilder, EmphasisHidesMarkersAroundStyledContent)
{
    auto snapshot = DocumentSnapshot::create("**bold**");
    std::vector<Element> elements{formatted(TextStyle::Bold, SpanRange{0, 8, 2, 6})};

    DecorationBuilder builder(*snapshot, neverReveal());
    EXPECT_EQ(describe(builder.build(elements)),
              (std::vector<std::string>{"span-replace@0-2 hidden-marker", "span-mark@2-6 cm-strong",
                                        "span-replace@6-8 hidden-marker"}));

    DecorationBuilder editing(*snapshot, SelectionState(8).oracle());
    EXPECT_TRUE(editing.build(elements).empty());
}

TEST(DecorationBuilder, TagMarkStaysWhileEditing)
{
    auto snapshot = DocumentSnapshot::create("#todo");
    Element tag;
    tag.kind = ElementKind::Tag;
    tag.from = 0;
    tag.to = 5;
    tag.payload = TagData{SpanRange{0, 5, 1, 5}, "todo"};

    DecorationBuilder builder(*snapshot, SelectionState(2).oracle());
    DecorationSet set = builder.build(std::vector<Element>{tag});
    ASSERT_EQ(set.size(), 1u);
    const auto *mark = set.front().as<SpanMark>();
    ASSERT_NE(mark, nullptr);
    EXPECT_EQ(mark->styleClass, "cm-hashtag");
    EXPECT_EQ(mark->attributes.at("data-tag"), "todo");
}

TEST(DecorationBuilder, ListItemBulletAndIndent)
{
    auto snapshot = DocumentSnapshot::create("  - item");
    Element item;
    item.kind = ElementKind::ListItem;
    item.from = 0;
    item.to = 8;
    item.content = "item";
    item.payload = ListItemData{ListType::Bullet, "-", false, 2, 2, 4};

    DecorationBuilder builder(*snapshot, neverReveal());
    DecorationSet set = builder.build(std::vector<Element>{item});
    ASSERT_EQ(set.size(), 2u);
    const auto *line = set[0].as<LineAttribute>();
    ASSERT_NE(line, nullptr);
    EXPECT_EQ(line->styleClass, "cm-list-item cm-list-bullet");
    EXPECT_EQ(line->attributes.at("data-indent"), "2");

    const auto *bullet = set[1].as<SpanReplace>();
    ASSERT_NE(bullet, nullptr);
    EXPECT_EQ(set[1].from, 2u);
    EXPECT_EQ(set[1].to, 4u);
    EXPECT_NE(std::get_if<ListBulletWidget>(&bullet->widget), nullptr);
}

TEST(DecorationBuilder, MultiLineBlockAnchorsWidgetAndHidesLines)
{
    auto snapshot = DocumentSnapshot::create("```cpp\nx\n```\nafter");
    std::vector<Element> elements{codeBlock(0, 12, 1, 3)};

    DecorationBuilder builder(*snapshot, neverReveal());
    DecorationSet set = builder.build(elements);
    EXPECT_EQ(describe(set),
              (std::vector<std::string>{"widget-anchor@0-0 code-block", "line-attribute@0-0 cm-hidden-line",
                                        "line-attribute@7-7 cm-hidden-line", "line-attribute@9-9 cm-hidden-line"}));
    const auto *anchor = set.front().as<WidgetAnchor>();
    ASSERT_NE(anchor, nullptr);
    EXPECT_EQ(anchor->blockTo, 12u);
    const auto *widget = std::get_if<CodeBlockWidget>(&anchor->widget);
    ASSERT_NE(widget, nullptr);
    EXPECT_EQ(widget->language, "cpp");
}

TEST(DecorationBuilder, RevealedBlockShowsSourceLines)
{
    auto snapshot = DocumentSnapshot::create("```cpp\nx\n```\nafter");
    std::vector<Element> elements{codeBlock(0, 12, 1, 3)};

    DecorationBuilder builder(*snapshot, SelectionState(7).oracle());
    EXPECT_EQ(describe(builder.build(elements)),
              (std::vector<std::string>{"line-attribute@0-0 cm-code-block-source",
                                        "line-attribute@7-7 cm-code-block-source",
                                        "line-attribute@9-9 cm-code-block-source"}));
}

TEST(DecorationBuilder, SingleLineBlockReplacesItsSpan)
{
    auto snapshot = DocumentSnapshot::create("$$ a+b $$");
    Element math;
    math.kind = ElementKind::MathBlock;
    math.from = 0;
    math.to = 9;
    math.startLine = 1;
    math.endLine = 1;
    math.payload = MathBlockData{"a+b", MathDelimiter::InlineDoubleDollar, ""};

    DecorationBuilder builder(*snapshot, neverReveal());
    EXPECT_EQ(describe(builder.build(std::vector<Element>{math})),
              (std::vector<std::string>{"span-replace@0-9 math-block"}));
}

TEST(DecorationBuilder, SkipsInvertedAndClampsOverlongRanges)
{
    auto snapshot = DocumentSnapshot::create("**bold**");
    Element inverted = formatted(TextStyle::Bold, SpanRange{6, 2, 4, 4});
    inverted.from = 6;
    inverted.to = 2;

    Element overlong;
    overlong.kind = ElementKind::InlineCode;
    overlong.from = 4;
    overlong.to = 40;
    overlong.content = "ld**";
    overlong.payload = CodeSpanData{SpanRange{4, 40, 5, 39}};

    DecorationBuilder builder(*snapshot, neverReveal());
    DecorationSet set = builder.build(std::vector<Element>{inverted, overlong});
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set.front().from, 4u);
    EXPECT_EQ(set.front().to, 8u);
}

TEST(DecorationBuilder, OutputIsSortedByPosition)
{
    auto snapshot = DocumentSnapshot::create("*a* and **b**");
    std::vector<Element> elements{formatted(TextStyle::Bold, SpanRange{8, 13, 10, 11}),
                                  formatted(TextStyle::Italic, SpanRange{0, 3, 1, 2})};

    DecorationBuilder builder(*snapshot, neverReveal());
    DecorationSet set = builder.build(elements);
    ASSERT_EQ(set.size(), 6u);
    for (std::size_t i = 1; i < set.size(); ++i)
    {
        EXPECT_LE(set[i - 1].from, set[i].from);
    }
    EXPECT_EQ(set[1].as<SpanMark>()->styleClass, "cm-em");
    EXPECT_EQ(set[4].as<SpanMark>()->styleClass, "cm-strong");
}
