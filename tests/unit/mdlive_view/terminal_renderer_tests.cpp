#include <gtest/gtest.h>

#include "mdlive/preview/live_preview_engine.hpp"
#include "mdlive/view/terminal_renderer.hpp"

#include <string>
#include <vector>

using namespace mdlive::preview;
using namespace mdlive::view;

namespace
{

std::vector<RenderedLine> renderText(const std::string &text, const RevealOracle &oracle = neverReveal(),
                                     int width = 80)
{
    auto snapshot = DocumentSnapshot::create(text);
    LivePreviewEngine engine;
    DecorationSet decorations = engine.decorations(snapshot, oracle);
    TerminalRenderer renderer(width);
    return renderer.render(*snapshot, decorations);
}

std::vector<std::string> textsOf(const std::vector<RenderedLine> &rows)
{
    std::vector<std::string> texts;
    for (const RenderedLine &row : rows)
        texts.push_back(row.text);
    return texts;
}

} // namespace

TEST(TerminalRenderer, HidesEmphasisMarkers)
{
    auto rows = renderText("**bold** text");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].text, "bold text");
    ASSERT_EQ(rows[0].runs.size(), 2u);
    EXPECT_EQ(rows[0].runs[0].role, TextRole::Strong);
    EXPECT_EQ(rows[0].runs[0].length, 4u);
    EXPECT_EQ(rows[0].runs[1].role, TextRole::Plain);
    EXPECT_FALSE(rows[0].widget);
}

TEST(TerminalRenderer, CaretShowsSourceMarkup)
{
    auto rows = renderText("**bold** text", SelectionState(3).oracle());
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].text, "**bold** text");
}

TEST(TerminalRenderer, HeadingLineUsesHeadingRole)
{
    auto rows = renderText("# Title\nbody");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].text, "Title");
    ASSERT_EQ(rows[0].runs.size(), 1u);
    EXPECT_EQ(rows[0].runs[0].role, TextRole::Heading);
    EXPECT_EQ(rows[1].sourceLine, 2);
}

TEST(TerminalRenderer, ListBulletReplacesMarker)
{
    auto rows = renderText("- item");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].text, "\xE2\x80\xA2 item");
    EXPECT_EQ(rows[0].runs[0].role, TextRole::ListMarker);
    EXPECT_EQ(rows[0].columnFor(2), 2u);
    EXPECT_EQ(rows[0].columnFor(6), 6u);
}

TEST(TerminalRenderer, FencedCodeBecomesBlockRows)
{
    auto rows = renderText("```js\nlet x=1;\n```\nafter");
    EXPECT_EQ(textsOf(rows), (std::vector<std::string>{"[js]", "\xE2\x94\x82 let x=1;", "after"}));
    EXPECT_TRUE(rows[0].widget);
    EXPECT_TRUE(rows[1].widget);
    EXPECT_EQ(rows[1].sourceLine, 1);
    EXPECT_EQ(rows[1].runs.back().role, TextRole::Code);
    EXPECT_FALSE(rows[2].widget);
    EXPECT_EQ(rows[2].sourceLine, 4);
}

TEST(TerminalRenderer, RevealedCodeBlockShowsSourceLines)
{
    auto rows = renderText("```js\nlet x=1;\n```\nafter", SelectionState(8).oracle());
    EXPECT_EQ(textsOf(rows), (std::vector<std::string>{"```js", "let x=1;", "```", "after"}));
    EXPECT_EQ(rows[1].runs.front().role, TextRole::Source);
}

TEST(TerminalRenderer, TableIsLaidOutInColumns)
{
    auto rows = renderText("| A | Bee |\n|---|---|\n| 1 | 2 |");
    EXPECT_EQ(textsOf(rows), (std::vector<std::string>{"A \xE2\x94\x82 Bee",
                                                       "\xE2\x94\x80\xE2\x94\x80\xE2\x94\xBC\xE2\x94\x80\xE2\x94\x80"
                                                       "\xE2\x94\x80\xE2\x94\x80",
                                                       "1 \xE2\x94\x82 2  "}));
    EXPECT_EQ(rows[0].runs.front().role, TextRole::Strong);
}

TEST(TerminalRenderer, HorizontalRuleFillsWidth)
{
    auto rows = renderText("---", neverReveal(), 10);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(displayWidth(rows[0].text), 10u);
    EXPECT_EQ(rows[0].runs.front().role, TextRole::Rule);
}

TEST(TerminalRenderer, CollapsedCalloutShowsOnlyHeader)
{
    auto rows = renderText("> [!warning]- Careful\n> hidden body\nnext");
    EXPECT_EQ(textsOf(rows), (std::vector<std::string>{"\xE2\x96\x8C Warning: Careful [+]", "next"}));
}

TEST(TerminalRenderer, InlineWidgetTexts)
{
    TerminalRenderer renderer;
    EXPECT_EQ(renderer.inlineText(ImageWidget{"logo", "img.png", "", std::nullopt}), "[image: logo]");
    EXPECT_EQ(renderer.inlineText(ScriptWidget{"2", true}), "^2");
    EXPECT_EQ(renderer.inlineText(ScriptWidget{"i", false}), "_i");
    EXPECT_EQ(renderer.inlineText(KbdWidget{"Ctrl"}), "[Ctrl]");
    EXPECT_EQ(renderer.inlineText(ListBulletWidget{ListType::Task, "-", true}), "[x] ");
    EXPECT_EQ(renderer.inlineText(ListBulletWidget{ListType::Numbered, "3.", false}), "3. ");
    EXPECT_EQ(renderer.inlineText(LinkWidget{"", "http://a", "", LinkForm::BareUrl, ""}), "http://a");
    EXPECT_TRUE(renderer.inlineText(HiddenMarker{}).empty());
}

TEST(TerminalRenderer, RoleHelpers)
{
    EXPECT_EQ(displayWidth("a\xE2\x80\xA2" "b"), 3u);
    EXPECT_EQ(roleForClass("cm-strong cm-em"), TextRole::StrongEmphasis);
    EXPECT_EQ(roleForClass("cm-hashtag"), TextRole::Tag);
    EXPECT_EQ(roleForClass("cm-unknown"), TextRole::Plain);
    EXPECT_EQ(combineRoles(TextRole::Strong, TextRole::Emphasis), TextRole::StrongEmphasis);
    EXPECT_EQ(combineRoles(TextRole::Heading, TextRole::Plain), TextRole::Heading);
}
