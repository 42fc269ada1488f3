#include <gtest/gtest.h>

#include "mdlive/preview/document.hpp"
#include "mdlive/preview/inline_scanner.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace mdlive::preview;

namespace
{

std::vector<Element> scanText(std::string_view text, const ReferenceTable &references = ReferenceTable())
{
    InlineScanner scanner;
    return scanner.scanInline(text, 0, 1, references);
}

std::vector<Element> ofKind(const std::vector<Element> &elements, ElementKind kind)
{
    std::vector<Element> result;
    for (const Element &element : elements)
        if (element.kind == kind)
            result.push_back(element);
    return result;
}

std::vector<Element> scanWholeLine(std::string text)
{
    auto snapshot = DocumentSnapshot::create(std::move(text));
    InlineScanner scanner;
    return scanner.scanLine(snapshot->line(1), ReferenceTable());
}

} // namespace

TEST(InlineScanner, InlineCodeSpansBackticks)
{
    auto elements = scanText("`code`");
    ASSERT_EQ(elements.size(), 1u);
    EXPECT_EQ(elements.front().kind, ElementKind::InlineCode);
    EXPECT_EQ(elements.front().from, 0u);
    EXPECT_EQ(elements.front().to, 6u);
    EXPECT_EQ(elements.front().content, "code");
}

TEST(InlineScanner, DoubleBacktickCodeTrimsPadding)
{
    auto code = ofKind(scanText("`` a`b ``"), ElementKind::InlineCode);
    ASSERT_EQ(code.size(), 1u);
    EXPECT_EQ(code.front().content, "a`b");
}

TEST(InlineScanner, EscapedAsterisksAreNotItalic)
{
    auto elements = scanText(R"(\*not italic\*)");
    EXPECT_TRUE(ofKind(elements, ElementKind::Italic).empty());
    EXPECT_TRUE(elements.empty());
}

TEST(InlineScanner, EscapedClosingMarkerEndsNothing)
{
    for (const char *text : {R"(*a\*)", R"(**a\**)", R"(~~a\~~)", R"(==a\==)", R"($a\$)", R"(^a\^)"})
        EXPECT_TRUE(scanText(text).empty()) << text;
}

TEST(InlineScanner, OverlongLineIsNotScanned)
{
    std::string text = "**" + std::string(200000, 'a') + "** [x](http://" + std::string(100000, 'b') + ")";
    EXPECT_TRUE(scanText(text).empty());
    EXPECT_TRUE(scanWholeLine("# " + text).empty());
}

TEST(InlineScanner, BoldKeepsNestedItalic)
{
    auto elements = scanText("**bold *and* nested**");
    auto bold = ofKind(elements, ElementKind::Bold);
    auto italic = ofKind(elements, ElementKind::Italic);
    ASSERT_EQ(bold.size(), 1u);
    ASSERT_EQ(italic.size(), 1u);
    EXPECT_EQ(bold.front().from, 0u);
    EXPECT_EQ(bold.front().to, 21u);
    EXPECT_EQ(italic.front().from, 7u);
    EXPECT_EQ(italic.front().to, 12u);
    EXPECT_EQ(italic.front().content, "and");
    EXPECT_TRUE(bold.front().contains(italic.front()));

    const auto *data = bold.front().as<FormattedData>();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->span.contentFrom, 2u);
    EXPECT_EQ(data->span.contentTo, 19u);
}

TEST(InlineScanner, SnakeCaseIsNotEmphasis)
{
    EXPECT_TRUE(ofKind(scanText("some_snake_case"), ElementKind::Italic).empty());
    EXPECT_EQ(ofKind(scanText("an _emphasised_ word"), ElementKind::Italic).size(), 1u);
}

TEST(InlineScanner, InlineMathNeedsTightDelimiters)
{
    EXPECT_TRUE(ofKind(scanText("costs $5 and $10"), ElementKind::InlineMath).empty());

    auto math = ofKind(scanText("area $x^2$ here"), ElementKind::InlineMath);
    ASSERT_EQ(math.size(), 1u);
    ASSERT_NE(math.front().as<MathInlineData>(), nullptr);
    EXPECT_EQ(math.front().as<MathInlineData>()->latex, "x^2");
}

TEST(InlineScanner, InlineLinkWithTitle)
{
    auto links = ofKind(scanText(R"([site](http://a.com "Home"))"), ElementKind::Link);
    ASSERT_EQ(links.size(), 1u);
    const auto *data = links.front().as<LinkData>();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->form, LinkForm::Inline);
    EXPECT_EQ(data->url, "http://a.com");
    EXPECT_EQ(data->title, "Home");
    EXPECT_EQ(links.front().content, "site");
}

TEST(InlineScanner, ImageWithWidthHint)
{
    auto elements = scanText("![logo|120](img.png)");
    auto images = ofKind(elements, ElementKind::Image);
    ASSERT_EQ(images.size(), 1u);
    const auto *data = images.front().as<ImageData>();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->alt, "logo");
    EXPECT_EQ(data->url, "img.png");
    ASSERT_TRUE(data->width.has_value());
    EXPECT_EQ(*data->width, 120);
    EXPECT_TRUE(ofKind(elements, ElementKind::Link).empty());
}

TEST(InlineScanner, WikiLinkWithHeadingAndAlias)
{
    auto links = ofKind(scanText("[[Page#Section|Alias]]"), ElementKind::Link);
    ASSERT_EQ(links.size(), 1u);
    const auto *data = links.front().as<LinkData>();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->form, LinkForm::Wiki);
    EXPECT_EQ(data->url, "Page");
    EXPECT_EQ(data->heading, "Section");
    EXPECT_EQ(links.front().content, "Alias");
}

TEST(InlineScanner, ReferenceLinkResolvesThroughTable)
{
    ReferenceTable references;
    references.define("1", "http://example.com", "Title");

    auto links = ofKind(scanText("[foo][1]", references), ElementKind::Link);
    ASSERT_EQ(links.size(), 1u);
    const auto *data = links.front().as<LinkData>();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->form, LinkForm::Reference);
    EXPECT_EQ(data->url, "http://example.com");
    EXPECT_EQ(data->title, "Title");
    EXPECT_EQ(links.front().content, "foo");
}

TEST(InlineScanner, UnresolvedReferenceProducesNothing)
{
    ReferenceTable references;
    references.define("known", "http://example.com");
    EXPECT_TRUE(scanText("[foo][missing] and [bar]", references).empty());
}

TEST(InlineScanner, SmallWidgets)
{
    auto elements = scanText("H~2~O and x^2^ press <kbd>Ctrl</kbd> see[^1]");
    std::vector<InlineWidget> kinds;
    std::vector<std::string> texts;
    for (const Element &element : elements)
    {
        if (const auto *data = element.as<InlineWidgetData>())
        {
            kinds.push_back(data->widget);
            texts.push_back(data->text);
        }
    }
    EXPECT_EQ(kinds, (std::vector<InlineWidget>{InlineWidget::Subscript, InlineWidget::Superscript,
                                                InlineWidget::Kbd, InlineWidget::FootnoteRef}));
    EXPECT_EQ(texts, (std::vector<std::string>{"2", "2", "Ctrl", "1"}));
}

TEST(InlineScanner, HashtagsNeedWordStart)
{
    auto tags = ofKind(scanText("#todo and issue#12 and #123 and (#inline)"), ElementKind::Tag);
    ASSERT_EQ(tags.size(), 2u);
    EXPECT_EQ(tags[0].content, "todo");
    EXPECT_EQ(tags[1].content, "inline");
}

TEST(InlineScanner, BareUrlDropsTrailingPunctuation)
{
    auto links = ofKind(scanText("see www.example.com."), ElementKind::Link);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links.front().content, "www.example.com");
    ASSERT_NE(links.front().as<LinkData>(), nullptr);
    EXPECT_EQ(links.front().as<LinkData>()->form, LinkForm::BareUrl);
    EXPECT_EQ(links.front().as<LinkData>()->url, "https://www.example.com");
}

TEST(InlineScanner, AutolinkIsNotAlsoBareUrl)
{
    auto links = ofKind(scanText("<https://x.org>"), ElementKind::Link);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links.front().as<LinkData>()->form, LinkForm::Autolink);
    EXPECT_EQ(links.front().as<LinkData>()->url, "https://x.org");
}

TEST(InlineScanner, StrikethroughAndHighlight)
{
    std::vector<TextStyle> styles;
    for (const Element &element : scanText("~~gone~~ and ==hot=="))
        if (const auto *data = element.as<FormattedData>())
            styles.push_back(data->style);
    EXPECT_EQ(styles, (std::vector<TextStyle>{TextStyle::Strikethrough, TextStyle::Highlight}));
}

TEST(InlineScanner, ElementsCarryLineOffset)
{
    InlineScanner scanner;
    auto elements = scanner.scanInline("`x`", 100, 7, ReferenceTable());
    ASSERT_EQ(elements.size(), 1u);
    EXPECT_EQ(elements.front().from, 100u);
    EXPECT_EQ(elements.front().to, 103u);
    EXPECT_EQ(elements.front().lineNumber, 7);
}

TEST(InlineScanner, HeadingStripsClosingSequence)
{
    auto elements = scanWholeLine("## Title #");
    auto headings = ofKind(elements, ElementKind::Heading);
    ASSERT_EQ(headings.size(), 1u);
    const auto *data = headings.front().as<HeadingData>();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->level, 2);
    EXPECT_EQ(data->text, "Title");
    EXPECT_EQ(data->markerFrom, 0u);
    EXPECT_EQ(data->markerTo, 3u);
    EXPECT_EQ(headings.front().to, 10u);
}

TEST(InlineScanner, TaskListItem)
{
    auto items = ofKind(scanWholeLine("- [x] done"), ElementKind::ListItem);
    ASSERT_EQ(items.size(), 1u);
    const auto *data = items.front().as<ListItemData>();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->type, ListType::Task);
    EXPECT_TRUE(data->checked);
    EXPECT_EQ(data->markerFrom, 0u);
    EXPECT_EQ(data->markerTo, 6u);
    EXPECT_EQ(items.front().content, "done");
}

TEST(InlineScanner, NestedQuotationDepth)
{
    auto quotes = ofKind(scanWholeLine("> > deep"), ElementKind::Blockquote);
    ASSERT_EQ(quotes.size(), 1u);
    ASSERT_NE(quotes.front().as<BlockquoteData>(), nullptr);
    EXPECT_EQ(quotes.front().as<BlockquoteData>()->depth, 2);
}

TEST(InlineScanner, HorizontalRuleStopsFurtherScanning)
{
    auto elements = scanWholeLine("* * *");
    ASSERT_EQ(elements.size(), 1u);
    EXPECT_EQ(elements.front().kind, ElementKind::HorizontalRule);
}

TEST(InlineScanner, IsEscapedCountsBackslashes)
{
    EXPECT_TRUE(isEscaped(R"(\*)", 1));
    EXPECT_FALSE(isEscaped(R"(\\*)", 2));
    EXPECT_TRUE(isEscaped(R"(\\\*)", 3));
    EXPECT_FALSE(isEscaped("*", 0));
}
