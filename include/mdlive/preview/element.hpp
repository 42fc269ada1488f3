#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mdlive::preview
{

// Declaration order is the conflict priority: a lower value wins.
enum class ElementKind
{
    CodeBlock = 1,
    MathBlock,
    Table,
    Callout,
    Details,
    Heading,
    Blockquote,
    ListItem,
    InlineMath,
    HorizontalRule,
    Bold,
    Italic,
    InlineCode,
    Link,
    Image,
    InlineOther,
    Tag,
    FootnoteDefinition,
    LinkReference
};

constexpr int priorityRank(ElementKind kind) noexcept
{
    return static_cast<int>(kind);
}

// Negative when a outranks b, zero for the same kind.
int comparePriority(ElementKind a, ElementKind b) noexcept;
std::string_view kindName(ElementKind kind) noexcept;

// Blocks that render as a single widget over several whole lines.
bool isMultiLineBlockKind(ElementKind kind) noexcept;
// Heading, quotation and list item styling attached to a whole line.
bool isLineLevelKind(ElementKind kind) noexcept;
// Inline constructs rendered by replacing their whole syntax span.
bool isInlineContainerKind(ElementKind kind) noexcept;

struct SpanRange
{
    std::size_t syntaxFrom = 0;
    std::size_t syntaxTo = 0;
    std::size_t contentFrom = 0;
    std::size_t contentTo = 0;
};

enum class MathDelimiter
{
    DoubleDollar,
    InlineDoubleDollar,
    Bracket,
    Environment
};

enum class TableAlignment
{
    Default,
    Left,
    Center,
    Right
};

enum class CalloutFold
{
    None,
    Expanded,
    Collapsed
};

enum class ListType
{
    Bullet,
    Numbered,
    Task
};

enum class TextStyle
{
    Bold,
    Italic,
    BoldItalic,
    Strikethrough,
    Highlight
};

enum class LinkForm
{
    Inline,
    Reference,
    Wiki,
    Autolink,
    BareUrl
};

enum class InlineWidget
{
    Superscript,
    Subscript,
    Kbd,
    FootnoteRef,
    Embed
};

struct CodeBlockData
{
    std::string language;
    std::string code;
    std::string fence;
};

struct MathBlockData
{
    std::string latex;
    MathDelimiter delimiter = MathDelimiter::DoubleDollar;
    std::string environment;
};

struct TableData
{
    std::vector<std::vector<std::string>> rows;
    std::vector<TableAlignment> alignments;
    bool hasHeader = false;
};

struct CalloutData
{
    std::string type;
    std::string title;
    std::string body;
    CalloutFold fold = CalloutFold::None;
};

struct DetailsData
{
    std::string summary;
    std::string body;
    bool open = false;
};

struct FootnoteDefinitionData
{
    std::string identifier;
    std::string body;
};

struct LinkReferenceData
{
    std::string label;
    std::string url;
    std::string title;
};

struct HeadingData
{
    int level = 1;
    std::size_t markerFrom = 0;
    std::size_t markerTo = 0;
    std::string text;
};

struct BlockquoteData
{
    std::size_t markerFrom = 0;
    std::size_t markerTo = 0;
    int depth = 1;
};

struct ListItemData
{
    ListType type = ListType::Bullet;
    std::string marker;
    bool checked = false;
    int indent = 0;
    std::size_t markerFrom = 0;
    std::size_t markerTo = 0;
};

struct RuleData
{
    char marker = '-';
};

struct FormattedData
{
    SpanRange span;
    TextStyle style = TextStyle::Bold;
};

struct CodeSpanData
{
    SpanRange span;
};

struct MathInlineData
{
    SpanRange span;
    std::string latex;
};

struct LinkData
{
    SpanRange span;
    LinkForm form = LinkForm::Inline;
    std::string url;
    std::string title;
    std::string label;
    std::string heading;
};

struct ImageData
{
    SpanRange span;
    std::string url;
    std::string alt;
    std::string title;
    std::optional<int> width;
    bool reference = false;
};

struct InlineWidgetData
{
    SpanRange span;
    InlineWidget widget = InlineWidget::Superscript;
    std::string text;
};

struct TagData
{
    SpanRange span;
    std::string tag;
};

using ElementPayload = std::variant<std::monostate,
                                    CodeBlockData,
                                    MathBlockData,
                                    TableData,
                                    CalloutData,
                                    DetailsData,
                                    FootnoteDefinitionData,
                                    LinkReferenceData,
                                    HeadingData,
                                    BlockquoteData,
                                    ListItemData,
                                    RuleData,
                                    FormattedData,
                                    CodeSpanData,
                                    MathInlineData,
                                    LinkData,
                                    ImageData,
                                    InlineWidgetData,
                                    TagData>;

struct Element
{
    ElementKind kind = ElementKind::InlineOther;
    std::size_t from = 0;
    std::size_t to = 0;
    int lineNumber = 0;
    std::optional<int> startLine;
    std::optional<int> endLine;
    std::string content;
    ElementPayload payload;

    bool isMultiLine() const noexcept { return startLine.has_value() && endLine.has_value() && *endLine > *startLine; }
    bool contains(const Element &other) const noexcept { return from <= other.from && other.to <= to; }
    bool overlaps(const Element &other) const noexcept;

    // Inline span of the element, if its payload carries one.
    const SpanRange *span() const noexcept;

    template <typename T>
    const T *as() const noexcept
    {
        return std::get_if<T>(&payload);
    }
};

// Copy of an element moved by delta bytes; used when a cached line shifts.
Element shifted(const Element &element, std::ptrdiff_t delta);

} // namespace mdlive::preview
