#include "mdlive/preview/decoration.hpp"

#include <algorithm>
#include <iterator>
#include <plog/Log.h>

namespace mdlive::preview
{
namespace
{
std::string_view listTypeName(ListType type) noexcept
{
    switch (type)
    {
    case ListType::Bullet:
        return "bullet";
    case ListType::Numbered:
        return "numbered";
    case ListType::Task:
        return "task";
    }
    return "bullet";
}

std::string_view styleClass(TextStyle style) noexcept
{
    switch (style)
    {
    case TextStyle::Bold:
        return "cm-strong";
    case TextStyle::Italic:
        return "cm-em";
    case TextStyle::BoldItalic:
        return "cm-strong cm-em";
    case TextStyle::Strikethrough:
        return "cm-strikethrough";
    case TextStyle::Highlight:
        return "cm-highlight";
    }
    return "cm-strong";
}

std::string editingClass(const Element &element)
{
    std::string base = "cm-" + std::string(kindName(element.kind)) + "-source";
    if (const auto *callout = element.as<CalloutData>())
        base += " cm-callout-" + callout->type + "-source";
    return base;
}

std::optional<Widget> blockWidget(const Element &element)
{
    if (const auto *code = element.as<CodeBlockData>())
        return CodeBlockWidget{code->language, code->code};
    if (const auto *math = element.as<MathBlockData>())
        return MathBlockWidget{math->latex};
    if (const auto *table = element.as<TableData>())
        return TableWidget{table->rows, table->alignments, table->hasHeader};
    if (const auto *callout = element.as<CalloutData>())
        return CalloutWidget{callout->type, callout->title, callout->body, callout->fold};
    if (const auto *details = element.as<DetailsData>())
        return DetailsWidget{details->summary, details->body, details->open};
    if (const auto *footnote = element.as<FootnoteDefinitionData>())
        return FootnoteDefinitionWidget{footnote->identifier, footnote->body};
    return std::nullopt;
}

std::optional<Widget> inlineWidget(const Element &element)
{
    if (element.as<CodeSpanData>())
        return InlineCodeWidget{element.content};
    if (const auto *math = element.as<MathInlineData>())
        return MathWidget{math->latex, false};
    if (const auto *link = element.as<LinkData>())
        return LinkWidget{element.content, link->url, link->title, link->form, link->heading};
    if (const auto *image = element.as<ImageData>())
        return ImageWidget{image->alt, image->url, image->title, image->width};
    if (const auto *widget = element.as<InlineWidgetData>())
    {
        switch (widget->widget)
        {
        case InlineWidget::Superscript:
            return ScriptWidget{widget->text, true};
        case InlineWidget::Subscript:
            return ScriptWidget{widget->text, false};
        case InlineWidget::Kbd:
            return KbdWidget{widget->text};
        case InlineWidget::FootnoteRef:
            return FootnoteRefWidget{widget->text};
        case InlineWidget::Embed:
            return EmbedWidget{widget->text};
        }
    }
    return std::nullopt;
}

void push(DecorationSet &out, std::size_t from, std::size_t to, ElementKind kind, Instruction instruction)
{
    out.push_back(RenderInstruction{from, to, kind, std::move(instruction)});
}

} // namespace

std::string_view instructionName(const RenderInstruction &instruction) noexcept
{
    switch (instruction.instruction.index())
    {
    case 0:
        return "line-attribute";
    case 1:
        return "span-replace";
    case 2:
        return "span-mark";
    default:
        return "widget-anchor";
    }
}

std::string_view widgetName(const Widget &widget) noexcept
{
    static constexpr std::string_view names[] = {
        "hidden-marker", "inline-code", "math",       "link",   "image",   "script",
        "kbd",           "footnote-ref", "embed",     "list-bullet", "horizontal-rule", "code-block",
        "math-block",    "table",       "callout",    "details", "footnote-definition"};
    static_assert(std::size(names) == std::variant_size_v<Widget>);
    return names[widget.index()];
}

DecorationBuilder::DecorationBuilder(const DocumentSnapshot &snapshot, RevealOracle oracle)
    : snapshot(snapshot), oracle(oracle ? std::move(oracle) : neverReveal())
{
}

bool DecorationBuilder::revealed(std::size_t from, std::size_t to, ElementKind kind) const
{
    return oracle(from, to, kind);
}

DecorationSet DecorationBuilder::build(std::span<const Element *const> elements) const
{
    DecorationSet out;
    out.reserve(elements.size() * 2);

    std::vector<const Element *> ordered(elements.begin(), elements.end());
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Element *a, const Element *b) { return a->from < b->from; });

    const std::size_t length = snapshot.length();
    for (const Element *source : ordered)
    {
        if (source->from > source->to)
        {
            PLOGD << "Skipping " << kindName(source->kind) << " with inverted range " << source->from << ".."
                  << source->to;
            continue;
        }
        if (source->to <= length)
        {
            emitElement(*source, out);
            continue;
        }
        Element clamped = *source;
        clamped.to = length;
        clamped.from = std::min(clamped.from, length);
        emitElement(clamped, out);
    }

    std::stable_sort(out.begin(), out.end(), [](const RenderInstruction &a, const RenderInstruction &b) {
        if (a.from != b.from)
            return a.from < b.from;
        if (a.to != b.to)
            return a.to < b.to;
        return a.priority() < b.priority();
    });
    return out;
}

DecorationSet DecorationBuilder::build(std::span<const Element> elements) const
{
    std::vector<const Element *> pointers;
    pointers.reserve(elements.size());
    for (const Element &element : elements)
        pointers.push_back(&element);
    return build(std::span<const Element *const>(pointers));
}

void DecorationBuilder::emitElement(const Element &element, DecorationSet &out) const
{
    if (isMultiLineBlockKind(element.kind))
        emitBlock(element, out);
    else if (isLineLevelKind(element.kind) || element.kind == ElementKind::HorizontalRule)
        emitLineLevel(element, out);
    else
        emitInline(element, out);
}

void DecorationBuilder::emitLineLevel(const Element &element, DecorationSet &out) const
{
    const std::size_t lineStart = element.from;
    const std::size_t length = snapshot.length();
    auto hideRange = [&](std::size_t from, std::size_t to) {
        to = std::min(to, length);
        if (from < to)
            push(out, from, to, element.kind, SpanReplace{HiddenMarker{}});
    };

    if (const auto *heading = element.as<HeadingData>())
    {
        push(out, lineStart, lineStart, element.kind,
             LineAttribute{"cm-heading cm-heading-" + std::to_string(heading->level), {}});
        if (!heading->text.empty() && !revealed(heading->markerFrom, heading->markerTo, element.kind))
            hideRange(heading->markerFrom, heading->markerTo);
        return;
    }

    bool lineRevealed = revealed(element.from, element.to, element.kind);
    if (const auto *quote = element.as<BlockquoteData>())
    {
        push(out, lineStart, lineStart, element.kind,
             LineAttribute{"cm-blockquote", {{"data-depth", std::to_string(quote->depth)}}});
        if (!lineRevealed)
            hideRange(quote->markerFrom, quote->markerTo);
        return;
    }

    if (const auto *item = element.as<ListItemData>())
    {
        push(out, lineStart, lineStart, element.kind,
             LineAttribute{"cm-list-item cm-list-" + std::string(listTypeName(item->type)),
                           {{"data-indent", std::to_string(item->indent)}}});
        if (!lineRevealed && item->markerFrom < item->markerTo)
            push(out, item->markerFrom, std::min(item->markerTo, length), element.kind,
                 SpanReplace{ListBulletWidget{item->type, item->marker, item->checked}});
        return;
    }

    if (element.kind == ElementKind::HorizontalRule && !lineRevealed && element.from < element.to)
        push(out, element.from, element.to, element.kind, SpanReplace{HorizontalRuleWidget{}});
}

void DecorationBuilder::emitInline(const Element &element, DecorationSet &out) const
{
    if (element.from == element.to)
    {
        PLOGD << "Skipping empty " << kindName(element.kind) << " at " << element.from;
        return;
    }

    // Style-only marks stay on while the caret is inside them.
    if (const auto *tag = element.as<TagData>())
    {
        push(out, element.from, element.to, element.kind, SpanMark{"cm-hashtag", {{"data-tag", tag->tag}}});
        return;
    }
    if (const auto *reference = element.as<LinkReferenceData>())
    {
        push(out, element.from, element.to, element.kind,
             SpanMark{"cm-link-reference", {{"data-label", reference->label}, {"data-url", reference->url}}});
        return;
    }

    if (revealed(element.from, element.to, element.kind))
        return;

    if (const auto *formatted = element.as<FormattedData>())
    {
        const SpanRange &span = formatted->span;
        if (span.syntaxFrom < span.contentFrom)
            push(out, span.syntaxFrom, span.contentFrom, element.kind, SpanReplace{HiddenMarker{}});
        if (span.contentFrom < span.contentTo)
            push(out, span.contentFrom, span.contentTo, element.kind,
                 SpanMark{std::string(styleClass(formatted->style)), {}});
        if (span.contentTo < span.syntaxTo)
            push(out, span.contentTo, span.syntaxTo, element.kind, SpanReplace{HiddenMarker{}});
        return;
    }

    std::optional<Widget> widget = inlineWidget(element);
    if (!widget)
    {
        PLOGD << "No renderer for " << kindName(element.kind) << " at " << element.from;
        return;
    }
    push(out, element.from, element.to, element.kind, SpanReplace{std::move(*widget)});
}

void DecorationBuilder::emitBlock(const Element &element, DecorationSet &out) const
{
    std::optional<Widget> widget = blockWidget(element);
    if (!widget)
    {
        PLOGD << "Block " << kindName(element.kind) << " at " << element.from << " carries no payload";
        return;
    }

    int firstLine = snapshot.lineAt(element.from).number;
    int lastLine = std::max(firstLine, snapshot.lineAt(element.to).number);

    if (revealed(element.from, element.to, element.kind))
    {
        std::string style = editingClass(element);
        for (int line = firstLine; line <= lastLine; ++line)
        {
            std::size_t start = snapshot.line(line).from;
            push(out, start, start, element.kind, LineAttribute{style, {}});
        }
        return;
    }

    if (lastLine > firstLine)
    {
        push(out, element.from, element.from, element.kind, WidgetAnchor{std::move(*widget), element.to});
        for (int line = firstLine; line <= lastLine; ++line)
        {
            std::size_t start = snapshot.line(line).from;
            push(out, start, start, element.kind, LineAttribute{"cm-hidden-line", {}});
        }
        return;
    }

    if (element.from == element.to)
    {
        PLOGD << "Skipping empty " << kindName(element.kind) << " at " << element.from;
        return;
    }
    push(out, element.from, element.to, element.kind, SpanReplace{std::move(*widget)});
}

} // namespace mdlive::preview
