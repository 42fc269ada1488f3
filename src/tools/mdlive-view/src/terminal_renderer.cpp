#include "mdlive/view/terminal_renderer.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <type_traits>
#include <utility>

namespace mdlive::view
{

using namespace mdlive::preview;

namespace
{

constexpr std::string_view kRuleGlyph = "\xE2\x94\x80";   // ─
constexpr std::string_view kCrossGlyph = "\xE2\x94\xBC";  // ┼
constexpr std::string_view kColumnGlyph = "\xE2\x94\x82"; // │
constexpr std::string_view kCalloutBar = "\xE2\x96\x8C ";  // ▌
constexpr std::string_view kBullet = "\xE2\x80\xA2 ";      // •
constexpr std::string_view kOpenArrow = "\xE2\x96\xBC ";   // ▼
constexpr std::string_view kClosedArrow = "\xE2\x96\xB6 "; // ▶

class LineBuilder
{
public:
    explicit LineBuilder(int sourceLine, bool widget)
    {
        line.sourceLine = sourceLine;
        line.widget = widget;
    }

    void append(std::string_view text, TextRole role, std::size_t sourceOffset = kNoSource)
    {
        if (text.empty())
            return;
        if (!line.runs.empty() && line.runs.back().role == role)
            line.runs.back().length += text.size();
        else
            line.runs.push_back(StyledRun{line.text.size(), text.size(), role});
        line.text.append(text);
        for (std::size_t i = 0; i < text.size(); ++i)
            line.sourceOffsets.push_back(sourceOffset == kNoSource ? kNoSource : sourceOffset + i);
    }

    RenderedLine take() { return std::move(line); }

private:
    RenderedLine line;
};

bool hasClass(std::string_view classes, std::string_view name) noexcept
{
    std::size_t pos = 0;
    while (pos <= classes.size())
    {
        std::size_t end = classes.find(' ', pos);
        if (end == std::string_view::npos)
            end = classes.size();
        if (classes.substr(pos, end - pos) == name)
            return true;
        pos = end + 1;
    }
    return false;
}

std::vector<std::string_view> splitLines(std::string_view text)
{
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (true)
    {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos)
        {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::string repeat(std::string_view glyph, std::size_t count)
{
    std::string result;
    result.reserve(glyph.size() * count);
    for (std::size_t i = 0; i < count; ++i)
        result.append(glyph);
    return result;
}

std::string capitalized(std::string text)
{
    if (!text.empty())
        text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    return text;
}

std::string padCell(std::string_view cell, std::size_t width, TableAlignment alignment)
{
    std::size_t used = displayWidth(cell);
    std::size_t gap = width > used ? width - used : 0;
    std::size_t left = 0;
    if (alignment == TableAlignment::Right)
        left = gap;
    else if (alignment == TableAlignment::Center)
        left = gap / 2;
    return std::string(left, ' ') + std::string(cell) + std::string(gap - left, ' ');
}

TextRole inlineRole(const Widget &widget) noexcept
{
    return std::visit(
        [](const auto &data) {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, InlineCodeWidget> || std::is_same_v<T, CodeBlockWidget>)
                return TextRole::Code;
            else if constexpr (std::is_same_v<T, MathWidget> || std::is_same_v<T, MathBlockWidget>)
                return TextRole::Math;
            else if constexpr (std::is_same_v<T, LinkWidget>)
                return TextRole::Link;
            else if constexpr (std::is_same_v<T, ImageWidget>)
                return TextRole::Image;
            else if constexpr (std::is_same_v<T, ListBulletWidget>)
                return TextRole::ListMarker;
            else if constexpr (std::is_same_v<T, HorizontalRuleWidget>)
                return TextRole::Rule;
            else
                return TextRole::Widget;
        },
        widget);
}

void appendBody(std::vector<RenderedLine> &rows, std::string_view body, std::string_view prefix,
                TextRole prefixRole, TextRole role, int sourceLine)
{
    for (std::string_view text : splitLines(body))
    {
        LineBuilder row(sourceLine, true);
        row.append(prefix, prefixRole);
        row.append(text, role);
        rows.push_back(row.take());
    }
}

} // namespace

std::size_t RenderedLine::columnFor(std::size_t offset) const noexcept
{
    std::size_t byte = text.size();
    for (std::size_t i = 0; i < sourceOffsets.size(); ++i)
    {
        if (sourceOffsets[i] != kNoSource && sourceOffsets[i] >= offset)
        {
            byte = i;
            break;
        }
    }
    return displayWidth(std::string_view(text).substr(0, byte));
}

std::size_t displayWidth(std::string_view text) noexcept
{
    std::size_t width = 0;
    for (char c : text)
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
            ++width;
    return width;
}

TextRole roleForClass(std::string_view styleClass) noexcept
{
    bool strong = hasClass(styleClass, "cm-strong");
    bool emphasis = hasClass(styleClass, "cm-em");
    if (strong && emphasis)
        return TextRole::StrongEmphasis;
    if (strong)
        return TextRole::Strong;
    if (emphasis)
        return TextRole::Emphasis;
    if (hasClass(styleClass, "cm-strikethrough"))
        return TextRole::Strikethrough;
    if (hasClass(styleClass, "cm-highlight"))
        return TextRole::Highlight;
    if (hasClass(styleClass, "cm-hashtag"))
        return TextRole::Tag;
    if (hasClass(styleClass, "cm-link-reference"))
        return TextRole::Link;
    return TextRole::Plain;
}

TextRole combineRoles(TextRole current, TextRole mark) noexcept
{
    if (mark == TextRole::Plain)
        return current;
    if ((current == TextRole::Strong && mark == TextRole::Emphasis) ||
        (current == TextRole::Emphasis && mark == TextRole::Strong))
        return TextRole::StrongEmphasis;
    return mark;
}

TerminalRenderer::TerminalRenderer(int width) noexcept
    : columns(std::max(width, 1))
{
}

void TerminalRenderer::setWidth(int width) noexcept
{
    columns = std::max(width, 1);
}

std::vector<RenderedLine> TerminalRenderer::render(const DocumentSnapshot &snapshot,
                                                   const DecorationSet &decorations) const
{
    std::vector<RenderedLine> out;
    out.reserve(snapshot.lineCount());

    auto cursor = decorations.begin();
    for (const DocumentLine &line : snapshot.lines())
    {
        cursor = std::partition_point(cursor, decorations.end(),
                                      [&](const RenderInstruction &item) { return item.from < line.from; });
        auto last = std::partition_point(cursor, decorations.end(),
                                         [&](const RenderInstruction &item) { return item.from <= line.to; });
        std::span<const RenderInstruction> onLine;
        if (cursor != last)
            onLine = std::span<const RenderInstruction>(&*cursor, static_cast<std::size_t>(last - cursor));

        bool hiddenLine = false;
        for (const RenderInstruction &item : onLine)
        {
            if (const auto *anchor = item.as<WidgetAnchor>())
            {
                auto rows = blockLines(anchor->widget, line.number);
                out.insert(out.end(), std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));
            }
            else if (const auto *attribute = item.as<LineAttribute>())
            {
                if (item.from == line.from && hasClass(attribute->styleClass, "cm-hidden-line"))
                    hiddenLine = true;
            }
        }
        if (!hiddenLine)
            out.push_back(renderLine(line, onLine));
    }
    return out;
}

RenderedLine TerminalRenderer::renderLine(const DocumentLine &line,
                                          std::span<const RenderInstruction> decorations) const
{
    const std::size_t length = line.text.size();
    TextRole base = TextRole::Plain;
    for (const RenderInstruction &item : decorations)
    {
        const auto *attribute = item.as<LineAttribute>();
        if (!attribute || item.from != line.from)
            continue;
        if (hasClass(attribute->styleClass, "cm-heading"))
            base = TextRole::Heading;
        else if (hasClass(attribute->styleClass, "cm-blockquote") && base == TextRole::Plain)
            base = TextRole::Quote;
        else if (attribute->styleClass.find("-source") != std::string::npos)
            base = TextRole::Source;
    }

    std::vector<bool> hidden(length, false);
    std::vector<TextRole> roles(length, base);
    std::map<std::size_t, std::vector<std::pair<std::string, TextRole>>> inserts;

    for (const RenderInstruction &item : decorations)
    {
        std::size_t from = std::min(item.from, line.from + length) - line.from;
        std::size_t to = std::min(std::max(item.to, item.from), line.from + length) - line.from;
        if (const auto *replace = item.as<SpanReplace>())
        {
            std::fill(hidden.begin() + static_cast<std::ptrdiff_t>(from),
                      hidden.begin() + static_cast<std::ptrdiff_t>(to), true);
            std::string text = inlineText(replace->widget);
            if (!text.empty())
                inserts[from].emplace_back(std::move(text), inlineRole(replace->widget));
        }
        else if (const auto *mark = item.as<SpanMark>())
        {
            TextRole role = roleForClass(mark->styleClass);
            for (std::size_t i = from; i < to; ++i)
                roles[i] = combineRoles(roles[i], role);
        }
    }

    LineBuilder builder(line.number, false);
    for (std::size_t i = 0; i <= length; ++i)
    {
        if (auto found = inserts.find(i); found != inserts.end())
            for (const auto &[text, role] : found->second)
                builder.append(text, role);
        if (i < length && !hidden[i])
            builder.append(line.text.substr(i, 1), roles[i], line.from + i);
    }
    return builder.take();
}

std::string TerminalRenderer::inlineText(const Widget &widget) const
{
    if (const auto *code = std::get_if<InlineCodeWidget>(&widget))
        return code->code;
    if (const auto *math = std::get_if<MathWidget>(&widget))
        return math->latex;
    if (const auto *link = std::get_if<LinkWidget>(&widget))
        return link->text.empty() ? link->url : link->text;
    if (const auto *image = std::get_if<ImageWidget>(&widget))
        return "[image: " + (image->alt.empty() ? image->url : image->alt) + "]";
    if (const auto *script = std::get_if<ScriptWidget>(&widget))
        return (script->superscript ? "^" : "_") + script->text;
    if (const auto *kbd = std::get_if<KbdWidget>(&widget))
        return "[" + kbd->key + "]";
    if (const auto *footnote = std::get_if<FootnoteRefWidget>(&widget))
        return "[" + footnote->identifier + "]";
    if (const auto *embed = std::get_if<EmbedWidget>(&widget))
        return "[[" + embed->target + "]]";
    if (const auto *bullet = std::get_if<ListBulletWidget>(&widget))
    {
        switch (bullet->type)
        {
        case ListType::Bullet:
            return std::string(kBullet);
        case ListType::Numbered:
            return bullet->marker + " ";
        case ListType::Task:
            return bullet->checked ? "[x] " : "[ ] ";
        }
        return std::string(kBullet);
    }
    if (std::holds_alternative<HorizontalRuleWidget>(widget))
        return repeat(kRuleGlyph, static_cast<std::size_t>(columns));
    if (std::holds_alternative<HiddenMarker>(widget))
        return {};

    // Block widgets collapsed onto a single source line.
    std::vector<RenderedLine> rows = blockLines(widget, 0);
    return rows.empty() ? std::string() : rows.front().text;
}

std::vector<RenderedLine> TerminalRenderer::blockLines(const Widget &widget, int sourceLine) const
{
    std::vector<RenderedLine> rows;

    if (const auto *code = std::get_if<CodeBlockWidget>(&widget))
    {
        if (!code->language.empty())
        {
            LineBuilder header(sourceLine, true);
            header.append("[" + code->language + "]", TextRole::Widget);
            rows.push_back(header.take());
        }
        std::string prefix = std::string(kColumnGlyph) + " ";
        appendBody(rows, code->code, prefix, TextRole::Widget, TextRole::Code, sourceLine);
    }
    else if (const auto *math = std::get_if<MathBlockWidget>(&widget))
    {
        appendBody(rows, math->latex, "  ", TextRole::Plain, TextRole::Math, sourceLine);
    }
    else if (const auto *table = std::get_if<TableWidget>(&widget))
    {
        std::size_t columnCount = 0;
        for (const auto &row : table->rows)
            columnCount = std::max(columnCount, row.size());
        std::vector<std::size_t> widths(columnCount, 1);
        for (const auto &row : table->rows)
            for (std::size_t c = 0; c < row.size(); ++c)
                widths[c] = std::max(widths[c], displayWidth(row[c]));

        std::string divider = " " + std::string(kColumnGlyph) + " ";
        for (std::size_t r = 0; r < table->rows.size(); ++r)
        {
            const auto &cells = table->rows[r];
            bool header = table->hasHeader && r == 0;
            LineBuilder row(sourceLine, true);
            for (std::size_t c = 0; c < columnCount; ++c)
            {
                if (c > 0)
                    row.append(divider, TextRole::Widget);
                TableAlignment alignment =
                    c < table->alignments.size() ? table->alignments[c] : TableAlignment::Default;
                std::string_view cell = c < cells.size() ? std::string_view(cells[c]) : std::string_view();
                row.append(padCell(cell, widths[c], alignment), header ? TextRole::Strong : TextRole::Plain);
            }
            rows.push_back(row.take());

            if (header)
            {
                LineBuilder rule(sourceLine, true);
                for (std::size_t c = 0; c < columnCount; ++c)
                {
                    if (c > 0)
                        rule.append(std::string(kRuleGlyph) + std::string(kCrossGlyph) + std::string(kRuleGlyph),
                                    TextRole::Widget);
                    rule.append(repeat(kRuleGlyph, widths[c]), TextRole::Widget);
                }
                rows.push_back(rule.take());
            }
        }
    }
    else if (const auto *callout = std::get_if<CalloutWidget>(&widget))
    {
        LineBuilder header(sourceLine, true);
        header.append(kCalloutBar, TextRole::Widget);
        std::string title = capitalized(callout->type);
        if (!callout->title.empty())
            title += ": " + callout->title;
        header.append(title, TextRole::Strong);
        if (callout->fold == CalloutFold::Collapsed)
            header.append(" [+]", TextRole::Widget);
        rows.push_back(header.take());
        if (callout->fold != CalloutFold::Collapsed && !callout->body.empty())
            appendBody(rows, callout->body, kCalloutBar, TextRole::Widget, TextRole::Quote, sourceLine);
    }
    else if (const auto *details = std::get_if<DetailsWidget>(&widget))
    {
        LineBuilder header(sourceLine, true);
        header.append(details->open ? kOpenArrow : kClosedArrow, TextRole::Widget);
        header.append(details->summary, TextRole::Strong);
        rows.push_back(header.take());
        if (details->open && !details->body.empty())
            appendBody(rows, details->body, "  ", TextRole::Plain, TextRole::Plain, sourceLine);
    }
    else if (const auto *footnote = std::get_if<FootnoteDefinitionWidget>(&widget))
    {
        std::vector<std::string_view> body = splitLines(footnote->body);
        LineBuilder first(sourceLine, true);
        first.append("[" + footnote->identifier + "]: ", TextRole::Widget);
        first.append(body.front(), TextRole::Plain);
        rows.push_back(first.take());
        for (std::size_t i = 1; i < body.size(); ++i)
        {
            LineBuilder row(sourceLine, true);
            row.append("    ", TextRole::Plain);
            row.append(body[i], TextRole::Plain);
            rows.push_back(row.take());
        }
    }
    else
    {
        LineBuilder row(sourceLine, true);
        row.append(inlineText(widget), inlineRole(widget));
        rows.push_back(row.take());
    }
    return rows;
}

} // namespace mdlive::view
