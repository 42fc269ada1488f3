#include "mdlive/preview/inline_scanner.hpp"

#include "mdlive/preview/line_prefix.hpp"
#include "mdlive/preview/pattern.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <plog/Log.h>
#include <utility>

namespace mdlive::preview
{
namespace
{
constexpr auto kIgnoreCase = std::regex::ECMAScript | std::regex::icase;

struct Patterns
{
    PatternMatcher horizontalRule{R"(^ {0,3}([-*_])(?:[ \t]*\1){2,}[ \t]*$)"};
    PatternMatcher heading{R"(^ {0,3}(#{1,6})(?:[ \t]+(.*?))?[ \t]*$)"};

    PatternMatcher inlineMath{R"(\$(?!\$)([^$]+?)\$(?!\$))"};
    PatternMatcher boldItalic{R"(\*\*\*([^*]+?)\*\*\*)"};
    PatternMatcher bold{R"(\*\*((?:[^*]|\*(?!\*))+?)\*\*)"};
    PatternMatcher italic{R"(\*(?!\*)([^*]+?)\*(?!\*)|_(?!_)([^_]+?)_(?!_))"};
    PatternMatcher strikethrough{R"(~~([^~]+?)~~)"};
    PatternMatcher highlight{R"(==([^=]+?)==)"};
    PatternMatcher doubleCode{R"(``(.+?)``)"};
    PatternMatcher code{R"(`([^`]+?)`)"};
    PatternMatcher embed{R"(!\[\[([^\]]+?)\]\])"};
    PatternMatcher wikiLink{R"(\[\[([^\]|#]*)(?:#([^\]|]*))?(?:\|([^\]]+))?\]\])"};
    PatternMatcher image{R"re(!\[([^\]]*?)(?:\|(\d+))?\]\(([^)\s]+)(?:\s+"([^"]*)")?\))re"};
    PatternMatcher link{R"re(\[([^\]]+?)\]\(([^)\s]*)(?:\s+"([^"]*)")?\))re"};
    PatternMatcher referenceImage{R"(!\[([^\]]*)\](?:\[([^\]]*)\])?)"};
    PatternMatcher referenceLink{R"(\[([^\]]+)\](?:\[([^\]]*)\])?)"};
    PatternMatcher superscript{R"(\^([^\^]+?)\^)"};
    PatternMatcher subscript{R"(~([^~]+?)~)"};
    PatternMatcher kbd{R"(<kbd>([^<]+?)</kbd>)", kIgnoreCase};
    PatternMatcher footnoteRef{R"(\[\^([^\]\s]+?)\])"};
    PatternMatcher hashtag{R"(#([A-Za-z0-9_][A-Za-z0-9_/-]*))"};
    PatternMatcher autolink{R"(<((?:https?|ftp)://[^>\s]+|mailto:[^>\s]+)>)", kIgnoreCase};
    PatternMatcher bareUrl{R"((?:https?://|www\.)[^\s<>\[\]()]+)", kIgnoreCase};
};

const Patterns &patterns()
{
    static const Patterns instance;
    return instance;
}

bool isSpaceChar(char ch) noexcept
{
    return ch == ' ' || ch == '\t';
}

bool isWordChar(char ch) noexcept
{
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

class LineContext
{
public:
    LineContext(std::string_view text, std::size_t lineFrom, int lineNumber, const ReferenceTable &references)
        : text(text), lineFrom(lineFrom), lineNumber(lineNumber), references(references)
    {
    }

    std::string_view text;
    std::size_t lineFrom;
    int lineNumber;
    const ReferenceTable &references;
    std::vector<Element> elements;

    char before(std::size_t pos) const noexcept { return pos == 0 ? '\0' : text[pos - 1]; }
    char at(std::size_t pos) const noexcept { return pos < text.size() ? text[pos] : '\0'; }

    SpanRange span(std::size_t from, std::size_t to, std::size_t contentFrom, std::size_t contentTo) const noexcept
    {
        return SpanRange{lineFrom + from, lineFrom + to, lineFrom + contentFrom, lineFrom + contentTo};
    }

    void emit(ElementKind kind, const PatternMatch &match, std::string content, ElementPayload payload)
    {
        Element element;
        element.kind = kind;
        element.from = lineFrom + match.position();
        element.to = lineFrom + match.end();
        element.lineNumber = lineNumber;
        element.content = std::move(content);
        element.payload = std::move(payload);
        elements.push_back(std::move(element));
    }

    void markLink(const PatternMatch &match) { links.emplace_back(match.position(), match.end()); }

    bool overlapsLink(std::size_t from, std::size_t to) const noexcept
    {
        return std::any_of(links.begin(), links.end(),
                           [&](const auto &range) { return range.first < to && from < range.second; });
    }

private:
    std::vector<std::pair<std::size_t, std::size_t>> links;
};

// Shared acceptance test for constructs delimited by a repeated marker.
bool acceptDelimited(const LineContext &ctx, const PatternMatch &match, std::size_t markerLength, char marker,
                     std::string_view content)
{
    std::size_t open = match.position();
    std::size_t close = match.end() - markerLength;
    if (isEscaped(ctx.text, open) || isEscaped(ctx.text, close))
        return false;
    if (ctx.before(open) == marker || ctx.at(match.end()) == marker)
        return false;
    if (content.empty() || isSpaceChar(content.front()) || isSpaceChar(content.back()))
        return false;
    return true;
}

void scanFormatted(LineContext &ctx, const PatternMatcher &matcher, std::size_t markerLength, char marker,
                   ElementKind kind, TextStyle style)
{
    for (auto sequence = matcher.matches(ctx.text); auto match = sequence.next();)
    {
        std::string_view content = match->group(1);
        if (!acceptDelimited(ctx, *match, markerLength, marker, content))
        {
            sequence.reject();
            continue;
        }
        std::size_t from = match->position();
        std::size_t to = match->end();
        FormattedData data{ctx.span(from, to, from + markerLength, to - markerLength), style};
        ctx.emit(kind, *match, std::string(content), data);
    }
}

void scanItalic(LineContext &ctx)
{
    for (auto sequence = patterns().italic.matches(ctx.text); auto match = sequence.next();)
    {
        bool underscore = match->matched(2);
        std::string_view content = underscore ? match->group(2) : match->group(1);
        char marker = underscore ? '_' : '*';
        bool accepted = acceptDelimited(ctx, *match, 1, marker, content);
        // snake_case identifiers are not emphasis.
        if (accepted && underscore && (isWordChar(ctx.before(match->position())) || isWordChar(ctx.at(match->end()))))
            accepted = false;
        if (!accepted)
        {
            sequence.reject();
            continue;
        }
        std::size_t from = match->position();
        std::size_t to = match->end();
        FormattedData data{ctx.span(from, to, from + 1, to - 1), TextStyle::Italic};
        ctx.emit(ElementKind::Italic, *match, std::string(content), data);
    }
}

void scanInlineMath(LineContext &ctx)
{
    for (auto sequence = patterns().inlineMath.matches(ctx.text); auto match = sequence.next();)
    {
        std::string_view latex = match->group(1);
        bool accepted = acceptDelimited(ctx, *match, 1, '$', latex) &&
                        std::isdigit(static_cast<unsigned char>(ctx.at(match->end()))) == 0;
        if (!accepted)
        {
            sequence.reject();
            continue;
        }
        std::size_t from = match->position();
        std::size_t to = match->end();
        MathInlineData data{ctx.span(from, to, from + 1, to - 1), std::string(latex)};
        ctx.emit(ElementKind::InlineMath, *match, std::string(latex), data);
    }
}

void scanCode(LineContext &ctx)
{
    for (auto sequence = patterns().doubleCode.matches(ctx.text); auto match = sequence.next();)
    {
        if (isEscaped(ctx.text, match->position()) || ctx.before(match->position()) == '`' ||
            ctx.at(match->end()) == '`')
        {
            sequence.reject();
            continue;
        }
        std::string_view content = match->group(1);
        std::size_t contentFrom = match->position() + 2;
        std::size_t contentTo = match->end() - 2;
        if (content.size() > 2 && content.front() == ' ' && content.back() == ' ')
        {
            content = content.substr(1, content.size() - 2);
            ++contentFrom;
            --contentTo;
        }
        CodeSpanData data{ctx.span(match->position(), match->end(), contentFrom, contentTo)};
        ctx.emit(ElementKind::InlineCode, *match, std::string(content), data);
    }

    for (auto sequence = patterns().code.matches(ctx.text); auto match = sequence.next();)
    {
        if (isEscaped(ctx.text, match->position()) || ctx.before(match->position()) == '`' ||
            ctx.at(match->end()) == '`')
        {
            sequence.reject();
            continue;
        }
        std::size_t from = match->position();
        std::size_t to = match->end();
        CodeSpanData data{ctx.span(from, to, from + 1, to - 1)};
        ctx.emit(ElementKind::InlineCode, *match, match->str(1), data);
    }
}

void scanEmbedsAndWikiLinks(LineContext &ctx)
{
    for (auto sequence = patterns().embed.matches(ctx.text); auto match = sequence.next();)
    {
        if (isEscaped(ctx.text, match->position()))
        {
            sequence.reject();
            continue;
        }
        std::size_t from = match->position();
        std::size_t to = match->end();
        InlineWidgetData data{ctx.span(from, to, from + 3, to - 2), InlineWidget::Embed, match->str(1)};
        ctx.emit(ElementKind::InlineOther, *match, match->str(1), data);
        ctx.markLink(*match);
    }

    for (auto sequence = patterns().wikiLink.matches(ctx.text); auto match = sequence.next();)
    {
        std::string target = trimCopy(match->group(1));
        std::string heading = trimCopy(match->group(2));
        if (ctx.before(match->position()) == '!' || isEscaped(ctx.text, match->position()) ||
            (target.empty() && heading.empty()))
        {
            sequence.reject();
            continue;
        }
        std::string alias = trimCopy(match->group(3));
        std::string display = !alias.empty() ? alias : (target.empty() ? heading : target);
        std::size_t from = match->position();
        std::size_t to = match->end();
        LinkData data;
        data.span = ctx.span(from, to, from + 2, to - 2);
        data.form = LinkForm::Wiki;
        data.url = target;
        data.label = alias;
        data.heading = heading;
        ctx.emit(ElementKind::Link, *match, display, data);
        ctx.markLink(*match);
    }
}

void scanInlineLinksAndImages(LineContext &ctx)
{
    for (auto sequence = patterns().image.matches(ctx.text); auto match = sequence.next();)
    {
        if (isEscaped(ctx.text, match->position()) || ctx.overlapsLink(match->position(), match->end()))
        {
            sequence.reject();
            continue;
        }
        std::size_t from = match->position();
        std::string_view alt = match->group(1);
        ImageData data;
        data.span = ctx.span(from, match->end(), from + 2, from + 2 + alt.size());
        data.alt = std::string(alt);
        data.url = match->str(3);
        data.title = match->str(4);
        if (match->matched(2))
        {
            std::string_view digits = match->group(2);
            int width = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), width);
            if (ec == std::errc() && ptr == digits.data() + digits.size())
                data.width = width;
        }
        ctx.emit(ElementKind::Image, *match, std::string(alt), data);
        ctx.markLink(*match);
    }

    for (auto sequence = patterns().link.matches(ctx.text); auto match = sequence.next();)
    {
        std::size_t from = match->position();
        if (isEscaped(ctx.text, from) || ctx.before(from) == '!' || ctx.overlapsLink(from, match->end()))
        {
            sequence.reject();
            continue;
        }
        std::string_view label = match->group(1);
        LinkData data;
        data.span = ctx.span(from, match->end(), from + 1, from + 1 + label.size());
        data.form = LinkForm::Inline;
        data.url = match->str(2);
        data.title = match->str(3);
        ctx.emit(ElementKind::Link, *match, std::string(label), data);
        ctx.markLink(*match);
    }
}

void scanReferenceLinksAndImages(LineContext &ctx)
{
    for (auto sequence = patterns().referenceImage.matches(ctx.text); auto match = sequence.next();)
    {
        std::size_t from = match->position();
        std::string_view alt = match->group(1);
        bool shortcut = !match->matched(2);
        char next = ctx.at(match->end());
        std::string label = match->matched(2) && !match->group(2).empty() ? match->str(2) : std::string(alt);

        bool rejected = isEscaped(ctx.text, from) || (!alt.empty() && alt.front() == '[') || next == '(' ||
                        (shortcut && (next == '[' || next == ':')) || (!label.empty() && label.front() == '^') ||
                        ctx.overlapsLink(from, match->end());
        std::optional<ReferenceDefinition> definition;
        if (!rejected)
            definition = ctx.references.resolve(label);
        if (!definition)
        {
            sequence.reject();
            continue;
        }
        ImageData data;
        data.span = ctx.span(from, match->end(), from + 2, from + 2 + alt.size());
        data.alt = std::string(alt);
        data.url = definition->url;
        data.title = definition->title;
        data.reference = true;
        ctx.emit(ElementKind::Image, *match, std::string(alt), data);
        ctx.markLink(*match);
    }

    for (auto sequence = patterns().referenceLink.matches(ctx.text); auto match = sequence.next();)
    {
        std::size_t from = match->position();
        std::string_view text = match->group(1);
        bool shortcut = !match->matched(2);
        char prev = ctx.before(from);
        char next = ctx.at(match->end());
        std::string label = match->matched(2) && !match->group(2).empty() ? match->str(2) : std::string(text);

        bool rejected = isEscaped(ctx.text, from) || prev == '!' || prev == '[' || next == '(' ||
                        (shortcut && (next == '[' || next == ':' || next == ']')) || text.front() == '^' ||
                        label.front() == '^' || ctx.overlapsLink(from, match->end());
        std::optional<ReferenceDefinition> definition;
        if (!rejected)
            definition = ctx.references.resolve(label);
        if (!definition)
        {
            sequence.reject();
            continue;
        }
        LinkData data;
        data.span = ctx.span(from, match->end(), from + 1, from + 1 + text.size());
        data.form = LinkForm::Reference;
        data.url = definition->url;
        data.title = definition->title;
        data.label = label;
        ctx.emit(ElementKind::Link, *match, std::string(text), data);
        ctx.markLink(*match);
    }
}

void scanWidgets(LineContext &ctx)
{
    auto scanWidget = [&ctx](const PatternMatcher &matcher, InlineWidget widget, std::size_t openLength,
                             std::size_t closeLength, char marker) {
        for (auto sequence = matcher.matches(ctx.text); auto match = sequence.next();)
        {
            std::size_t from = match->position();
            std::size_t to = match->end();
            std::string_view content = match->group(1);
            bool rejected = isEscaped(ctx.text, from) || isEscaped(ctx.text, to - closeLength);
            if (marker != '\0')
                rejected = rejected || ctx.before(from) == marker || ctx.at(to) == marker ||
                           isSpaceChar(content.front()) || isSpaceChar(content.back());
            if (widget == InlineWidget::Superscript && ctx.before(from) == '[')
                rejected = true;
            if (widget == InlineWidget::FootnoteRef && ctx.at(to) == ':')
                rejected = true;
            if (rejected)
            {
                sequence.reject();
                continue;
            }
            InlineWidgetData data{ctx.span(from, to, from + openLength, to - closeLength), widget, std::string(content)};
            ctx.emit(ElementKind::InlineOther, *match, std::string(content), data);
        }
    };

    scanWidget(patterns().superscript, InlineWidget::Superscript, 1, 1, '^');
    scanWidget(patterns().subscript, InlineWidget::Subscript, 1, 1, '~');
    scanWidget(patterns().kbd, InlineWidget::Kbd, 5, 6, '\0');
    scanWidget(patterns().footnoteRef, InlineWidget::FootnoteRef, 2, 1, '\0');
}

void scanTags(LineContext &ctx)
{
    for (auto sequence = patterns().hashtag.matches(ctx.text); auto match = sequence.next();)
    {
        std::size_t from = match->position();
        char prev = ctx.before(from);
        std::string_view tag = match->group(1);
        bool numeric = std::all_of(tag.begin(), tag.end(), [](char ch) {
            return std::isdigit(static_cast<unsigned char>(ch)) != 0;
        });
        if ((prev != '\0' && !isSpaceChar(prev) && prev != '(') || numeric || isEscaped(ctx.text, from))
        {
            sequence.reject();
            continue;
        }
        TagData data{ctx.span(from, match->end(), from + 1, match->end()), std::string(tag)};
        ctx.emit(ElementKind::Tag, *match, std::string(tag), data);
    }
}

void scanUrls(LineContext &ctx)
{
    for (auto sequence = patterns().autolink.matches(ctx.text); auto match = sequence.next();)
    {
        std::size_t from = match->position();
        if (isEscaped(ctx.text, from) || ctx.overlapsLink(from, match->end()))
        {
            sequence.reject();
            continue;
        }
        LinkData data;
        data.span = ctx.span(from, match->end(), from + 1, match->end() - 1);
        data.form = LinkForm::Autolink;
        data.url = match->str(1);
        ctx.emit(ElementKind::Link, *match, data.url, data);
        ctx.markLink(*match);
    }

    for (auto sequence = patterns().bareUrl.matches(ctx.text); auto match = sequence.next();)
    {
        std::size_t from = match->position();
        char prev = ctx.before(from);
        if (isWordChar(prev) || prev == '<' || prev == '/' || prev == '"' || prev == '\'' || prev == '=' ||
            isEscaped(ctx.text, from) || ctx.overlapsLink(from, match->end()))
        {
            sequence.reject();
            continue;
        }
        std::string_view url = match->group(0);
        while (!url.empty() && std::string_view(".,;:!?*_~'\"").find(url.back()) != std::string_view::npos)
            url.remove_suffix(1);
        if (url.empty())
        {
            sequence.reject();
            continue;
        }

        Element element;
        element.kind = ElementKind::Link;
        element.from = ctx.lineFrom + from;
        element.to = element.from + url.size();
        element.lineNumber = ctx.lineNumber;
        element.content = std::string(url);
        LinkData data;
        data.span = ctx.span(from, from + url.size(), from, from + url.size());
        data.form = LinkForm::BareUrl;
        data.url = toLower(url.substr(0, 4)) == "www." ? "https://" + std::string(url) : std::string(url);
        element.payload = std::move(data);
        ctx.elements.push_back(std::move(element));
    }
}

} // namespace

bool isEscaped(std::string_view text, std::size_t pos) noexcept
{
    std::size_t count = 0;
    while (pos > count && text[pos - count - 1] == '\\')
        ++count;
    return count % 2 == 1;
}

std::vector<Element> InlineScanner::scanStructure(const DocumentLine &line, bool &isRule) const
{
    std::vector<Element> elements;
    isRule = false;
    std::string_view text = line.text;

    auto lineElement = [&](ElementKind kind, std::string content, ElementPayload payload) {
        Element element;
        element.kind = kind;
        element.from = line.from;
        element.to = line.to;
        element.lineNumber = line.number;
        element.content = std::move(content);
        element.payload = std::move(payload);
        elements.push_back(std::move(element));
    };

    {
        auto sequence = patterns().horizontalRule.matches(text);
        if (auto match = sequence.next())
        {
            isRule = true;
            lineElement(ElementKind::HorizontalRule, std::string(), RuleData{match->group(1).front()});
            return elements;
        }
    }

    {
        auto sequence = patterns().heading.matches(text);
        if (auto match = sequence.next())
        {
            std::string_view body = match->group(2);
            // Drop an optional closing sequence of '#'.
            std::size_t closing = body.find_last_not_of('#');
            if (closing != std::string_view::npos && closing + 1 < body.size() && isSpaceChar(body[closing]))
                body = trimView(body.substr(0, closing));
            else if (closing == std::string_view::npos)
                body = std::string_view();

            HeadingData data;
            data.level = static_cast<int>(match->group(1).size());
            data.markerFrom = line.from + match->groupPosition(1);
            data.markerTo = match->matched(2) ? line.from + match->groupPosition(2) : line.to;
            data.text = std::string(body);
            lineElement(ElementKind::Heading, data.text, data);
        }
    }

    LinePrefix prefix = stripLinePrefix(text);
    if (prefix.quoteDepth > 0)
    {
        BlockquoteData data{line.from + prefix.quoteFrom, line.from + prefix.quoteTo, prefix.quoteDepth};
        lineElement(ElementKind::Blockquote, std::string(text.substr(prefix.quoteTo)), data);
    }
    if (prefix.list)
    {
        ListItemData data;
        data.type = prefix.list->type;
        data.marker = prefix.list->marker;
        data.checked = prefix.list->checked;
        data.indent = static_cast<int>(prefix.list->indent);
        data.markerFrom = line.from + prefix.list->from;
        data.markerTo = line.from + prefix.list->to;
        lineElement(ElementKind::ListItem, std::string(text.substr(prefix.list->to)), data);
    }
    return elements;
}

std::vector<Element> InlineScanner::scanInline(std::string_view text, std::size_t lineFrom, int lineNumber,
                                               const ReferenceTable &references) const
{
    LineContext ctx(text, lineFrom, lineNumber, references);
    const Patterns &p = patterns();

    scanInlineMath(ctx);
    scanFormatted(ctx, p.boldItalic, 3, '*', ElementKind::InlineOther, TextStyle::BoldItalic);
    scanFormatted(ctx, p.bold, 2, '*', ElementKind::Bold, TextStyle::Bold);
    scanItalic(ctx);
    scanFormatted(ctx, p.strikethrough, 2, '~', ElementKind::InlineOther, TextStyle::Strikethrough);
    scanFormatted(ctx, p.highlight, 2, '=', ElementKind::InlineOther, TextStyle::Highlight);
    scanCode(ctx);
    scanEmbedsAndWikiLinks(ctx);
    scanInlineLinksAndImages(ctx);
    scanReferenceLinksAndImages(ctx);
    scanWidgets(ctx);
    scanTags(ctx);
    scanUrls(ctx);

    std::stable_sort(ctx.elements.begin(), ctx.elements.end(), [](const Element &a, const Element &b) {
        if (a.from != b.from)
            return a.from < b.from;
        return priorityRank(a.kind) < priorityRank(b.kind);
    });
    return std::move(ctx.elements);
}

std::vector<Element> InlineScanner::scanLine(const DocumentLine &line, const ReferenceTable &references) const
{
    if (!withinPatternLimit(line.text))
    {
        PLOG_WARNING << "Line " << line.number << " is " << line.text.size()
                     << " bytes long; showing it without inline formatting";
        return {};
    }

    bool isRule = false;
    std::vector<Element> elements = scanStructure(line, isRule);
    if (isRule)
        return elements;
    std::vector<Element> inlineElements = scanInline(line.text, line.from, line.number, references);
    elements.insert(elements.end(), std::make_move_iterator(inlineElements.begin()),
                    std::make_move_iterator(inlineElements.end()));
    return elements;
}

} // namespace mdlive::preview
