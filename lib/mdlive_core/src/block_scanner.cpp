#include "mdlive/preview/block_scanner.hpp"

#include "mdlive/preview/line_prefix.hpp"
#include "mdlive/preview/pattern.hpp"

#include <algorithm>
#include <optional>
#include <plog/Log.h>
#include <regex>

namespace mdlive::preview
{
namespace
{
BlockRange rangeFor(LineSpan lines, std::size_t first, std::size_t last, std::size_t documentLength)
{
    BlockRange range;
    range.from = std::min(lines[first].from, documentLength);
    range.to = std::clamp(lines[last].to, range.from, documentLength);
    range.startLine = lines[first].number;
    range.endLine = lines[last].number;
    return range;
}

std::string joinLines(const std::vector<std::string> &parts)
{
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i)
    {
        if (i > 0)
            result.push_back('\n');
        result += parts[i];
    }
    return result;
}

bool startsWith(std::string_view text, std::string_view prefix) noexcept
{
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(std::string_view text, std::string_view suffix) noexcept
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string_view quoteStripped(std::string_view text)
{
    return text.substr(stripLinePrefix(text, false).contentOffset);
}

// ---------------------------------------------------------------------------
// Fenced code

struct FenceOpen
{
    char marker = '`';
    std::size_t length = 0;
    std::size_t indent = 0;
    int quoteDepth = 0;
    std::string info;
};

std::optional<FenceOpen> parseFenceOpen(std::string_view text)
{
    LinePrefix prefix = stripLinePrefix(text);
    std::size_t pos = prefix.contentOffset;
    while (pos < text.size() && text[pos] == ' ')
        ++pos;
    if (pos >= text.size() || (text[pos] != '`' && text[pos] != '~'))
        return std::nullopt;

    FenceOpen fence;
    fence.marker = text[pos];
    fence.quoteDepth = prefix.quoteDepth;
    fence.indent = pos - prefix.quoteTo;
    std::size_t end = pos;
    while (end < text.size() && text[end] == fence.marker)
        ++end;
    fence.length = end - pos;
    if (fence.length < 3)
        return std::nullopt;
    fence.info = trimCopy(text.substr(end));
    if (fence.marker == '`' && fence.info.find('`') != std::string::npos)
        return std::nullopt;
    return fence;
}

bool closesFence(std::string_view text, const FenceOpen &fence)
{
    std::string_view content = trimView(quoteStripped(text));
    if (content.size() < fence.length)
        return false;
    return std::all_of(content.begin(), content.end(), [&](char ch) { return ch == fence.marker; });
}

std::string fenceBodyLine(std::string_view text, const FenceOpen &fence)
{
    std::string_view body = fence.quoteDepth > 0 ? quoteStripped(text) : text;
    std::size_t strip = 0;
    while (strip < fence.indent && strip < body.size() && body[strip] == ' ')
        ++strip;
    return std::string(body.substr(strip));
}

// ---------------------------------------------------------------------------
// Math

const std::regex &mathEnvironmentPattern()
{
    static const std::regex pattern(
        R"(^\\begin\{((?:equation|align|alignat|gather|multline|flalign|eqnarray|displaymath|math)\*?)\})");
    return pattern;
}

bool acceptLatex(const std::string &latex, int line)
{
    std::string_view trimmed = trimView(latex);
    if (trimmed.empty() || trimmed == "undefined")
    {
        PLOG_WARNING << "Discarding empty math block starting on line " << line;
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Details

const std::regex &detailsOpenPattern()
{
    static const std::regex pattern(R"(^\s*<details(\s+open)?(\s[^>]*)?>)", std::regex::icase);
    return pattern;
}

const std::regex &detailsTagPattern()
{
    static const std::regex pattern(R"(<(/?)details\b[^>]*>)", std::regex::icase);
    return pattern;
}

const std::regex &summaryPattern()
{
    static const std::regex pattern(R"(<summary>(.+?)</summary>)", std::regex::icase);
    return pattern;
}

int detailsDepthChange(const std::string &text)
{
    int change = 0;
    if (!withinPatternLimit(text))
        return change;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), detailsTagPattern()); it != std::sregex_iterator();
         ++it)
        change += (*it)[1].length() > 0 ? -1 : 1;
    return change;
}

bool isDetailsMarkupOnly(std::string_view line)
{
    static const std::regex tagsOnly(R"(^(\s*</?(details|summary)\b[^>]*>\s*)+$)", std::regex::icase);
    if (!withinPatternLimit(line))
        return false;
    std::string text(line);
    return std::regex_match(text, tagsOnly);
}

} // namespace

// ---------------------------------------------------------------------------
// LineSet

LineSet::LineSet(int lineCount)
    : bits(static_cast<std::size_t>(std::max(lineCount, 0)) + 1, false)
{
}

void LineSet::insert(int line)
{
    if (line < 1)
        return;
    if (static_cast<std::size_t>(line) >= bits.size())
        bits.resize(static_cast<std::size_t>(line) + 1, false);
    bits[static_cast<std::size_t>(line)] = true;
}

void LineSet::insertRange(int first, int last)
{
    for (int line = first; line <= last; ++line)
        insert(line);
}

void LineSet::merge(const LineSet &other)
{
    if (other.bits.size() > bits.size())
        bits.resize(other.bits.size(), false);
    for (std::size_t i = 0; i < other.bits.size(); ++i)
        if (other.bits[i])
            bits[i] = true;
}

bool LineSet::contains(int line) const noexcept
{
    return line >= 1 && static_cast<std::size_t>(line) < bits.size() && bits[static_cast<std::size_t>(line)];
}

bool LineSet::intersects(int first, int last) const noexcept
{
    for (int line = first; line <= last; ++line)
        if (contains(line))
            return true;
    return false;
}

std::size_t LineSet::count() const noexcept
{
    return static_cast<std::size_t>(std::count(bits.begin(), bits.end(), true));
}

// ---------------------------------------------------------------------------
// Scanners

std::vector<CodeBlockMatch> scanCodeBlocks(LineSpan lines, std::size_t documentLength)
{
    std::vector<CodeBlockMatch> blocks;
    std::optional<FenceOpen> open;
    std::size_t openIndex = 0;
    std::vector<std::string> body;

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        std::string_view text = lines[i].text;
        if (!open)
        {
            open = parseFenceOpen(text);
            if (open)
            {
                openIndex = i;
                body.clear();
            }
            continue;
        }

        if (closesFence(text, *open))
        {
            CodeBlockMatch match;
            static_cast<BlockRange &>(match) = rangeFor(lines, openIndex, i, documentLength);
            std::string_view info = open->info;
            match.language = std::string(info.substr(0, info.find_first_of(" \t{")));
            match.code = joinLines(body);
            match.fence = std::string(open->length, open->marker);
            blocks.push_back(std::move(match));
            open.reset();
            continue;
        }
        body.push_back(fenceBodyLine(text, *open));
    }

    if (open)
        PLOG_WARNING << "Unterminated code fence opened on line " << lines[openIndex].number;
    return blocks;
}

std::vector<MathBlockMatch> scanMathBlocks(LineSpan lines, std::size_t documentLength, const LineSet &excluded)
{
    enum class State
    {
        Outside,
        InDollar,
        InBracket,
        InEnvironment
    };

    std::vector<MathBlockMatch> blocks;
    State state = State::Outside;
    std::size_t openIndex = 0;
    std::string environment;
    std::vector<std::string> body;

    auto emit = [&](std::size_t lastIndex, MathDelimiter delimiter, std::string latex) {
        if (!acceptLatex(latex, lines[openIndex].number))
            return;
        MathBlockMatch match;
        static_cast<BlockRange &>(match) = rangeFor(lines, openIndex, lastIndex, documentLength);
        match.latex = trimCopy(latex);
        match.delimiter = delimiter;
        match.environment = delimiter == MathDelimiter::Environment ? environment : std::string();
        blocks.push_back(std::move(match));
    };

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (excluded.contains(lines[i].number))
        {
            if (state != State::Outside)
            {
                PLOG_WARNING << "Math block opened on line " << lines[openIndex].number
                             << " runs into a code block; discarding";
                state = State::Outside;
            }
            continue;
        }

        std::string_view content = trimView(quoteStripped(lines[i].text));
        switch (state)
        {
        case State::Outside:
        {
            openIndex = i;
            body.clear();
            if (startsWith(content, "$$"))
            {
                if (content.size() >= 4 && endsWith(content, "$$"))
                {
                    emit(i, MathDelimiter::InlineDoubleDollar, std::string(content.substr(2, content.size() - 4)));
                    break;
                }
                std::string_view rest = trimView(content.substr(2));
                if (!rest.empty())
                    body.emplace_back(rest);
                state = State::InDollar;
            }
            else if (startsWith(content, "\\["))
            {
                if (content.size() >= 4 && endsWith(content, "\\]"))
                {
                    emit(i, MathDelimiter::Bracket, std::string(content.substr(2, content.size() - 4)));
                    break;
                }
                std::string_view rest = trimView(content.substr(2));
                if (!rest.empty())
                    body.emplace_back(rest);
                state = State::InBracket;
            }
            else
            {
                std::string text(content);
                std::smatch match;
                if (!withinPatternLimit(text) || !std::regex_search(text, match, mathEnvironmentPattern()))
                    break;
                environment = match[1].str();
                body.push_back(text);
                if (text.find("\\end{" + environment + "}") != std::string::npos)
                    emit(i, MathDelimiter::Environment, text);
                else
                    state = State::InEnvironment;
            }
            break;
        }
        case State::InDollar:
            if (endsWith(content, "$$"))
            {
                std::string_view rest = trimView(content.substr(0, content.size() - 2));
                if (!rest.empty())
                    body.emplace_back(rest);
                emit(i, MathDelimiter::DoubleDollar, joinLines(body));
                state = State::Outside;
            }
            else
            {
                body.emplace_back(content);
            }
            break;
        case State::InBracket:
            if (endsWith(content, "\\]"))
            {
                std::string_view rest = trimView(content.substr(0, content.size() - 2));
                if (!rest.empty())
                    body.emplace_back(rest);
                emit(i, MathDelimiter::Bracket, joinLines(body));
                state = State::Outside;
            }
            else
            {
                body.emplace_back(content);
            }
            break;
        case State::InEnvironment:
            body.emplace_back(content);
            if (content.find("\\end{" + environment + "}") != std::string_view::npos)
            {
                emit(i, MathDelimiter::Environment, joinLines(body));
                state = State::Outside;
            }
            break;
        }
    }

    if (state != State::Outside)
        PLOG_WARNING << "Unterminated math block opened on line " << lines[openIndex].number;
    return blocks;
}

std::vector<std::string> splitTableRow(std::string_view row)
{
    std::string_view text = trimView(row);
    std::vector<std::string> cells;
    if (text.find('|') == std::string_view::npos)
        return cells;
    if (!text.empty() && text.front() == '|')
        text.remove_prefix(1);
    if (!text.empty() && text.back() == '|' && (text.size() < 2 || text[text.size() - 2] != '\\'))
        text.remove_suffix(1);

    std::string cell;
    bool escape = false;
    for (char ch : text)
    {
        if (escape)
        {
            if (ch != '|')
                cell.push_back('\\');
            cell.push_back(ch);
            escape = false;
            continue;
        }
        if (ch == '\\')
        {
            escape = true;
            continue;
        }
        if (ch == '|')
        {
            cells.push_back(trimCopy(cell));
            cell.clear();
            continue;
        }
        cell.push_back(ch);
    }
    if (escape)
        cell.push_back('\\');
    cells.push_back(trimCopy(cell));
    return cells;
}

bool isTableSeparatorRow(std::string_view row)
{
    static const std::regex separatorCell(R"(^:?-{3,}:?$)");
    if (!withinPatternLimit(row))
        return false;
    std::vector<std::string> cells = splitTableRow(row);
    if (cells.empty())
        return false;
    return std::all_of(cells.begin(), cells.end(),
                       [](const std::string &cell) { return std::regex_match(cell, separatorCell); });
}

std::vector<TableAlignment> parseAlignmentRow(std::string_view row)
{
    std::vector<TableAlignment> alignments;
    for (const std::string &cell : splitTableRow(row))
    {
        bool left = !cell.empty() && cell.front() == ':';
        bool right = !cell.empty() && cell.back() == ':';
        if (left && right)
            alignments.push_back(TableAlignment::Center);
        else if (left)
            alignments.push_back(TableAlignment::Left);
        else if (right)
            alignments.push_back(TableAlignment::Right);
        else
            alignments.push_back(TableAlignment::Default);
    }
    return alignments;
}

std::vector<TableMatch> scanTables(LineSpan lines, std::size_t documentLength, const LineSet &excluded)
{
    std::vector<TableMatch> tables;
    std::size_t i = 0;
    while (i + 1 < lines.size())
    {
        if (excluded.contains(lines[i].number) || excluded.contains(lines[i + 1].number))
        {
            ++i;
            continue;
        }

        LinePrefix headerPrefix = stripLinePrefix(lines[i].text, false);
        std::string_view header = trimView(lines[i].text.substr(headerPrefix.contentOffset));
        std::string_view separator = trimView(quoteStripped(lines[i + 1].text));
        if (header.find('|') == std::string_view::npos || !isTableSeparatorRow(separator))
        {
            ++i;
            continue;
        }

        std::vector<std::string> headerCells = splitTableRow(header);
        std::vector<TableAlignment> alignments = parseAlignmentRow(separator);
        if (headerCells.size() != alignments.size())
        {
            ++i;
            continue;
        }

        TableMatch table;
        table.rows.push_back(std::move(headerCells));
        table.alignments = std::move(alignments);
        table.hasHeader = true;

        std::size_t last = i + 1;
        for (std::size_t row = i + 2; row < lines.size(); ++row)
        {
            if (excluded.contains(lines[row].number))
                break;
            LinePrefix prefix = stripLinePrefix(lines[row].text, false);
            if (prefix.quoteDepth != headerPrefix.quoteDepth)
                break;
            std::string_view content = trimView(lines[row].text.substr(prefix.contentOffset));
            if (content.empty() || content.find('|') == std::string_view::npos)
                break;
            table.rows.push_back(splitTableRow(content));
            last = row;
        }

        static_cast<BlockRange &>(table) = rangeFor(lines, i, last, documentLength);
        tables.push_back(std::move(table));
        i = last + 1;
    }
    return tables;
}

std::vector<CalloutMatch> scanCallouts(LineSpan lines, std::size_t documentLength, const LineSet &excluded)
{
    static const std::regex header(R"(^\[!(\w+)\]([-+])?\s*(.*)$)");

    std::vector<CalloutMatch> callouts;
    std::size_t i = 0;
    while (i < lines.size())
    {
        if (excluded.contains(lines[i].number))
        {
            ++i;
            continue;
        }
        LinePrefix prefix = stripLinePrefix(lines[i].text, false);
        if (prefix.quoteDepth == 0)
        {
            ++i;
            continue;
        }
        std::string content = trimCopy(lines[i].text.substr(prefix.contentOffset));
        std::smatch match;
        if (!withinPatternLimit(content) || !std::regex_match(content, match, header))
        {
            ++i;
            continue;
        }

        CalloutMatch callout;
        callout.type = toLower(match[1].str());
        if (match[2].matched)
            callout.fold = match[2].str() == "-" ? CalloutFold::Collapsed : CalloutFold::Expanded;
        callout.title = trimCopy(match[3].str());

        std::vector<std::string> body;
        std::size_t last = i;
        for (std::size_t row = i + 1; row < lines.size(); ++row)
        {
            if (excluded.contains(lines[row].number))
                break;
            std::string_view text = lines[row].text;
            std::string_view lead = trimView(text);
            if (lead.empty() || lead.front() != '>')
                break;
            // Only the first quotation level belongs to the callout.
            std::size_t marker = text.find('>');
            std::size_t start = marker + 1;
            if (start < text.size() && (text[start] == ' ' || text[start] == '\t'))
                ++start;
            std::string_view line = text.substr(start);
            if (!isBlank(line))
                body.push_back(trimCopy(line));
            last = row;
        }

        callout.body = joinLines(body);
        static_cast<BlockRange &>(callout) = rangeFor(lines, i, last, documentLength);
        callouts.push_back(std::move(callout));
        i = last + 1;
    }
    return callouts;
}

std::vector<DetailsMatch> scanDetails(LineSpan lines, std::size_t documentLength, const LineSet &excluded)
{
    std::vector<DetailsMatch> blocks;
    std::size_t i = 0;
    while (i < lines.size())
    {
        std::string first(quoteStripped(lines[i].text));
        std::smatch openMatch;
        if (excluded.contains(lines[i].number) || !withinPatternLimit(first) ||
            !std::regex_search(first, openMatch, detailsOpenPattern()))
        {
            ++i;
            continue;
        }

        // Tags inside code and math blocks are content, not nesting.
        int depth = 0;
        std::optional<std::size_t> closeIndex;
        for (std::size_t row = i; row < lines.size(); ++row)
        {
            if (excluded.contains(lines[row].number))
                continue;
            depth += detailsDepthChange(std::string(lines[row].text));
            if (depth <= 0)
            {
                closeIndex = row;
                break;
            }
        }

        if (!closeIndex)
        {
            PLOG_WARNING << "Unterminated <details> block opened on line " << lines[i].number;
            ++i;
            continue;
        }

        DetailsMatch block;
        block.open = openMatch[1].matched;
        std::vector<std::string> body;
        for (std::size_t row = i; row <= *closeIndex; ++row)
        {
            std::string text(quoteStripped(lines[row].text));
            std::smatch summary;
            if (block.summary.empty() && !excluded.contains(lines[row].number) && withinPatternLimit(text) &&
                std::regex_search(text, summary, summaryPattern()))
            {
                block.summary = trimCopy(summary[1].str());
                text = summary.prefix().str() + summary.suffix().str();
            }
            if (row == i)
                text = std::regex_replace(text, detailsOpenPattern(), "");
            if (row == *closeIndex)
            {
                std::size_t close = toLower(text).rfind("</details>");
                if (close != std::string::npos)
                    text.erase(close, 10);
            }
            if (isBlank(text) || isDetailsMarkupOnly(text))
                continue;
            body.push_back(trimCopy(text));
        }
        block.body = joinLines(body);
        static_cast<BlockRange &>(block) = rangeFor(lines, i, *closeIndex, documentLength);
        blocks.push_back(std::move(block));
        i = *closeIndex + 1;
    }
    return blocks;
}

std::vector<FootnoteDefinitionMatch> scanFootnoteDefinitions(LineSpan lines, std::size_t documentLength,
                                                             const LineSet &excluded)
{
    static const std::regex header(R"(^ {0,3}\[\^([^\]\s]+)\]:\s?(.*)$)");

    auto isContinuation = [](std::string_view text) {
        return startsWith(text, "    ") || startsWith(text, "\t");
    };

    std::vector<FootnoteDefinitionMatch> footnotes;
    std::size_t i = 0;
    while (i < lines.size())
    {
        LinePrefix prefix = stripLinePrefix(lines[i].text, false);
        std::string text(lines[i].text.substr(prefix.contentOffset));
        std::smatch match;
        if (excluded.contains(lines[i].number) || !withinPatternLimit(text) || !std::regex_match(text, match, header))
        {
            ++i;
            continue;
        }

        // Continuation lines share the quotation depth of the definition.
        auto continuationText = [&](std::size_t row) -> std::optional<std::string_view> {
            std::string_view raw = lines[row].text;
            LinePrefix rowPrefix = stripLinePrefix(raw, false);
            if (rowPrefix.quoteDepth != prefix.quoteDepth)
                return std::nullopt;
            return raw.substr(rowPrefix.contentOffset);
        };

        FootnoteDefinitionMatch footnote;
        footnote.identifier = match[1].str();
        std::vector<std::string> body;
        std::string firstLine = trimCopy(match[2].str());
        if (!firstLine.empty())
            body.push_back(std::move(firstLine));

        std::size_t last = i;
        std::size_t row = i + 1;
        while (row < lines.size() && !excluded.contains(lines[row].number))
        {
            std::optional<std::string_view> next = continuationText(row);
            if (!next)
                break;
            if (isContinuation(*next) && !isBlank(*next))
            {
                body.push_back(trimCopy(*next));
                last = row;
                ++row;
                continue;
            }
            // A blank line only belongs to the footnote when indented text follows it.
            std::optional<std::string_view> following =
                row + 1 < lines.size() && !excluded.contains(lines[row + 1].number) ? continuationText(row + 1)
                                                                                    : std::nullopt;
            if (isBlank(*next) && following && isContinuation(*following) && !isBlank(*following))
            {
                body.emplace_back();
                ++row;
                continue;
            }
            break;
        }

        footnote.body = joinLines(body);
        static_cast<BlockRange &>(footnote) = rangeFor(lines, i, last, documentLength);
        footnotes.push_back(std::move(footnote));
        i = last + 1;
    }
    return footnotes;
}

std::vector<ReferenceDefinitionMatch> scanReferenceDefinitions(LineSpan lines, std::size_t documentLength,
                                                               const LineSet &excluded)
{
    static const std::regex definition(
        R"re(^ {0,3}\[([^\]]+)\]:\s*(<[^>]*>|\S+)(?:\s+(?:"([^"]*)"|'([^']*)'|\(([^)]*)\)))?\s*$)re");

    std::vector<ReferenceDefinitionMatch> definitions;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (excluded.contains(lines[i].number))
            continue;
        std::string text(quoteStripped(lines[i].text));
        std::smatch match;
        if (!withinPatternLimit(text) || !std::regex_match(text, match, definition))
            continue;
        std::string label = match[1].str();
        if (!label.empty() && label.front() == '^')
            continue;

        ReferenceDefinitionMatch reference;
        reference.label = trimCopy(label);
        std::string url = match[2].str();
        if (url.size() >= 2 && url.front() == '<' && url.back() == '>')
            url = url.substr(1, url.size() - 2);
        reference.url = std::move(url);
        for (int group = 3; group <= 5; ++group)
        {
            if (match[group].matched)
            {
                reference.title = match[group].str();
                break;
            }
        }
        static_cast<BlockRange &>(reference) = rangeFor(lines, i, i, documentLength);
        definitions.push_back(std::move(reference));
    }
    return definitions;
}

// ---------------------------------------------------------------------------
// BlockScanResult / BlockScanner

std::vector<Element> BlockScanResult::toElements() const
{
    std::vector<Element> elements;
    auto base = [](ElementKind kind, const BlockRange &range, std::string content) {
        Element element;
        element.kind = kind;
        element.from = range.from;
        element.to = range.to;
        element.lineNumber = range.startLine;
        if (range.endLine > range.startLine)
        {
            element.startLine = range.startLine;
            element.endLine = range.endLine;
        }
        element.content = std::move(content);
        return element;
    };

    for (const auto &block : codeBlocks)
    {
        Element element = base(ElementKind::CodeBlock, block, block.code);
        element.payload = CodeBlockData{block.language, block.code, block.fence};
        elements.push_back(std::move(element));
    }
    for (const auto &block : mathBlocks)
    {
        Element element = base(ElementKind::MathBlock, block, block.latex);
        element.payload = MathBlockData{block.latex, block.delimiter, block.environment};
        elements.push_back(std::move(element));
    }
    for (const auto &table : tables)
    {
        std::string content;
        if (!table.rows.empty())
            content = joinLines(table.rows.front());
        Element element = base(ElementKind::Table, table, std::move(content));
        element.payload = TableData{table.rows, table.alignments, table.hasHeader};
        elements.push_back(std::move(element));
    }
    for (const auto &callout : callouts)
    {
        Element element = base(ElementKind::Callout, callout, callout.body);
        element.payload = CalloutData{callout.type, callout.title, callout.body, callout.fold};
        elements.push_back(std::move(element));
    }
    for (const auto &block : details)
    {
        Element element = base(ElementKind::Details, block, block.body);
        element.payload = DetailsData{block.summary, block.body, block.open};
        elements.push_back(std::move(element));
    }
    for (const auto &footnote : footnotes)
    {
        Element element = base(ElementKind::FootnoteDefinition, footnote, footnote.body);
        element.payload = FootnoteDefinitionData{footnote.identifier, footnote.body};
        elements.push_back(std::move(element));
    }
    for (const auto &reference : referenceDefinitions)
    {
        Element element = base(ElementKind::LinkReference, reference, reference.label);
        element.payload = LinkReferenceData{reference.label, reference.url, reference.title};
        elements.push_back(std::move(element));
    }

    std::stable_sort(elements.begin(), elements.end(), [](const Element &a, const Element &b) {
        if (a.from != b.from)
            return a.from < b.from;
        return priorityRank(a.kind) < priorityRank(b.kind);
    });
    return elements;
}

BlockScanResult BlockScanner::scan(const DocumentSnapshot &snapshot) const
{
    const LineSpan lines(snapshot.lines());
    const std::size_t length = snapshot.length();

    BlockScanResult result;
    result.occupied = LineSet(snapshot.lineCount());

    result.codeBlocks = scanCodeBlocks(lines, length);
    LineSet codeLines(snapshot.lineCount());
    for (const auto &block : result.codeBlocks)
        codeLines.insertRange(block.startLine, block.endLine);

    result.mathBlocks = scanMathBlocks(lines, length, codeLines);
    LineSet codeAndMath = codeLines;
    for (const auto &block : result.mathBlocks)
        codeAndMath.insertRange(block.startLine, block.endLine);

    result.tables = scanTables(lines, length, codeAndMath);
    result.callouts = scanCallouts(lines, length, codeAndMath);
    result.details = scanDetails(lines, length, codeAndMath);
    result.footnotes = scanFootnoteDefinitions(lines, length, codeAndMath);
    result.referenceDefinitions = scanReferenceDefinitions(lines, length, codeAndMath);

    for (const auto &reference : result.referenceDefinitions)
    {
        if (!result.references.define(reference.label, reference.url, reference.title))
            PLOGD << "Duplicate link reference definition [" << reference.label << "] on line "
                  << reference.startLine;
    }

    result.occupied.merge(codeAndMath);
    auto occupy = [&](const auto &records) {
        for (const auto &record : records)
            result.occupied.insertRange(record.startLine, record.endLine);
    };
    occupy(result.tables);
    occupy(result.callouts);
    occupy(result.details);
    occupy(result.footnotes);
    occupy(result.referenceDefinitions);
    return result;
}

} // namespace mdlive::preview
