#include "mdlive/preview/line_prefix.hpp"

#include <cctype>

namespace mdlive::preview
{
namespace
{
bool isSpace(char ch) noexcept
{
    return ch == ' ' || ch == '\t';
}

bool isDigit(char ch) noexcept
{
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

std::size_t skipSpaces(std::string_view line, std::size_t pos) noexcept
{
    while (pos < line.size() && isSpace(line[pos]))
        ++pos;
    return pos;
}

std::optional<ListMarker> parseListMarker(std::string_view line, std::size_t start)
{
    std::size_t pos = skipSpaces(line, start);
    if (pos >= line.size())
        return std::nullopt;

    ListMarker marker;
    marker.indent = pos - start;
    marker.from = pos;

    char ch = line[pos];
    if (ch == '-' || ch == '*' || ch == '+')
    {
        if (pos + 1 >= line.size() || !isSpace(line[pos + 1]))
            return std::nullopt;
        marker.type = ListType::Bullet;
        marker.marker = std::string(1, ch);
        pos = skipSpaces(line, pos + 1);

        // "[ ]", "[x]" or "[X]" followed by whitespace turns the item into a task.
        if (pos + 2 < line.size() && line[pos] == '[' && line[pos + 2] == ']' &&
            (line[pos + 1] == ' ' || line[pos + 1] == 'x' || line[pos + 1] == 'X') &&
            (pos + 3 == line.size() || isSpace(line[pos + 3])))
        {
            marker.type = ListType::Task;
            marker.checked = line[pos + 1] != ' ';
            pos = skipSpaces(line, pos + 3);
        }
        marker.to = pos;
        return marker;
    }

    if (isDigit(ch))
    {
        std::size_t end = pos;
        while (end < line.size() && isDigit(line[end]) && end - pos < 9)
            ++end;
        if (end >= line.size() || (line[end] != '.' && line[end] != ')'))
            return std::nullopt;
        if (end + 1 >= line.size() || !isSpace(line[end + 1]))
            return std::nullopt;
        marker.type = ListType::Numbered;
        marker.marker = std::string(line.substr(pos, end + 1 - pos));
        marker.to = skipSpaces(line, end + 1);
        return marker;
    }

    return std::nullopt;
}

} // namespace

LinePrefix stripLinePrefix(std::string_view line, bool includeList)
{
    LinePrefix prefix;
    std::size_t pos = 0;
    while (true)
    {
        std::size_t probe = pos;
        while (probe < line.size() && probe - pos < 3 && line[probe] == ' ')
            ++probe;
        if (probe >= line.size() || line[probe] != '>')
            break;
        if (prefix.quoteDepth == 0)
            prefix.quoteFrom = probe;
        ++prefix.quoteDepth;
        pos = probe + 1;
        if (pos < line.size() && isSpace(line[pos]))
            ++pos;
        prefix.quoteTo = pos;
    }

    prefix.contentOffset = pos;
    if (includeList)
    {
        prefix.list = parseListMarker(line, pos);
        if (prefix.list)
            prefix.contentOffset = prefix.list->to;
    }
    return prefix;
}

std::string_view prefixedContent(std::string_view line, bool includeList)
{
    LinePrefix prefix = stripLinePrefix(line, includeList);
    return trimView(line.substr(prefix.contentOffset));
}

std::string_view trimView(std::string_view text) noexcept
{
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    return text.substr(begin, end - begin);
}

std::string trimCopy(std::string_view text)
{
    return std::string(trimView(text));
}

std::string toLower(std::string_view text)
{
    std::string result(text.begin(), text.end());
    for (char &ch : result)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return result;
}

bool isBlank(std::string_view text) noexcept
{
    return trimView(text).empty();
}

} // namespace mdlive::preview
