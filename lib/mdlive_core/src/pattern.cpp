#include "mdlive/preview/pattern.hpp"

namespace mdlive::preview
{

PatternMatch::PatternMatch(std::cmatch match, const char *text)
    : result(std::move(match)), base(text)
{
    start = static_cast<std::size_t>(result[0].first - base);
    size = static_cast<std::size_t>(result[0].length());
}

bool PatternMatch::matched(std::size_t index) const
{
    return index < result.size() && result[index].matched;
}

std::string_view PatternMatch::group(std::size_t index) const
{
    if (!matched(index))
        return {};
    return std::string_view(result[index].first, static_cast<std::size_t>(result[index].length()));
}

std::size_t PatternMatch::groupPosition(std::size_t index) const
{
    if (!matched(index))
        return std::string_view::npos;
    return static_cast<std::size_t>(result[index].first - base);
}

MatchSequence::MatchSequence(const std::regex &regex, std::string_view input)
    : pattern(&regex), text(input)
{
}

std::optional<PatternMatch> MatchSequence::next()
{
    if (started && retryAfterStart)
        cursor = lastStart + 1;
    retryAfterStart = false;
    if (cursor > text.size() || !withinPatternLimit(text))
        return std::nullopt;

    const char *begin = text.data();
    const char *end = begin + text.size();
    auto flags = cursor > 0 ? std::regex_constants::match_prev_avail : std::regex_constants::match_default;

    std::cmatch result;
    if (!std::regex_search(begin + cursor, end, result, *pattern, flags))
    {
        cursor = text.size() + 1;
        return std::nullopt;
    }

    PatternMatch match(std::move(result), begin);
    started = true;
    lastStart = match.position();
    cursor = match.length() > 0 ? match.end() : match.position() + 1;
    return match;
}

PatternMatcher::PatternMatcher(const std::string &expression, std::regex::flag_type flags)
    : pattern(expression, flags)
{
}

} // namespace mdlive::preview
