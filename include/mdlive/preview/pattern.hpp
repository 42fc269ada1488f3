#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace mdlive::preview
{

// std::regex recurses once per input character. Longer texts never match.
inline constexpr std::size_t kMaxPatternInput = 8192;

inline bool withinPatternLimit(std::string_view text) noexcept
{
    return text.size() <= kMaxPatternInput;
}

class PatternMatch
{
public:
    PatternMatch(std::cmatch result, const char *base);

    std::size_t position() const noexcept { return start; }
    std::size_t length() const noexcept { return size; }
    std::size_t end() const noexcept { return start + size; }

    bool matched(std::size_t group) const;
    std::string_view group(std::size_t group) const;
    std::string str(std::size_t group = 0) const { return std::string(this->group(group)); }
    // Offset of a group within the scanned text; npos when it did not participate.
    std::size_t groupPosition(std::size_t group) const;

private:
    std::cmatch result;
    const char *base = nullptr;
    std::size_t start = 0;
    std::size_t size = 0;
};

// One pass over a text. Every call to next() searches from where the previous
// candidate left off: after its end by default, or one byte after its start
// when the caller rejected it. A text longer than kMaxPatternInput yields no
// matches.
class MatchSequence
{
public:
    MatchSequence(const std::regex &pattern, std::string_view text);

    std::optional<PatternMatch> next();
    void reject() noexcept { retryAfterStart = true; }

private:
    const std::regex *pattern = nullptr;
    std::string_view text;
    std::size_t cursor = 0;
    std::size_t lastStart = 0;
    bool started = false;
    bool retryAfterStart = false;
};

// A compiled pattern. Holds no search position; matches() hands out an
// independent sequence for each scan.
class PatternMatcher
{
public:
    explicit PatternMatcher(const std::string &expression,
                            std::regex::flag_type flags = std::regex::ECMAScript);

    MatchSequence matches(std::string_view text) const { return MatchSequence(pattern, text); }

private:
    std::regex pattern;
};

} // namespace mdlive::preview
