#include <gtest/gtest.h>

#include "mdlive/preview/pattern.hpp"

#include <string>
#include <vector>

using namespace mdlive::preview;

TEST(PatternMatcher, FindsEveryMatchInOrder)
{
    PatternMatcher matcher("a+");
    auto sequence = matcher.matches("aa b aaa");

    std::vector<std::size_t> positions;
    std::vector<std::string> texts;
    while (auto match = sequence.next())
    {
        positions.push_back(match->position());
        texts.push_back(match->str());
    }
    EXPECT_EQ(positions, (std::vector<std::size_t>{0, 5}));
    EXPECT_EQ(texts, (std::vector<std::string>{"aa", "aaa"}));
}

TEST(PatternMatcher, RejectRetriesOneByteAfterStart)
{
    PatternMatcher matcher("ab|b");
    auto sequence = matcher.matches("ab");

    auto first = sequence.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->str(), "ab");
    sequence.reject();

    auto second = sequence.next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->position(), 1u);
    EXPECT_EQ(second->str(), "b");
    EXPECT_FALSE(sequence.next().has_value());
}

TEST(PatternMatcher, UnmatchedGroupHasNoPosition)
{
    PatternMatcher matcher("(x)?(y)");
    auto sequence = matcher.matches("zy");
    auto match = sequence.next();
    ASSERT_TRUE(match.has_value());
    EXPECT_FALSE(match->matched(1));
    EXPECT_EQ(match->groupPosition(1), std::string::npos);
    EXPECT_TRUE(match->group(1).empty());
    EXPECT_EQ(match->groupPosition(2), 1u);
    EXPECT_EQ(match->end(), 2u);
}

TEST(PatternMatcher, SequencesAreIndependent)
{
    PatternMatcher matcher("[0-9]+");
    auto first = matcher.matches("1 22 333");
    auto second = matcher.matches("1 22 333");

    ASSERT_TRUE(first.next().has_value());
    ASSERT_TRUE(first.next().has_value());

    auto fromStart = second.next();
    ASSERT_TRUE(fromStart.has_value());
    EXPECT_EQ(fromStart->str(), "1");

    auto third = first.next();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->str(), "333");
}

TEST(PatternMatcher, WordBoundaryRespectsPrecedingText)
{
    PatternMatcher matcher(R"(\bcat)");
    auto sequence = matcher.matches("concat cat");
    auto match = sequence.next();
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->position(), 7u);
}

TEST(PatternMatcher, OverlongTextNeverMatches)
{
    PatternMatcher matcher("x");
    std::string text(kMaxPatternInput, 'a');
    text.push_back('x');
    auto sequence = matcher.matches(text);
    EXPECT_FALSE(sequence.next().has_value());

    text.erase(0, 1);
    auto bounded = matcher.matches(text);
    auto match = bounded.next();
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->position(), kMaxPatternInput - 1);
}
