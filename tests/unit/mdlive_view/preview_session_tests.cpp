#include <gtest/gtest.h>

#include "mdlive/view/preview_session.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using mdlive::view::PreviewSession;

namespace
{

std::filesystem::path makeTempDocument(const std::string &text)
{
    auto path = std::filesystem::temp_directory_path() /
                ("mdlive_session_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".md");
    std::ofstream out(path, std::ios::binary);
    out << text;
    return path;
}

} // namespace

TEST(PreviewSession, CaretLineIsShownAsSource)
{
    PreviewSession session;
    session.setText("# Title\nbody **b**");
    session.refresh();

    ASSERT_EQ(session.lines().size(), 2u);
    EXPECT_EQ(session.lines()[0].text, "# Title");
    EXPECT_EQ(session.lines()[1].text, "body b");
    EXPECT_EQ(session.caretRow(), 0u);

    session.moveLines(1);
    EXPECT_EQ(session.caret(), 8u);
    EXPECT_EQ(session.caretLine(), 2);
    EXPECT_EQ(session.caretColumn(), 1);

    session.refresh();
    EXPECT_EQ(session.lines()[0].text, "Title");
    EXPECT_EQ(session.caretRow(), 1u);
}

TEST(PreviewSession, VerticalMovesKeepDesiredColumn)
{
    PreviewSession session;
    session.setText("abcdef\nab\nabcdef");
    session.setCaret(5);

    session.moveLines(1);
    EXPECT_EQ(session.caret(), 9u);
    session.moveLines(1);
    EXPECT_EQ(session.caret(), 15u);
    EXPECT_EQ(session.caretColumn(), 6);

    session.moveLines(10);
    EXPECT_EQ(session.caretLine(), 3);
    session.moveLines(-10);
    EXPECT_EQ(session.caret(), 5u);
}

TEST(PreviewSession, HorizontalMovesClampToDocument)
{
    PreviewSession session;
    session.setText("abcdef\nxyz");
    session.moveColumns(-100);
    EXPECT_EQ(session.caret(), 0u);

    session.moveToLineEnd();
    EXPECT_EQ(session.caret(), 6u);
    session.moveColumns(2);
    EXPECT_EQ(session.caret(), 8u);
    session.moveToLineStart();
    EXPECT_EQ(session.caret(), 7u);

    session.moveColumns(1000);
    EXPECT_EQ(session.caret(), session.snapshot()->length());
    session.setCaret(1000);
    EXPECT_EQ(session.caret(), 10u);
}

TEST(PreviewSession, CaretRowSkipsBlockWidgetRows)
{
    PreviewSession session;
    session.setText("```\ncode\n```\nafter");
    session.setCaret(13);
    session.refresh();

    ASSERT_EQ(session.lines().size(), 2u);
    EXPECT_TRUE(session.lines()[0].widget);
    EXPECT_EQ(session.caretRow(), 1u);

    session.setCaret(5);
    session.refresh();
    EXPECT_EQ(session.lines().size(), 4u);
    EXPECT_EQ(session.caretRow(), 1u);
}

TEST(PreviewSession, LoadAndReloadFromDisk)
{
    auto path = makeTempDocument("one\ntwo");

    PreviewSession session;
    ASSERT_TRUE(session.load(path));
    EXPECT_EQ(session.path(), path);
    EXPECT_EQ(session.snapshot()->lineCount(), 2);

    session.setCaret(5);
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "one\ntwo\nthree";
    }
    ASSERT_TRUE(session.reload());
    EXPECT_EQ(session.snapshot()->lineCount(), 3);
    EXPECT_EQ(session.caret(), 5u);

    std::error_code ec;
    std::filesystem::remove(path, ec);
    EXPECT_FALSE(session.reload());
}

TEST(PreviewSession, MissingFileIsReported)
{
    PreviewSession session;
    EXPECT_FALSE(session.load("/nonexistent/mdlive/missing.md"));
    EXPECT_TRUE(session.path().empty());
    EXPECT_FALSE(session.reload());
    EXPECT_FALSE(mdlive::view::readTextFile("/nonexistent/mdlive/missing.md").has_value());
}
