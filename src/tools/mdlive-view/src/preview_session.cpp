#include "mdlive/view/preview_session.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace mdlive::view
{

std::optional<std::string> readTextFile(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        PLOG_ERROR << "Cannot open " << path.string();
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad())
    {
        PLOG_ERROR << "Failed reading " << path.string();
        return std::nullopt;
    }
    return buffer.str();
}

PreviewSession::PreviewSession(preview::EngineOptions options, int width)
    : document(preview::DocumentSnapshot::create(std::string())), previewEngine(options), terminal(width)
{
}

bool PreviewSession::load(const std::filesystem::path &path)
{
    std::optional<std::string> text = readTextFile(path);
    if (!text)
        return false;
    filePath = path;
    setText(std::move(*text));
    PLOG_INFO << "Loaded " << path.string() << " (" << document->lineCount() << " lines)";
    return true;
}

bool PreviewSession::reload()
{
    if (filePath.empty())
        return false;
    std::optional<std::string> text = readTextFile(filePath);
    if (!text)
        return false;
    std::size_t keep = caretOffset;
    setText(std::move(*text));
    setCaret(keep);
    return true;
}

void PreviewSession::setText(std::string text)
{
    document = preview::DocumentSnapshot::create(std::move(text));
    caretOffset = 0;
    desiredColumn = 0;
}

void PreviewSession::setCaret(std::size_t offset) noexcept
{
    caretOffset = std::min(offset, document->length());
    desiredColumn = caretOffset - document->lineAt(caretOffset).from;
}

void PreviewSession::moveLines(int delta)
{
    const preview::DocumentLine &current = document->lineAt(caretOffset);
    int target = std::clamp(current.number + delta, 1, document->lineCount());
    const preview::DocumentLine &line = document->line(target);
    caretOffset = line.from + std::min(desiredColumn, line.to - line.from);
}

void PreviewSession::moveColumns(int delta)
{
    if (delta < 0)
    {
        std::size_t back = static_cast<std::size_t>(-delta);
        setCaret(caretOffset > back ? caretOffset - back : 0);
    }
    else
    {
        setCaret(caretOffset + static_cast<std::size_t>(delta));
    }
}

void PreviewSession::moveToLineStart()
{
    setCaret(document->lineAt(caretOffset).from);
}

void PreviewSession::moveToLineEnd()
{
    setCaret(document->lineAt(caretOffset).to);
}

int PreviewSession::caretLine() const
{
    return document->lineAt(caretOffset).number;
}

int PreviewSession::caretColumn() const
{
    return static_cast<int>(caretOffset - document->lineAt(caretOffset).from) + 1;
}

const std::vector<RenderedLine> &PreviewSession::refresh(std::optional<preview::Viewport> viewport)
{
    preview::SelectionState selection(caretOffset);
    decorationSet = previewEngine.decorations(document, selection.oracle(), viewport);
    rows = terminal.render(*document, decorationSet);
    return rows;
}

std::size_t PreviewSession::caretRow() const noexcept
{
    const int line = document->lineAt(caretOffset).number;
    std::size_t best = 0;
    for (std::size_t i = 0; i < rows.size(); ++i)
    {
        if (rows[i].sourceLine > line)
            break;
        if (rows[i].sourceLine == line && !rows[i].widget)
            return i;
        if (rows[i].sourceLine <= line)
            best = i;
    }
    return best;
}

} // namespace mdlive::view
