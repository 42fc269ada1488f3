#pragma once

#include "mdlive/preview/live_preview_engine.hpp"
#include "mdlive/view/terminal_renderer.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mdlive::view
{

// Returns nullopt and logs when the file cannot be read.
std::optional<std::string> readTextFile(const std::filesystem::path &path);

// One open document with a caret, its engine and its rendered rows. Holds no
// terminal state so hosts other than the tvision window can drive it.
class PreviewSession
{
public:
    explicit PreviewSession(preview::EngineOptions options = {}, int width = 80);

    bool load(const std::filesystem::path &path);
    bool reload();
    void setText(std::string text);

    const std::filesystem::path &path() const noexcept { return filePath; }
    const preview::SnapshotPtr &snapshot() const noexcept { return document; }

    std::size_t caret() const noexcept { return caretOffset; }
    void setCaret(std::size_t offset) noexcept;
    void moveLines(int delta);
    void moveColumns(int delta);
    void moveToLineStart();
    void moveToLineEnd();
    int caretLine() const;
    int caretColumn() const;

    // Rebuilds decorations for the current caret and re-renders.
    const std::vector<RenderedLine> &refresh(std::optional<preview::Viewport> viewport = std::nullopt);
    const std::vector<RenderedLine> &lines() const noexcept { return rows; }
    const preview::DecorationSet &decorations() const noexcept { return decorationSet; }

    // Row that shows the caret's source line, or the closest row before it.
    std::size_t caretRow() const noexcept;

    preview::LivePreviewEngine &engine() noexcept { return previewEngine; }
    TerminalRenderer &renderer() noexcept { return terminal; }

private:
    std::filesystem::path filePath;
    preview::SnapshotPtr document;
    preview::LivePreviewEngine previewEngine;
    TerminalRenderer terminal;
    preview::DecorationSet decorationSet;
    std::vector<RenderedLine> rows;
    std::size_t caretOffset = 0;
    std::size_t desiredColumn = 0;
};

} // namespace mdlive::view
