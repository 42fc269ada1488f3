#pragma once

#include "mdlive/view/preview_session.hpp"

#define Uses_TWindow
#define Uses_TScroller
#define Uses_TScrollBar
#define Uses_TRect
#define Uses_TEvent
#define Uses_TKeys
#define Uses_TDrawBuffer
#define Uses_TMenuBar
#define Uses_TMenuItem
#define Uses_TSubMenu
#define Uses_TStatusLine
#define Uses_TStatusItem
#define Uses_TStatusDef
#define Uses_TDeskTop
#define Uses_TFileDialog
#define Uses_TApplication
#define Uses_TProgram
#define Uses_MsgBox
#include <tvision/tv.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mdlive::view
{

inline constexpr std::string_view kAppName = "mdlive-view";
inline constexpr std::string_view kAppShortDescription = "Live Markdown preview for the terminal";

inline constexpr ushort cmReloadDocument = 3000;
inline constexpr ushort cmAboutViewer = 3001;

class PreviewView : public TScroller
{
public:
    PreviewView(const TRect &bounds, TScrollBar *vScrollBar, std::unique_ptr<PreviewSession> session) noexcept;

    virtual void draw() override;
    virtual void handleEvent(TEvent &event) override;
    virtual void changeBounds(const TRect &bounds) override;

    PreviewSession &session() noexcept { return *model; }
    void refresh();

private:
    TColorAttr roleColor(TextRole role, TColorAttr base) const;
    void scrollToCaret();

    std::unique_ptr<PreviewSession> model;
};

class PreviewWindow : public TWindow
{
public:
    PreviewWindow(const TRect &bounds, const std::string &fileName, const preview::EngineOptions &options);

    virtual void handleEvent(TEvent &event) override;

    bool loaded() const noexcept { return documentLoaded; }
    PreviewView *view() noexcept { return previewView; }

private:
    PreviewView *previewView = nullptr;
    bool documentLoaded = false;
};

class PreviewApp : public TApplication
{
public:
    PreviewApp(const std::vector<std::string> &files, const preview::EngineOptions &options);

    virtual void handleEvent(TEvent &event) override;

    static TMenuBar *initMenuBar(TRect r);
    static TStatusLine *initStatusLine(TRect r);

private:
    void openDocument(const char *fileName);
    void fileOpen();
    void reloadCurrent();
    void showAbout();

    preview::EngineOptions engineOptions;
};

} // namespace mdlive::view
