#include "mdlive/view/preview_window.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <filesystem>

namespace mdlive::view
{

PreviewView::PreviewView(const TRect &bounds, TScrollBar *vScrollBar, std::unique_ptr<PreviewSession> session) noexcept
    : TScroller(bounds, nullptr, vScrollBar), model(std::move(session))
{
    growMode = gfGrowHiX | gfGrowHiY;
    options |= ofSelectable;
    showCursor();
}

TColorAttr PreviewView::roleColor(TextRole role, TColorAttr base) const
{
    TColorAttr attr = base;
    auto addStyle = [&attr](ushort style)
    {
        setStyle(attr, getStyle(attr) | style);
    };

    switch (role)
    {
    case TextRole::Plain:
        break;
    case TextRole::Heading:
        addStyle(slBold);
        setFore(attr, TColorBIOS(0x0E));
        break;
    case TextRole::Strong:
        addStyle(slBold);
        break;
    case TextRole::Emphasis:
        addStyle(slItalic);
        break;
    case TextRole::StrongEmphasis:
        addStyle(slBold | slItalic);
        break;
    case TextRole::Strikethrough:
        addStyle(slStrike);
        break;
    case TextRole::Highlight:
        setFore(attr, TColorBIOS(0x00));
        setBack(attr, TColorBIOS(0x0E));
        break;
    case TextRole::Code:
        setFore(attr, TColorBIOS(0x0A));
        break;
    case TextRole::Math:
    case TextRole::Image:
        setFore(attr, TColorBIOS(0x0D));
        break;
    case TextRole::Link:
        addStyle(slUnderline);
        setFore(attr, TColorBIOS(0x0B));
        break;
    case TextRole::Tag:
        setFore(attr, TColorBIOS(0x03));
        break;
    case TextRole::Quote:
        addStyle(slItalic);
        break;
    case TextRole::ListMarker:
        setFore(attr, TColorBIOS(0x0E));
        break;
    case TextRole::Rule:
    case TextRole::Widget:
        setFore(attr, TColorBIOS(0x08));
        break;
    case TextRole::Source:
        setFore(attr, TColorBIOS(0x07));
        break;
    }
    return attr;
}

void PreviewView::draw()
{
    const auto &rows = model->lines();
    const std::size_t caretRow = model->caretRow();
    const TColorAttr normal = getColor(1);
    const TColorAttr active = getColor(2);

    TDrawBuffer buffer;
    for (short y = 0; y < size.y; ++y)
    {
        const std::size_t index = static_cast<std::size_t>(delta.y) + static_cast<std::size_t>(y);
        const TColorAttr rowAttr = index == caretRow ? active : normal;
        buffer.moveChar(0, ' ', rowAttr, size.x);
        if (index < rows.size())
        {
            const RenderedLine &row = rows[index];
            ushort x = 0;
            for (const StyledRun &run : row.runs)
            {
                if (x >= size.x)
                    break;
                TStringView text(row.text.data() + run.offset, run.length);
                x += buffer.moveStr(x, text, roleColor(run.role, rowAttr));
            }
        }
        writeLine(0, y, size.x, 1, buffer);
    }

    if (caretRow < rows.size())
    {
        const int column = static_cast<int>(rows[caretRow].columnFor(model->caret()));
        setCursor(std::min(column, size.x - 1), static_cast<int>(caretRow) - delta.y);
    }
}

void PreviewView::refresh()
{
    const int line = model->caretLine();
    const int lineCount = model->snapshot()->lineCount();
    preview::Viewport viewport{std::max(1, line - size.y), std::min(lineCount, line + size.y)};
    model->refresh(viewport);
    setLimit(size.x, static_cast<int>(model->lines().size()));
    scrollToCaret();
    drawView();
}

void PreviewView::scrollToCaret()
{
    const int row = static_cast<int>(model->caretRow());
    if (row < delta.y)
        scrollTo(0, row);
    else if (row >= delta.y + size.y)
        scrollTo(0, row - size.y + 1);
}

void PreviewView::changeBounds(const TRect &bounds)
{
    TScroller::changeBounds(bounds);
    model->renderer().setWidth(size.x);
    refresh();
}

void PreviewView::handleEvent(TEvent &event)
{
    TScroller::handleEvent(event);
    if (event.what != evKeyDown)
        return;

    bool handled = true;
    switch (event.keyDown.keyCode)
    {
    case kbUp:
        model->moveLines(-1);
        break;
    case kbDown:
        model->moveLines(1);
        break;
    case kbLeft:
        model->moveColumns(-1);
        break;
    case kbRight:
        model->moveColumns(1);
        break;
    case kbHome:
        model->moveToLineStart();
        break;
    case kbEnd:
        model->moveToLineEnd();
        break;
    case kbPgUp:
        model->moveLines(-size.y);
        break;
    case kbPgDn:
        model->moveLines(size.y);
        break;
    case kbCtrlPgUp:
        model->setCaret(0);
        break;
    case kbCtrlPgDn:
        model->setCaret(model->snapshot()->length());
        break;
    default:
        handled = false;
        break;
    }
    if (!handled)
        return;
    refresh();
    clearEvent(event);
}

PreviewWindow::PreviewWindow(const TRect &bounds, const std::string &fileName, const preview::EngineOptions &options)
    : TWindowInit(&TWindow::initFrame),
      TWindow(bounds, std::filesystem::path(fileName).filename().string(), wnNoNumber)
{
    this->options |= ofTileable;

    TScrollBar *vScrollBar = standardScrollBar(sbVertical);
    TRect inner = getExtent();
    inner.grow(-1, -1);

    auto session = std::make_unique<PreviewSession>(options, inner.b.x - inner.a.x);
    documentLoaded = session->load(fileName);
    previewView = new PreviewView(inner, vScrollBar, std::move(session));
    insert(previewView);
    previewView->refresh();
}

void PreviewWindow::handleEvent(TEvent &event)
{
    TWindow::handleEvent(event);
    if (event.what == evCommand && event.message.command == cmReloadDocument)
    {
        if (previewView->session().reload())
            previewView->refresh();
        else
            messageBox("Could not reload the document.", mfError | mfOKButton);
        clearEvent(event);
    }
}

PreviewApp::PreviewApp(const std::vector<std::string> &files, const preview::EngineOptions &options)
    : TProgInit(&PreviewApp::initStatusLine, &PreviewApp::initMenuBar, &TApplication::initDeskTop),
      TApplication(),
      engineOptions(options)
{
    for (const std::string &file : files)
        openDocument(file.c_str());
    if (files.size() > 1)
        tile();
}

void PreviewApp::openDocument(const char *fileName)
{
    TRect r = deskTop->getExtent();
    auto *win = new PreviewWindow(r, fileName, engineOptions);
    if (!win->loaded())
    {
        std::string message = std::string("Cannot open ") + fileName;
        destroy(win);
        messageBox(message.c_str(), mfError | mfOKButton);
        return;
    }
    deskTop->insert(validView(win));
}

void PreviewApp::fileOpen()
{
    char name[MAXPATH] = "*.md";
    if (execDialog(new TFileDialog("*.md", "Open file", "~N~ame", fdOpenButton, 100), name) != cmCancel)
        openDocument(name);
}

void PreviewApp::reloadCurrent()
{
    if (!deskTop->current)
        return;
    auto *win = dynamic_cast<PreviewWindow *>(deskTop->current);
    if (!win)
        return;
    TEvent ev;
    ev.what = evCommand;
    ev.message.command = cmReloadDocument;
    ev.message.infoPtr = nullptr;
    win->handleEvent(ev);
}

void PreviewApp::showAbout()
{
    std::string text = std::string("\003") + std::string(kAppName) + " " + MDLIVE_VERSION + "\n\003" +
                       std::string(kAppShortDescription);
    messageBox(text.c_str(), mfInformation | mfOKButton);
}

void PreviewApp::handleEvent(TEvent &event)
{
    TApplication::handleEvent(event);
    if (event.what != evCommand)
        return;

    bool handled = true;
    switch (event.message.command)
    {
    case cmOpen:
        fileOpen();
        break;
    case cmReloadDocument:
        reloadCurrent();
        break;
    case cmAboutViewer:
        showAbout();
        break;
    default:
        handled = false;
        break;
    }
    if (handled)
        clearEvent(event);
}

TMenuBar *PreviewApp::initMenuBar(TRect r)
{
    r.b.y = r.a.y + 1;
    return new TMenuBar(r,
                        *new TSubMenu("~F~ile", kbNoKey) +
                            *new TMenuItem("~O~pen...", cmOpen, kbF3, hcNoContext, "F3") +
                            *new TMenuItem("~R~eload", cmReloadDocument, kbF5, hcNoContext, "F5") +
                            newLine() +
                            *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext, "Alt-X") +
                        *new TSubMenu("~W~indows", kbNoKey) +
                            *new TMenuItem("~T~ile", cmTile, kbNoKey) +
                            *new TMenuItem("C~a~scade", cmCascade, kbNoKey) +
                            *new TMenuItem("~N~ext", cmNext, kbF6, hcNoContext, "F6") +
                            *new TMenuItem("~C~lose", cmClose, kbAltF3, hcNoContext, "Alt-F3") +
                        *new TSubMenu("~H~elp", kbNoKey) +
                            *new TMenuItem("~A~bout...", cmAboutViewer, kbNoKey));
}

TStatusLine *PreviewApp::initStatusLine(TRect r)
{
    r.a.y = r.b.y - 1;
    return new TStatusLine(r,
                           *new TStatusDef(0, 0xFFFF) +
                               *new TStatusItem("~Alt-X~ Exit", kbAltX, cmQuit) +
                               *new TStatusItem("~F3~ Open", kbF3, cmOpen) +
                               *new TStatusItem("~F5~ Reload", kbF5, cmReloadDocument) +
                               *new TStatusItem("~F6~ Next", kbF6, cmNext) +
                               *new TStatusItem("~Alt-F3~ Close", kbAltF3, cmClose));
}

} // namespace mdlive::view
