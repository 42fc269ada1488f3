#pragma once

#include "mdlive/preview/document.hpp"
#include "mdlive/preview/element.hpp"
#include "mdlive/preview/reveal.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace mdlive::preview
{

struct HiddenMarker
{
};

struct InlineCodeWidget
{
    std::string code;
};

struct MathWidget
{
    std::string latex;
    bool display = false;
};

struct LinkWidget
{
    std::string text;
    std::string url;
    std::string title;
    LinkForm form = LinkForm::Inline;
    std::string heading;
};

struct ImageWidget
{
    std::string alt;
    std::string url;
    std::string title;
    std::optional<int> width;
};

struct ScriptWidget
{
    std::string text;
    bool superscript = true;
};

struct KbdWidget
{
    std::string key;
};

struct FootnoteRefWidget
{
    std::string identifier;
};

struct EmbedWidget
{
    std::string target;
};

struct ListBulletWidget
{
    ListType type = ListType::Bullet;
    std::string marker;
    bool checked = false;
};

struct HorizontalRuleWidget
{
};

struct CodeBlockWidget
{
    std::string language;
    std::string code;
};

struct MathBlockWidget
{
    std::string latex;
};

struct TableWidget
{
    std::vector<std::vector<std::string>> rows;
    std::vector<TableAlignment> alignments;
    bool hasHeader = false;
};

struct CalloutWidget
{
    std::string type;
    std::string title;
    std::string body;
    CalloutFold fold = CalloutFold::None;
};

struct DetailsWidget
{
    std::string summary;
    std::string body;
    bool open = false;
};

struct FootnoteDefinitionWidget
{
    std::string identifier;
    std::string body;
};

using Widget = std::variant<HiddenMarker,
                            InlineCodeWidget,
                            MathWidget,
                            LinkWidget,
                            ImageWidget,
                            ScriptWidget,
                            KbdWidget,
                            FootnoteRefWidget,
                            EmbedWidget,
                            ListBulletWidget,
                            HorizontalRuleWidget,
                            CodeBlockWidget,
                            MathBlockWidget,
                            TableWidget,
                            CalloutWidget,
                            DetailsWidget,
                            FootnoteDefinitionWidget>;

using AttributeMap = std::map<std::string, std::string>;

struct LineAttribute
{
    std::string styleClass;
    AttributeMap attributes;
};

struct SpanReplace
{
    Widget widget;
};

struct SpanMark
{
    std::string styleClass;
    AttributeMap attributes;
};

// Block widget drawn at `from`; the source it stands for runs to blockTo.
struct WidgetAnchor
{
    Widget widget;
    std::size_t blockTo = 0;
};

using Instruction = std::variant<LineAttribute, SpanReplace, SpanMark, WidgetAnchor>;

struct RenderInstruction
{
    std::size_t from = 0;
    std::size_t to = 0;
    ElementKind source = ElementKind::InlineOther;
    Instruction instruction;

    int priority() const noexcept { return priorityRank(source); }
    bool isLineLevel() const noexcept { return std::holds_alternative<LineAttribute>(instruction); }

    template <typename T>
    const T *as() const noexcept
    {
        return std::get_if<T>(&instruction);
    }
};

using DecorationSet = std::vector<RenderInstruction>;

std::string_view instructionName(const RenderInstruction &instruction) noexcept;
std::string_view widgetName(const Widget &widget) noexcept;

class DecorationBuilder
{
public:
    DecorationBuilder(const DocumentSnapshot &snapshot, RevealOracle oracle);

    // Elements must already be conflict-free.
    DecorationSet build(std::span<const Element *const> elements) const;
    DecorationSet build(std::span<const Element> elements) const;

private:
    void emitElement(const Element &element, DecorationSet &out) const;
    void emitLineLevel(const Element &element, DecorationSet &out) const;
    void emitInline(const Element &element, DecorationSet &out) const;
    void emitBlock(const Element &element, DecorationSet &out) const;

    bool revealed(std::size_t from, std::size_t to, ElementKind kind) const;

    const DocumentSnapshot &snapshot;
    RevealOracle oracle;
};

} // namespace mdlive::preview
