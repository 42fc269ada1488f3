#include "mdlive/view/json_export.hpp"

#include <type_traits>

namespace mdlive::view
{

using namespace mdlive::preview;

namespace
{

const char *linkFormName(LinkForm form) noexcept
{
    switch (form)
    {
    case LinkForm::Inline:
        return "inline";
    case LinkForm::Reference:
        return "reference";
    case LinkForm::Wiki:
        return "wiki";
    case LinkForm::Autolink:
        return "autolink";
    case LinkForm::BareUrl:
        return "bare-url";
    }
    return "inline";
}

const char *listTypeName(ListType type) noexcept
{
    switch (type)
    {
    case ListType::Bullet:
        return "bullet";
    case ListType::Numbered:
        return "numbered";
    case ListType::Task:
        return "task";
    }
    return "bullet";
}

const char *alignmentName(TableAlignment alignment) noexcept
{
    switch (alignment)
    {
    case TableAlignment::Default:
        return "default";
    case TableAlignment::Left:
        return "left";
    case TableAlignment::Center:
        return "center";
    case TableAlignment::Right:
        return "right";
    }
    return "default";
}

const char *foldName(CalloutFold fold) noexcept
{
    switch (fold)
    {
    case CalloutFold::None:
        return "none";
    case CalloutFold::Expanded:
        return "expanded";
    case CalloutFold::Collapsed:
        return "collapsed";
    }
    return "none";
}

} // namespace

json widgetToJson(const Widget &widget)
{
    json out = json::object();
    out["type"] = std::string(widgetName(widget));
    std::visit(
        [&out](const auto &data) {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, InlineCodeWidget>)
            {
                out["code"] = data.code;
            }
            else if constexpr (std::is_same_v<T, MathWidget>)
            {
                out["latex"] = data.latex;
                out["display"] = data.display;
            }
            else if constexpr (std::is_same_v<T, LinkWidget>)
            {
                out["text"] = data.text;
                out["url"] = data.url;
                out["form"] = linkFormName(data.form);
                if (!data.title.empty())
                    out["title"] = data.title;
                if (!data.heading.empty())
                    out["heading"] = data.heading;
            }
            else if constexpr (std::is_same_v<T, ImageWidget>)
            {
                out["alt"] = data.alt;
                out["url"] = data.url;
                if (!data.title.empty())
                    out["title"] = data.title;
                if (data.width)
                    out["width"] = *data.width;
            }
            else if constexpr (std::is_same_v<T, ScriptWidget>)
            {
                out["text"] = data.text;
                out["superscript"] = data.superscript;
            }
            else if constexpr (std::is_same_v<T, KbdWidget>)
            {
                out["key"] = data.key;
            }
            else if constexpr (std::is_same_v<T, FootnoteRefWidget>)
            {
                out["identifier"] = data.identifier;
            }
            else if constexpr (std::is_same_v<T, EmbedWidget>)
            {
                out["target"] = data.target;
            }
            else if constexpr (std::is_same_v<T, ListBulletWidget>)
            {
                out["listType"] = listTypeName(data.type);
                out["marker"] = data.marker;
                if (data.type == ListType::Task)
                    out["checked"] = data.checked;
            }
            else if constexpr (std::is_same_v<T, CodeBlockWidget>)
            {
                out["language"] = data.language;
                out["code"] = data.code;
            }
            else if constexpr (std::is_same_v<T, MathBlockWidget>)
            {
                out["latex"] = data.latex;
            }
            else if constexpr (std::is_same_v<T, TableWidget>)
            {
                out["rows"] = data.rows;
                json alignments = json::array();
                for (TableAlignment alignment : data.alignments)
                    alignments.push_back(alignmentName(alignment));
                out["alignments"] = std::move(alignments);
                out["hasHeader"] = data.hasHeader;
            }
            else if constexpr (std::is_same_v<T, CalloutWidget>)
            {
                out["calloutType"] = data.type;
                out["title"] = data.title;
                out["body"] = data.body;
                out["fold"] = foldName(data.fold);
            }
            else if constexpr (std::is_same_v<T, DetailsWidget>)
            {
                out["summary"] = data.summary;
                out["body"] = data.body;
                out["open"] = data.open;
            }
            else if constexpr (std::is_same_v<T, FootnoteDefinitionWidget>)
            {
                out["identifier"] = data.identifier;
                out["body"] = data.body;
            }
        },
        widget);
    return out;
}

json instructionToJson(const RenderInstruction &instruction)
{
    json out = {
        {"from", instruction.from},
        {"to", instruction.to},
        {"source", std::string(kindName(instruction.source))},
        {"type", std::string(instructionName(instruction))},
    };

    if (const auto *attribute = instruction.as<LineAttribute>())
    {
        out["class"] = attribute->styleClass;
        if (!attribute->attributes.empty())
            out["attributes"] = attribute->attributes;
    }
    else if (const auto *mark = instruction.as<SpanMark>())
    {
        out["class"] = mark->styleClass;
        if (!mark->attributes.empty())
            out["attributes"] = mark->attributes;
    }
    else if (const auto *replace = instruction.as<SpanReplace>())
    {
        out["widget"] = widgetToJson(replace->widget);
    }
    else if (const auto *anchor = instruction.as<WidgetAnchor>())
    {
        out["widget"] = widgetToJson(anchor->widget);
        out["blockTo"] = anchor->blockTo;
    }
    return out;
}

json decorationsToJson(const DecorationSet &decorations)
{
    json out = json::array();
    for (const RenderInstruction &instruction : decorations)
        out.push_back(instructionToJson(instruction));
    return out;
}

json outlineToJson(const std::vector<OutlineItem> &outline)
{
    json out = json::array();
    for (const OutlineItem &item : outline)
    {
        json node = {
            {"level", item.level},
            {"text", item.text},
            {"line", item.line},
            {"from", item.from},
            {"to", item.to},
        };
        if (!item.children.empty())
            node["children"] = outlineToJson(item.children);
        out.push_back(std::move(node));
    }
    return out;
}

} // namespace mdlive::view
