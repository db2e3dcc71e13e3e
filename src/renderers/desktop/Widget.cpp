// SPDX-License-Identifier: Apache-2.0
#include <renderers/desktop/Widget.hpp>

namespace uniui::desktop
{

auto Widget::operator==(Widget const& other) const -> bool
{
    return type == other.type && id == other.id && props == other.props && children == other.children;
}

auto toJson(Widget const& widget) -> nlohmann::json
{
    auto children = nlohmann::json::array();
    for (auto const& child: widget.children)
        children.push_back(toJson(child));

    return {
        { "type", widget.type },
        { "id", widget.id ? nlohmann::json(*widget.id) : nlohmann::json(nullptr) },
        { "props", widget.props },
        { "children", std::move(children) },
    };
}

auto label(std::string text, nlohmann::json props) -> Widget
{
    props["text"] = std::move(text);
    return Widget { .type = "label", .props = std::move(props) };
}

auto button(std::string label, nlohmann::json onClick, nlohmann::json props) -> Widget
{
    props["label"] = std::move(label);
    props["on_click"] = std::move(onClick);
    return Widget { .type = "button", .props = std::move(props) };
}

auto container(std::string direction, std::vector<Widget> children, nlohmann::json props) -> Widget
{
    props["direction"] = std::move(direction);
    return Widget { .type = "container", .props = std::move(props), .children = std::move(children) };
}

auto styleProps(std::optional<iur::Style> const& style) -> nlohmann::json
{
    auto props = nlohmann::json::object();
    if (!style)
        return props;

    if (style->fg)
        props["color"] = iur::colorToString(*style->fg);
    if (style->bg)
        props["background"] = iur::colorToString(*style->bg);

    auto fontStyle = nlohmann::json::array();
    for (auto const attr: style->attrs)
    {
        if (attr == iur::TextAttr::Bold || attr == iur::TextAttr::Italic || attr == iur::TextAttr::Underline)
            fontStyle.push_back(std::string(iur::textAttrName(attr)));
    }
    if (!fontStyle.empty())
        props["font_style"] = std::move(fontStyle);

    return props;
}

auto withStyle(nlohmann::json props, std::optional<iur::Style> const& style) -> nlohmann::json
{
    for (auto const& [key, value]: styleProps(style).items())
    {
        if (!props.contains(key))
            props[key] = value;
    }
    return props;
}

} // namespace uniui::desktop
