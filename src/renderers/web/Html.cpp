// SPDX-License-Identifier: Apache-2.0
#include <renderers/web/Html.hpp>

#include <algorithm>
#include <array>
#include <format>

namespace uniui::web
{

namespace
{
    template <class... Ts>
    struct overloaded: Ts...
    {
        using Ts::operator()...;
    };

    constexpr auto InputTypes = std::array<std::string_view, 7> {
        "text", "password", "email", "number", "tel", "url", "search",
    };

    auto dashed(std::string name) -> std::string
    {
        std::ranges::replace(name, '_', '-');
        return name;
    }

    auto attrCss(iur::TextAttr attr) -> std::string_view
    {
        switch (attr)
        {
            case iur::TextAttr::Bold: return "font-weight: bold";
            case iur::TextAttr::Underline: return "text-decoration: underline";
            case iur::TextAttr::Italic: return "font-style: italic";
            case iur::TextAttr::Strikethrough: return "text-decoration: line-through";
            case iur::TextAttr::Dim: return "opacity: 0.7";
            case iur::TextAttr::Inverse:
            case iur::TextAttr::Blink: return "";
        }
        return "";
    }
} // namespace

auto escape(std::string_view text) -> std::string
{
    auto result = std::string {};
    result.reserve(text.size());
    for (auto const ch: text)
    {
        switch (ch)
        {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&#39;"; break;
            default: result += ch; break;
        }
    }
    return result;
}

auto attributes(std::vector<Attribute> const& attrs) -> std::string
{
    auto result = std::string {};
    for (auto const& [name, value]: attrs)
    {
        if (!value.empty())
            result += std::format(" {}=\"{}\"", name, escape(value));
    }
    return result;
}

auto element(std::string_view tag, std::vector<Attribute> const& attrs, std::string_view content) -> std::string
{
    return std::format("<{}{}>{}</{}>", tag, attributes(attrs), content, tag);
}

auto voidElement(std::string_view tag, std::vector<Attribute> const& attrs) -> std::string
{
    return std::format("<{}{} />", tag, attributes(attrs));
}

auto toCss(std::optional<iur::Style> const& style) -> std::string
{
    if (!style)
        return "";

    auto parts = std::vector<std::string> {};
    if (style->fg)
        parts.push_back(std::format("color: {}", iur::colorToString(*style->fg)));
    if (style->bg)
        parts.push_back(std::format("background-color: {}", iur::colorToString(*style->bg)));
    for (auto const attr: style->attrs)
        parts.emplace_back(attrCss(attr));

    return joinCss(parts);
}

auto joinCss(std::vector<std::string> const& parts) -> std::string
{
    auto result = std::string {};
    for (auto const& part: parts)
    {
        if (part.empty())
            continue;
        if (!result.empty())
            result += "; ";
        result += part;
    }
    return result;
}

auto eventName(iur::Handler const& handler) -> std::string
{
    return std::visit(overloaded {
                          [](std::string const& name) { return dashed(name); },
                          [](iur::NamedHandler const& named) { return dashed(named.name); },
                          [](iur::RemoteCall const&) { return std::string { "generic-event" }; },
                      },
                      handler);
}

auto inputType(std::string_view type) -> std::string_view
{
    if (std::ranges::find(InputTypes, type) != InputTypes.end())
        return type;
    return "text";
}

} // namespace uniui::web
