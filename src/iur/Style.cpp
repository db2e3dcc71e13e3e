// SPDX-License-Identifier: Apache-2.0
#include <iur/Style.hpp>

#include <algorithm>
#include <array>
#include <format>

namespace uniui::iur
{

namespace
{
    constexpr auto ReservedKeys =
        std::array<std::string_view, 9> { "fg", "bg", "attrs", "padding", "margin", "width", "height", "align",
                                          "spacing" };

    auto parseColor(nlohmann::json const& value) -> std::optional<Color>
    {
        if (value.is_string())
            return Color { value.get<std::string>() };

        if (value.is_array() && value.size() == 3
            && std::ranges::all_of(value, [](auto const& c) { return c.is_number_integer(); }))
        {
            auto const channel = [](nlohmann::json const& c) {
                return static_cast<std::uint8_t>(std::clamp(c.get<int>(), 0, 255));
            };
            return Color { Rgb { channel(value[0]), channel(value[1]), channel(value[2]) } };
        }

        return std::nullopt;
    }

    auto parseSize(nlohmann::json const& value) -> std::optional<Size>
    {
        if (value.is_number_integer())
            return Size { value.get<int>() };
        if (value.is_string())
            return Size { value.get<std::string>() };
        return std::nullopt;
    }

    auto parseAttrs(nlohmann::json const& value) -> std::vector<TextAttr>
    {
        auto result = std::vector<TextAttr> {};
        auto const add = [&](nlohmann::json const& item) {
            if (!item.is_string())
                return;
            if (auto attr = textAttrFromString(item.get<std::string>()))
                result.push_back(*attr);
        };

        if (value.is_array())
        {
            for (auto const& item: value)
                add(item);
        }
        else
            add(value);

        return result;
    }

    void normalizeAttrs(std::vector<TextAttr>& attrs)
    {
        std::ranges::sort(attrs);
        auto const [first, last] = std::ranges::unique(attrs);
        attrs.erase(first, last);
    }

    auto isPair(nlohmann::json const& item) -> bool
    {
        return item.is_array() && item.size() == 2 && item[0].is_string();
    }

    auto sizeToJson(Size const& size) -> nlohmann::json
    {
        if (auto const* cells = std::get_if<int>(&size))
            return *cells;
        return std::get<std::string>(size);
    }

    auto colorToJson(Color const& color) -> nlohmann::json
    {
        if (auto const* name = std::get_if<std::string>(&color))
            return *name;
        auto const& rgb = std::get<Rgb>(color);
        return nlohmann::json::array({ rgb.r, rgb.g, rgb.b });
    }
} // namespace

auto textAttrName(TextAttr attr) -> std::string_view
{
    switch (attr)
    {
        case TextAttr::Bold: return "bold";
        case TextAttr::Dim: return "dim";
        case TextAttr::Italic: return "italic";
        case TextAttr::Underline: return "underline";
        case TextAttr::Blink: return "blink";
        case TextAttr::Inverse: return "inverse";
        case TextAttr::Strikethrough: return "strikethrough";
    }
    return "bold";
}

auto textAttrFromString(std::string_view name) -> std::optional<TextAttr>
{
    if (name == "bold")
        return TextAttr::Bold;
    if (name == "dim")
        return TextAttr::Dim;
    if (name == "italic")
        return TextAttr::Italic;
    if (name == "underline")
        return TextAttr::Underline;
    if (name == "blink")
        return TextAttr::Blink;
    if (name == "inverse" || name == "reverse")
        return TextAttr::Inverse;
    if (name == "strikethrough")
        return TextAttr::Strikethrough;
    return std::nullopt;
}

auto isReservedAttributeKey(std::string_view key) -> bool
{
    return std::ranges::find(ReservedKeys, key) != ReservedKeys.end();
}

auto attributePairs(nlohmann::json const& attributes) -> std::vector<std::pair<std::string, nlohmann::json>>
{
    auto pairs = std::vector<std::pair<std::string, nlohmann::json>> {};

    if (attributes.is_object())
    {
        for (auto const& [key, value]: attributes.items())
            pairs.emplace_back(key, value);
        return pairs;
    }

    if (!attributes.is_array())
        return pairs;

    for (auto i = std::size_t { 0 }; i < attributes.size(); ++i)
    {
        auto const& item = attributes[i];
        if (isPair(item))
            pairs.emplace_back(item[0].get<std::string>(), item[1]);
        else if (item.is_object())
        {
            for (auto const& [key, value]: item.items())
                pairs.emplace_back(key, value);
        }
        else if (item.is_string() && i + 1 < attributes.size())
        {
            pairs.emplace_back(item.get<std::string>(), attributes[i + 1]);
            ++i;
        }
    }

    return pairs;
}

auto Style::fromAttributes(nlohmann::json const& attributes) -> Style
{
    auto style = Style {};

    for (auto const& [key, value]: attributePairs(attributes))
    {
        if (key == "fg")
            style.fg = parseColor(value);
        else if (key == "bg")
            style.bg = parseColor(value);
        else if (key == "attrs")
            style.attrs = parseAttrs(value);
        else if (key == "padding" && value.is_number_integer())
            style.padding = value.get<int>();
        else if (key == "margin" && value.is_number_integer())
            style.margin = value.get<int>();
        else if (key == "width")
            style.width = parseSize(value);
        else if (key == "height")
            style.height = parseSize(value);
        else if (key == "align" && value.is_string())
            style.align = value.get<std::string>();
    }

    normalizeAttrs(style.attrs);
    return style;
}

auto Style::has(TextAttr attr) const noexcept -> bool
{
    return std::ranges::find(attrs, attr) != attrs.end();
}

auto Style::isEmpty() const noexcept -> bool
{
    return *this == Style {};
}

auto merge(std::optional<Style> const& a, std::optional<Style> const& b) -> Style
{
    if (!a && !b)
        return Style {};
    if (!a)
        return *b;
    if (!b)
        return *a;

    auto result = *a;
    if (b->fg)
        result.fg = b->fg;
    if (b->bg)
        result.bg = b->bg;
    if (b->padding)
        result.padding = b->padding;
    if (b->margin)
        result.margin = b->margin;
    if (b->width)
        result.width = b->width;
    if (b->height)
        result.height = b->height;
    if (b->align)
        result.align = b->align;

    result.attrs.insert(result.attrs.end(), b->attrs.begin(), b->attrs.end());
    normalizeAttrs(result.attrs);
    return result;
}

auto colorToString(Color const& color) -> std::string
{
    if (auto const* name = std::get_if<std::string>(&color))
        return *name;
    auto const& rgb = std::get<Rgb>(color);
    return std::format("rgb({}, {}, {})", rgb.r, rgb.g, rgb.b);
}

auto toJson(Style const& style) -> nlohmann::json
{
    auto result = nlohmann::json::object();
    if (style.fg)
        result["fg"] = colorToJson(*style.fg);
    if (style.bg)
        result["bg"] = colorToJson(*style.bg);
    if (!style.attrs.empty())
    {
        auto attrs = nlohmann::json::array();
        for (auto const attr: style.attrs)
            attrs.push_back(textAttrName(attr));
        result["attrs"] = std::move(attrs);
    }
    if (style.padding)
        result["padding"] = *style.padding;
    if (style.margin)
        result["margin"] = *style.margin;
    if (style.width)
        result["width"] = sizeToJson(*style.width);
    if (style.height)
        result["height"] = sizeToJson(*style.height);
    if (style.align)
        result["align"] = *style.align;
    return result;
}

} // namespace uniui::iur
