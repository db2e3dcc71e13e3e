// SPDX-License-Identifier: Apache-2.0
#include <iur/StyleResolver.hpp>

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace uniui::iur
{

namespace
{
    auto formatChain(std::vector<std::string> const& chain) -> std::string
    {
        auto text = std::string {};
        for (auto const& name: chain)
        {
            if (!text.empty())
                text += " -> ";
            text += name;
        }
        return text;
    }

    auto resolveWithInheritance(StyleRegistry const& registry,
                                NamedStyle const& style,
                                nlohmann::json const& overrides,
                                std::vector<std::string> seen) -> Style
    {
        if (!style.extends)
            return merge(Style::fromAttributes(style.attributes), Style::fromAttributes(overrides));

        if (std::ranges::find(seen, style.name) != seen.end())
        {
            seen.push_back(style.name);
            throw ConfigurationError(std::format("Circular style reference detected: style '{}' extends '{}' "
                                                 "(inheritance chain: {})",
                                                 style.name,
                                                 *style.extends,
                                                 formatChain(seen)),
                                     seen);
        }

        seen.push_back(style.name);

        auto const* parent = registry.find(*style.extends);
        if (!parent)
        {
            log::debug("Style '{}' extends unknown style '{}'", style.name, *style.extends);
            return merge(Style::fromAttributes(style.attributes), Style::fromAttributes(overrides));
        }

        auto const parentResolved = resolveWithInheritance(registry, *parent, nlohmann::json::array(), seen);
        return merge(merge(parentResolved, Style::fromAttributes(style.attributes)),
                     Style::fromAttributes(overrides));
    }

    auto overridesOf(nlohmann::json const& ref) -> nlohmann::json
    {
        auto rest = nlohmann::json::array();
        for (auto i = std::size_t { 1 }; i < ref.size(); ++i)
            rest.push_back(ref[i]);
        return rest;
    }
} // namespace

StyleRegistry::StyleRegistry(std::vector<NamedStyle> styles)
{
    for (auto& style: styles)
        add(std::move(style));
}

auto StyleRegistry::fromJson(nlohmann::json const& styles) -> Result<StyleRegistry>
{
    auto registry = StyleRegistry {};
    if (styles.is_null())
        return registry;

    if (!styles.is_array())
        return makeError(ErrorCode::ParseError, "Style definitions must be a list");

    for (auto const& entry: styles)
    {
        auto name = json::getString(entry, "name");
        if (!name)
            return makeError(ErrorCode::ParseError,
                             std::format("Invalid style definition: {}", name.error().message));

        registry.add(NamedStyle {
            .name = std::move(*name),
            .extends = json::getOptString(entry, "extends"),
            .attributes = json::getOpt(entry, "attributes").value_or(nlohmann::json::array()),
        });
    }

    return registry;
}

void StyleRegistry::add(NamedStyle style)
{
    auto name = style.name;
    _styles.insert_or_assign(std::move(name), std::move(style));
}

auto StyleRegistry::find(std::string_view name) const -> NamedStyle const*
{
    auto const it = _styles.find(name);
    return it != _styles.end() ? &it->second : nullptr;
}

auto StyleRegistry::all() const -> std::vector<NamedStyle>
{
    auto result = std::vector<NamedStyle> {};
    result.reserve(_styles.size());
    for (auto const& [_, style]: _styles)
        result.push_back(style);
    return result;
}

auto resolve(StyleRegistry const& registry, std::string_view name, nlohmann::json const& overrides) -> Style
{
    auto const* style = registry.find(name);
    if (!style)
        return Style::fromAttributes(overrides);

    return resolveWithInheritance(registry, *style, overrides, {});
}

auto resolveRef(StyleRegistry const& registry, nlohmann::json const& ref) -> std::optional<Style>
{
    if (ref.is_null() || (ref.is_array() && ref.empty()))
        return std::nullopt;

    if (ref.is_string())
        return resolve(registry, ref.get<std::string>());

    if (ref.is_array() && ref[0].is_string())
    {
        auto const head = ref[0].get<std::string>();
        if (isReservedAttributeKey(head))
            return Style::fromAttributes(ref);
        return resolve(registry, head, overridesOf(ref));
    }

    return Style::fromAttributes(ref);
}

auto validateStyleRef(StyleRegistry const& registry, nlohmann::json const& ref) -> VoidResult
{
    if (!ref.is_string())
        return {};

    auto const name = ref.get<std::string>();
    if (!registry.contains(name))
        return makeError(ErrorCode::StyleNotFound, std::format("Style not found: {}", name));
    return {};
}

auto allStyles(StyleRegistry const& registry) -> std::vector<NamedStyle>
{
    return registry.all();
}

} // namespace uniui::iur
