// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <iur/Style.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uniui::iur
{

/// @brief A named style definition, optionally extending a parent style.
struct NamedStyle
{
    std::string name;
    std::optional<std::string> extends;
    nlohmann::json attributes = nlohmann::json::array(); ///< Inline attributes in any accepted form.
};

/// @brief Registry of named styles, keyed by name.
class StyleRegistry
{
  public:
    StyleRegistry() = default;
    explicit StyleRegistry(std::vector<NamedStyle> styles);

    /// @brief Parses a list of `{"name", "extends", "attributes"}` records.
    [[nodiscard]] static auto fromJson(nlohmann::json const& styles) -> Result<StyleRegistry>;

    /// @brief Adds or replaces a style definition.
    void add(NamedStyle style);

    /// @brief Looks up a style definition by name.
    [[nodiscard]] auto find(std::string_view name) const -> NamedStyle const*;

    [[nodiscard]] auto contains(std::string_view name) const -> bool { return find(name) != nullptr; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return _styles.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return _styles.empty(); }

    /// @brief Returns all definitions ordered by name.
    [[nodiscard]] auto all() const -> std::vector<NamedStyle>;

  private:
    std::map<std::string, NamedStyle, std::less<>> _styles;
};

/// @brief Resolves a named style, walking its inheritance chain.
///
/// Parent attributes are applied first, then the style's own attributes, then @p overrides.
/// A name missing from the registry resolves to the overrides alone.
/// @throws ConfigurationError if the inheritance chain revisits a style.
[[nodiscard]] auto resolve(StyleRegistry const& registry,
                           std::string_view name,
                           nlohmann::json const& overrides = nlohmann::json::array()) -> Style;

/// @brief Resolves a style reference as found in an element's `style` attribute.
///
/// A reference is null or empty (no style), a style name, inline attributes, or a list
/// whose head is a style name followed by override attributes. A list whose head is a
/// reserved attribute key is treated as inline attributes.
/// @throws ConfigurationError on circular inheritance.
[[nodiscard]] auto resolveRef(StyleRegistry const& registry, nlohmann::json const& ref)
    -> std::optional<Style>;

/// @brief Checks that a named style reference exists. Inline references are always valid.
[[nodiscard]] auto validateStyleRef(StyleRegistry const& registry, nlohmann::json const& ref) -> VoidResult;

/// @brief Returns all named style definitions, ordered by name.
[[nodiscard]] auto allStyles(StyleRegistry const& registry) -> std::vector<NamedStyle>;

} // namespace uniui::iur
