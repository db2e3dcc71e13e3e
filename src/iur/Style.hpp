// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace uniui::iur
{

/// @brief An RGB color triple.
struct Rgb
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    auto operator==(Rgb const&) const -> bool = default;
};

/// @brief A color: a name or hex string ("blue", "#FF8000") or an RGB triple.
using Color = std::variant<std::string, Rgb>;

/// @brief A size constraint: fixed cells/pixels or a keyword ("auto", "fill", "50%").
using Size = std::variant<int, std::string>;

/// @brief Text attributes that can be attached to a style.
enum class TextAttr : std::uint8_t
{
    Bold,
    Dim,
    Italic,
    Underline,
    Blink,
    Inverse,
    Strikethrough,
};

/// @brief Returns the lowercase name of a text attribute.
[[nodiscard]] auto textAttrName(TextAttr attr) -> std::string_view;

/// @brief Parses a text attribute name ("reverse" is accepted as an alias for inverse).
[[nodiscard]] auto textAttrFromString(std::string_view name) -> std::optional<TextAttr>;

/// @brief Platform-agnostic visual attributes of an element.
///
/// Every field is optional. Styles are immutable values: they are built from attribute
/// lists and combined with merge(), never modified in place.
struct Style
{
    std::optional<Color> fg;
    std::optional<Color> bg;
    std::vector<TextAttr> attrs; ///< Sorted and deduplicated.
    std::optional<int> padding;
    std::optional<int> margin;
    std::optional<Size> width;
    std::optional<Size> height;
    std::optional<std::string> align;

    /// @brief Builds a style from inline attributes.
    ///
    /// Accepts an object (`{"fg": "red"}`), a list of pairs (`[["fg", "red"]]`) or a flat
    /// alternating list (`["fg", "red", "attrs", ["bold"]]`). Unknown keys are ignored.
    [[nodiscard]] static auto fromAttributes(nlohmann::json const& attributes) -> Style;

    /// @brief Returns true if the given text attribute is set.
    [[nodiscard]] auto has(TextAttr attr) const noexcept -> bool;

    /// @brief Returns true if no field is set.
    [[nodiscard]] auto isEmpty() const noexcept -> bool;

    auto operator==(Style const&) const -> bool = default;
};

/// @brief Merges two styles, with fields of @p b taking precedence.
///
/// Text attributes are the union of both. A missing style acts as the identity, and
/// merging two missing styles yields an empty style.
[[nodiscard]] auto merge(std::optional<Style> const& a, std::optional<Style> const& b) -> Style;

/// @brief Normalizes inline attribute forms into an ordered list of key/value pairs.
[[nodiscard]] auto attributePairs(nlohmann::json const& attributes)
    -> std::vector<std::pair<std::string, nlohmann::json>>;

/// @brief Returns true for the keys that may start an inline attribute list.
[[nodiscard]] auto isReservedAttributeKey(std::string_view key) -> bool;

/// @brief Renders a color as text: names verbatim, RGB as "rgb(r, g, b)".
[[nodiscard]] auto colorToString(Color const& color) -> std::string;

/// @brief Serializes a style to JSON, omitting unset fields.
[[nodiscard]] auto toJson(Style const& style) -> nlohmann::json;

} // namespace uniui::iur
