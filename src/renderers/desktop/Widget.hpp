// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <iur/Style.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace uniui::desktop
{

/// @brief A desktop widget description: `{type, id, props, children}`.
///
/// The tree is handed to a desktop toolkit as is; widget types are label, button,
/// container, text_input and one type per data or navigation widget.
struct Widget
{
    std::string type;
    std::optional<std::string> id;
    nlohmann::json props = nlohmann::json::object();
    std::vector<Widget> children;

    auto operator==(Widget const& other) const -> bool;
};

[[nodiscard]] auto toJson(Widget const& widget) -> nlohmann::json;

/// @brief Creates a label widget with `text` and the given extra props.
[[nodiscard]] auto label(std::string text, nlohmann::json props = nlohmann::json::object()) -> Widget;

/// @brief Creates a button widget; @p onClick is the handler JSON or null.
[[nodiscard]] auto button(std::string label, nlohmann::json onClick, nlohmann::json props = nlohmann::json::object())
    -> Widget;

/// @brief Creates a container with `direction` set to "vbox" or "hbox".
[[nodiscard]] auto container(std::string direction,
                             std::vector<Widget> children,
                             nlohmann::json props = nlohmann::json::object()) -> Widget;

/// @brief Converts a style into widget props.
///
/// `fg` becomes `color`, `bg` becomes `background`, and bold, italic and underline are
/// listed under `font_style`. Other text attributes have no desktop equivalent.
[[nodiscard]] auto styleProps(std::optional<iur::Style> const& style) -> nlohmann::json;

/// @brief Merges style props into @p props. Existing keys are kept.
[[nodiscard]] auto withStyle(nlohmann::json props, std::optional<iur::Style> const& style) -> nlohmann::json;

} // namespace uniui::desktop
