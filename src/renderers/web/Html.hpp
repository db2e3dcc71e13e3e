// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <iur/Element.hpp>
#include <iur/Style.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace uniui::web
{

/// @brief An HTML attribute name and its unescaped value.
using Attribute = std::pair<std::string, std::string>;

/// @brief Escapes `& < > " '` for use in text content and attribute values.
[[nodiscard]] auto escape(std::string_view text) -> std::string;

/// @brief Renders attributes as ` name="value"`, skipping empty values.
[[nodiscard]] auto attributes(std::vector<Attribute> const& attrs) -> std::string;

/// @brief Renders `<tag attrs>content</tag>`. @p content must already be escaped.
[[nodiscard]] auto element(std::string_view tag, std::vector<Attribute> const& attrs, std::string_view content)
    -> std::string;

/// @brief Renders a self-closing `<tag attrs />`.
[[nodiscard]] auto voidElement(std::string_view tag, std::vector<Attribute> const& attrs) -> std::string;

/// @brief Converts a style to an inline CSS declaration list ("color: red; font-weight: bold").
///
/// Inverse and blink have no CSS equivalent and are dropped.
[[nodiscard]] auto toCss(std::optional<iur::Style> const& style) -> std::string;

/// @brief Joins CSS declaration lists with "; ", skipping empty ones.
[[nodiscard]] auto joinCss(std::vector<std::string> const& parts) -> std::string;

/// @brief Returns the client event name bound to a handler.
///
/// Signal names use dashes instead of underscores; remote calls bind "generic-event".
[[nodiscard]] auto eventName(iur::Handler const& handler) -> std::string;

/// @brief Returns the HTML input type for a text input type; unknown types become "text".
[[nodiscard]] auto inputType(std::string_view type) -> std::string_view;

} // namespace uniui::web
