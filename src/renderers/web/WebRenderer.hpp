// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <iur/Element.hpp>
#include <renderers/Renderer.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace uniui::web
{

/// @brief Renders IUR trees into HTML strings with inline styles.
///
/// All interpolated text and attribute values are escaped. Event handlers become
/// `phx-*` bindings named after the handler's signal.
class WebRenderer final: public renderers::Renderer<std::string>
{
  public:
    [[nodiscard]] auto platform() const noexcept -> Platform override { return Platform::Web; }

    [[nodiscard]] auto convert(iur::Element const& element, State const& state) const
        -> std::optional<std::string> override;

  private:
    [[nodiscard]] auto convertChildren(std::span<iur::Element const> elements, State const& state) const
        -> std::string;
    [[nodiscard]] auto convertTabs(iur::Tabs const& tabs, State const& state) const -> std::string;
    [[nodiscard]] auto convertLayout(std::string_view direction,
                                     std::optional<std::string> const& id,
                                     std::span<iur::Element const> children,
                                     int spacing,
                                     std::optional<int> padding,
                                     std::optional<std::string> const& alignItems,
                                     std::optional<std::string> const& justifyContent,
                                     std::optional<iur::Style> const& style,
                                     State const& state) const -> std::string;
};

/// @brief Wraps rendered markup in a standalone HTML5 document.
[[nodiscard]] auto htmlDocument(std::string_view body, std::string_view title = "uniui") -> std::string;

} // namespace uniui::web
