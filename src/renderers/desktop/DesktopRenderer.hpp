// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <iur/Element.hpp>
#include <renderers/Renderer.hpp>
#include <renderers/desktop/Widget.hpp>

#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace uniui::desktop
{

/// @brief Renders IUR trees into desktop widget descriptions.
class DesktopRenderer final: public renderers::Renderer<Widget>
{
  public:
    [[nodiscard]] auto platform() const noexcept -> Platform override { return Platform::Desktop; }

    [[nodiscard]] auto convert(iur::Element const& element, State const& state) const
        -> std::optional<Widget> override;

  private:
    [[nodiscard]] auto convertChildren(std::span<iur::Element const> elements, State const& state) const
        -> std::vector<Widget>;
    [[nodiscard]] auto convertTab(iur::Tab const& tab, State const& state) const -> Widget;
};

/// @brief Maps layout alignment keywords to desktop ones (start to left, end to right).
[[nodiscard]] auto desktopAlign(std::string_view align) -> std::string;

/// @brief Maps justification keywords to desktop ones (start to top, end to bottom).
[[nodiscard]] auto desktopJustify(std::string_view justify) -> std::string;

/// @brief Collects the handler names found in widget props, by widget id.
[[nodiscard]] auto extractHandlers(Widget const& root) -> std::map<std::string, std::vector<std::string>>;

} // namespace uniui::desktop
