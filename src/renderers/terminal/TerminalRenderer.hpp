// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <iur/Element.hpp>
#include <renderers/Renderer.hpp>
#include <renderers/terminal/Node.hpp>

#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace uniui::terminal
{

/// @brief Converts an IUR style to terminal SGR attributes.
///
/// Colors that are not terminal color names, hex strings or indices are dropped.
[[nodiscard]] auto convertStyle(std::optional<iur::Style> const& style) -> tui::Style;

/// @brief Renders IUR trees into terminal text/stack trees.
///
/// Widgets with event handlers are wrapped in tagged nodes carrying their handler and
/// source metadata, so that extractHandlers() and the event layer can map user input back
/// to the widget that produced it.
class TerminalRenderer final: public renderers::Renderer<Node>
{
  public:
    [[nodiscard]] auto platform() const noexcept -> Platform override { return Platform::Terminal; }

    [[nodiscard]] auto convert(iur::Element const& element, State const& state) const
        -> std::optional<Node> override;

  private:
    [[nodiscard]] auto convertChildren(std::span<iur::Element const> elements, State const& state) const
        -> std::vector<Node>;
    [[nodiscard]] auto convertTabs(iur::Tabs const& tabs, State const& state) const -> Node;
    [[nodiscard]] auto convertLayout(Direction direction,
                                     std::span<iur::Element const> children,
                                     int spacing,
                                     std::optional<int> padding,
                                     std::optional<std::string> const& alignItems,
                                     std::optional<std::string> const& justifyContent,
                                     std::optional<iur::Style> const& style,
                                     State const& state) const -> Node;
};

/// @brief Collects the handler names attached to each tagged widget of a converted tree.
/// @return Handler names by element id; widgets without an id are skipped.
[[nodiscard]] auto extractHandlers(Node const& root) -> std::map<std::string, std::vector<std::string>>;

} // namespace uniui::terminal
