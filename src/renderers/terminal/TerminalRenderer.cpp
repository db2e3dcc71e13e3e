// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <renderers/AsciiCharts.hpp>
#include <renderers/terminal/TerminalRenderer.hpp>

#include <algorithm>
#include <array>
#include <format>

namespace uniui::terminal
{

namespace
{
    template <class... Ts>
    struct overloaded: Ts...
    {
        using Ts::operator()...;
    };

    constexpr auto HandlerKeys = std::array<std::string_view, 8> {
        "on_click", "on_change", "on_submit", "action", "on_row_select", "on_sort", "on_select", "on_toggle",
    };

    template <typename T>
    auto optionalJson(std::optional<T> const& value) -> nlohmann::json
    {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }

    auto handlerJson(std::optional<iur::Handler> const& handler) -> nlohmann::json
    {
        return handler ? iur::handlerToJson(*handler) : nlohmann::json(nullptr);
    }

    auto dataJson(std::vector<iur::DataPoint> const& data) -> nlohmann::json
    {
        auto result = nlohmann::json::array();
        for (auto const& point: data)
            result.push_back(nlohmann::json::array({ point.label, point.value }));
        return result;
    }

    auto toTerminalColor(iur::Color const& color) -> tui::Color
    {
        return std::visit(overloaded {
                              [](std::string const& name) { return tui::parseColor(name).value_or(tui::Color {}); },
                              [](iur::Rgb const& rgb) {
                                  return tui::Color { tui::RgbColor { .r = rgb.r, .g = rgb.g, .b = rgb.b } };
                              },
                          },
                          color);
    }

    auto inputIndicator(std::string_view type) -> std::string_view
    {
        if (type == "password")
            return "*";
        if (type == "email")
            return "@";
        if (type == "number")
            return "#";
        if (type == "tel")
            return "T";
        return ":";
    }

    auto convertMenuItem(iur::MenuItem const& item) -> Node
    {
        auto label = std::string {};
        if (item.disabled)
            label += "× ";
        if (item.icon)
            label += std::format("[{}] ", *item.icon);
        label += item.label.value_or("");
        if (item.shortcut)
            label += std::format(" ({})", *item.shortcut);
        if (!item.submenu.empty())
            label += " >";

        return tagged("menu_item",
                      text(std::move(label)),
                      {
                          { "id", optionalJson(item.id) },
                          { "label", optionalJson(item.label) },
                          { "action", handlerJson(item.action) },
                          { "disabled", item.disabled },
                          { "icon", optionalJson(item.icon) },
                          { "shortcut", optionalJson(item.shortcut) },
                          { "has_submenu", !item.submenu.empty() },
                      });
    }

    auto convertMenuItems(std::vector<iur::MenuItem> const& items) -> std::vector<Node>
    {
        auto nodes = std::vector<Node> {};
        for (auto const& item: items)
        {
            if (item.visible)
                nodes.push_back(convertMenuItem(item));
        }
        return nodes;
    }

    auto convertTab(iur::Tab const& tab) -> Node
    {
        auto label = std::string {};
        if (tab.disabled)
            label += "(×) ";
        if (tab.icon)
            label += std::format("[{}] ", *tab.icon);
        label += tab.label.value_or("");
        if (tab.closable)
            label += " ×";

        return tagged("tab",
                      text(std::move(label)),
                      {
                          { "id", optionalJson(tab.id) },
                          { "label", optionalJson(tab.label) },
                          { "icon", optionalJson(tab.icon) },
                          { "disabled", tab.disabled },
                          { "closable", tab.closable },
                      });
    }

    auto convertTreeNode(iur::TreeNode const& node) -> Node
    {
        auto const hasChildren = !node.children.empty();
        auto label = std::string { hasChildren ? (node.expanded ? "[-] " : "[+] ") : "    " };
        if (node.icon)
            label += std::format("[{}] ", node.expanded && node.iconExpanded ? *node.iconExpanded : *node.icon);
        label += node.label.value_or("");

        auto content = text(std::move(label));
        if (node.expanded && hasChildren)
        {
            auto children = std::vector<Node> {};
            for (auto const& child: node.children)
            {
                if (child.visible)
                    children.push_back(convertTreeNode(child));
            }
            content = stack(Direction::Vertical,
                            { std::move(content), stack(Direction::Vertical, std::move(children), { .indent = 4 }) });
        }

        return tagged("tree_node",
                      std::move(content),
                      {
                          { "id", optionalJson(node.id) },
                          { "label", optionalJson(node.label) },
                          { "value", node.value },
                          { "expanded", node.expanded },
                          { "icon", optionalJson(node.icon) },
                          { "icon_expanded", optionalJson(node.iconExpanded) },
                          { "selectable", node.selectable },
                          { "has_children", hasChildren },
                      });
    }

    auto convertTable(iur::Table const& table) -> Node
    {
        auto columns = nlohmann::json::array();
        for (auto const& column: charts::resolveColumns(table))
            columns.push_back(iur::metadata(iur::Element { column }));

        return tagged("table",
                      styled(text(charts::tableText(table)), convertStyle(table.style)),
                      {
                          { "id", optionalJson(table.id) },
                          { "columns", std::move(columns) },
                          { "data", charts::sortedRows(table) },
                          { "selected_row", optionalJson(table.selectedRow) },
                          { "on_row_select", handlerJson(table.onRowSelect) },
                          { "on_sort", handlerJson(table.onSort) },
                          { "sort_column", optionalJson(table.sortColumn) },
                          { "sort_direction", iur::sortDirectionName(table.sortDirection) },
                      });
    }

    void collectHandlers(Node const& node, std::map<std::string, std::vector<std::string>>& handlers)
    {
        std::visit(overloaded {
                       [&](StackNode const& stackNode) {
                           for (auto const& child: stackNode.children)
                               collectHandlers(child, handlers);
                       },
                       [&](StyledNode const& styledNode) {
                           if (styledNode.child)
                               collectHandlers(*styledNode.child, handlers);
                       },
                       [&](TaggedNode const& taggedNode) {
                           auto const& meta = taggedNode.meta;
                           if (meta.contains("id") && meta["id"].is_string())
                           {
                               auto names = std::vector<std::string> {};
                               for (auto const key: HandlerKeys)
                               {
                                   auto const keyString = std::string(key);
                                   if (!meta.contains(keyString))
                                       continue;
                                   if (auto handler = iur::handlerFromJson(meta[keyString]))
                                       names.push_back(iur::handlerName(*handler));
                               }
                               if (!names.empty())
                               {
                                   auto& entry = handlers[meta["id"].get<std::string>()];
                                   entry.insert(entry.end(), names.begin(), names.end());
                               }
                           }
                           if (taggedNode.child)
                               collectHandlers(*taggedNode.child, handlers);
                       },
                       [](auto const&) {},
                   },
                   node.value);
    }
} // namespace

auto convertStyle(std::optional<iur::Style> const& style) -> tui::Style
{
    if (!style)
        return {};

    auto result = tui::Style {};
    if (style->fg)
        result.fg = toTerminalColor(*style->fg);
    if (style->bg)
        result.bg = toTerminalColor(*style->bg);
    result.bold = style->has(iur::TextAttr::Bold);
    result.italic = style->has(iur::TextAttr::Italic);
    result.underline = style->has(iur::TextAttr::Underline);
    result.strikethrough = style->has(iur::TextAttr::Strikethrough);
    result.dim = style->has(iur::TextAttr::Dim);
    result.inverse = style->has(iur::TextAttr::Inverse);
    result.blink = style->has(iur::TextAttr::Blink);
    return result;
}

auto TerminalRenderer::convert(iur::Element const& element, State const& state) const -> std::optional<Node>
{
    if (!iur::isVisible(element))
        return std::nullopt;

    log::trace("terminal: converting {}", iur::typeName(element));

    return std::visit(
        overloaded {
            [](iur::Text const& widget) { return text(widget.content.value_or(""), convertStyle(widget.style)); },
            [](iur::Button const& button) {
                auto node = styled(text(std::format("[ {} ]", button.label.value_or(""))), convertStyle(button.style));
                if (!button.onClick)
                    return node;
                return tagged("button",
                              std::move(node),
                              {
                                  { "on_click", iur::handlerToJson(*button.onClick) },
                                  { "id", optionalJson(button.id) },
                                  { "disabled", button.disabled },
                              });
            },
            [](iur::Label const& label) {
                auto node = styled(text(label.text.value_or("")), convertStyle(label.style));
                if (!label.forId)
                    return node;
                return tagged("label", std::move(node), { { "for", *label.forId }, { "id", optionalJson(label.id) } });
            },
            [](iur::TextInput const& input) {
                auto const display = input.value         ? *input.value
                                     : input.placeholder ? std::format("[{}]", *input.placeholder)
                                                         : std::string { "[________________]" };
                return tagged("text_input",
                              styled(text(std::format("{} {}", inputIndicator(input.type), display)),
                                     convertStyle(input.style)),
                              {
                                  { "id", optionalJson(input.id) },
                                  { "value", optionalJson(input.value) },
                                  { "placeholder", optionalJson(input.placeholder) },
                                  { "type", input.type },
                                  { "on_change", handlerJson(input.onChange) },
                                  { "on_submit", handlerJson(input.onSubmit) },
                                  { "disabled", input.disabled },
                                  { "form_id", optionalJson(input.formId) },
                              });
            },
            [](iur::Gauge const& gauge) {
                return tagged("gauge",
                              styled(text(charts::gaugeText(gauge)), convertStyle(gauge.style)),
                              {
                                  { "id", optionalJson(gauge.id) },
                                  { "value", gauge.value },
                                  { "min", gauge.min },
                                  { "max", gauge.max },
                                  { "label", optionalJson(gauge.label) },
                              });
            },
            [](iur::Sparkline const& sparkline) {
                return tagged("sparkline",
                              styled(text(charts::sparklineText(sparkline.data)), convertStyle(sparkline.style)),
                              {
                                  { "id", optionalJson(sparkline.id) },
                                  { "data", sparkline.data },
                                  { "show_dots", sparkline.showDots },
                                  { "show_area", sparkline.showArea },
                              });
            },
            [](iur::BarChart const& chart) {
                return tagged("bar_chart",
                              styled(text(charts::barChartText(chart)), convertStyle(chart.style)),
                              {
                                  { "id", optionalJson(chart.id) },
                                  { "data", dataJson(chart.data) },
                                  { "orientation", chart.orientation },
                                  { "show_labels", chart.showLabels },
                              });
            },
            [](iur::LineChart const& chart) {
                return tagged("line_chart",
                              styled(text(charts::lineChartText(chart)), convertStyle(chart.style)),
                              {
                                  { "id", optionalJson(chart.id) },
                                  { "data", dataJson(chart.data) },
                                  { "show_dots", chart.showDots },
                                  { "show_area", chart.showArea },
                              });
            },
            [](iur::Table const& table) { return convertTable(table); },
            [](iur::MenuItem const& item) { return convertMenuItem(item); },
            [](iur::Menu const& menu) {
                auto children = std::vector<Node> {};
                if (menu.title)
                    children.push_back(text(menu.position == "top" ? std::format("── {} ──", *menu.title) : *menu.title));
                for (auto& item: convertMenuItems(menu.items))
                    children.push_back(std::move(item));

                return tagged("menu",
                              styled(stack(Direction::Vertical, std::move(children)), convertStyle(menu.style)),
                              {
                                  { "id", optionalJson(menu.id) },
                                  { "title", optionalJson(menu.title) },
                                  { "position", optionalJson(menu.position) },
                              });
            },
            [](iur::ContextMenu const& menu) {
                return tagged("context_menu",
                              styled(stack(Direction::Vertical, convertMenuItems(menu.items)), convertStyle(menu.style)),
                              { { "id", optionalJson(menu.id) }, { "trigger_on", menu.triggerOn } });
            },
            [](iur::Tab const& tab) { return convertTab(tab); },
            [&](iur::Tabs const& tabs) { return convertTabs(tabs, state); },
            [](iur::TreeNode const& node) { return convertTreeNode(node); },
            [](iur::TreeView const& tree) {
                auto roots = std::vector<Node> {};
                for (auto const& node: tree.rootNodes)
                {
                    if (node.visible)
                        roots.push_back(convertTreeNode(node));
                }

                return tagged("tree_view",
                              styled(stack(Direction::Vertical, std::move(roots)), convertStyle(tree.style)),
                              {
                                  { "id", optionalJson(tree.id) },
                                  { "selected_node", optionalJson(tree.selectedNode) },
                                  { "expanded_nodes", tree.expandedNodes },
                                  { "on_select", handlerJson(tree.onSelect) },
                                  { "on_toggle", handlerJson(tree.onToggle) },
                                  { "show_root", tree.showRoot },
                              });
            },
            [&](iur::VBox const& box) {
                return convertLayout(Direction::Vertical,
                                     box.children,
                                     box.spacing,
                                     box.padding,
                                     box.alignItems,
                                     box.justifyContent,
                                     box.style,
                                     state);
            },
            [&](iur::HBox const& box) {
                return convertLayout(Direction::Horizontal,
                                     box.children,
                                     box.spacing,
                                     box.padding,
                                     box.alignItems,
                                     box.justifyContent,
                                     box.style,
                                     state);
            },
            [](auto const&) { return empty(); },
        },
        element.node);
}

auto TerminalRenderer::convertChildren(std::span<iur::Element const> elements, State const& state) const
    -> std::vector<Node>
{
    auto nodes = std::vector<Node> {};
    for (auto const& element: elements)
    {
        if (auto node = convert(element, state))
            nodes.push_back(std::move(*node));
    }
    return nodes;
}

auto TerminalRenderer::convertTabs(iur::Tabs const& tabs, State const& state) const -> Node
{
    auto headers = std::vector<Node> {};
    for (auto const& tab: tabs.tabs)
    {
        if (tab.visible)
            headers.push_back(convertTab(tab));
    }

    auto children = std::vector<Node> {};
    children.push_back(
        styled(stack(Direction::Horizontal, std::move(headers), { .spacing = 2 }), convertStyle(tabs.style)));

    if (tabs.activeTab)
    {
        auto const active =
            std::ranges::find_if(tabs.tabs, [&](iur::Tab const& tab) { return tab.id == tabs.activeTab; });
        if (active != tabs.tabs.end())
        {
            auto content = convertChildren(active->content, state);
            if (content.size() == 1)
                children.push_back(std::move(content.front()));
            else if (!content.empty())
                children.push_back(stack(Direction::Vertical, std::move(content)));
        }
    }

    auto tabIds = nlohmann::json::array();
    for (auto const& tab: tabs.tabs)
        tabIds.push_back(optionalJson(tab.id));

    return tagged("tabs",
                  stack(Direction::Vertical, std::move(children), { .spacing = 1 }),
                  {
                      { "id", optionalJson(tabs.id) },
                      { "active_tab", optionalJson(tabs.activeTab) },
                      { "position", optionalJson(tabs.position) },
                      { "on_change", handlerJson(tabs.onChange) },
                      { "tabs", std::move(tabIds) },
                  });
}

auto TerminalRenderer::convertLayout(Direction direction,
                                     std::span<iur::Element const> children,
                                     int spacing,
                                     std::optional<int> padding,
                                     std::optional<std::string> const& alignItems,
                                     std::optional<std::string> const& justifyContent,
                                     std::optional<iur::Style> const& style,
                                     State const& state) const -> Node
{
    auto options = StackOptions {
        .spacing = spacing,
        .padding = padding.value_or(0),
        .align = alignItems,
        .justify = justifyContent,
    };
    return styled(stack(direction, convertChildren(children, state), std::move(options)), convertStyle(style));
}

auto extractHandlers(Node const& root) -> std::map<std::string, std::vector<std::string>>
{
    auto handlers = std::map<std::string, std::vector<std::string>> {};
    collectHandlers(root, handlers);
    return handlers;
}

} // namespace uniui::terminal
