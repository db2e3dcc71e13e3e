// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <renderers/AsciiCharts.hpp>
#include <renderers/desktop/DesktopRenderer.hpp>

#include <array>
#include <format>

namespace uniui::desktop
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

    auto widget(std::string type, std::optional<std::string> id, nlohmann::json props, std::vector<Widget> children = {})
        -> Widget
    {
        return Widget { .type = std::move(type), .id = std::move(id), .props = std::move(props), .children = std::move(children) };
    }

    auto convertMenuItem(iur::MenuItem const& item) -> Widget
    {
        auto submenu = std::vector<Widget> {};
        for (auto const& sub: item.submenu)
        {
            if (sub.visible)
                submenu.push_back(convertMenuItem(sub));
        }

        return widget("menu_item",
                      item.id,
                      {
                          { "label", item.label.value_or("") },
                          { "action", handlerJson(item.action) },
                          { "disabled", item.disabled },
                          { "icon", optionalJson(item.icon) },
                          { "shortcut", optionalJson(item.shortcut) },
                      },
                      std::move(submenu));
    }

    auto convertMenuItems(std::vector<iur::MenuItem> const& items) -> std::vector<Widget>
    {
        auto widgets = std::vector<Widget> {};
        for (auto const& item: items)
        {
            if (item.visible)
                widgets.push_back(convertMenuItem(item));
        }
        return widgets;
    }

    auto convertTreeNode(iur::TreeNode const& node) -> Widget
    {
        auto children = std::vector<Widget> {};
        if (node.expanded)
        {
            for (auto const& child: node.children)
            {
                if (child.visible)
                    children.push_back(convertTreeNode(child));
            }
        }

        auto const icon = node.expanded && node.iconExpanded ? node.iconExpanded : node.icon;
        return widget("tree_node",
                      node.id,
                      {
                          { "label", node.label.value_or("") },
                          { "value", node.value },
                          { "expanded", node.expanded },
                          { "icon", optionalJson(icon) },
                          { "selectable", node.selectable },
                          { "has_children", !node.children.empty() },
                      },
                      std::move(children));
    }

    auto layoutProps(int spacing,
                     std::optional<int> padding,
                     std::optional<std::string> const& alignItems,
                     std::optional<std::string> const& justifyContent) -> nlohmann::json
    {
        auto props = nlohmann::json { { "spacing", spacing } };
        if (padding)
            props["padding"] = *padding;
        if (alignItems)
            props["align"] = desktopAlign(*alignItems);
        if (justifyContent)
            props["justify"] = desktopJustify(*justifyContent);
        return props;
    }

    void collectHandlers(Widget const& widget, std::map<std::string, std::vector<std::string>>& handlers)
    {
        if (widget.id)
        {
            for (auto const key: HandlerKeys)
            {
                auto const keyString = std::string(key);
                if (!widget.props.contains(keyString))
                    continue;
                if (auto handler = iur::handlerFromJson(widget.props[keyString]))
                    handlers[*widget.id].push_back(iur::handlerName(*handler));
            }
        }

        for (auto const& child: widget.children)
            collectHandlers(child, handlers);
    }
} // namespace

auto desktopAlign(std::string_view align) -> std::string
{
    if (align == "start")
        return "left";
    if (align == "end")
        return "right";
    return std::string(align);
}

auto desktopJustify(std::string_view justify) -> std::string
{
    if (justify == "start")
        return "top";
    if (justify == "end")
        return "bottom";
    return std::string(justify);
}

auto DesktopRenderer::convert(iur::Element const& element, State const& state) const -> std::optional<Widget>
{
    if (!iur::isVisible(element))
        return std::nullopt;

    log::trace("desktop: converting {}", iur::typeName(element));

    return std::visit(
        overloaded {
            [](iur::Text const& text) { return label(text.content.value_or(""), styleProps(text.style)); },
            [](iur::Button const& widget) {
                auto props = styleProps(widget.style);
                if (widget.disabled)
                    props["disabled"] = true;
                auto result = button(widget.label.value_or(""), handlerJson(widget.onClick), std::move(props));
                result.id = widget.id;
                return result;
            },
            [](iur::Label const& widget) {
                auto props = styleProps(widget.style);
                if (widget.forId)
                    props["label_for"] = *widget.forId;
                auto result = label(widget.text.value_or(""), std::move(props));
                result.id = widget.id;
                return result;
            },
            [](iur::TextInput const& input) {
                auto const display = input.value         ? *input.value
                                     : input.placeholder ? std::format("[{}]", *input.placeholder)
                                                         : std::string { "[________________]" };
                return widget("text_input",
                              input.id,
                              withStyle(
                                  {
                                      { "text", display },
                                      { "value", optionalJson(input.value) },
                                      { "placeholder", optionalJson(input.placeholder) },
                                      { "input_type", input.type },
                                      { "on_change", handlerJson(input.onChange) },
                                      { "on_submit", handlerJson(input.onSubmit) },
                                      { "disabled", input.disabled },
                                      { "form_id", optionalJson(input.formId) },
                                  },
                                  input.style));
            },
            [](iur::Gauge const& gauge) {
                return widget("gauge",
                              gauge.id,
                              withStyle(
                                  {
                                      { "text", charts::gaugeText(gauge) },
                                      { "value", gauge.value },
                                      { "min", gauge.min },
                                      { "max", gauge.max },
                                      { "label", optionalJson(gauge.label) },
                                      { "color_zones", gauge.colorZones },
                                  },
                                  gauge.style));
            },
            [](iur::Sparkline const& sparkline) {
                return widget("sparkline",
                              sparkline.id,
                              withStyle(
                                  {
                                      { "text", charts::sparklineText(sparkline.data) },
                                      { "data", sparkline.data },
                                      { "color", optionalJson(sparkline.color) },
                                      { "show_dots", sparkline.showDots },
                                      { "show_area", sparkline.showArea },
                                  },
                                  sparkline.style));
            },
            [](iur::BarChart const& chart) {
                return widget("bar_chart",
                              chart.id,
                              withStyle(
                                  {
                                      { "text", charts::barChartText(chart) },
                                      { "data", dataJson(chart.data) },
                                      { "orientation", chart.orientation },
                                      { "show_labels", chart.showLabels },
                                  },
                                  chart.style));
            },
            [](iur::LineChart const& chart) {
                return widget("line_chart",
                              chart.id,
                              withStyle(
                                  {
                                      { "text", charts::lineChartText(chart) },
                                      { "data", dataJson(chart.data) },
                                      { "show_dots", chart.showDots },
                                      { "show_area", chart.showArea },
                                  },
                                  chart.style));
            },
            [](iur::Table const& table) {
                auto columns = nlohmann::json::array();
                for (auto const& column: charts::resolveColumns(table))
                    columns.push_back(iur::metadata(iur::Element { column }));

                return widget("table",
                              table.id,
                              withStyle(
                                  {
                                      { "text", charts::tableText(table) },
                                      { "columns", std::move(columns) },
                                      { "rows", charts::sortedRows(table) },
                                      { "selected_row", optionalJson(table.selectedRow) },
                                      { "height", optionalJson(table.height) },
                                      { "on_row_select", handlerJson(table.onRowSelect) },
                                      { "on_sort", handlerJson(table.onSort) },
                                      { "sort_column", optionalJson(table.sortColumn) },
                                      { "sort_direction", iur::sortDirectionName(table.sortDirection) },
                                  },
                                  table.style));
            },
            [](iur::MenuItem const& item) { return convertMenuItem(item); },
            [](iur::Menu const& menu) {
                return widget("menu",
                              menu.id,
                              withStyle({ { "title", optionalJson(menu.title) }, { "position", optionalJson(menu.position) } },
                                        menu.style),
                              convertMenuItems(menu.items));
            },
            [](iur::ContextMenu const& menu) {
                return widget("context_menu",
                              menu.id,
                              withStyle({ { "trigger_on", menu.triggerOn } }, menu.style),
                              convertMenuItems(menu.items));
            },
            [&](iur::Tab const& tab) { return convertTab(tab, state); },
            [&](iur::Tabs const& tabs) {
                auto children = std::vector<Widget> {};
                for (auto const& tab: tabs.tabs)
                {
                    if (tab.visible)
                        children.push_back(convertTab(tab, state));
                }
                return widget("tabs",
                              tabs.id,
                              withStyle(
                                  {
                                      { "active_tab", optionalJson(tabs.activeTab) },
                                      { "position", optionalJson(tabs.position) },
                                      { "on_change", handlerJson(tabs.onChange) },
                                  },
                                  tabs.style),
                              std::move(children));
            },
            [](iur::TreeNode const& node) { return convertTreeNode(node); },
            [](iur::TreeView const& tree) {
                auto roots = std::vector<Widget> {};
                for (auto const& node: tree.rootNodes)
                {
                    if (node.visible)
                        roots.push_back(convertTreeNode(node));
                }
                return widget("tree_view",
                              tree.id,
                              withStyle(
                                  {
                                      { "selected_node", optionalJson(tree.selectedNode) },
                                      { "expanded_nodes", tree.expandedNodes },
                                      { "on_select", handlerJson(tree.onSelect) },
                                      { "on_toggle", handlerJson(tree.onToggle) },
                                      { "show_root", tree.showRoot },
                                  },
                                  tree.style),
                              std::move(roots));
            },
            [&](iur::VBox const& box) {
                auto result = container("vbox",
                                        convertChildren(box.children, state),
                                        withStyle(layoutProps(box.spacing, box.padding, box.alignItems, box.justifyContent),
                                                  box.style));
                result.id = box.id;
                return result;
            },
            [&](iur::HBox const& box) {
                auto result = container("hbox",
                                        convertChildren(box.children, state),
                                        withStyle(layoutProps(box.spacing, box.padding, box.alignItems, box.justifyContent),
                                                  box.style));
                result.id = box.id;
                return result;
            },
            [](auto const&) { return label(""); },
        },
        element.node);
}

auto DesktopRenderer::convertChildren(std::span<iur::Element const> elements, State const& state) const
    -> std::vector<Widget>
{
    auto widgets = std::vector<Widget> {};
    for (auto const& element: elements)
    {
        if (auto widget = convert(element, state))
            widgets.push_back(std::move(*widget));
    }
    return widgets;
}

auto DesktopRenderer::convertTab(iur::Tab const& tab, State const& state) const -> Widget
{
    return widget("tab",
                  tab.id,
                  {
                      { "label", tab.label.value_or("") },
                      { "icon", optionalJson(tab.icon) },
                      { "disabled", tab.disabled },
                      { "closable", tab.closable },
                  },
                  convertChildren(tab.content, state));
}

auto extractHandlers(Widget const& root) -> std::map<std::string, std::vector<std::string>>
{
    auto handlers = std::map<std::string, std::vector<std::string>> {};
    collectHandlers(root, handlers);
    return handlers;
}

} // namespace uniui::desktop
