// SPDX-License-Identifier: Apache-2.0
#include <iur/Element.hpp>

#include <format>

namespace uniui::iur
{

auto Tab::operator==(Tab const&) const -> bool = default;
auto Tabs::operator==(Tabs const&) const -> bool = default;
auto VBox::operator==(VBox const&) const -> bool = default;
auto HBox::operator==(HBox const&) const -> bool = default;
auto Element::operator==(Element const&) const -> bool = default;

namespace
{
    template <class... Ts>
    struct overloaded: Ts...
    {
        using Ts::operator()...;
    };

    template <typename T>
    auto optionalToJson(std::optional<T> const& value) -> nlohmann::json
    {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }

    auto optionalHandlerToJson(std::optional<Handler> const& handler) -> nlohmann::json
    {
        return handler ? handlerToJson(*handler) : nlohmann::json(nullptr);
    }

    auto dataPointsToJson(std::vector<DataPoint> const& points) -> nlohmann::json
    {
        auto result = nlohmann::json::array();
        for (auto const& point: points)
            result.push_back(nlohmann::json::array({ point.label, point.value }));
        return result;
    }

    /// Adds id and style to a metadata record when present.
    auto withCommon(nlohmann::json meta,
                    std::optional<std::string> const& id,
                    std::optional<Style> const& style) -> nlohmann::json
    {
        if (id)
            meta["id"] = *id;
        if (style)
            meta["style"] = toJson(*style);
        return meta;
    }

    auto columnMetadata(Column const& column) -> nlohmann::json
    {
        return {
            { "type", "column" },
            { "key", column.key },
            { "header", optionalToJson(column.header) },
            { "sortable", column.sortable },
            { "formatter", optionalToJson(column.formatter) },
            { "width", optionalToJson(column.width) },
            { "align", column.align },
            { "visible", true },
        };
    }

    auto menuItemMetadata(MenuItem const& item) -> nlohmann::json
    {
        auto submenu = nlohmann::json::array();
        for (auto const& sub: item.submenu)
            submenu.push_back(menuItemMetadata(sub));

        return withCommon(
            {
                { "type", "menu_item" },
                { "label", optionalToJson(item.label) },
                { "action", optionalHandlerToJson(item.action) },
                { "disabled", item.disabled },
                { "icon", optionalToJson(item.icon) },
                { "shortcut", optionalToJson(item.shortcut) },
                { "submenu", item.submenu.empty() ? nlohmann::json(nullptr) : submenu },
                { "visible", item.visible },
            },
            item.id,
            std::nullopt);
    }

    auto treeNodeMetadata(TreeNode const& node) -> nlohmann::json
    {
        auto nodes = nlohmann::json::array();
        for (auto const& child: node.children)
            nodes.push_back(treeNodeMetadata(child));

        return withCommon(
            {
                { "type", "tree_node" },
                { "label", optionalToJson(node.label) },
                { "value", node.value },
                { "expanded", node.expanded },
                { "icon", optionalToJson(node.icon) },
                { "icon_expanded", optionalToJson(node.iconExpanded) },
                { "selectable", node.selectable },
                { "children", node.children.empty() ? nlohmann::json(nullptr) : nodes },
                { "visible", node.visible },
            },
            node.id,
            std::nullopt);
    }

    auto tabMetadata(Tab const& tab) -> nlohmann::json
    {
        auto content = nlohmann::json::array();
        for (auto const& element: tab.content)
            content.push_back(toJson(element));

        return withCommon(
            {
                { "type", "tab" },
                { "label", optionalToJson(tab.label) },
                { "icon", optionalToJson(tab.icon) },
                { "disabled", tab.disabled },
                { "closable", tab.closable },
                { "content", content },
                { "visible", tab.visible },
            },
            tab.id,
            std::nullopt);
    }

    auto layoutMetadata(std::string_view type,
                        int spacing,
                        std::optional<std::string> const& alignItems,
                        std::optional<std::string> const& justifyContent,
                        std::optional<int> const& padding,
                        bool visible) -> nlohmann::json
    {
        return {
            { "type", type },
            { "spacing", spacing },
            { "align_items", optionalToJson(alignItems) },
            { "justify_content", optionalToJson(justifyContent) },
            { "padding", optionalToJson(padding) },
            { "visible", visible },
        };
    }
} // namespace

// =============================================================================
// Handlers
// =============================================================================

auto handlerFromJson(nlohmann::json const& value) -> std::optional<Handler>
{
    if (value.is_string())
        return Handler { value.get<std::string>() };

    if (value.is_object())
    {
        if (value.contains("module") && value["module"].is_string() && value.contains("function")
            && value["function"].is_string())
        {
            return Handler { RemoteCall {
                .module = value["module"].get<std::string>(),
                .function = value["function"].get<std::string>(),
                .args = value.value("args", nlohmann::json::array()),
            } };
        }
        if (value.contains("name") && value["name"].is_string())
        {
            return Handler { NamedHandler {
                .name = value["name"].get<std::string>(),
                .payload = value.value("payload", nlohmann::json::object()),
            } };
        }
        return std::nullopt;
    }

    if (value.is_array())
    {
        if (value.size() == 3 && value[0].is_string() && value[1].is_string())
        {
            return Handler { RemoteCall {
                .module = value[0].get<std::string>(),
                .function = value[1].get<std::string>(),
                .args = value[2].is_array() ? value[2] : nlohmann::json::array({ value[2] }),
            } };
        }
        if (value.size() == 2 && value[0].is_string())
            return Handler { NamedHandler { .name = value[0].get<std::string>(), .payload = value[1] } };
    }

    return std::nullopt;
}

auto handlerToJson(Handler const& handler) -> nlohmann::json
{
    return std::visit(overloaded {
                          [](std::string const& name) -> nlohmann::json { return name; },
                          [](NamedHandler const& named) -> nlohmann::json {
                              return { { "name", named.name }, { "payload", named.payload } };
                          },
                          [](RemoteCall const& call) -> nlohmann::json {
                              return { { "module", call.module },
                                       { "function", call.function },
                                       { "args", call.args } };
                          },
                      },
                      handler);
}

auto handlerName(Handler const& handler) -> std::string
{
    return std::visit(overloaded {
                          [](std::string const& name) { return name; },
                          [](NamedHandler const& named) { return named.name; },
                          [](RemoteCall const& call) { return std::format("{}.{}", call.module, call.function); },
                      },
                      handler);
}

auto sortDirectionName(SortDirection direction) -> std::string_view
{
    return direction == SortDirection::Desc ? "desc" : "asc";
}

// =============================================================================
// Element protocol
// =============================================================================

auto typeName(Element const& element) -> std::string_view
{
    return std::visit(overloaded {
                          [](Unknown const&) { return std::string_view { "unknown" }; },
                          [](Text const&) { return std::string_view { "text" }; },
                          [](Button const&) { return std::string_view { "button" }; },
                          [](Label const&) { return std::string_view { "label" }; },
                          [](TextInput const&) { return std::string_view { "text_input" }; },
                          [](Gauge const&) { return std::string_view { "gauge" }; },
                          [](Sparkline const&) { return std::string_view { "sparkline" }; },
                          [](BarChart const&) { return std::string_view { "bar_chart" }; },
                          [](LineChart const&) { return std::string_view { "line_chart" }; },
                          [](Table const&) { return std::string_view { "table" }; },
                          [](Column const&) { return std::string_view { "column" }; },
                          [](Menu const&) { return std::string_view { "menu" }; },
                          [](MenuItem const&) { return std::string_view { "menu_item" }; },
                          [](ContextMenu const&) { return std::string_view { "context_menu" }; },
                          [](Tabs const&) { return std::string_view { "tabs" }; },
                          [](Tab const&) { return std::string_view { "tab" }; },
                          [](TreeView const&) { return std::string_view { "tree_view" }; },
                          [](TreeNode const&) { return std::string_view { "tree_node" }; },
                          [](VBox const&) { return std::string_view { "vbox" }; },
                          [](HBox const&) { return std::string_view { "hbox" }; },
                      },
                      element.node);
}

auto children(Element const& element) -> std::span<Element const>
{
    if (auto const* vbox = element.as<VBox>())
        return vbox->children;
    if (auto const* hbox = element.as<HBox>())
        return hbox->children;
    return {};
}

auto metadata(Element const& element) -> nlohmann::json
{
    return std::visit(
        overloaded {
            [](Unknown const&) -> nlohmann::json { return { { "type", "unknown" } }; },
            [](Text const& text) {
                return withCommon({ { "type", "text" },
                                    { "content", optionalToJson(text.content) },
                                    { "visible", text.visible } },
                                  text.id,
                                  text.style);
            },
            [](Button const& button) {
                return withCommon({ { "type", "button" },
                                    { "label", optionalToJson(button.label) },
                                    { "on_click", optionalHandlerToJson(button.onClick) },
                                    { "disabled", button.disabled },
                                    { "visible", button.visible } },
                                  button.id,
                                  button.style);
            },
            [](Label const& label) {
                return withCommon({ { "type", "label" },
                                    { "for", optionalToJson(label.forId) },
                                    { "text", optionalToJson(label.text) },
                                    { "visible", label.visible } },
                                  label.id,
                                  label.style);
            },
            [](TextInput const& input) {
                return withCommon({ { "type", "text_input" },
                                    { "value", optionalToJson(input.value) },
                                    { "placeholder", optionalToJson(input.placeholder) },
                                    { "input_type", input.type },
                                    { "on_change", optionalHandlerToJson(input.onChange) },
                                    { "on_submit", optionalHandlerToJson(input.onSubmit) },
                                    { "form_id", optionalToJson(input.formId) },
                                    { "disabled", input.disabled },
                                    { "visible", input.visible } },
                                  input.id,
                                  input.style);
            },
            [](Gauge const& gauge) {
                return withCommon({ { "type", "gauge" },
                                    { "value", gauge.value },
                                    { "min", gauge.min },
                                    { "max", gauge.max },
                                    { "label", optionalToJson(gauge.label) },
                                    { "width", optionalToJson(gauge.width) },
                                    { "height", optionalToJson(gauge.height) },
                                    { "color_zones", gauge.colorZones },
                                    { "visible", gauge.visible } },
                                  gauge.id,
                                  gauge.style);
            },
            [](Sparkline const& sparkline) {
                return withCommon({ { "type", "sparkline" },
                                    { "data", sparkline.data },
                                    { "width", optionalToJson(sparkline.width) },
                                    { "height", optionalToJson(sparkline.height) },
                                    { "color", optionalToJson(sparkline.color) },
                                    { "show_dots", sparkline.showDots },
                                    { "show_area", sparkline.showArea },
                                    { "visible", sparkline.visible } },
                                  sparkline.id,
                                  sparkline.style);
            },
            [](BarChart const& chart) {
                return withCommon({ { "type", "bar_chart" },
                                    { "data", dataPointsToJson(chart.data) },
                                    { "width", optionalToJson(chart.width) },
                                    { "height", optionalToJson(chart.height) },
                                    { "orientation", chart.orientation },
                                    { "show_labels", chart.showLabels },
                                    { "visible", chart.visible } },
                                  chart.id,
                                  chart.style);
            },
            [](LineChart const& chart) {
                return withCommon({ { "type", "line_chart" },
                                    { "data", dataPointsToJson(chart.data) },
                                    { "width", optionalToJson(chart.width) },
                                    { "height", optionalToJson(chart.height) },
                                    { "show_dots", chart.showDots },
                                    { "show_area", chart.showArea },
                                    { "visible", chart.visible } },
                                  chart.id,
                                  chart.style);
            },
            [](Table const& table) {
                auto columns = nlohmann::json::array();
                for (auto const& column: table.columns)
                    columns.push_back(columnMetadata(column));
                return withCommon({ { "type", "table" },
                                    { "data", table.data },
                                    { "columns", table.columns.empty() ? nlohmann::json(nullptr) : columns },
                                    { "selected_row", optionalToJson(table.selectedRow) },
                                    { "height", optionalToJson(table.height) },
                                    { "on_row_select", optionalHandlerToJson(table.onRowSelect) },
                                    { "on_sort", optionalHandlerToJson(table.onSort) },
                                    { "sort_column", optionalToJson(table.sortColumn) },
                                    { "sort_direction", sortDirectionName(table.sortDirection) },
                                    { "visible", table.visible } },
                                  table.id,
                                  table.style);
            },
            [](Column const& column) { return columnMetadata(column); },
            [](Menu const& menu) {
                auto items = nlohmann::json::array();
                for (auto const& item: menu.items)
                    items.push_back(menuItemMetadata(item));
                return withCommon({ { "type", "menu" },
                                    { "title", optionalToJson(menu.title) },
                                    { "position", optionalToJson(menu.position) },
                                    { "items", items },
                                    { "visible", menu.visible } },
                                  menu.id,
                                  menu.style);
            },
            [](MenuItem const& item) { return menuItemMetadata(item); },
            [](ContextMenu const& menu) {
                auto items = nlohmann::json::array();
                for (auto const& item: menu.items)
                    items.push_back(menuItemMetadata(item));
                return withCommon({ { "type", "context_menu" },
                                    { "trigger_on", menu.triggerOn },
                                    { "items", items },
                                    { "visible", menu.visible } },
                                  menu.id,
                                  menu.style);
            },
            [](Tabs const& tabs) {
                auto list = nlohmann::json::array();
                for (auto const& tab: tabs.tabs)
                    list.push_back(tabMetadata(tab));
                return withCommon({ { "type", "tabs" },
                                    { "active_tab", optionalToJson(tabs.activeTab) },
                                    { "position", optionalToJson(tabs.position) },
                                    { "on_change", optionalHandlerToJson(tabs.onChange) },
                                    { "tabs", list },
                                    { "visible", tabs.visible } },
                                  tabs.id,
                                  tabs.style);
            },
            [](Tab const& tab) { return tabMetadata(tab); },
            [](TreeView const& tree) {
                auto nodes = nlohmann::json::array();
                for (auto const& node: tree.rootNodes)
                    nodes.push_back(treeNodeMetadata(node));
                return withCommon({ { "type", "tree_view" },
                                    { "root_nodes", nodes },
                                    { "selected_node", optionalToJson(tree.selectedNode) },
                                    { "expanded_nodes", tree.expandedNodes },
                                    { "on_select", optionalHandlerToJson(tree.onSelect) },
                                    { "on_toggle", optionalHandlerToJson(tree.onToggle) },
                                    { "show_root", tree.showRoot },
                                    { "visible", tree.visible } },
                                  tree.id,
                                  tree.style);
            },
            [](TreeNode const& node) { return treeNodeMetadata(node); },
            [](VBox const& vbox) {
                return withCommon(
                    layoutMetadata("vbox", vbox.spacing, vbox.alignItems, vbox.justifyContent, vbox.padding, vbox.visible),
                    vbox.id,
                    vbox.style);
            },
            [](HBox const& hbox) {
                return withCommon(
                    layoutMetadata("hbox", hbox.spacing, hbox.alignItems, hbox.justifyContent, hbox.padding, hbox.visible),
                    hbox.id,
                    hbox.style);
            },
        },
        element.node);
}

auto toJson(Element const& element) -> nlohmann::json
{
    auto result = metadata(element);
    if (element.is<VBox>() || element.is<HBox>())
    {
        auto list = nlohmann::json::array();
        for (auto const& child: children(element))
            list.push_back(toJson(child));
        result["children"] = std::move(list);
    }
    return result;
}

auto isVisible(Element const& element) -> bool
{
    return std::visit(overloaded {
                          [](Unknown const&) { return true; },
                          [](Column const&) { return true; },
                          [](auto const& value) { return value.visible; },
                      },
                      element.node);
}

auto elementId(Element const& element) -> std::optional<std::string>
{
    return std::visit(overloaded {
                          [](Unknown const&) -> std::optional<std::string> { return std::nullopt; },
                          [](Column const&) -> std::optional<std::string> { return std::nullopt; },
                          [](auto const& value) -> std::optional<std::string> { return value.id; },
                      },
                      element.node);
}

auto elementStyle(Element const& element) -> std::optional<Style>
{
    return std::visit(overloaded {
                          [](Unknown const&) -> std::optional<Style> { return std::nullopt; },
                          [](Column const&) -> std::optional<Style> { return std::nullopt; },
                          [](MenuItem const&) -> std::optional<Style> { return std::nullopt; },
                          [](Tab const&) -> std::optional<Style> { return std::nullopt; },
                          [](TreeNode const&) -> std::optional<Style> { return std::nullopt; },
                          [](auto const& value) -> std::optional<Style> { return value.style; },
                      },
                      element.node);
}

} // namespace uniui::iur
