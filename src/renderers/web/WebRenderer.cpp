// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <renderers/AsciiCharts.hpp>
#include <renderers/web/Html.hpp>
#include <renderers/web/WebRenderer.hpp>
#include <table/Sort.hpp>

#include <algorithm>
#include <format>

namespace uniui::web
{

namespace
{
    template <class... Ts>
    struct overloaded: Ts...
    {
        using Ts::operator()...;
    };

    auto boundEvent(std::optional<iur::Handler> const& handler) -> std::string
    {
        return handler ? eventName(*handler) : std::string {};
    }

    auto flag(bool value) -> std::string
    {
        return value ? "true" : "";
    }

    auto dataPoints(std::vector<iur::DataPoint> const& data) -> std::string
    {
        auto points = nlohmann::json::array();
        for (auto const& point: data)
            points.push_back(nlohmann::json::array({ point.label, point.value }));
        return points.dump();
    }

    auto chart(std::string_view cssClass,
               std::optional<std::string> const& id,
               std::string points,
               std::optional<iur::Style> const& style,
               std::string_view text,
               std::vector<Attribute> extra = {}) -> std::string
    {
        auto attrs = std::vector<Attribute> {
            { "id", id.value_or("") },
            { "class", std::string(cssClass) },
            { "data-points", std::move(points) },
        };
        attrs.insert(attrs.end(), std::make_move_iterator(extra.begin()), std::make_move_iterator(extra.end()));
        attrs.emplace_back("style", toCss(style));
        return element("pre", attrs, escape(text));
    }

    auto flexAlign(std::string_view value) -> std::string
    {
        if (value == "start")
            return "flex-start";
        if (value == "end")
            return "flex-end";
        return std::string(value);
    }

    auto convertMenuItem(iur::MenuItem const& item) -> std::string
    {
        auto content = std::string {};
        if (item.icon)
            content += element("span", { { "class", "icon" } }, escape(*item.icon));
        content += escape(item.label.value_or(""));
        if (item.shortcut)
            content += element("kbd", {}, escape(*item.shortcut));

        auto submenu = std::string {};
        for (auto const& sub: item.submenu)
        {
            if (sub.visible)
                submenu += convertMenuItem(sub);
        }
        if (!submenu.empty())
            content += element("ul", { { "class", "submenu" } }, submenu);

        return element("li",
                       {
                           { "id", item.id.value_or("") },
                           { "class", "menu-item" },
                           { "aria-disabled", flag(item.disabled) },
                           { "phx-click", item.disabled ? std::string {} : boundEvent(item.action) },
                       },
                       content);
    }

    auto convertMenuItems(std::vector<iur::MenuItem> const& items) -> std::string
    {
        auto html = std::string {};
        for (auto const& item: items)
        {
            if (item.visible)
                html += convertMenuItem(item);
        }
        return html;
    }

    auto convertTab(iur::Tab const& tab, bool selected, std::optional<iur::Handler> const& onChange) -> std::string
    {
        auto content = std::string {};
        if (tab.icon)
            content += element("span", { { "class", "icon" } }, escape(*tab.icon));
        content += escape(tab.label.value_or(""));
        if (tab.closable)
            content += element("span", { { "class", "close" } }, "×");

        return element("button",
                       {
                           { "role", "tab" },
                           { "id", tab.id.value_or("") },
                           { "aria-selected", selected ? "true" : "false" },
                           { "disabled", flag(tab.disabled) },
                           { "phx-click", tab.disabled ? std::string {} : boundEvent(onChange) },
                           { "phx-value-tab", tab.id.value_or("") },
                       },
                       content);
    }

    auto convertTreeNode(iur::TreeNode const& node, std::optional<iur::Handler> const& onSelect) -> std::string
    {
        auto const hasChildren = !node.children.empty();
        auto content = std::string {};
        auto const icon = node.expanded && node.iconExpanded ? node.iconExpanded : node.icon;
        if (icon)
            content += element("span", { { "class", "icon" } }, escape(*icon));
        content += escape(node.label.value_or(""));

        if (hasChildren && node.expanded)
        {
            auto children = std::string {};
            for (auto const& child: node.children)
            {
                if (child.visible)
                    children += convertTreeNode(child, onSelect);
            }
            content += element("ul", { { "role", "group" } }, children);
        }

        return element("li",
                       {
                           { "id", node.id.value_or("") },
                           { "role", "treeitem" },
                           { "aria-expanded", hasChildren ? (node.expanded ? "true" : "false") : "" },
                           { "data-value", node.value.is_null() ? std::string {} : node.value.dump() },
                           { "phx-click", node.selectable ? boundEvent(onSelect) : std::string {} },
                           { "phx-value-node", node.id.value_or("") },
                       },
                       content);
    }

    auto convertTable(iur::Table const& table) -> std::string
    {
        auto const columns = charts::resolveColumns(table);
        auto const rows = charts::sortedRows(table);
        auto const tableAttrs = std::vector<Attribute> {
            { "id", table.id.value_or("") },
            { "class", "table" },
            { "style", toCss(table.style) },
        };
        if (columns.empty())
            return element("table", tableAttrs, "");

        auto header = std::string {};
        for (auto const& column: columns)
        {
            auto const sorted = table.sortColumn == column.key;
            auto const ascending = table.sortDirection == iur::SortDirection::Asc;
            auto label = escape(column.header.value_or(""));
            if (sorted)
                label += ascending ? " ↑" : " ↓";

            header += element("th",
                              {
                                  { "data-key", column.key },
                                  { "aria-sort", sorted ? (ascending ? "ascending" : "descending") : "" },
                                  { "phx-click", column.sortable ? boundEvent(table.onSort) : std::string {} },
                                  { "phx-value-column", column.sortable && table.onSort ? column.key : std::string {} },
                              },
                              label);
        }

        auto body = std::string {};
        auto index = 0;
        for (auto const& row: rows)
        {
            auto cells = std::string {};
            for (auto const& column: columns)
            {
                auto const alignment = column.align == "left" ? std::string {} : std::format("text-align: {}", column.align);
                cells += element("td",
                                 { { "style", alignment } },
                                 escape(charts::formatCell(column, uniui::table::cellValue(row, column.key))));
            }

            body += element("tr",
                            {
                                { "class", table.selectedRow == index ? "selected" : "" },
                                { "phx-click", boundEvent(table.onRowSelect) },
                                { "phx-value-row", table.onRowSelect ? std::to_string(index) : std::string {} },
                            },
                            cells);
            ++index;
        }

        return element("table",
                       tableAttrs,
                       element("thead", {}, element("tr", {}, header)) + element("tbody", {}, body));
    }
} // namespace

auto WebRenderer::convert(iur::Element const& element, State const& state) const -> std::optional<std::string>
{
    if (!iur::isVisible(element))
        return std::nullopt;

    log::trace("web: converting {}", iur::typeName(element));

    return std::visit(
        overloaded {
            [](iur::Text const& text) {
                return web::element("span", { { "style", toCss(text.style) } }, escape(text.content.value_or("")));
            },
            [](iur::Button const& button) {
                return web::element("button",
                                    {
                                        { "id", button.id.value_or("") },
                                        { "disabled", flag(button.disabled) },
                                        { "phx-click", boundEvent(button.onClick) },
                                        { "style", toCss(button.style) },
                                    },
                                    escape(button.label.value_or("")));
            },
            [](iur::Label const& label) {
                return web::element("label",
                                    { { "for", label.forId.value_or("") }, { "style", toCss(label.style) } },
                                    escape(label.text.value_or("")));
            },
            [](iur::TextInput const& input) {
                return voidElement("input",
                                   {
                                       { "form", input.formId.value_or("") },
                                       { "disabled", flag(input.disabled) },
                                       { "phx-change", boundEvent(input.onChange) },
                                       { "phx-submit", boundEvent(input.onSubmit) },
                                       { "placeholder", input.placeholder.value_or("") },
                                       { "value", input.value.value_or("") },
                                       { "id", input.id.value_or("") },
                                       { "style", toCss(input.style) },
                                       { "type", std::string(inputType(input.type)) },
                                   });
            },
            [](iur::Gauge const& gauge) {
                auto content = std::string {};
                if (gauge.label)
                    content += web::element("span", { { "class", "gauge-label" } }, escape(*gauge.label));
                content += web::element("meter",
                                        {
                                            { "min", charts::formatNumber(gauge.min) },
                                            { "max", charts::formatNumber(gauge.max) },
                                            { "value", charts::formatNumber(gauge.value) },
                                        },
                                        escape(std::format("{}/{}",
                                                           charts::formatNumber(gauge.value),
                                                           charts::formatNumber(gauge.max))));
                return web::element(
                    "div",
                    { { "id", gauge.id.value_or("") }, { "class", "gauge" }, { "style", toCss(gauge.style) } },
                    content);
            },
            [](iur::Sparkline const& sparkline) {
                return chart("sparkline",
                             sparkline.id,
                             nlohmann::json(sparkline.data).dump(),
                             sparkline.style,
                             charts::sparklineText(sparkline.data));
            },
            [](iur::BarChart const& bars) {
                return chart("bar-chart",
                             bars.id,
                             dataPoints(bars.data),
                             bars.style,
                             charts::barChartText(bars),
                             { { "data-orientation", bars.orientation } });
            },
            [](iur::LineChart const& line) {
                return chart("line-chart", line.id, dataPoints(line.data), line.style, charts::lineChartText(line));
            },
            [](iur::Table const& table) { return convertTable(table); },
            [](iur::MenuItem const& item) { return convertMenuItem(item); },
            [](iur::Menu const& menu) {
                auto content = std::string {};
                if (menu.title)
                    content += web::element("div", { { "class", "menu-title" } }, escape(*menu.title));
                content += web::element("ul", {}, convertMenuItems(menu.items));
                return web::element("nav",
                                    {
                                        { "id", menu.id.value_or("") },
                                        { "class", "menu" },
                                        { "data-position", menu.position.value_or("") },
                                        { "style", toCss(menu.style) },
                                    },
                                    content);
            },
            [](iur::ContextMenu const& menu) {
                return web::element("ul",
                                    {
                                        { "id", menu.id.value_or("") },
                                        { "class", "context-menu" },
                                        { "data-trigger", menu.triggerOn },
                                        { "style", toCss(menu.style) },
                                    },
                                    convertMenuItems(menu.items));
            },
            [](iur::Tab const& tab) { return convertTab(tab, false, std::nullopt); },
            [&](iur::Tabs const& tabs) { return convertTabs(tabs, state); },
            [](iur::TreeNode const& node) { return convertTreeNode(node, std::nullopt); },
            [](iur::TreeView const& tree) {
                auto nodes = std::string {};
                for (auto const& node: tree.rootNodes)
                {
                    if (node.visible)
                        nodes += convertTreeNode(node, tree.onSelect);
                }
                return web::element("ul",
                                    {
                                        { "id", tree.id.value_or("") },
                                        { "class", "tree-view" },
                                        { "role", "tree" },
                                        { "data-on-toggle", boundEvent(tree.onToggle) },
                                        { "style", toCss(tree.style) },
                                    },
                                    nodes);
            },
            [&](iur::VBox const& box) {
                return convertLayout("column",
                                     box.id,
                                     box.children,
                                     box.spacing,
                                     box.padding,
                                     box.alignItems,
                                     box.justifyContent,
                                     box.style,
                                     state);
            },
            [&](iur::HBox const& box) {
                return convertLayout("row",
                                     box.id,
                                     box.children,
                                     box.spacing,
                                     box.padding,
                                     box.alignItems,
                                     box.justifyContent,
                                     box.style,
                                     state);
            },
            [](auto const&) { return std::string { "<span></span>" }; },
        },
        element.node);
}

auto WebRenderer::convertChildren(std::span<iur::Element const> elements, State const& state) const -> std::string
{
    auto html = std::string {};
    for (auto const& child: elements)
    {
        if (auto converted = convert(child, state))
            html += *converted;
    }
    return html;
}

auto WebRenderer::convertTabs(iur::Tabs const& tabs, State const& state) const -> std::string
{
    auto bar = std::string {};
    for (auto const& tab: tabs.tabs)
    {
        if (tab.visible)
            bar += convertTab(tab, tabs.activeTab && tab.id == tabs.activeTab, tabs.onChange);
    }

    auto content = element("div", { { "role", "tablist" } }, bar);
    if (tabs.activeTab)
    {
        auto const active =
            std::ranges::find_if(tabs.tabs, [&](iur::Tab const& tab) { return tab.id == tabs.activeTab; });
        if (active != tabs.tabs.end())
            content += element("div", { { "role", "tabpanel" } }, convertChildren(active->content, state));
    }

    return element("div",
                   {
                       { "id", tabs.id.value_or("") },
                       { "class", "tabs" },
                       { "data-position", tabs.position.value_or("") },
                       { "style", toCss(tabs.style) },
                   },
                   content);
}

auto WebRenderer::convertLayout(std::string_view direction,
                                std::optional<std::string> const& id,
                                std::span<iur::Element const> children,
                                int spacing,
                                std::optional<int> padding,
                                std::optional<std::string> const& alignItems,
                                std::optional<std::string> const& justifyContent,
                                std::optional<iur::Style> const& style,
                                State const& state) const -> std::string
{
    auto css = std::vector<std::string> { "display: flex", std::format("flex-direction: {}", direction) };
    if (spacing > 0)
        css.push_back(std::format("gap: {}px", spacing));
    if (padding)
        css.push_back(std::format("padding: {}px", *padding));
    if (alignItems)
        css.push_back(std::format("align-items: {}", flexAlign(*alignItems)));
    if (justifyContent)
        css.push_back(std::format("justify-content: {}", flexAlign(*justifyContent)));
    css.push_back(toCss(style));

    return element("div", { { "id", id.value_or("") }, { "style", joinCss(css) } }, convertChildren(children, state));
}

auto htmlDocument(std::string_view body, std::string_view title) -> std::string
{
    return std::format("<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\" />\n<title>{}</title>\n</head>\n"
                       "<body>\n{}\n</body>\n</html>\n",
                       escape(title),
                       body);
}

} // namespace uniui::web
