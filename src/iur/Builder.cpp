// SPDX-License-Identifier: Apache-2.0
#include <iur/Builder.hpp>

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace uniui::iur
{

namespace
{
    auto optString(nlohmann::json const& attrs, std::string_view key) -> std::optional<std::string>
    {
        auto const value = json::getOpt(attrs, key);
        if (!value)
            return std::nullopt;
        if (value->is_string())
            return value->get<std::string>();
        return value->dump();
    }

    auto optHandler(nlohmann::json const& attrs, std::string_view key) -> std::optional<Handler>
    {
        if (auto const value = json::getOpt(attrs, key))
            return handlerFromJson(*value);
        return std::nullopt;
    }

    auto style(nlohmann::json const& attrs, StyleRegistry const& styles) -> std::optional<Style>
    {
        return resolveRef(styles, json::getOpt(attrs, "style").value_or(nullptr));
    }

    auto visible(nlohmann::json const& attrs) -> bool
    {
        return json::getBoolOr(attrs, "visible", true);
    }

    auto numbers(nlohmann::json const& value) -> std::vector<double>
    {
        auto result = std::vector<double> {};
        if (!value.is_array())
            return result;
        for (auto const& item: value)
        {
            if (item.is_number())
                result.push_back(item.get<double>());
        }
        return result;
    }

    auto dataPoints(nlohmann::json const& value) -> std::vector<DataPoint>
    {
        auto result = std::vector<DataPoint> {};
        if (!value.is_array())
            return result;

        for (auto const& item: value)
        {
            if (item.is_array() && item.size() == 2 && item[1].is_number())
            {
                auto label = item[0].is_string() ? item[0].get<std::string>() : item[0].dump();
                result.push_back({ std::move(label), item[1].get<double>() });
            }
            else if (item.is_object())
            {
                result.push_back({ json::getStringOr(item, "label", ""), json::getDoubleOr(item, "value", 0.0) });
            }
        }
        return result;
    }

    auto stringList(nlohmann::json const& value) -> std::vector<std::string>
    {
        auto result = std::vector<std::string> {};
        if (!value.is_array())
            return result;
        for (auto const& item: value)
        {
            if (item.is_string())
                result.push_back(item.get<std::string>());
        }
        return result;
    }

    auto normalizeColumns(nlohmann::json const& columns) -> std::vector<Column>
    {
        auto result = std::vector<Column> {};
        if (!columns.is_array())
            return result;

        for (auto const& column: columns)
        {
            if (column.is_object() && column.contains("name"))
                result.push_back(buildColumn(column));
            else if (column.is_object() || column.is_array())
                result.push_back(buildColumn({ { "attrs", column } }));
            else if (column.is_string())
                result.push_back(Column { .key = column.get<std::string>() });
        }
        return result;
    }

    auto buildText(nlohmann::json const& attrs, StyleRegistry const& styles) -> Text
    {
        return Text {
            .content = optString(attrs, "content"),
            .id = optString(attrs, "id"),
            .style = style(attrs, styles),
            .visible = visible(attrs),
        };
    }

    auto buildButton(nlohmann::json const& attrs, StyleRegistry const& styles) -> Button
    {
        auto label = json::getOpt(attrs, "label");
        return Button {
            .label = label && label->is_string() ? std::optional(label->get<std::string>()) : std::nullopt,
            .onClick = optHandler(attrs, "on_click"),
            .id = optString(attrs, "id"),
            .style = style(attrs, styles),
            .disabled = json::getBoolOr(attrs, "disabled", false),
            .visible = visible(attrs),
        };
    }

    auto buildLabel(nlohmann::json const& attrs, StyleRegistry const& styles) -> Label
    {
        return Label {
            .forId = optString(attrs, "for"),
            .text = optString(attrs, "text"),
            .id = optString(attrs, "id"),
            .style = style(attrs, styles),
            .visible = visible(attrs),
        };
    }

    auto buildTextInput(nlohmann::json const& attrs, StyleRegistry const& styles) -> TextInput
    {
        return TextInput {
            .id = optString(attrs, "id"),
            .value = optString(attrs, "value"),
            .placeholder = optString(attrs, "placeholder"),
            .type = json::getStringOr(attrs, "type", "text"),
            .onChange = optHandler(attrs, "on_change"),
            .onSubmit = optHandler(attrs, "on_submit"),
            .formId = optString(attrs, "form_id"),
            .disabled = json::getBoolOr(attrs, "disabled", false),
            .style = style(attrs, styles),
            .visible = visible(attrs),
        };
    }

    auto buildGauge(nlohmann::json const& attrs, StyleRegistry const& styles) -> Gauge
    {
        return Gauge {
            .id = optString(attrs, "id"),
            .value = json::getDoubleOr(attrs, "value", 0.0),
            .min = json::getDoubleOr(attrs, "min", 0.0),
            .max = json::getDoubleOr(attrs, "max", 100.0),
            .label = optString(attrs, "label"),
            .width = json::getOptInt(attrs, "width"),
            .height = json::getOptInt(attrs, "height"),
            .colorZones = json::getOpt(attrs, "color_zones").value_or(nullptr),
            .style = style(attrs, styles),
            .visible = visible(attrs),
        };
    }

    auto buildSparkline(nlohmann::json const& attrs, StyleRegistry const& styles) -> Sparkline
    {
        return Sparkline {
            .id = optString(attrs, "id"),
            .data = numbers(json::getOpt(attrs, "data").value_or(nullptr)),
            .width = json::getOptInt(attrs, "width"),
            .height = json::getOptInt(attrs, "height"),
            .color = optString(attrs, "color"),
            .showDots = json::getBoolOr(attrs, "show_dots", false),
            .showArea = json::getBoolOr(attrs, "show_area", false),
            .style = style(attrs, styles),
            .visible = visible(attrs),
        };
    }

    auto buildBarChart(nlohmann::json const& attrs, StyleRegistry const& styles) -> BarChart
    {
        return BarChart {
            .id = optString(attrs, "id"),
            .data = dataPoints(json::getOpt(attrs, "data").value_or(nullptr)),
            .width = json::getOptInt(attrs, "width"),
            .height = json::getOptInt(attrs, "height"),
            .orientation = json::getStringOr(attrs, "orientation", "horizontal"),
            .showLabels = json::getBoolOr(attrs, "show_labels", true),
            .style = style(attrs, styles),
            .visible = visible(attrs),
        };
    }

    auto buildLineChart(nlohmann::json const& attrs, StyleRegistry const& styles) -> LineChart
    {
        return LineChart {
            .id = optString(attrs, "id"),
            .data = dataPoints(json::getOpt(attrs, "data").value_or(nullptr)),
            .width = json::getOptInt(attrs, "width"),
            .height = json::getOptInt(attrs, "height"),
            .showDots = json::getBoolOr(attrs, "show_dots", true),
            .showArea = json::getBoolOr(attrs, "show_area", false),
            .style = style(attrs, styles),
            .visible = visible(attrs),
        };
    }

    auto buildTable(nlohmann::json const& entity, StyleRegistry const& styles) -> Table
    {
        auto const attrs = entityAttrs(entity);

        auto columns = std::vector<Column> {};
        for (auto const& nested: nestedEntities(entity, "columns", "column"))
            columns.push_back(buildColumn(nested));
        if (columns.empty())
            columns = normalizeColumns(json::getOpt(attrs, "columns").value_or(nullptr));

        auto data = json::getOpt(attrs, "data").value_or(nlohmann::json::array());

        return Table {
            .id = optString(attrs, "id"),
            .data = data.is_array() ? std::move(data) : nlohmann::json::array(),
            .columns = std::move(columns),
            .selectedRow = json::getOptInt(attrs, "selected_row"),
            .height = json::getOptInt(attrs, "height"),
            .onRowSelect = optHandler(attrs, "on_row_select"),
            .onSort = optHandler(attrs, "on_sort"),
            .sortColumn = optString(attrs, "sort_column"),
            .sortDirection =
                json::getStringOr(attrs, "sort_direction", "asc") == "desc" ? SortDirection::Desc : SortDirection::Asc,
            .style = style(attrs, styles),
            .visible = visible(attrs),
        };
    }

    template <typename Layout>
    auto buildLayout(nlohmann::json const& entity, StyleRegistry const& styles) -> Layout
    {
        auto const attrs = entityAttrs(entity);
        return Layout {
            .id = optString(attrs, "id"),
            .children = buildChildren(entity, styles),
            .spacing = json::getIntOr(attrs, "spacing", 0),
            .alignItems = optString(attrs, "align_items"),
            .justifyContent = optString(attrs, "justify_content"),
            .padding = json::getOptInt(attrs, "padding"),
            .style = style(attrs, styles),
            .visible = visible(attrs),
        };
    }

    auto buildMenuItems(nlohmann::json const& entity,
                        std::string_view key,
                        StyleRegistry const& styles) -> std::vector<MenuItem>
    {
        auto items = std::vector<MenuItem> {};
        for (auto const& nested: nestedEntities(entity, key, "menu_item"))
            items.push_back(buildMenuItem(nested, styles));
        return items;
    }

    auto buildMenu(nlohmann::json const& entity, StyleRegistry const& styles) -> Menu
    {
        auto const attrs = entityAttrs(entity);
        return Menu {
            .id = optString(attrs, "id"),
            .title = optString(attrs, "title"),
            .position = optString(attrs, "position"),
            .items = buildMenuItems(entity, "menu_items", styles),
            .style = style(attrs, styles),
            .visible = visible(attrs),
        };
    }

    auto buildContextMenu(nlohmann::json const& entity, StyleRegistry const& styles) -> ContextMenu
    {
        auto const attrs = entityAttrs(entity);
        return ContextMenu {
            .id = optString(attrs, "id"),
            .triggerOn = json::getStringOr(attrs, "trigger_on", "right_click"),
            .items = buildMenuItems(entity, "items", styles),
            .style = style(attrs, styles),
            .visible = visible(attrs),
        };
    }

    auto buildTabs(nlohmann::json const& entity, StyleRegistry const& styles) -> Tabs
    {
        auto const attrs = entityAttrs(entity);

        auto tabs = std::vector<Tab> {};
        for (auto const& nested: nestedEntities(entity, "tabs", "tab"))
            tabs.push_back(buildTab(nested, styles));

        return Tabs {
            .id = optString(attrs, "id"),
            .activeTab = optString(attrs, "active_tab"),
            .position = optString(attrs, "position"),
            .onChange = optHandler(attrs, "on_change"),
            .tabs = std::move(tabs),
            .style = style(attrs, styles),
            .visible = visible(attrs),
        };
    }

    auto buildTreeView(nlohmann::json const& entity, StyleRegistry const& styles) -> TreeView
    {
        auto const attrs = entityAttrs(entity);

        auto nodes = std::vector<TreeNode> {};
        for (auto const& nested: nestedEntities(entity, "root_nodes", "tree_node"))
            nodes.push_back(buildTreeNode(nested, styles));

        return TreeView {
            .id = optString(attrs, "id"),
            .rootNodes = std::move(nodes),
            .selectedNode = optString(attrs, "selected_node"),
            .expandedNodes = stringList(json::getOpt(attrs, "expanded_nodes").value_or(nullptr)),
            .onSelect = optHandler(attrs, "on_select"),
            .onToggle = optHandler(attrs, "on_toggle"),
            .showRoot = json::getBoolOr(attrs, "show_root", true),
            .style = style(attrs, styles),
            .visible = visible(attrs),
        };
    }
} // namespace

// =============================================================================
// Definitions
// =============================================================================

auto parseDefinition(nlohmann::json const& document) -> Result<Definition>
{
    if (!document.is_object())
        return makeError(ErrorCode::ParseError, "UI definition must be an object");

    auto styles = StyleRegistry::fromJson(json::getOpt(document, "styles").value_or(nullptr));
    if (!styles)
        return std::unexpected(styles.error());

    auto entities = json::getOpt(document, "ui").value_or(nlohmann::json::array());
    if (entities.is_object())
        entities = nlohmann::json::array({ std::move(entities) });
    if (!entities.is_array())
        return makeError(ErrorCode::ParseError, "UI definition 'ui' must be a list of entities");

    return Definition { .styles = std::move(*styles), .entities = std::move(entities) };
}

auto loadDefinition(std::string_view path) -> Result<Definition>
{
    auto document = json::readFile(path);
    if (!document)
        return std::unexpected(document.error());
    return parseDefinition(*document);
}

// =============================================================================
// Building
// =============================================================================

auto build(nlohmann::json const& entities, StyleRegistry const& styles) -> std::optional<Element>
{
    if (!entities.is_array())
        return buildEntity(entities, styles);

    for (auto const& entity: entities)
    {
        if (auto element = buildEntity(entity, styles))
            return element;
    }
    return std::nullopt;
}

auto build(Definition const& definition) -> std::optional<Element>
{
    return build(definition.entities, definition.styles);
}

auto entityAttrs(nlohmann::json const& entity) -> nlohmann::json
{
    auto result = nlohmann::json::object();
    if (!entity.is_object() || !entity.contains("attrs"))
        return result;

    for (auto& [key, value]: attributePairs(entity["attrs"]))
        result[key] = std::move(value);
    return result;
}

auto nestedEntities(nlohmann::json const& entity,
                    std::string_view key,
                    std::optional<std::string_view> childName) -> std::vector<nlohmann::json>
{
    auto result = std::vector<nlohmann::json> {};
    if (!entity.is_object() || !entity.contains("entities") || !entity["entities"].is_array())
        return result;

    for (auto const& nested: entity["entities"])
    {
        auto const name = json::getStringOr(nested, "name", "");
        if (name == key && nested.contains("entities") && nested["entities"].is_array())
        {
            for (auto const& inner: nested["entities"])
                result.push_back(inner);
        }
        else if (childName && name == *childName)
            result.push_back(nested);
        else if (!childName && name == key)
            result.push_back(nested);
    }
    return result;
}

auto buildChildren(nlohmann::json const& entity, StyleRegistry const& styles) -> std::vector<Element>
{
    auto result = std::vector<Element> {};
    if (!entity.is_object() || !entity.contains("entities") || !entity["entities"].is_array())
        return result;

    for (auto const& nested: entity["entities"])
    {
        if (auto element = buildEntity(nested, styles))
            result.push_back(std::move(*element));
    }
    return result;
}

auto buildEntity(nlohmann::json const& entity, StyleRegistry const& styles) -> std::optional<Element>
{
    auto const name = json::getStringOr(entity, "name", "");
    auto const attrs = entityAttrs(entity);

    if (name == "button")
        return buildButton(attrs, styles);
    if (name == "text")
        return buildText(attrs, styles);
    if (name == "label")
        return buildLabel(attrs, styles);
    if (name == "text_input")
        return buildTextInput(attrs, styles);
    if (name == "vbox")
        return buildLayout<VBox>(entity, styles);
    if (name == "hbox")
        return buildLayout<HBox>(entity, styles);
    if (name == "gauge")
        return buildGauge(attrs, styles);
    if (name == "sparkline")
        return buildSparkline(attrs, styles);
    if (name == "bar_chart")
        return buildBarChart(attrs, styles);
    if (name == "line_chart")
        return buildLineChart(attrs, styles);
    if (name == "table")
        return buildTable(entity, styles);
    if (name == "column")
        return buildColumn(entity);
    if (name == "menu")
        return buildMenu(entity, styles);
    if (name == "context_menu")
        return buildContextMenu(entity, styles);
    if (name == "tabs")
        return buildTabs(entity, styles);
    if (name == "tree_view")
        return buildTreeView(entity, styles);

    log::debug("Skipping unknown entity kind '{}'", name);
    return std::nullopt;
}

auto buildColumn(nlohmann::json const& entity) -> Column
{
    auto const attrs = entityAttrs(entity);
    return Column {
        .key = optString(attrs, "key").value_or(""),
        .header = optString(attrs, "header"),
        .sortable = json::getBoolOr(attrs, "sortable", true),
        .formatter = optString(attrs, "formatter"),
        .width = json::getOptInt(attrs, "width"),
        .align = json::getStringOr(attrs, "align", "left"),
    };
}

auto buildMenuItem(nlohmann::json const& entity, StyleRegistry const& styles) -> MenuItem
{
    auto const attrs = entityAttrs(entity);
    return MenuItem {
        .label = optString(attrs, "label"),
        .id = optString(attrs, "id"),
        .action = optHandler(attrs, "action"),
        .disabled = json::getBoolOr(attrs, "disabled", false),
        .submenu = buildMenuItems(entity, "submenu", styles),
        .icon = optString(attrs, "icon"),
        .shortcut = optString(attrs, "shortcut"),
        .visible = visible(attrs),
    };
}

auto buildTab(nlohmann::json const& entity, StyleRegistry const& styles) -> Tab
{
    auto const attrs = entityAttrs(entity);
    return Tab {
        .id = optString(attrs, "id"),
        .label = optString(attrs, "label"),
        .icon = optString(attrs, "icon"),
        .disabled = json::getBoolOr(attrs, "disabled", false),
        .closable = json::getBoolOr(attrs, "closable", false),
        .content = buildChildren(entity, styles),
        .visible = visible(attrs),
    };
}

auto buildTreeNode(nlohmann::json const& entity, StyleRegistry const& styles) -> TreeNode
{
    auto const attrs = entityAttrs(entity);

    auto children = std::vector<TreeNode> {};
    for (auto const& nested: nestedEntities(entity, "children", "tree_node"))
        children.push_back(buildTreeNode(nested, styles));

    return TreeNode {
        .id = optString(attrs, "id"),
        .label = optString(attrs, "label"),
        .value = json::getOpt(attrs, "value").value_or(nullptr),
        .expanded = json::getBoolOr(attrs, "expanded", false),
        .icon = optString(attrs, "icon"),
        .iconExpanded = optString(attrs, "icon_expanded"),
        .selectable = json::getBoolOr(attrs, "selectable", true),
        .children = std::move(children),
        .visible = visible(attrs),
    };
}

// =============================================================================
// Validation
// =============================================================================

auto validate(Element const& element) -> VoidResult
{
    if (auto const* button = element.as<Button>())
    {
        if (!button->label)
            return makeError(ErrorCode::MissingLabel, std::format("Button {} has no label", button->id.value_or("")));
        return {};
    }

    if (auto const* text = element.as<Text>())
    {
        if (!text->content)
            return makeError(ErrorCode::MissingContent, std::format("Text {} has no content", text->id.value_or("")));
        return {};
    }

    if (element.is<VBox>() || element.is<HBox>())
        return validateChildren(children(element));

    if (element.is<Unknown>())
        return makeError(ErrorCode::UnknownType, "Unknown element type");

    return {};
}

auto validateChildren(std::span<Element const> elements) -> VoidResult
{
    for (auto const& element: elements)
    {
        if (auto result = validate(element); !result)
            return result;
    }
    return {};
}

} // namespace uniui::iur
