// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <iur/Style.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace uniui::iur
{

struct Element;

// =============================================================================
// Event handlers
// =============================================================================

/// @brief A signal name with a fixed payload merged into every emitted signal.
struct NamedHandler
{
    std::string name;
    nlohmann::json payload = nlohmann::json::object();

    auto operator==(NamedHandler const&) const -> bool = default;
};

/// @brief A call to a registered function, identified by module and function name.
struct RemoteCall
{
    std::string module;
    std::string function;
    nlohmann::json args = nlohmann::json::array();

    auto operator==(RemoteCall const&) const -> bool = default;
};

/// @brief An event handler: a bare signal name, a named handler with payload, or a remote call.
using Handler = std::variant<std::string, NamedHandler, RemoteCall>;

/// @brief Parses a handler from its JSON forms.
///
/// Accepted forms: `"save"`, `["save", {...}]`, `{"name": "save", "payload": {...}}`,
/// `{"module": "M", "function": "f", "args": [...]}` and `["M", "f", [...]]`.
[[nodiscard]] auto handlerFromJson(nlohmann::json const& value) -> std::optional<Handler>;

/// @brief Serializes a handler to JSON.
[[nodiscard]] auto handlerToJson(Handler const& handler) -> nlohmann::json;

/// @brief Returns the signal name of a handler, or "Module.function" for remote calls.
[[nodiscard]] auto handlerName(Handler const& handler) -> std::string;

/// @brief Table sort direction.
enum class SortDirection : std::uint8_t
{
    Asc,
    Desc,
};

/// @brief A labelled numeric sample used by bar and line charts.
struct DataPoint
{
    std::string label;
    double value = 0.0;

    auto operator==(DataPoint const&) const -> bool = default;
};

// =============================================================================
// Widgets
// =============================================================================

struct Text
{
    std::optional<std::string> content;
    std::optional<std::string> id;
    std::optional<Style> style;
    bool visible = true;

    auto operator==(Text const&) const -> bool = default;
};

struct Button
{
    std::optional<std::string> label;
    std::optional<Handler> onClick;
    std::optional<std::string> id;
    std::optional<Style> style;
    bool disabled = false;
    bool visible = true;

    auto operator==(Button const&) const -> bool = default;
};

struct Label
{
    std::optional<std::string> forId; ///< Id of the input this label describes.
    std::optional<std::string> text;
    std::optional<std::string> id;
    std::optional<Style> style;
    bool visible = true;

    auto operator==(Label const&) const -> bool = default;
};

struct TextInput
{
    std::optional<std::string> id;
    std::optional<std::string> value;
    std::optional<std::string> placeholder;
    std::string type = "text"; ///< text, password, email, number, tel, url or search.
    std::optional<Handler> onChange;
    std::optional<Handler> onSubmit;
    std::optional<std::string> formId;
    bool disabled = false;
    std::optional<Style> style;
    bool visible = true;

    auto operator==(TextInput const&) const -> bool = default;
};

struct Gauge
{
    std::optional<std::string> id;
    double value = 0.0;
    double min = 0.0;
    double max = 100.0;
    std::optional<std::string> label;
    std::optional<int> width;
    std::optional<int> height;
    nlohmann::json colorZones; ///< Null, or a list of `[threshold, color]` pairs.
    std::optional<Style> style;
    bool visible = true;

    auto operator==(Gauge const&) const -> bool = default;
};

struct Sparkline
{
    std::optional<std::string> id;
    std::vector<double> data;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<std::string> color;
    bool showDots = false;
    bool showArea = false;
    std::optional<Style> style;
    bool visible = true;

    auto operator==(Sparkline const&) const -> bool = default;
};

struct BarChart
{
    std::optional<std::string> id;
    std::vector<DataPoint> data;
    std::optional<int> width;
    std::optional<int> height;
    std::string orientation = "horizontal";
    bool showLabels = true;
    std::optional<Style> style;
    bool visible = true;

    auto operator==(BarChart const&) const -> bool = default;
};

struct LineChart
{
    std::optional<std::string> id;
    std::vector<DataPoint> data;
    std::optional<int> width;
    std::optional<int> height;
    bool showDots = true;
    bool showArea = false;
    std::optional<Style> style;
    bool visible = true;

    auto operator==(LineChart const&) const -> bool = default;
};

/// @brief Table column definition.
struct Column
{
    std::string key;
    std::optional<std::string> header;
    bool sortable = true;
    std::optional<std::string> formatter; ///< std::format pattern applied to the cell value, e.g. "${}".
    std::optional<int> width;
    std::string align = "left";

    auto operator==(Column const&) const -> bool = default;
};

struct Table
{
    std::optional<std::string> id;
    nlohmann::json data = nlohmann::json::array(); ///< Rows: objects or lists of `[key, value]` pairs.
    std::vector<Column> columns;                   ///< Empty means derive from the first row.
    std::optional<int> selectedRow;
    std::optional<int> height;
    std::optional<Handler> onRowSelect;
    std::optional<Handler> onSort;
    std::optional<std::string> sortColumn;
    SortDirection sortDirection = SortDirection::Asc;
    std::optional<Style> style;
    bool visible = true;

    auto operator==(Table const&) const -> bool = default;
};

struct MenuItem
{
    std::optional<std::string> label;
    std::optional<std::string> id;
    std::optional<Handler> action;
    bool disabled = false;
    std::vector<MenuItem> submenu;
    std::optional<std::string> icon;
    std::optional<std::string> shortcut;
    bool visible = true;

    auto operator==(MenuItem const&) const -> bool = default;
};

struct Menu
{
    std::optional<std::string> id;
    std::optional<std::string> title;
    std::optional<std::string> position;
    std::vector<MenuItem> items;
    std::optional<Style> style;
    bool visible = true;

    auto operator==(Menu const&) const -> bool = default;
};

struct ContextMenu
{
    std::optional<std::string> id;
    std::string triggerOn = "right_click";
    std::vector<MenuItem> items;
    std::optional<Style> style;
    bool visible = true;

    auto operator==(ContextMenu const&) const -> bool = default;
};

struct Tab
{
    std::optional<std::string> id;
    std::optional<std::string> label;
    std::optional<std::string> icon;
    bool disabled = false;
    bool closable = false;
    std::vector<Element> content;
    bool visible = true;

    auto operator==(Tab const&) const -> bool;
};

struct Tabs
{
    std::optional<std::string> id;
    std::optional<std::string> activeTab;
    std::optional<std::string> position;
    std::optional<Handler> onChange;
    std::vector<Tab> tabs;
    std::optional<Style> style;
    bool visible = true;

    auto operator==(Tabs const&) const -> bool;
};

struct TreeNode
{
    std::optional<std::string> id;
    std::optional<std::string> label;
    nlohmann::json value;
    bool expanded = false;
    std::optional<std::string> icon;
    std::optional<std::string> iconExpanded;
    bool selectable = true;
    std::vector<TreeNode> children; ///< Empty means a leaf.
    bool visible = true;

    auto operator==(TreeNode const&) const -> bool = default;
};

struct TreeView
{
    std::optional<std::string> id;
    std::vector<TreeNode> rootNodes;
    std::optional<std::string> selectedNode;
    std::vector<std::string> expandedNodes;
    std::optional<Handler> onSelect;
    std::optional<Handler> onToggle;
    bool showRoot = true;
    std::optional<Style> style;
    bool visible = true;

    auto operator==(TreeView const&) const -> bool = default;
};

// =============================================================================
// Layouts
// =============================================================================

struct VBox
{
    std::optional<std::string> id;
    std::vector<Element> children;
    int spacing = 0;
    std::optional<std::string> alignItems;
    std::optional<std::string> justifyContent;
    std::optional<int> padding;
    std::optional<Style> style;
    bool visible = true;

    auto operator==(VBox const&) const -> bool;
};

struct HBox
{
    std::optional<std::string> id;
    std::vector<Element> children;
    int spacing = 0;
    std::optional<std::string> alignItems;
    std::optional<std::string> justifyContent;
    std::optional<int> padding;
    std::optional<Style> style;
    bool visible = true;

    auto operator==(HBox const&) const -> bool;
};

/// @brief Placeholder for a value that is not a recognized element kind.
struct Unknown
{
    std::string kind;

    auto operator==(Unknown const&) const -> bool = default;
};

// =============================================================================
// Element
// =============================================================================

/// @brief A node of the intermediate UI representation.
///
/// Closed set of widget and layout kinds. Layouts own their children; container widgets
/// own their nested collections. The tree is a pure value.
struct Element
{
    using Node = std::variant<Unknown,
                              Text,
                              Button,
                              Label,
                              TextInput,
                              Gauge,
                              Sparkline,
                              BarChart,
                              LineChart,
                              Table,
                              Column,
                              Menu,
                              MenuItem,
                              ContextMenu,
                              Tabs,
                              Tab,
                              TreeView,
                              TreeNode,
                              VBox,
                              HBox>;

    Node node;

    Element() = default;

    template <typename T>
        requires std::is_constructible_v<Node, T&&>
    Element(T&& value): node(std::forward<T>(value)) // NOLINT(google-explicit-constructor)
    {
    }

    /// @brief Returns the held alternative if it is a @p T, nullptr otherwise.
    template <typename T>
    [[nodiscard]] auto as() const noexcept -> T const*
    {
        return std::get_if<T>(&node);
    }

    template <typename T>
    [[nodiscard]] auto is() const noexcept -> bool
    {
        return std::holds_alternative<T>(node);
    }

    auto operator==(Element const&) const -> bool;
};

/// @brief Returns the snake_case kind name ("text", "vbox", "unknown", ...).
[[nodiscard]] auto typeName(Element const& element) -> std::string_view;

/// @brief Returns the layout children of an element. Widgets have none.
[[nodiscard]] auto children(Element const& element) -> std::span<Element const>;

/// @brief Returns the flattened property record of an element.
///
/// Always contains `type` and `visible`; `id` and `style` are present when set.
/// Unknown elements yield `{"type": "unknown"}`.
[[nodiscard]] auto metadata(Element const& element) -> nlohmann::json;

/// @brief Serializes the whole subtree, including layout children, for change detection.
[[nodiscard]] auto toJson(Element const& element) -> nlohmann::json;

[[nodiscard]] auto isVisible(Element const& element) -> bool;
[[nodiscard]] auto elementId(Element const& element) -> std::optional<std::string>;
[[nodiscard]] auto elementStyle(Element const& element) -> std::optional<Style>;

[[nodiscard]] auto sortDirectionName(SortDirection direction) -> std::string_view;

} // namespace uniui::iur
