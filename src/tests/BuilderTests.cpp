// SPDX-License-Identifier: Apache-2.0
#include <iur/Builder.hpp>
#include <iur/Verifiers.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace uniui;
using namespace uniui::iur;

namespace
{

auto buildFrom(std::string_view document) -> std::optional<Element>
{
    auto definition = parseDefinition(nlohmann::json::parse(document));
    REQUIRE(definition.has_value());
    return build(*definition);
}

} // namespace

TEST_CASE("Builder converts a layout with widgets", "[builder]")
{
    auto const root = buildFrom(R"({
        "styles": [{"name": "title", "attributes": {"fg": "cyan", "attrs": ["bold"]}}],
        "ui": [{
            "name": "vbox",
            "attrs": {"id": "main", "spacing": 1, "align_items": "center"},
            "entities": [
                {"name": "text", "attrs": {"id": "greeting", "content": "Hello", "style": "title"}},
                {"name": "button", "attrs": {"id": "save", "label": "Save", "on_click": "save"}},
                {"name": "text_input", "attrs": {"id": "email", "type": "email", "placeholder": "you@example.com"}}
            ]
        }]
    })");

    REQUIRE(root);
    auto const* vbox = root->as<VBox>();
    REQUIRE(vbox);
    CHECK(vbox->id == "main");
    CHECK(vbox->spacing == 1);
    CHECK(vbox->alignItems == "center");
    REQUIRE(vbox->children.size() == 3);

    auto const* text = vbox->children[0].as<Text>();
    REQUIRE(text);
    CHECK(text->content == "Hello");
    REQUIRE(text->style);
    CHECK(text->style->has(TextAttr::Bold));

    auto const* button = vbox->children[1].as<Button>();
    REQUIRE(button);
    CHECK(button->label == "Save");
    CHECK(button->onClick == Handler { std::string("save") });

    auto const* input = vbox->children[2].as<TextInput>();
    REQUIRE(input);
    CHECK(input->type == "email");
    CHECK(input->placeholder == "you@example.com");
}

TEST_CASE("Builder drops unknown entity kinds", "[builder]")
{
    auto const root = buildFrom(R"({
        "ui": [{
            "name": "hbox",
            "entities": [
                {"name": "hologram", "attrs": {}},
                {"name": "text", "attrs": {"content": "kept"}}
            ]
        }]
    })");

    REQUIRE(root);
    REQUIRE(root->is<HBox>());
    REQUIRE(children(*root).size() == 1);
    CHECK(children(*root)[0].is<Text>());

    CHECK(!buildEntity({ { "name", "hologram" } }, StyleRegistry {}));
}

TEST_CASE("Builder accepts attribute pair lists", "[builder]")
{
    auto const root = buildFrom(R"({
        "ui": [{"name": "button", "attrs": [["label", "Go"], ["disabled", true]]}]
    })");

    REQUIRE(root);
    auto const* button = root->as<Button>();
    REQUIRE(button);
    CHECK(button->label == "Go");
    CHECK(button->disabled);
}

TEST_CASE("Builder reads handler forms", "[builder]")
{
    auto const root = buildFrom(R"({
        "ui": [{"name": "vbox", "entities": [
            {"name": "button", "attrs": {"label": "A", "on_click": ["save", {"draft": true}]}},
            {"name": "button", "attrs": {"label": "B", "on_click": {"module": "Files", "function": "open", "args": [1]}}}
        ]}]
    })");

    REQUIRE(root);
    auto const kids = children(*root);
    REQUIRE(kids.size() == 2);

    auto const& named = std::get<NamedHandler>(*kids[0].as<Button>()->onClick);
    CHECK(named.name == "save");
    CHECK(named.payload == nlohmann::json { { "draft", true } });

    auto const& remote = std::get<RemoteCall>(*kids[1].as<Button>()->onClick);
    CHECK(remote.module == "Files");
    CHECK(remote.function == "open");
    CHECK(handlerName(*kids[1].as<Button>()->onClick) == "Files.open");
}

TEST_CASE("Builder collects nested collections", "[builder]")
{
    SECTION("table columns as nested entities")
    {
        auto const root = buildFrom(R"({
            "ui": [{"name": "table", "attrs": {"id": "users", "data": [{"name": "A"}], "sort_column": "name",
                                               "sort_direction": "desc"},
                    "entities": [{"name": "columns", "entities": [
                        {"name": "column", "attrs": {"key": "name", "header": "Name"}},
                        {"name": "column", "attrs": {"key": "age", "sortable": false, "width": 5}}
                    ]}]}]
        })");

        REQUIRE(root);
        auto const* table = root->as<Table>();
        REQUIRE(table);
        REQUIRE(table->columns.size() == 2);
        CHECK(table->columns[0].header == "Name");
        CHECK(!table->columns[1].sortable);
        CHECK(table->columns[1].width == 5);
        CHECK(table->sortColumn == "name");
        CHECK(table->sortDirection == SortDirection::Desc);
    }

    SECTION("menu items with submenus")
    {
        auto const root = buildFrom(R"({
            "ui": [{"name": "menu", "attrs": {"id": "file", "title": "File"}, "entities": [
                {"name": "menu_item", "attrs": {"label": "Open", "shortcut": "Ctrl+O"}},
                {"name": "menu_item", "attrs": {"label": "Recent"}, "entities": [
                    {"name": "submenu", "entities": [{"name": "menu_item", "attrs": {"label": "a.txt"}}]}
                ]}
            ]}]
        })");

        REQUIRE(root);
        auto const* menu = root->as<Menu>();
        REQUIRE(menu);
        REQUIRE(menu->items.size() == 2);
        CHECK(menu->items[0].shortcut == "Ctrl+O");
        REQUIRE(menu->items[1].submenu.size() == 1);
        CHECK(menu->items[1].submenu[0].label == "a.txt");
    }

    SECTION("tabs with content")
    {
        auto const root = buildFrom(R"({
            "ui": [{"name": "tabs", "attrs": {"active_tab": "one"}, "entities": [
                {"name": "tab", "attrs": {"id": "one", "label": "One"}, "entities": [
                    {"name": "text", "attrs": {"content": "first"}}
                ]},
                {"name": "tab", "attrs": {"id": "two", "label": "Two"}}
            ]}]
        })");

        REQUIRE(root);
        auto const* tabs = root->as<Tabs>();
        REQUIRE(tabs);
        REQUIRE(tabs->tabs.size() == 2);
        CHECK(tabs->tabs[0].content.size() == 1);
        CHECK(tabs->tabs[1].content.empty());
    }

    SECTION("tree nodes with children")
    {
        auto const root = buildFrom(R"({
            "ui": [{"name": "tree_view", "attrs": {"id": "files"}, "entities": [
                {"name": "tree_node", "attrs": {"id": "src", "label": "src", "expanded": true}, "entities": [
                    {"name": "tree_node", "attrs": {"id": "main", "label": "main.cpp"}}
                ]}
            ]}]
        })");

        REQUIRE(root);
        auto const* tree = root->as<TreeView>();
        REQUIRE(tree);
        REQUIRE(tree->rootNodes.size() == 1);
        CHECK(tree->rootNodes[0].expanded);
        REQUIRE(tree->rootNodes[0].children.size() == 1);
        CHECK(tree->rootNodes[0].children[0].label == "main.cpp");
    }

    SECTION("malformed nested shapes yield empty collections")
    {
        CHECK(nestedEntities({ { "name", "menu" }, { "entities", "oops" } }, "items", "menu_item").empty());
        CHECK(nestedEntities({ { "name", "menu" } }, "items", "menu_item").empty());
    }
}

TEST_CASE("Builder parses chart data", "[builder]")
{
    auto const root = buildFrom(R"({
        "ui": [{"name": "hbox", "entities": [
            {"name": "bar_chart", "attrs": {"data": [["a", 1], {"label": "b", "value": 2.5}], "orientation": "vertical"}},
            {"name": "sparkline", "attrs": {"data": [1, 2, "x", 3]}},
            {"name": "gauge", "attrs": {"value": 42, "label": "CPU"}}
        ]}]
    })");

    REQUIRE(root);
    auto const kids = children(*root);
    REQUIRE(kids.size() == 3);

    auto const* bars = kids[0].as<BarChart>();
    REQUIRE(bars);
    CHECK(bars->data == std::vector<DataPoint> { { "a", 1.0 }, { "b", 2.5 } });
    CHECK(bars->orientation == "vertical");

    CHECK(kids[1].as<Sparkline>()->data == std::vector { 1.0, 2.0, 3.0 });

    auto const* gauge = kids[2].as<Gauge>();
    REQUIRE(gauge);
    CHECK(gauge->value == 42.0);
    CHECK(gauge->max == 100.0);
}

TEST_CASE("validate checks required fields", "[builder]")
{
    CHECK(validate(Button { .label = "OK" }).has_value());
    CHECK(validate(Text { .content = "hi" }).has_value());

    auto const noLabel = validate(Button {});
    REQUIRE(!noLabel);
    CHECK(noLabel.error().code == ErrorCode::MissingLabel);

    auto const noContent = validate(VBox { .children = { Text { .content = "ok" }, Text {} } });
    REQUIRE(!noContent);
    CHECK(noContent.error().code == ErrorCode::MissingContent);

    auto const unknown = validate(Unknown { "sprite" });
    REQUIRE(!unknown);
    CHECK(unknown.error().code == ErrorCode::UnknownType);
}

TEST_CASE("Verifiers reject broken definitions", "[builder]")
{
    SECTION("duplicate ids")
    {
        auto const root = Element { VBox { .children = { Text { .content = "a", .id = "x" },
                                                          Button { .label = "b", .id = "x" } } } };
        CHECK_THROWS_AS(verifyUniqueIds(root), ConfigurationError);
    }

    SECTION("dangling label reference")
    {
        auto const root = Element { VBox { .children = { Label { .forId = "missing", .text = "Name" },
                                                          TextInput { .id = "name" } } } };
        CHECK_THROWS_AS(verifyLabelRefs(root), ConfigurationError);
    }

    SECTION("valid label reference")
    {
        auto const root = Element { VBox { .children = { Label { .forId = "name", .text = "Name" },
                                                          TextInput { .id = "name" } } } };
        CHECK_NOTHROW(verifyAll(root));
    }
}

TEST_CASE("Builder fails on circular style inheritance", "[builder]")
{
    auto definition = parseDefinition(nlohmann::json::parse(R"({
        "styles": [
            {"name": "a", "extends": "b", "attributes": {}},
            {"name": "b", "extends": "a", "attributes": {}}
        ],
        "ui": [{"name": "text", "attrs": {"content": "x", "style": "a"}}]
    })"));
    REQUIRE(definition.has_value());
    CHECK_THROWS_AS(build(*definition), ConfigurationError);
}

TEST_CASE("loadDefinition reads a definition file", "[builder]")
{
    auto const path = std::filesystem::temp_directory_path() / "uniui_test_definition.json";
    {
        auto file = std::ofstream(path);
        file << R"({"ui": [{"name": "text", "attrs": {"content": "from file"}}]})";
    }

    auto definition = loadDefinition(path.string());
    REQUIRE(definition.has_value());
    auto const root = build(*definition);
    REQUIRE(root);
    CHECK(root->as<Text>()->content == "from file");

    std::filesystem::remove(path);

    auto const missing = loadDefinition("/nonexistent/uniui.json");
    REQUIRE(!missing);
    CHECK(missing.error().code == ErrorCode::IoError);
}
