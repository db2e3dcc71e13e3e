// SPDX-License-Identifier: Apache-2.0
#include <renderers/desktop/DesktopRenderer.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace uniui;
using namespace uniui::iur;
using uniui::desktop::DesktopRenderer;

namespace
{

auto toolbar() -> Element
{
    auto bold = Style {};
    bold.fg = Color { std::string("blue") };
    bold.attrs = { TextAttr::Bold, TextAttr::Blink };

    return HBox {
        .id = "toolbar",
        .children = {
            Button { .label = "New", .onClick = Handler { std::string("new_file") }, .id = "new" },
            Button { .label = "Delete", .id = "delete", .disabled = true },
            Text { .content = "Ready", .id = "status", .style = bold },
        },
        .spacing = 4,
        .alignItems = "start",
        .justifyContent = "end",
    };
}

} // namespace

TEST_CASE("DesktopRenderer builds a widget tree", "[desktop]")
{
    auto const state = DesktopRenderer {}.render(toolbar());
    REQUIRE(state.has_value());
    CHECK(state->platform == Platform::Desktop);
    CHECK(state->version == 1);
    REQUIRE(state->root);

    auto const& root = *state->root;
    CHECK(root.type == "container");
    CHECK(root.id == "toolbar");
    CHECK(root.props["direction"] == "hbox");
    CHECK(root.props["spacing"] == 4);
    CHECK(root.props["align"] == "left");
    CHECK(root.props["justify"] == "bottom");
    REQUIRE(root.children.size() == 3);

    auto const& newButton = root.children[0];
    CHECK(newButton.type == "button");
    CHECK(newButton.props["label"] == "New");
    CHECK(newButton.props["on_click"] == "new_file");

    CHECK(root.children[1].props["disabled"] == true);
    CHECK(root.children[1].props["on_click"].is_null());

    auto const& status = root.children[2];
    CHECK(status.type == "label");
    CHECK(status.props["text"] == "Ready");
    CHECK(status.props["color"] == "blue");
    CHECK(status.props["font_style"] == nlohmann::json::array({ "bold" }));
}

TEST_CASE("DesktopRenderer omits invisible children", "[desktop]")
{
    auto const tree = Element { VBox { .children = { Text { .content = "a" },
                                                     Button { .label = "b", .visible = false },
                                                     Text { .content = "c" } } } };

    auto const state = DesktopRenderer {}.render(tree);
    REQUIRE(state.has_value());
    REQUIRE(state->root);
    CHECK(state->root->children.size() == 2);
}

TEST_CASE("DesktopRenderer update gating", "[desktop]")
{
    auto const renderer = DesktopRenderer {};
    auto const first = renderer.render(toolbar());
    REQUIRE(first.has_value());

    auto const same = renderer.update(toolbar(), *first);
    REQUIRE(same.has_value());
    CHECK(same->version == 1);

    auto changed = toolbar();
    std::get<HBox>(changed.node).spacing = 8;
    auto const next = renderer.update(changed, *first);
    REQUIRE(next.has_value());
    CHECK(next->version == 2);
    CHECK(next->root->props["spacing"] == 8);

    auto const again = renderer.update(changed, *next);
    REQUIRE(again.has_value());
    CHECK(again->version == 2);

    CHECK(renderer.destroy(*again).has_value());
}

TEST_CASE("DesktopRenderer converts navigation widgets", "[desktop]")
{
    auto const renderer = DesktopRenderer {};
    auto const state = renderer.render(Element { Text {} });
    REQUIRE(state.has_value());

    SECTION("menu with submenu")
    {
        auto const menu = renderer.convert(
            Menu {
                .id = "file",
                .title = "File",
                .items = {
                    MenuItem { .label = "Open", .id = "open", .action = Handler { std::string("open") } },
                    MenuItem { .label = "Hidden", .visible = false },
                    MenuItem { .label = "Recent", .submenu = { MenuItem { .label = "a.txt" } } },
                },
            },
            *state);
        REQUIRE(menu);
        CHECK(menu->type == "menu");
        CHECK(menu->props["title"] == "File");
        REQUIRE(menu->children.size() == 2);
        CHECK(menu->children[1].children.size() == 1);
        CHECK(desktop::extractHandlers(*menu).at("open") == std::vector<std::string> { "open" });
    }

    SECTION("collapsed tree nodes keep their children hidden")
    {
        auto const tree = renderer.convert(
            TreeView {
                .id = "files",
                .rootNodes = {
                    TreeNode { .id = "src", .label = "src", .children = { TreeNode { .label = "main.cpp" } } },
                    TreeNode { .id = "doc", .label = "doc", .expanded = true, .children = { TreeNode { .label = "a.md" } } },
                },
            },
            *state);
        REQUIRE(tree);
        REQUIRE(tree->children.size() == 2);
        CHECK(tree->children[0].children.empty());
        CHECK(tree->children[0].props["has_children"] == true);
        CHECK(tree->children[1].children.size() == 1);
    }

    SECTION("tabs carry their content")
    {
        auto const tabs = renderer.convert(
            Tabs {
                .id = "tabs",
                .activeTab = "one",
                .tabs = { Tab { .id = "one", .label = "One", .content = { Text { .content = "first" } } } },
            },
            *state);
        REQUIRE(tabs);
        CHECK(tabs->props["active_tab"] == "one");
        REQUIRE(tabs->children.size() == 1);
        CHECK(tabs->children[0].children[0].props["text"] == "first");
    }
}

TEST_CASE("desktop widget helpers", "[desktop]")
{
    CHECK(desktop::desktopAlign("end") == "right");
    CHECK(desktop::desktopAlign("center") == "center");
    CHECK(desktop::desktopJustify("start") == "top");

    auto const json = desktop::toJson(desktop::container("vbox", { desktop::label("hi") }));
    CHECK(json["type"] == "container");
    CHECK(json["id"].is_null());
    CHECK(json["children"][0]["props"]["text"] == "hi");

    auto const props = desktop::withStyle({ { "color", "keep" } }, Style::fromAttributes({ { "fg", "red" }, { "bg", "black" } }));
    CHECK(props["color"] == "keep");
    CHECK(props["background"] == "black");
}
