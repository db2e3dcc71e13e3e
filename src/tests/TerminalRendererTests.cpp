// SPDX-License-Identifier: Apache-2.0
#include <renderers/terminal/TerminalRenderer.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace uniui;
using namespace uniui::iur;
using uniui::terminal::TerminalRenderer;

namespace
{

auto form() -> Element
{
    return VBox {
        .id = "form",
        .children = {
            Text { .content = "Sign in", .id = "title" },
            TextInput { .id = "user", .placeholder = "name" },
            Button { .label = "OK", .onClick = Handler { std::string("submit") }, .id = "ok" },
        },
    };
}

} // namespace

TEST_CASE("TerminalRenderer renders a fresh state", "[terminal]")
{
    auto const renderer = TerminalRenderer {};
    auto const state = renderer.render(form());
    REQUIRE(state.has_value());

    CHECK(state->platform == Platform::Terminal);
    CHECK(state->version == 1);
    REQUIRE(state->root);
    CHECK(terminal::plainText(*state->root) == "Sign in\n: [name]\n[ OK ]");

    CHECK(state->widgets.size() == 4);
    CHECK(state->widgets.at("ok")["label"] == "OK");
    CHECK(renderers::lastIur(*state) == toJson(form()));
}

TEST_CASE("TerminalRenderer skips invisible elements", "[terminal]")
{
    auto const renderer = TerminalRenderer {};
    auto const tree = Element { VBox { .children = { Text { .content = "shown" },
                                                     Text { .content = "hidden", .visible = false } } } };

    auto const state = renderer.render(tree);
    REQUIRE(state.has_value());
    REQUIRE(state->root);

    auto const* stack = state->root->as<terminal::StackNode>();
    REQUIRE(stack);
    CHECK(stack->children.size() == 1);

    auto const invisibleRoot = renderer.render(Text { .content = "x", .visible = false });
    REQUIRE(invisibleRoot.has_value());
    CHECK(!invisibleRoot->root);
}

TEST_CASE("TerminalRenderer update bumps the version only on change", "[terminal]")
{
    auto const renderer = TerminalRenderer {};
    auto const first = renderer.render(form());
    REQUIRE(first.has_value());

    SECTION("unchanged tree keeps the state")
    {
        auto const same = renderer.update(form(), *first);
        REQUIRE(same.has_value());
        CHECK(*same == *first);
    }

    SECTION("changed tree")
    {
        auto changed = form();
        std::get<VBox>(changed.node).children[0] = Text { .content = "Welcome", .id = "title" };

        auto const next = renderer.update(changed, *first);
        REQUIRE(next.has_value());
        CHECK(next->version == 2);
        CHECK(terminal::plainText(*next->root).starts_with("Welcome"));
    }

    SECTION("changed config")
    {
        auto const next = renderer.update(form(), *first, { { "theme", "dark" } });
        REQUIRE(next.has_value());
        CHECK(next->version == 2);
        CHECK(next->config["theme"] == "dark");
        CHECK(next->root == first->root);
    }
}

TEST_CASE("TerminalRenderer rejects non-object options", "[terminal]")
{
    auto const result = TerminalRenderer {}.render(form(), nlohmann::json::array());
    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("TerminalRenderer tags widgets with handlers", "[terminal]")
{
    auto const state = TerminalRenderer {}.render(form());
    REQUIRE(state.has_value());

    auto const handlers = terminal::extractHandlers(*state->root);
    REQUIRE(handlers.contains("ok"));
    CHECK(handlers.at("ok") == std::vector<std::string> { "submit" });
    CHECK(!handlers.contains("title"));
}

TEST_CASE("TerminalRenderer renders widget text", "[terminal]")
{
    auto const renderer = TerminalRenderer {};
    auto const state = renderer.render(Element { Text {} });
    REQUIRE(state.has_value());

    auto const textOf = [&](Element const& element) {
        auto const node = renderer.convert(element, *state);
        REQUIRE(node);
        return terminal::plainText(*node);
    };

    CHECK(textOf(TextInput { .id = "pw", .value = "secret", .type = "password" }) == "* secret");
    CHECK(textOf(TextInput { .id = "empty" }) == ": [________________]");
    CHECK(textOf(MenuItem { .label = "Open", .disabled = true, .shortcut = "Ctrl+O" }) == "× Open (Ctrl+O)");
    CHECK(textOf(TreeNode { .id = "n", .label = "leaf" }) == "    leaf");
    CHECK(textOf(TreeNode { .id = "d", .label = "dir", .children = { TreeNode { .label = "f" } } }) == "[+] dir");
}

TEST_CASE("TerminalRenderer shows only the active tab", "[terminal]")
{
    auto const tabs = Element { Tabs {
        .id = "tabs",
        .activeTab = "b",
        .tabs = {
            Tab { .id = "a", .label = "A", .content = { Text { .content = "alpha" } } },
            Tab { .id = "b", .label = "B", .content = { Text { .content = "beta" } } },
        },
    } };

    auto const state = TerminalRenderer {}.render(tabs);
    REQUIRE(state.has_value());

    auto const output = terminal::plainText(*state->root);
    CHECK(output.find("beta") != std::string::npos);
    CHECK(output.find("alpha") == std::string::npos);
}

TEST_CASE("convertStyle maps colors and attributes", "[terminal]")
{
    auto const style = Style::fromAttributes({ { "fg", "red" }, { "attrs", { "bold", "reverse" } } });
    auto const converted = terminal::convertStyle(style);
    CHECK(converted.bold);
    CHECK(converted.inverse);
    CHECK(!converted.italic);
    CHECK(!std::holds_alternative<std::monostate>(converted.fg));

    CHECK(terminal::convertStyle(std::nullopt).isDefault());
}

TEST_CASE("TerminalRenderer hides the children of collapsed tree nodes", "[terminal]")
{
    auto const tree = Element { TreeView {
        .id = "files",
        .rootNodes = {
            TreeNode { .id = "src", .label = "src", .children = { TreeNode { .label = "main.cpp" } } },
            TreeNode { .id = "doc", .label = "doc", .expanded = true, .children = { TreeNode { .label = "a.md" } } },
        },
    } };

    auto const state = TerminalRenderer {}.render(tree);
    REQUIRE(state.has_value());
    REQUIRE(state->root);

    auto const text = terminal::plainText(*state->root);
    CHECK(text.find("[+] src") != std::string::npos);
    CHECK(text.find("main.cpp") == std::string::npos);
    CHECK(text.find("[-] doc") != std::string::npos);
    CHECK(text.find("a.md") != std::string::npos);
}
