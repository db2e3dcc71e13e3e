// SPDX-License-Identifier: Apache-2.0
#include <iur/Element.hpp>
#include <iur/TreeUtils.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace uniui::iur;

namespace
{

auto sampleTree() -> Element
{
    return VBox {
        .id = "root",
        .children = {
            Text { .content = "Title", .id = "title" },
            HBox {
                .id = "row",
                .children = {
                    Button { .label = "OK", .id = "ok" },
                    Button { .label = "Cancel", .id = "cancel" },
                },
            },
            Tabs {
                .id = "tabs",
                .tabs = { Tab { .id = "first", .label = "First", .content = { Text { .content = "inside" } } } },
            },
        },
    };
}

} // namespace

TEST_CASE("children returns layout children only", "[tree]")
{
    auto const tree = sampleTree();
    CHECK(children(tree).size() == 3);
    CHECK(children(Text { .content = "leaf" }).empty());
    CHECK(children(Tabs { .tabs = { Tab {} } }).empty());
}

TEST_CASE("traverse visits in the requested order", "[tree]")
{
    auto const tree = Element { VBox { .id = "a", .children = { Text { .content = "x", .id = "b" } } } };

    auto visits = std::vector<std::pair<std::string, int>> {};
    auto const record = [&](Element const& element, int depth) {
        visits.emplace_back(elementId(element).value_or("?"), depth);
    };

    SECTION("pre")
    {
        traverse(tree, record, TraverseOrder::Pre);
        CHECK(visits == std::vector<std::pair<std::string, int>> { { "a", 0 }, { "b", 1 } });
    }

    SECTION("post")
    {
        traverse(tree, record, TraverseOrder::Post);
        CHECK(visits == std::vector<std::pair<std::string, int>> { { "b", 1 }, { "a", 0 } });
    }

    SECTION("both")
    {
        traverse(tree, record, TraverseOrder::Both);
        CHECK(visits == std::vector<std::pair<std::string, int>> { { "a", 0 }, { "b", 1 }, { "b", 1 }, { "a", 0 } });
    }
}

TEST_CASE("findById searches nested collections", "[tree]")
{
    auto const tree = sampleTree();

    auto const cancel = findById(tree, "cancel");
    REQUIRE(cancel);
    CHECK(cancel->as<Button>()->label == "Cancel");

    auto const tab = findById(tree, "first");
    REQUIRE(tab);
    CHECK(tab->is<Tab>());

    CHECK(!findById(tree, "nowhere"));
}

TEST_CASE("counting helpers", "[tree]")
{
    auto const tree = sampleTree();

    CHECK(countElements(tree) == 8);

    auto const counts = countByType(tree);
    CHECK(counts.at("button") == 2);
    CHECK(counts.at("text") == 2);
    CHECK(counts.at("vbox") == 1);

    CHECK(allIds(tree) == std::vector<std::string> { "root", "title", "row", "ok", "cancel", "tabs", "first" });
}

TEST_CASE("collectStyles keys styles by id or kind", "[tree]")
{
    auto red = Style {};
    red.fg = Color { std::string("red") };

    auto const tree = Element { VBox { .children = { Text { .content = "a", .id = "t", .style = red },
                                                      Text { .content = "b", .style = red } } } };

    auto const styles = collectStyles(tree);
    REQUIRE(styles.size() == 2);
    CHECK(styles[0].first == "t");
    CHECK(styles[1].first == "text");
}

TEST_CASE("validateTree reports structural issues", "[tree]")
{
    auto const tree = Element { VBox {
        .children = {
            Text { .content = "a", .id = "dup" },
            Text { .content = "b", .id = "dup" },
            TextInput {},
            HBox { .id = "empty" },
        },
    } };

    auto const issues = validateTree(tree);
    REQUIRE(issues.size() == 3);
    CHECK(issues[0].kind == TreeIssue::Kind::DuplicateId);
    CHECK(issues[1].kind == TreeIssue::Kind::MissingIdOnTextInput);
    CHECK(issues[2].kind == TreeIssue::Kind::EmptyLayout);
    CHECK(treeIssueName(issues[2].kind) == "empty_layout");

    CHECK(validateTree(sampleTree()).empty());
}

TEST_CASE("metadata describes every kind", "[tree]")
{
    auto const button = metadata(Button { .label = "Go", .onClick = Handler { std::string("go") }, .id = "go" });
    CHECK(button["type"] == "button");
    CHECK(button["label"] == "Go");
    CHECK(button["on_click"] == "go");
    CHECK(button["id"] == "go");

    CHECK(metadata(Unknown { "sprite" }) == nlohmann::json { { "type", "unknown" } });

    auto const column = metadata(Column { .key = "age", .header = "Age" });
    CHECK(column["type"] == "column");
    CHECK(column["key"] == "age");
}

TEST_CASE("toJson changes with any nested change", "[tree]")
{
    auto const a = toJson(sampleTree());
    auto changed = sampleTree();
    std::get<VBox>(changed.node).children[0] = Text { .content = "Other", .id = "title" };

    CHECK(a == toJson(sampleTree()));
    CHECK(a != toJson(changed));
    REQUIRE(a.contains("children"));
    CHECK(a["children"].size() == 3);
}

TEST_CASE("isVisible and typeName", "[tree]")
{
    CHECK(isVisible(Text { .content = "a" }));
    CHECK(!isVisible(Text { .content = "a", .visible = false }));
    CHECK(typeName(TreeView {}) == "tree_view");
    CHECK(typeName(Unknown {}) == "unknown");
}
