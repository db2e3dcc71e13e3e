// SPDX-License-Identifier: Apache-2.0
#include <iur/TreeUtils.hpp>

#include <format>
#include <set>

namespace uniui::iur
{

namespace
{
    void walk(Element const& element, Visitor const& visitor, TraverseOrder order, int depth)
    {
        if (order != TraverseOrder::Post)
            visitor(element, depth);

        for (auto const& child: descendants(element))
            walk(child, visitor, order, depth + 1);

        if (order != TraverseOrder::Pre)
            visitor(element, depth);
    }
} // namespace

auto descendants(Element const& element) -> std::vector<Element>
{
    auto result = std::vector<Element> {};

    if (auto const* vbox = element.as<VBox>())
        result.assign(vbox->children.begin(), vbox->children.end());
    else if (auto const* hbox = element.as<HBox>())
        result.assign(hbox->children.begin(), hbox->children.end());
    else if (auto const* tabs = element.as<Tabs>())
        result.assign(tabs->tabs.begin(), tabs->tabs.end());
    else if (auto const* tab = element.as<Tab>())
        result.assign(tab->content.begin(), tab->content.end());
    else if (auto const* menu = element.as<Menu>())
        result.assign(menu->items.begin(), menu->items.end());
    else if (auto const* contextMenu = element.as<ContextMenu>())
        result.assign(contextMenu->items.begin(), contextMenu->items.end());
    else if (auto const* item = element.as<MenuItem>())
        result.assign(item->submenu.begin(), item->submenu.end());
    else if (auto const* tree = element.as<TreeView>())
        result.assign(tree->rootNodes.begin(), tree->rootNodes.end());
    else if (auto const* node = element.as<TreeNode>())
        result.assign(node->children.begin(), node->children.end());

    return result;
}

void traverse(Element const& root, Visitor const& visitor, TraverseOrder order)
{
    walk(root, visitor, order, 0);
}

auto findById(Element const& root, std::string_view id) -> std::optional<Element>
{
    if (auto const ownId = elementId(root); ownId && *ownId == id)
        return root;

    for (auto const& child: descendants(root))
    {
        if (auto found = findById(child, id))
            return found;
    }
    return std::nullopt;
}

auto countElements(Element const& root) -> std::size_t
{
    auto count = std::size_t { 0 };
    traverse(root, [&](Element const&, int) { ++count; });
    return count;
}

auto countByType(Element const& root) -> std::map<std::string, std::size_t>
{
    auto counts = std::map<std::string, std::size_t> {};
    traverse(root, [&](Element const& element, int) { ++counts[std::string(typeName(element))]; });
    return counts;
}

auto allIds(Element const& root) -> std::vector<std::string>
{
    auto ids = std::vector<std::string> {};
    traverse(root, [&](Element const& element, int) {
        if (auto id = elementId(element))
            ids.push_back(std::move(*id));
    });
    return ids;
}

auto collectStyles(Element const& root) -> std::vector<std::pair<std::string, Style>>
{
    auto styles = std::vector<std::pair<std::string, Style>> {};
    traverse(root, [&](Element const& element, int) {
        if (auto style = elementStyle(element))
            styles.emplace_back(elementId(element).value_or(std::string(typeName(element))), std::move(*style));
    });
    return styles;
}

auto treeIssueName(TreeIssue::Kind kind) -> std::string_view
{
    switch (kind)
    {
        case TreeIssue::Kind::DuplicateId: return "duplicate_id";
        case TreeIssue::Kind::MissingIdOnTextInput: return "missing_id_on_text_input";
        case TreeIssue::Kind::EmptyLayout: return "empty_layout";
    }
    return "unknown";
}

auto validateTree(Element const& root) -> std::vector<TreeIssue>
{
    auto issues = std::vector<TreeIssue> {};
    auto seen = std::set<std::string> {};
    auto reported = std::set<std::string> {};

    traverse(root, [&](Element const& element, int) {
        if (auto id = elementId(element))
        {
            if (!seen.insert(*id).second && reported.insert(*id).second)
                issues.push_back({ TreeIssue::Kind::DuplicateId, std::format("Duplicate id: {}", *id) });
        }

        if (auto const* input = element.as<TextInput>(); input && !input->id)
            issues.push_back({ TreeIssue::Kind::MissingIdOnTextInput, "Text input without an id" });

        if ((element.is<VBox>() || element.is<HBox>()) && children(element).empty())
        {
            issues.push_back({ TreeIssue::Kind::EmptyLayout,
                               std::format("Empty {} {}", typeName(element), elementId(element).value_or("")) });
        }
    });

    return issues;
}

} // namespace uniui::iur
