// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <iur/Element.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace uniui::iur
{

/// @brief Order in which traverse() invokes the visitor.
enum class TraverseOrder : std::uint8_t
{
    Pre,  ///< Parent before children.
    Post, ///< Children before parent.
    Both, ///< Parent before and after children.
};

/// @brief Visitor callback; @p depth is 0 for the root.
using Visitor = std::function<void(Element const& element, int depth)>;

/// @brief Returns the direct descendants of an element in the full tree walk.
///
/// Unlike children(), this includes nested collections: tab contents, menu items and
/// submenus, and tree nodes. Table columns are not part of the walk.
[[nodiscard]] auto descendants(Element const& element) -> std::vector<Element>;

/// @brief Walks the tree depth first.
void traverse(Element const& root, Visitor const& visitor, TraverseOrder order = TraverseOrder::Pre);

/// @brief Finds the first element carrying the given id.
[[nodiscard]] auto findById(Element const& root, std::string_view id) -> std::optional<Element>;

/// @brief Counts all elements in the tree, the root included.
[[nodiscard]] auto countElements(Element const& root) -> std::size_t;

/// @brief Counts elements per kind name.
[[nodiscard]] auto countByType(Element const& root) -> std::map<std::string, std::size_t>;

/// @brief Returns all ids in walk order, duplicates included.
[[nodiscard]] auto allIds(Element const& root) -> std::vector<std::string>;

/// @brief Returns every resolved style in walk order, keyed by element id or kind name.
[[nodiscard]] auto collectStyles(Element const& root) -> std::vector<std::pair<std::string, Style>>;

/// @brief A structural problem found by validateTree().
struct TreeIssue
{
    enum class Kind : std::uint8_t
    {
        DuplicateId,
        MissingIdOnTextInput,
        EmptyLayout,
    };

    Kind kind;
    std::string detail;

    auto operator==(TreeIssue const&) const -> bool = default;
};

/// @brief Returns the snake_case name of an issue kind.
[[nodiscard]] auto treeIssueName(TreeIssue::Kind kind) -> std::string_view;

/// @brief Checks the tree for duplicate ids, text inputs without an id and empty layouts.
/// @return The issues found, in walk order; empty if the tree is well formed.
[[nodiscard]] auto validateTree(Element const& root) -> std::vector<TreeIssue>;

} // namespace uniui::iur
