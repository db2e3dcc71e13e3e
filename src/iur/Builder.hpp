// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <iur/Element.hpp>
#include <iur/StyleResolver.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace uniui::iur
{

/// @brief A parsed UI definition: named styles plus the root source entities.
///
/// Source entities are records of the form
/// `{"name": "vbox", "attrs": {...}, "entities": [...]}`.
struct Definition
{
    StyleRegistry styles;
    nlohmann::json entities = nlohmann::json::array();
};

/// @brief Parses a `{"styles": [...], "ui": [...]}` document.
[[nodiscard]] auto parseDefinition(nlohmann::json const& document) -> Result<Definition>;

/// @brief Loads and parses a UI definition file.
[[nodiscard]] auto loadDefinition(std::string_view path) -> Result<Definition>;

/// @brief Builds the IUR tree from a list of root entities.
///
/// Returns the first root entity that builds into an element; unknown kinds are skipped.
/// @throws ConfigurationError on circular style inheritance.
[[nodiscard]] auto build(nlohmann::json const& entities, StyleRegistry const& styles) -> std::optional<Element>;

/// @brief Builds the IUR tree of a parsed definition.
[[nodiscard]] auto build(Definition const& definition) -> std::optional<Element>;

/// @brief Converts one source entity, dispatching on its `name`.
/// @return The element, or std::nullopt for an unrecognized kind.
[[nodiscard]] auto buildEntity(nlohmann::json const& entity, StyleRegistry const& styles) -> std::optional<Element>;

/// @brief Builds every nested entity of a container, dropping unrecognized kinds.
[[nodiscard]] auto buildChildren(nlohmann::json const& entity, StyleRegistry const& styles) -> std::vector<Element>;

/// @brief Returns the attribute record of an entity as a JSON object.
[[nodiscard]] auto entityAttrs(nlohmann::json const& entity) -> nlohmann::json;

/// @brief Selects the nested entities of a named sub-collection.
///
/// A nested entity named @p key contributes its own nested entities; an entity named
/// @p childName contributes itself. Without a @p childName, an entity named @p key
/// contributes itself. Everything else is ignored.
[[nodiscard]] auto nestedEntities(nlohmann::json const& entity,
                                  std::string_view key,
                                  std::optional<std::string_view> childName) -> std::vector<nlohmann::json>;

[[nodiscard]] auto buildColumn(nlohmann::json const& entity) -> Column;
[[nodiscard]] auto buildMenuItem(nlohmann::json const& entity, StyleRegistry const& styles) -> MenuItem;
[[nodiscard]] auto buildTab(nlohmann::json const& entity, StyleRegistry const& styles) -> Tab;
[[nodiscard]] auto buildTreeNode(nlohmann::json const& entity, StyleRegistry const& styles) -> TreeNode;

/// @brief Checks required fields: buttons need a label, text needs content.
///
/// Layouts validate their children and stop at the first invalid one.
[[nodiscard]] auto validate(Element const& element) -> VoidResult;

/// @brief Validates a list of elements, stopping at the first invalid one.
[[nodiscard]] auto validateChildren(std::span<Element const> elements) -> VoidResult;

} // namespace uniui::iur
