// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <iur/Element.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace uniui::table
{

/// @brief Returns the value stored under @p key in a table row.
///
/// Rows are either JSON objects or lists of `[key, value]` pairs. Missing keys yield null.
[[nodiscard]] auto cellValue(nlohmann::json const& row, std::string_view key) -> nlohmann::json;

/// @brief Renders a cell value as text; strings are taken verbatim, null is empty.
[[nodiscard]] auto cellText(nlohmann::json const& value) -> std::string;

/// @brief Strict weak ordering of cell values with null placed first.
///
/// Numbers compare numerically, strings and booleans natively; mixed kinds compare by
/// their textual form.
[[nodiscard]] auto lessThan(nlohmann::json const& a, nlohmann::json const& b) -> bool;

/// @brief Sorts table rows by a column.
///
/// Null values come first when ascending and last when descending. The sort is stable.
/// An empty row list or a missing column returns the rows unchanged.
[[nodiscard]] auto sortRows(nlohmann::json const& rows,
                            std::optional<std::string_view> column,
                            iur::SortDirection direction) -> nlohmann::json;

} // namespace uniui::table
