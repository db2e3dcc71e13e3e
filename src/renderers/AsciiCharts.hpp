// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <iur/Element.hpp>

#include <nlohmann/json.hpp>

#include <span>
#include <string_view>
#include <string>
#include <vector>

namespace uniui::charts
{

/// Width of the filled scale used by gauges and horizontal bar charts.
constexpr auto ScaleWidth = 20;

/// Number of rows drawn by vertical bar charts and line charts.
constexpr auto ChartHeight = 5;

/// @brief Formats a number for display; integral values print without a fraction.
[[nodiscard]] auto formatNumber(double value) -> std::string;

/// @brief Renders a gauge as `label: [=====     ] value/max`.
///
/// The value is clamped into `[min, max]` before the fill ratio is computed. The printed
/// value is the raw one.
[[nodiscard]] auto gaugeText(iur::Gauge const& gauge) -> std::string;

/// @brief Renders a one-line sparkline. Fewer than two samples yield an empty string.
[[nodiscard]] auto sparklineText(std::span<double const> data) -> std::string;

/// @brief Renders a bar chart in its configured orientation.
[[nodiscard]] auto barChartText(iur::BarChart const& chart) -> std::string;

/// @brief Renders a five-row line chart followed by a row of abbreviated x labels.
[[nodiscard]] auto lineChartText(iur::LineChart const& chart) -> std::string;

/// @brief Returns the declared columns, or columns derived from the first row.
///
/// Derived columns use the row's keys (sorted for objects) and a capitalized header.
[[nodiscard]] auto resolveColumns(iur::Table const& table) -> std::vector<iur::Column>;

/// @brief Returns the table rows, sorted by the table's sort column if one is set.
[[nodiscard]] auto sortedRows(iur::Table const& table) -> nlohmann::json;

/// @brief Formats a cell value with the column's formatter.
///
/// A formatter is a std::format pattern receiving the cell text. An invalid pattern falls
/// back to the plain cell text.
[[nodiscard]] auto formatCell(iur::Column const& column, nlohmann::json const& value) -> std::string;

/// @brief Renders a table as a bordered text grid with a sort indicator on the sorted column.
[[nodiscard]] auto tableText(iur::Table const& table) -> std::string;

/// @brief Upper-cases the first character of a string and lower-cases the rest.
[[nodiscard]] auto capitalize(std::string_view text) -> std::string;

} // namespace uniui::charts
