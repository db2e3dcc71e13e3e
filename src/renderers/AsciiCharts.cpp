// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <renderers/AsciiCharts.hpp>
#include <table/Sort.hpp>
#include <tui/Text.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <format>

namespace uniui::charts
{

namespace
{
    constexpr auto SparkChars = std::array<std::string_view, 8> { "_", "", "-", ".", "o", "O", "@", "#" };
    constexpr auto MaxVerticalBars = std::size_t { 10 };
    constexpr auto LabelWidth = 10;

    auto join(std::vector<std::string> const& parts, std::string_view separator) -> std::string
    {
        auto result = std::string {};
        for (auto i = std::size_t { 0 }; i < parts.size(); ++i)
        {
            if (i > 0)
                result += separator;
            result += parts[i];
        }
        return result;
    }

    /// Returns the first @p count code points of @p text.
    auto prefix(std::string_view text, int count) -> std::string
    {
        auto result = std::string {};
        auto seen = 0;
        for (auto const ch: text)
        {
            auto const isLead = (static_cast<unsigned char>(ch) & 0xC0) != 0x80;
            if (isLead && seen++ == count)
                break;
            result += ch;
        }
        return result;
    }

    auto maxValue(std::vector<iur::DataPoint> const& data) -> double
    {
        auto result = 0.0;
        for (auto const& point: data)
            result = std::max(result, point.value);
        return result;
    }

    auto horizontalBars(iur::BarChart const& chart) -> std::string
    {
        auto const max = maxValue(chart.data);
        auto lines = std::vector<std::string> {};
        for (auto const& point: chart.data)
        {
            auto const width = max > 0 ? std::max(0L, std::lround(point.value / max * ScaleWidth)) : 0L;
            lines.push_back(std::format("{} [{}] {}",
                                        tui::alignText(point.label, LabelWidth, tui::TextAlign::Left),
                                        std::string(static_cast<std::size_t>(width), '='),
                                        formatNumber(point.value)));
        }
        return join(lines, "\n");
    }

    auto verticalBars(iur::BarChart const& chart) -> std::string
    {
        if (chart.data.empty())
            return "No data";

        auto const max = maxValue(chart.data);
        auto const bars = std::min(chart.data.size(), MaxVerticalBars);
        auto lines = std::vector<std::string> {};

        for (auto y = ChartHeight - 1; y >= 0; --y)
        {
            auto const threshold = (y + 1) * max / ChartHeight;
            auto cells = std::vector<std::string> {};
            for (auto i = std::size_t { 0 }; i < bars; ++i)
                cells.emplace_back(chart.data[i].value >= threshold ? "|" : " ");

            lines.push_back(std::format("{} |{}|",
                                        tui::alignText(std::to_string(y * 20), 4, tui::TextAlign::Right),
                                        join(cells, " ")));
        }

        lines.push_back("      " + join(std::vector<std::string>(bars, "--"), " "));
        return join(lines, "\n");
    }
} // namespace

auto formatNumber(double value) -> std::string
{
    if (std::isfinite(value) && value == std::trunc(value) && std::fabs(value) < 1e15)
        return std::format("{}", static_cast<long long>(value));
    return std::format("{}", value);
}

auto capitalize(std::string_view text) -> std::string
{
    auto result = std::string(text);
    for (auto i = std::size_t { 0 }; i < result.size(); ++i)
    {
        auto const ch = static_cast<unsigned char>(result[i]);
        result[i] = static_cast<char>(i == 0 ? std::toupper(ch) : std::tolower(ch));
    }
    return result;
}

auto gaugeText(iur::Gauge const& gauge) -> std::string
{
    auto const value = std::clamp(gauge.value, std::min(gauge.min, gauge.max), std::max(gauge.min, gauge.max));
    auto const range = gauge.max - gauge.min;
    auto const ratio = range > 0 ? (value - gauge.min) / range : 0.0;
    auto const filled = static_cast<std::size_t>(std::lround(ratio * ScaleWidth));

    auto const label = gauge.label ? std::format("{}: ", *gauge.label) : std::string {};
    return std::format("{}[{}{}] {}/{}",
                       label,
                       std::string(filled, '='),
                       std::string(ScaleWidth - filled, ' '),
                       formatNumber(gauge.value),
                       formatNumber(gauge.max));
}

auto sparklineText(std::span<double const> data) -> std::string
{
    if (data.size() < 2)
        return "";

    auto const [minIt, maxIt] = std::minmax_element(data.begin(), data.end());
    auto const range = *maxIt - *minIt;
    if (range <= 0)
        return "";

    auto result = std::string {};
    for (auto const sample: data)
    {
        auto const normalized = (sample - *minIt) / range;
        auto const index = std::min(static_cast<std::size_t>(normalized * SparkChars.size()), SparkChars.size() - 1);
        result += SparkChars[index];
    }
    return result;
}

auto barChartText(iur::BarChart const& chart) -> std::string
{
    if (chart.orientation == "vertical")
        return verticalBars(chart);
    return horizontalBars(chart);
}

auto lineChartText(iur::LineChart const& chart) -> std::string
{
    if (chart.data.size() < 2)
        return "No data";

    auto const [minIt, maxIt] = std::minmax_element(
        chart.data.begin(), chart.data.end(), [](auto const& a, auto const& b) { return a.value < b.value; });
    auto const min = minIt->value;
    auto const range = maxIt->value - min;
    auto const mark = chart.showDots ? 'o' : '*';

    auto lines = std::vector<std::string> {};
    for (auto y = ChartHeight - 1; y >= 0; --y)
    {
        auto row = std::string {};
        for (auto const& point: chart.data)
        {
            auto const level = range > 0 ? std::lround((point.value - min) / range * (ChartHeight - 1)) : 0L;
            row += level == y ? mark : ' ';
        }
        lines.push_back(std::move(row));
    }

    auto labels = std::string {};
    for (auto const& point: chart.data)
        labels += tui::alignText(prefix(point.label, 3), 4, tui::TextAlign::Left);
    lines.push_back(std::move(labels));

    return join(lines, "\n");
}

auto resolveColumns(iur::Table const& table) -> std::vector<iur::Column>
{
    if (!table.columns.empty() || !table.data.is_array() || table.data.empty())
        return table.columns;

    auto keys = std::vector<std::string> {};
    auto const& first = table.data.front();
    if (first.is_object())
    {
        // nlohmann::json objects iterate in key order.
        for (auto const& [key, _]: first.items())
            keys.push_back(key);
    }
    else if (first.is_array())
    {
        for (auto const& pair: first)
        {
            if (pair.is_array() && pair.size() == 2 && pair[0].is_string())
                keys.push_back(pair[0].get<std::string>());
        }
    }

    auto columns = std::vector<iur::Column> {};
    for (auto& key: keys)
    {
        auto header = capitalize(key);
        columns.push_back(iur::Column { .key = std::move(key), .header = std::move(header) });
    }
    return columns;
}

auto sortedRows(iur::Table const& table) -> nlohmann::json
{
    if (!table.data.is_array())
        return nlohmann::json::array();
    if (!table.sortColumn)
        return table.data;
    return uniui::table::sortRows(table.data, *table.sortColumn, table.sortDirection);
}

auto formatCell(iur::Column const& column, nlohmann::json const& value) -> std::string
{
    auto text = uniui::table::cellText(value);
    if (!column.formatter)
        return text;

    try
    {
        return std::vformat(*column.formatter, std::make_format_args(text));
    }
    catch (std::format_error const& e)
    {
        log::trace("Invalid formatter '{}' on column {}: {}", *column.formatter, column.key, e.what());
        return text;
    }
}

auto tableText(iur::Table const& table) -> std::string
{
    auto const columns = resolveColumns(table);
    if (columns.empty())
        return "No columns defined";

    auto const rows = sortedRows(table);

    auto cells = std::vector<std::vector<std::string>> {};
    for (auto const& row: rows)
    {
        auto& line = cells.emplace_back();
        for (auto const& column: columns)
            line.push_back(formatCell(column, uniui::table::cellValue(row, column.key)));
    }

    auto widths = std::vector<int> {};
    for (auto c = std::size_t { 0 }; c < columns.size(); ++c)
    {
        auto width = tui::displayWidth(columns[c].header.value_or(""));
        for (auto const& line: cells)
            width = std::max(width, tui::displayWidth(line[c]));
        // A declared width caps the column but never collapses it below one cell.
        if (columns[c].width)
            width = std::max(1, std::min(width, *columns[c].width));
        widths.push_back(width);
    }

    auto const fit = [&](std::string_view text, std::size_t c) {
        return tui::alignText(tui::truncate(text, widths[c]), widths[c], tui::parseAlign(columns[c].align));
    };

    auto headers = std::vector<std::string> {};
    auto separators = std::vector<std::string> {};
    for (auto c = std::size_t { 0 }; c < columns.size(); ++c)
    {
        auto header = fit(columns[c].header.value_or(""), c);
        if (table.sortColumn == columns[c].key)
            header += table.sortDirection == iur::SortDirection::Asc ? " ↑" : " ↓";
        headers.push_back(std::move(header));
        separators.emplace_back(static_cast<std::size_t>(widths[c] + 2), '-');
    }

    auto const separator = join(separators, "+");
    auto lines = std::vector<std::string> { separator, "| " + join(headers, " | ") + " |", separator };

    for (auto const& line: cells)
    {
        auto aligned = std::vector<std::string> {};
        for (auto c = std::size_t { 0 }; c < columns.size(); ++c)
            aligned.push_back(fit(line[c], c));
        lines.push_back("| " + join(aligned, " | ") + " |");
    }
    lines.push_back(separator);

    return join(lines, "\n");
}

} // namespace uniui::charts
