// SPDX-License-Identifier: Apache-2.0
#include <table/Sort.hpp>

#include <algorithm>
#include <vector>

namespace uniui::table
{

auto cellValue(nlohmann::json const& row, std::string_view key) -> nlohmann::json
{
    if (row.is_object())
    {
        auto const it = row.find(std::string(key));
        return it != row.end() ? *it : nlohmann::json(nullptr);
    }

    if (row.is_array())
    {
        for (auto const& pair: row)
        {
            if (pair.is_array() && pair.size() == 2 && pair[0].is_string() && pair[0].get<std::string>() == key)
                return pair[1];
        }
    }

    return nullptr;
}

auto cellText(nlohmann::json const& value) -> std::string
{
    if (value.is_null())
        return {};
    if (value.is_string())
        return value.get<std::string>();
    return value.dump();
}

auto lessThan(nlohmann::json const& a, nlohmann::json const& b) -> bool
{
    if (a.is_null())
        return !b.is_null();
    if (b.is_null())
        return false;

    if (a.is_number() && b.is_number())
        return a.get<double>() < b.get<double>();
    if (a.is_string() && b.is_string())
        return a.get<std::string>() < b.get<std::string>();
    if (a.is_boolean() && b.is_boolean())
        return a.get<bool>() < b.get<bool>();

    return cellText(a) < cellText(b);
}

auto sortRows(nlohmann::json const& rows,
              std::optional<std::string_view> column,
              iur::SortDirection direction) -> nlohmann::json
{
    if (!rows.is_array() || rows.empty() || !column)
        return rows;

    auto sorted = std::vector<nlohmann::json>(rows.begin(), rows.end());
    auto const key = *column;

    if (direction == iur::SortDirection::Asc)
    {
        std::ranges::stable_sort(
            sorted, [&](auto const& a, auto const& b) { return lessThan(cellValue(a, key), cellValue(b, key)); });
    }
    else
    {
        std::ranges::stable_sort(
            sorted, [&](auto const& a, auto const& b) { return lessThan(cellValue(b, key), cellValue(a, key)); });
    }

    return nlohmann::json(std::move(sorted));
}

} // namespace uniui::table
