// SPDX-License-Identifier: Apache-2.0
#include <iur/TreeUtils.hpp>
#include <iur/Verifiers.hpp>

#include <core/Error.hpp>

#include <algorithm>
#include <format>
#include <set>

namespace uniui::iur
{

namespace
{
    auto formatIds(std::vector<std::string> const& ids) -> std::string
    {
        if (ids.empty())
            return "(none)";

        auto text = std::string {};
        for (auto const& id: ids)
        {
            if (!text.empty())
                text += ", ";
            text += id;
        }
        return text;
    }

    auto isWellFormed(Handler const& handler) -> bool
    {
        if (auto const* name = std::get_if<std::string>(&handler))
            return !name->empty();
        if (auto const* named = std::get_if<NamedHandler>(&handler))
            return !named->name.empty();
        auto const& call = std::get<RemoteCall>(handler);
        return !call.module.empty() && !call.function.empty();
    }

    void checkHandler(Element const& element, std::optional<Handler> const& handler, std::string_view attribute)
    {
        if (!handler || isWellFormed(*handler))
            return;

        auto const owner = elementId(element).value_or(std::string(typeName(element)));
        throw ConfigurationError(std::format("Invalid {} handler on {}", attribute, owner), { owner });
    }
} // namespace

void verifyUniqueIds(Element const& root)
{
    auto seen = std::set<std::string> {};
    for (auto const& id: allIds(root))
    {
        if (!seen.insert(id).second)
        {
            throw ConfigurationError(
                std::format("Duplicate ID found: {}. Each widget and layout id must be unique.", id), { id });
        }
    }
}

void verifyLabelRefs(Element const& root)
{
    auto inputIds = std::vector<std::string> {};
    traverse(root, [&](Element const& element, int) {
        if (auto const* input = element.as<TextInput>(); input && input->id)
            inputIds.push_back(*input->id);
    });

    traverse(root, [&](Element const& element, int) {
        auto const* label = element.as<Label>();
        if (!label || !label->forId)
            return;

        if (std::ranges::find(inputIds, *label->forId) == inputIds.end())
        {
            throw ConfigurationError(std::format("Invalid label reference: '{}' does not name a text_input. "
                                                 "Available input ids: {}",
                                                 *label->forId,
                                                 formatIds(inputIds)),
                                     { *label->forId });
        }
    });
}

void verifyHandlers(Element const& root)
{
    traverse(root, [](Element const& element, int) {
        if (auto const* button = element.as<Button>())
            checkHandler(element, button->onClick, "on_click");
        else if (auto const* input = element.as<TextInput>())
        {
            checkHandler(element, input->onChange, "on_change");
            checkHandler(element, input->onSubmit, "on_submit");
        }
        else if (auto const* item = element.as<MenuItem>())
            checkHandler(element, item->action, "action");
        else if (auto const* table = element.as<Table>())
        {
            checkHandler(element, table->onRowSelect, "on_row_select");
            checkHandler(element, table->onSort, "on_sort");
        }
    });
}

void verifyAll(Element const& root)
{
    verifyUniqueIds(root);
    verifyLabelRefs(root);
    verifyHandlers(root);
}

} // namespace uniui::iur
