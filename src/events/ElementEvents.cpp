// SPDX-License-Identifier: Apache-2.0
#include <events/ElementEvents.hpp>

#include <chrono>
#include <format>
#include <initializer_list>

namespace uniui::events
{

namespace
{
    auto handlerKey(std::string_view event) -> std::optional<std::string_view>
    {
        if (event == "click")
            return "on_click";
        if (event == "change")
            return "on_change";
        if (event == "submit")
            return "on_submit";
        if (event == "focus")
            return "on_focus";
        if (event == "blur")
            return "on_blur";
        return std::nullopt;
    }

    void putFirst(nlohmann::json& target,
                  nlohmann::json const& source,
                  char const* key,
                  std::initializer_list<char const*> aliases)
    {
        for (auto const* alias: aliases)
        {
            if (source.contains(alias))
            {
                target[key] = source[alias];
                return;
            }
        }
    }
} // namespace

auto getHandler(iur::Element const& element, std::string_view event) -> std::optional<iur::Handler>
{
    auto const key = handlerKey(event);
    if (!key)
        return std::nullopt;

    auto const meta = iur::metadata(element);
    auto const it = meta.find(std::string(*key));
    if (it == meta.end() || it->is_null())
        return std::nullopt;
    return iur::handlerFromJson(*it);
}

auto buildHandlerSignal(iur::Element const& element, std::string_view event, nlohmann::json const& payload)
    -> Result<HandlerSignal>
{
    auto const handler = getHandler(element, event);
    if (!handler)
        return makeError(ErrorCode::NoHandler, std::format("{} has no {} handler", iur::typeName(element), event));

    auto const id = iur::elementId(element);
    if (!id)
        return makeError(ErrorCode::MissingElementId, std::format("{} has no id", iur::typeName(element)));

    auto fullPayload = payload.is_object() ? payload : nlohmann::json::object();
    fullPayload["element_id"] = *id;

    return std::visit(
        [&](auto const& h) -> HandlerSignal {
            using T = std::decay_t<decltype(h)>;
            if constexpr (std::is_same_v<T, std::string>)
                return HandlerSignal { .name = h, .payload = std::move(fullPayload) };
            else if constexpr (std::is_same_v<T, iur::NamedHandler>)
            {
                if (h.payload.is_object())
                    fullPayload.update(h.payload);
                return HandlerSignal { .name = h.name, .payload = std::move(fullPayload) };
            }
            else
            {
                return HandlerSignal {
                    .name = "mfa_call",
                    .payload = { { "module", h.module },
                                 { "function", h.function },
                                 { "args", h.args },
                                 { "context", std::move(fullPayload) } },
                };
            }
        },
        *handler);
}

auto normalizePayload(nlohmann::json payload) -> nlohmann::json
{
    if (!payload.is_object())
        payload = nlohmann::json::object();

    if (!payload.contains("element_id"))
        payload["element_id"] = "unknown";

    if (!payload.contains("timestamp"))
    {
        auto const now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch());
        payload["timestamp"] = now.count();
    }

    return payload;
}

auto validateSignal(HandlerSignal const& signal) -> VoidResult
{
    if (signal.name.empty() || !signal.payload.is_object())
        return makeError(ErrorCode::InvalidEvent, "Handler signal must have a name and an object payload");
    if (!signal.payload.contains("element_id"))
        return makeError(ErrorCode::MissingElementId, std::format("Signal {} has no element_id", signal.name));
    return {};
}

auto extractMetadata(nlohmann::json const& platformEvent) -> nlohmann::json
{
    auto result = nlohmann::json::object();
    if (!platformEvent.is_object())
        return result;

    putFirst(result, platformEvent, "x", { "x" });
    putFirst(result, platformEvent, "y", { "y" });
    putFirst(result, platformEvent, "ctrl", { "control", "ctrl" });
    putFirst(result, platformEvent, "alt", { "modifier_alt", "alt" });
    putFirst(result, platformEvent, "shift", { "modifier_shift", "shift" });
    putFirst(result, platformEvent, "meta", { "modifier_meta", "meta" });
    putFirst(result, platformEvent, "timestamp", { "timestamp", "time", "timestamp_ms", "ms" });
    return result;
}

} // namespace uniui::events
