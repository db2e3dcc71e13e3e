// SPDX-License-Identifier: Apache-2.0
#include <events/ElementEvents.hpp>
#include <events/PlatformEvents.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace uniui;
using namespace uniui::events;

TEST_CASE("eventTypes differ per platform", "[events]")
{
    auto const supports = [](Platform platform, std::string_view type) {
        auto const types = eventTypes(platform);
        return std::ranges::find(types, type) != types.end();
    };

    CHECK(supports(Platform::Terminal, "mouse"));
    CHECK(!supports(Platform::Terminal, "window"));
    CHECK(supports(Platform::Desktop, "window"));
    CHECK(supports(Platform::Web, "hook"));
    CHECK(supports(Platform::Web, "key_release"));
    CHECK(!supports(Platform::Web, "mouse"));
}

TEST_CASE("toSignal stamps platform and source", "[events]")
{
    auto const signal = toSignal(Platform::Terminal, "click", { { "widget_id", "ok" } });
    REQUIRE(signal.has_value());
    CHECK(signal->type == "unified.button.clicked");
    CHECK(signal->source == "/unified_ui/terminal");
    CHECK(signal->data["platform"] == "terminal");
    CHECK(signal->data["widget_id"] == "ok");

    auto const custom = toSignal(Platform::Web, "focus", nlohmann::json::object(), { .source = "/app", .subject = "x" });
    REQUIRE(custom.has_value());
    CHECK(custom->source == "/app");
    CHECK(custom->subject == "x");
    CHECK(custom->type == "unified.element.focused");
}

TEST_CASE("toSignal rejects unsupported events and actions", "[events]")
{
    SECTION("unsupported event type")
    {
        auto const result = toSignal(Platform::Web, "window", { { "action", "resize" } });
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::InvalidEvent);
    }

    SECTION("injected mouse action")
    {
        auto const result = toSignal(Platform::Terminal, "mouse", { { "action", "<script>" } });
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::InvalidAction);
    }

    SECTION("unknown window action")
    {
        auto const result = toSignal(Platform::Desktop, "window", { { "action", "format_disk" } });
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::InvalidAction);
    }

    SECTION("missing action")
    {
        auto const result = toSignal(Platform::Desktop, "mouse", nlohmann::json::object());
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::InvalidAction);
    }

    SECTION("oversized payload")
    {
        auto const result = toSignal(Platform::Terminal, "change", { { "value", std::string(MaxStringLength + 1, 'v') } });
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::StringTooLong);
    }
}

TEST_CASE("hook events only accept allowlisted hooks", "[events]")
{
    auto const allowed = hookEvent("scroll_handler", { { "top", 10 } });
    REQUIRE(allowed.has_value());
    CHECK(allowed->type == "unified.web.scroll_handler");
    CHECK(allowed->data["hook_name"] == "scroll_handler");
    CHECK(allowed->data["data"]["top"] == 10);

    auto const rejected = hookEvent("eval_handler", nlohmann::json::object());
    REQUIRE(!rejected);
    CHECK(rejected.error().code == ErrorCode::InvalidHook);
}

TEST_CASE("event builders", "[events]")
{
    SECTION("button click")
    {
        auto const signal = buttonClick(Platform::Desktop, "save", "save_doc");
        REQUIRE(signal.has_value());
        CHECK(signal->type == "unified.button.clicked");
        CHECK(signal->data["action"] == "save_doc");
        CHECK(signal->data["platform"] == "desktop");
    }

    SECTION("form submit redacts credentials")
    {
        auto const signal = formSubmit(Platform::Web, "login", { { "username", "ada" }, { "password", "hunter2" } });
        REQUIRE(signal.has_value());
        CHECK(signal->type == "unified.form.submitted");
        CHECK(signal->data["data"]["username"] == "ada");
        CHECK(signal->data["data"]["password"] == RedactedMarker);
    }

    SECTION("keys")
    {
        auto const press = keyPress(Platform::Terminal, "q", { "ctrl" });
        REQUIRE(press.has_value());
        CHECK(press->type == "unified.key.pressed");
        CHECK(press->data["modifiers"] == nlohmann::json { "ctrl" });

        auto const release = keyRelease(Platform::Web, "Enter");
        REQUIRE(release.has_value());
        CHECK(release->type == "unified.key.released");

        CHECK(!keyRelease(Platform::Terminal, "Enter"));
    }

    SECTION("mouse")
    {
        auto const click = mouseDoubleClick(Platform::Terminal, "row", "left", 3, 4);
        REQUIRE(click.has_value());
        CHECK(click->type == "unified.mouse.double_click");
        CHECK(click->data["x"] == 3);

        auto const scroll = mouseScroll(Platform::Desktop, 0, 0, "up", 2);
        REQUIRE(scroll.has_value());
        CHECK(scroll->type == "unified.mouse.scroll");
        CHECK(scroll->data["delta"] == 2);
    }

    SECTION("window")
    {
        auto const resize = windowResize(800, 600);
        REQUIRE(resize.has_value());
        CHECK(resize->type == "unified.window.resize");
        CHECK(resize->data["width"] == 800);
        CHECK(resize->source == "/unified_ui/desktop");

        CHECK(windowClose()->type == "unified.window.close");
        CHECK(windowBlur()->type == "unified.window.blur");
    }

    SECTION("websocket lifecycle")
    {
        auto const reconnecting = wsReconnecting(2, 2000);
        REQUIRE(reconnecting.has_value());
        CHECK(reconnecting->type == "unified.web.reconnecting");
        CHECK(reconnecting->data["data"]["delay_ms"] == 2000);
        CHECK(wsConnected()->type == "unified.web.connected");
    }
}

TEST_CASE("reconnectDelay doubles up to the cap", "[events]")
{
    CHECK(reconnectDelay(1) == 1000);
    CHECK(reconnectDelay(2) == 2000);
    CHECK(reconnectDelay(5) == 16000);
    CHECK(reconnectDelay(6) == 32000);
    CHECK(reconnectDelay(10) == 32000);
    CHECK(!reconnectDelay(11));
    CHECK(!reconnectDelay(0));
}

TEST_CASE("buildHandlerSignal resolves element handlers", "[events]")
{
    using namespace uniui::iur;

    SECTION("named handler")
    {
        auto const button = Element { Button { .label = "Save", .onClick = Handler { std::string("save") }, .id = "save" } };
        auto const signal = buildHandlerSignal(button, "click", { { "x", 1 } });
        REQUIRE(signal.has_value());
        CHECK(signal->name == "save");
        CHECK(signal->payload["element_id"] == "save");
        CHECK(signal->payload["x"] == 1);
    }

    SECTION("handler with payload")
    {
        auto const button = Element {
            Button { .label = "Go", .onClick = Handler { NamedHandler { "go", { { "draft", true } } } }, .id = "go" },
        };
        auto const signal = buildHandlerSignal(button, "click", nlohmann::json::object());
        REQUIRE(signal.has_value());
        CHECK(signal->payload["draft"] == true);
        CHECK(signal->payload["element_id"] == "go");
    }

    SECTION("remote call")
    {
        auto const button = Element {
            Button { .label = "Open", .onClick = Handler { RemoteCall { "Files", "open", { 1 } } }, .id = "open" },
        };
        auto const signal = buildHandlerSignal(button, "click", nlohmann::json::object());
        REQUIRE(signal.has_value());
        CHECK(signal->name == "mfa_call");
        CHECK(signal->payload["module"] == "Files");
        CHECK(signal->payload["function"] == "open");
        CHECK(signal->payload["context"]["element_id"] == "open");
    }

    SECTION("missing handler or id")
    {
        auto const noHandler = buildHandlerSignal(Button { .label = "x", .id = "x" }, "click", nullptr);
        REQUIRE(!noHandler);
        CHECK(noHandler.error().code == ErrorCode::NoHandler);

        auto const noId = buildHandlerSignal(Button { .label = "x", .onClick = Handler { std::string("x") } }, "click", nullptr);
        REQUIRE(!noId);
        CHECK(noId.error().code == ErrorCode::MissingElementId);

        CHECK(!getHandler(Button { .label = "x", .onClick = Handler { std::string("x") } }, "hover"));
    }
}

TEST_CASE("handler signal helpers", "[events]")
{
    auto const payload = normalizePayload(nullptr);
    CHECK(payload["element_id"] == "unknown");
    CHECK(payload.contains("timestamp"));
    CHECK(normalizePayload({ { "element_id", "a" }, { "timestamp", 5 } })["timestamp"] == 5);

    CHECK(validateSignal({ .name = "save", .payload = { { "element_id", "a" } } }).has_value());
    CHECK(validateSignal({ .name = "save", .payload = nlohmann::json::object() }).error().code
          == ErrorCode::MissingElementId);
    CHECK(validateSignal({ .name = "", .payload = nlohmann::json::object() }).error().code == ErrorCode::InvalidEvent);

    auto const meta = extractMetadata({ { "x", 1 }, { "control", true }, { "time", 99 }, { "junk", 0 } });
    CHECK(meta == nlohmann::json { { "x", 1 }, { "ctrl", true }, { "timestamp", 99 } });
}
