// SPDX-License-Identifier: Apache-2.0
#include <events/Signal.hpp>

#include <catch2/catch_test_macros.hpp>

#include <regex>
#include <set>

using namespace uniui;
using namespace uniui::events;

TEST_CASE("signalType maps the standard names", "[signal]")
{
    CHECK(signalType("click") == "unified.button.clicked");
    CHECK(signalType("change") == "unified.input.changed");
    CHECK(signalType("submit") == "unified.form.submitted");
    CHECK(signalType("focus") == "unified.element.focused");
    CHECK(signalType("blur") == "unified.element.blurred");
    CHECK(signalType("select") == "unified.item.selected");

    auto const unknown = signalType("explode");
    REQUIRE(!unknown);
    CHECK(unknown.error().code == ErrorCode::UnknownSignal);
}

TEST_CASE("validType requires three lowercase segments", "[signal]")
{
    CHECK(validType("unified.button.clicked").has_value());
    CHECK(validType("unified.mouse.double_click").has_value());
    CHECK(validType("a.b.c.d").has_value());

    CHECK(!validType("unified.button"));
    CHECK(!validType("Unified.button.clicked"));
    CHECK(!validType("unified..clicked"));
    CHECK(!validType("unified.1st.clicked"));
    CHECK(validType("unified.button.Clicked").error().code == ErrorCode::InvalidTypeFormat);
}

TEST_CASE("createSignal resolves short names", "[signal]")
{
    auto const signal = createSignal("click", { { "widget_id", "save" } });
    REQUIRE(signal.has_value());
    CHECK(signal->type == "unified.button.clicked");
    CHECK(signal->source == "/unified_ui");
    CHECK(signal->data["widget_id"] == "save");
    CHECK(!signal->subject);

    auto const unknown = createSignal("explode", nlohmann::json::object());
    REQUIRE(!unknown);
    CHECK(unknown.error().code == ErrorCode::UnknownSignal);
}

TEST_CASE("createSignal keeps full types and options", "[signal]")
{
    auto const signal = createSignal("unified.window.resize",
                                     nullptr,
                                     SignalOptions { .source = "/app", .subject = "main", .id = "fixed-id" });
    REQUIRE(signal.has_value());
    CHECK(signal->type == "unified.window.resize");
    CHECK(signal->data == nlohmann::json::object());
    CHECK(signal->source == "/app");
    CHECK(signal->subject == "main");
    CHECK(signal->id == "fixed-id");

    auto const invalid = createSignal("unified.Window.resize", nlohmann::json::object());
    REQUIRE(!invalid);
    CHECK(invalid.error().code == ErrorCode::InvalidTypeFormat);
}

TEST_CASE("generateUuid produces distinct version 4 identifiers", "[signal]")
{
    auto const pattern = std::regex("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    auto seen = std::set<std::string> {};
    for (auto i = 0; i < 32; ++i)
    {
        auto const uuid = generateUuid();
        CHECK(std::regex_match(uuid, pattern));
        seen.insert(uuid);
    }
    CHECK(seen.size() == 32);
}

TEST_CASE("signalToJson includes the subject only when set", "[signal]")
{
    auto signal = createSignal("submit", { { "form_id", "login" } }, SignalOptions { .id = "1" });
    REQUIRE(signal.has_value());

    auto const json = signalToJson(*signal);
    CHECK(json["type"] == "unified.form.submitted");
    CHECK(json["id"] == "1");
    CHECK(json["data"]["form_id"] == "login");
    CHECK(!json.contains("subject"));

    signal->subject = "login-form";
    CHECK(signalToJson(*signal)["subject"] == "login-form");
}
