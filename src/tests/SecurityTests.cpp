// SPDX-License-Identifier: Apache-2.0
#include <events/Security.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>

using namespace uniui;
using namespace uniui::events;

namespace
{

auto nested(int levels) -> nlohmann::json
{
    auto payload = nlohmann::json { { "leaf", 1 } };
    for (auto i = 0; i < levels; ++i)
        payload = nlohmann::json { { "inner", payload } };
    return payload;
}

} // namespace

TEST_CASE("validateEventAction enforces the action allowlists", "[security]")
{
    CHECK(validateEventAction("mouse", "double_click").has_value());
    CHECK(validateEventAction("window", "resize").has_value());
    CHECK(validateEventAction("key", "press").has_value());
    CHECK(validateEventAction("focus", "blur").has_value());

    auto const script = validateEventAction("mouse", "<script>");
    REQUIRE(!script);
    CHECK(script.error().code == ErrorCode::InvalidAction);

    CHECK(!validateEventAction("window", "format_disk"));
    CHECK(!validateEventAction("teleport", "now"));
}

TEST_CASE("validateEventAction accepts any action for fixed categories", "[security]")
{
    CHECK(validateEventAction("click", "anything").has_value());
    CHECK(validateEventAction("change", "").has_value());
    CHECK(validateEventAction("submit", "save_form").has_value());
}

TEST_CASE("validatePayload enforces the limits", "[security]")
{
    CHECK(validatePayload({ { "name", "ok" }, { "count", 3 } }).has_value());

    SECTION("too large")
    {
        auto payload = nlohmann::json::object();
        for (auto i = 0; i < 20; ++i)
            payload[std::format("field{}", i)] = std::string(600, 'x');

        auto const result = validatePayload(payload);
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::PayloadTooLarge);
    }

    SECTION("too deep")
    {
        CHECK(validatePayload(nested(MaxPayloadDepth)).has_value());

        auto const result = validatePayload(nested(MaxPayloadDepth + 1));
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::PayloadTooDeep);
    }

    SECTION("string too long")
    {
        auto const result = validatePayload({ { "bio", std::string(MaxStringLength + 1, 'a') } });
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::StringTooLong);
    }

    SECTION("nested string too long")
    {
        auto const result = validatePayload({ { "user", { { "bio", std::string(MaxStringLength + 1, 'a') } } } });
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::StringTooLong);
    }

    SECTION("strings inside lists count towards the limits")
    {
        auto const longItem = validatePayload({ { "items", { "short", std::string(MaxStringLength + 1, 'a') } } });
        REQUIRE(!longItem);
        CHECK(longItem.error().code == ErrorCode::StringTooLong);
        CHECK(longItem.error().message.find("items.1") != std::string::npos);

        auto items = nlohmann::json::array();
        for (auto i = 0; i < 20; ++i)
            items.push_back(std::string(600, 'x'));
        auto const large = validatePayload({ { "items", items } });
        REQUIRE(!large);
        CHECK(large.error().code == ErrorCode::PayloadTooLarge);

        auto const rows = nlohmann::json::array({ nlohmann::json { { "bio", std::string(MaxStringLength + 1, 'a') } } });
        auto const inObject = validatePayload({ { "rows", rows } });
        REQUIRE(!inObject);
        CHECK(inObject.error().code == ErrorCode::StringTooLong);
    }

    SECTION("lists count towards the depth")
    {
        auto payload = nlohmann::json::array({ 1 });
        for (auto i = 0; i < MaxPayloadDepth; ++i)
            payload = nlohmann::json::array({ payload });

        CHECK(payloadDepth({ { "list", payload } }) == MaxPayloadDepth + 1);
        auto const result = validatePayload({ { "list", payload } });
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::PayloadTooDeep);
    }

    SECTION("not an object")
    {
        auto const result = validatePayload("just a string");
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::InvalidPayload);
    }
}

TEST_CASE("sanitize strips markup from nested strings", "[security]")
{
    auto const payload = nlohmann::json::parse(R"({
        "comment": "<script>alert(1)</script>",
        "user": {"name": "<b>Bob</b>"},
        "tags": ["<i>keep</i>"],
        "count": 5
    })");

    auto const clean = sanitize(payload);
    CHECK(clean["comment"] == "scriptalert(1)/script");
    CHECK(clean["user"]["name"] == "bBob/b");
    CHECK(clean["tags"][0] == "<i>keep</i>");
    CHECK(clean["count"] == 5);
}

TEST_CASE("redact masks credential fields", "[security]")
{
    auto const result = redact({ { "password", "x" }, { "username", "y" } });
    CHECK(result == nlohmann::json { { "password", "[REDACTED]" }, { "username", "y" } });

    auto const mixed = redact({ { "API_KEY", "k" }, { "userToken", "t" }, { "note", "n" } });
    CHECK(mixed["API_KEY"] == "[REDACTED]");
    CHECK(mixed["userToken"] == "[REDACTED]");
    CHECK(mixed["note"] == "n");
}

TEST_CASE("secure validates, sanitizes and redacts", "[security]")
{
    auto const result = secure({ { "comment", "<b>hi</b>" }, { "secret", "s3" } });
    REQUIRE(result.has_value());
    CHECK((*result)["comment"] == "bhi/b");
    CHECK((*result)["secret"] == "[REDACTED]");

    auto const rejected = secure(nested(MaxPayloadDepth + 1));
    REQUIRE(!rejected);
    CHECK(rejected.error().code == ErrorCode::PayloadTooDeep);
}
