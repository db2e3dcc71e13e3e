// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include <tui/TerminalOutput.hpp>
#include <tui/Text.hpp>

using namespace uniui::tui;

// =============================================================================
// TerminalOutput tests (buffer inspection)
// =============================================================================

TEST_CASE("TerminalOutput: Style SGR generation", "[tui][output]")
{
    auto output = TerminalOutput {};

    auto style = Style {};
    style.bold = true;
    style.fg = RgbColor { .r = 255, .g = 0, .b = 0 };

    output.write("Hello", style);
    output.writeRaw(" ");
    output.write("World");

    CHECK(output.str() == "\033[1;38;2;255;0;0mHello\033[m World");
}

TEST_CASE("TerminalOutput: indexed colors and attributes", "[tui][output]")
{
    auto output = TerminalOutput {};

    auto style = Style {};
    style.underline = true;
    style.inverse = true;
    style.bg = Color { std::uint8_t { 4 } };

    output.write("x", style);
    CHECK(output.str() == "\033[4;7;48;5;4mx\033[m");
}

TEST_CASE("TerminalOutput: colors disabled writes plain text", "[tui][output]")
{
    auto output = TerminalOutput(false);

    auto style = Style {};
    style.bold = true;
    output.write("plain", style);
    output.newline();
    output.write("text");

    CHECK(output.str() == "plain\ntext");
}

TEST_CASE("parseColor: names, hex and indices", "[tui][output]")
{
    CHECK(parseColor("red") == Color { std::uint8_t { 1 } });
    CHECK(parseColor("bright_white") == Color { std::uint8_t { 15 } });
    CHECK(parseColor("#ff8000") == Color { RgbColor { .r = 255, .g = 128, .b = 0 } });
    CHECK(parseColor("208") == Color { std::uint8_t { 208 } });

    CHECK(!parseColor("#ff80"));
    CHECK(!parseColor("#gg0000"));
    CHECK(!parseColor("256"));
    CHECK(!parseColor("chartreuse"));
}

TEST_CASE("Style: isDefault", "[tui][output]")
{
    CHECK(Style {}.isDefault());

    auto style = Style {};
    style.dim = true;
    CHECK(!style.isDefault());
}

// =============================================================================
// Text helpers
// =============================================================================

TEST_CASE("TextLine: width, pad and indent", "[tui][text]")
{
    auto line = TextLine {};
    line.append("ab");
    line.append("cd", Style { .bold = true });
    CHECK(line.width() == 4);
    CHECK(line.text() == "abcd");

    line.pad(2);
    line.indent(1);
    CHECK(line.text() == " abcd  ");
    CHECK(line.spans.size() == 4);

    line.pad(0);
    CHECK(line.spans.size() == 4);
}

TEST_CASE("splitLines: keeps empty lines", "[tui][text]")
{
    CHECK(splitLines("") == std::vector<std::string> { "" });
    CHECK(splitLines("a\n\nb") == std::vector<std::string> { "a", "", "b" });
    CHECK(splitLines("a\n") == std::vector<std::string> { "a", "" });
}

TEST_CASE("wordWrap: breaks at word boundaries", "[tui][text]")
{
    CHECK(wordWrap("the quick brown fox", 10) == std::vector<std::string> { "the quick", "brown fox" });
    CHECK(wordWrap("unbreakable", 4) == std::vector<std::string> { "unbreakable" });
    CHECK(wordWrap("one\ntwo", 80) == std::vector<std::string> { "one", "two" });
    CHECK(wordWrap("", 5) == std::vector<std::string> { "" });
}

TEST_CASE("truncate: adds an ellipsis", "[tui][text]")
{
    CHECK(truncate("hello", 10) == "hello");
    CHECK(truncate("hello world", 6) == "hello…");
    CHECK(truncate("hello", 2) == "..");
    CHECK(truncate("hello", 0).empty());
}

TEST_CASE("alignText and parseAlign", "[tui][text]")
{
    CHECK(alignText("ab", 5, TextAlign::Left) == "ab   ");
    CHECK(alignText("ab", 5, TextAlign::Right) == "   ab");
    CHECK(alignText("ab", 5, TextAlign::Center) == " ab  ");
    CHECK(alignText("toolong", 3, TextAlign::Right) == "toolong");

    CHECK(parseAlign("end") == TextAlign::Right);
    CHECK(parseAlign("center") == TextAlign::Center);
    CHECK(parseAlign("sideways") == TextAlign::Left);
}

TEST_CASE("displayWidth: counts code points", "[tui][text]")
{
    CHECK(displayWidth("abc") == 3);
    CHECK(displayWidth("×→") == 2);
    CHECK(displayWidth("") == 0);
}

// =============================================================================
// log::setCallback tests
// =============================================================================

TEST_CASE("log::setCallback: routes messages to callback", "[core][log]")
{
    auto received = std::vector<std::pair<uniui::log::Level, std::string>> {};

    uniui::log::setLevel(uniui::log::Level::Info);
    uniui::log::setCallback([&](uniui::log::Level level, std::string_view message) {
        received.emplace_back(level, std::string(message));
    });

    uniui::log::info("hello {}", "world");
    uniui::log::warning("warn msg");
    uniui::log::error("err msg");
    uniui::log::debug("filtered out");

    // Restore stderr output for other tests
    uniui::log::setCallback(nullptr);

    REQUIRE(received.size() == 3);

    CHECK(received[0].first == uniui::log::Level::Info);
    CHECK(received[0].second == "hello world");

    CHECK(received[1].first == uniui::log::Level::Warning);
    CHECK(received[1].second == "warn msg");

    CHECK(received[2].first == uniui::log::Level::Error);
    CHECK(received[2].second == "err msg");
}

TEST_CASE("log::parseLevel and levelName", "[core][log]")
{
    CHECK(uniui::log::parseLevel("warn") == uniui::log::Level::Warning);
    CHECK(uniui::log::parseLevel("trace") == uniui::log::Level::Trace);
    CHECK(!uniui::log::parseLevel("verbose"));
    CHECK(uniui::log::levelName(uniui::log::Level::Debug) == "debug");
}

TEST_CASE("log::setCallback(nullptr): reverts to stderr without crash", "[core][log]")
{
    uniui::log::setCallback(nullptr);

    // Should not crash, goes to stderr
    uniui::log::info("this goes to stderr");
}
