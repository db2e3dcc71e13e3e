// SPDX-License-Identifier: Apache-2.0
#include <coordinator/Coordinator.hpp>
#include <coordinator/Dispatch.hpp>
#include <coordinator/Mailbox.hpp>
#include <coordinator/Platforms.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>

using namespace uniui;
using namespace uniui::coordinator;
using namespace std::chrono_literals;

namespace
{

auto sampleUi() -> iur::Element
{
    return iur::VBox {
        .id = "root",
        .children = { iur::Text { .content = "Hello" },
                      iur::Button { .label = "OK", .onClick = iur::Handler { std::string("ok") }, .id = "ok" } },
    };
}

auto environment(std::map<std::string, std::string, std::less<>> values) -> EnvironmentLookup
{
    return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
        if (auto const it = values.find(name); it != values.end())
            return it->second;
        return std::nullopt;
    };
}

} // namespace

// {{{ Platform selection
TEST_CASE("detectPlatform reads the environment", "[coordinator]")
{
    CHECK(detectPlatform({ .environment = environment({}) }) == Platform::Terminal);
    CHECK(detectPlatform({ .environment = environment({ { "WAYLAND_DISPLAY", "wayland-0" } }) }) == Platform::Desktop);
    CHECK(detectPlatform({ .environment = environment({ { "DISPLAY", "" } }) }) == Platform::Terminal);
    CHECK(detectPlatform({ .webEnabled = true, .environment = environment({ { "DISPLAY", ":0" } }) }) == Platform::Web);

    CHECK(isDesktop({ .environment = environment({ { "KDE_FULL_SESSION", "true" } }) }));
    CHECK(isTerminal({ .environment = environment({}) }));
    CHECK(isWeb({ .webEnabled = true, .environment = environment({}) }));
}

TEST_CASE("renderer selection", "[coordinator]")
{
    CHECK(supportsPlatform("web"));
    CHECK(!supportsPlatform("console"));
    CHECK(availableRenderers().size() == 3);

    CHECK(selectRenderer("desktop") == Platform::Desktop);
    auto const unknown = selectRenderer("console");
    REQUIRE(!unknown);
    CHECK(unknown.error().code == ErrorCode::InvalidPlatform);

    auto const names = std::vector<std::string> { "web", "terminal" };
    CHECK(selectRenderers(names) == std::vector { Platform::Web, Platform::Terminal });

    auto const withBogus = std::vector<std::string> { "web", "bogus" };
    CHECK(!selectRenderers(withBogus));

    CHECK(enabledRenderers({}) == availableRenderers());
    CHECK(enabledRenderers(withBogus) == std::vector { Platform::Web });
}
// }}}

// {{{ Rendering
TEST_CASE("renderOn reports each platform separately", "[coordinator]")
{
    auto const platforms = std::vector<std::string> { "terminal", "bogus" };
    auto const results = renderOn(sampleUi(), platforms);
    REQUIRE(results.has_value());
    REQUIRE(results->size() == 2);

    auto const& terminal = results->at("terminal");
    REQUIRE(terminal.has_value());
    CHECK(statePlatform(*terminal) == Platform::Terminal);
    CHECK(stateVersion(*terminal) == 1);

    auto const& bogus = results->at("bogus");
    REQUIRE(!bogus);
    CHECK(bogus.error().code == ErrorCode::InvalidPlatform);
}

TEST_CASE("renderOn rejects non-object options", "[coordinator]")
{
    auto const platforms = std::vector<std::string> { "web" };
    auto const result = renderOn(sampleUi(), platforms, nlohmann::json::array({ 1, 2 }));
    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("concurrentRender renders all platforms", "[coordinator]")
{
    auto const platforms = std::vector<std::string> { "terminal", "desktop", "web" };
    auto workers = RenderWorkers {};
    auto const results = concurrentRender(workers, sampleUi(), platforms, { { "theme", "dark" } });
    REQUIRE(results.has_value());
    REQUIRE(results->size() == 3);

    for (auto const& [name, result]: *results)
    {
        REQUIRE(result.has_value());
        CHECK(platformToString(statePlatform(*result)) == name);
    }

    auto const& web = std::get<WebState>(*results->at("web"));
    REQUIRE(web.root);
    CHECK(web.root->find("phx-click=\"ok\"") != std::string::npos);
    CHECK(web.config["theme"] == "dark");
}

TEST_CASE("concurrentRender reports slow platforms as timeouts", "[coordinator]")
{
    auto finished = std::atomic<bool> { false };
    auto renderers = defaultRenderers();
    renderers.desktop = [&finished](iur::Element const&, nlohmann::json const&) -> Result<AnyRendererState> {
        std::this_thread::sleep_for(300ms);
        finished = true;
        return makeError(ErrorCode::RenderError, "too late");
    };

    auto workers = RenderWorkers {};
    auto const platforms = std::vector<std::string> { "terminal", "desktop" };
    auto const results = concurrentRender(workers, sampleUi(), platforms, nlohmann::json::object(), 50ms, renderers);
    REQUIRE(results.has_value());

    CHECK(results->at("terminal").has_value());
    REQUIRE(!results->at("desktop"));
    CHECK(results->at("desktop").error().code == ErrorCode::Timeout);

    // The late task is still owned by the workers and finishes before wait() returns.
    CHECK(!finished);
    workers.wait();
    CHECK(finished);
}

TEST_CASE("concurrentRender turns renderer exceptions into errors", "[coordinator]")
{
    auto renderers = defaultRenderers();
    renderers.web = [](iur::Element const&, nlohmann::json const&) -> Result<AnyRendererState> {
        throw std::runtime_error("boom");
    };

    renderers.desktop = [](iur::Element const&, nlohmann::json const&) -> Result<AnyRendererState> {
        throw 42;
    };

    auto workers = RenderWorkers {};
    auto const platforms = std::vector<std::string> { "web", "desktop", "terminal" };
    auto const results = concurrentRender(workers, sampleUi(), platforms, nlohmann::json::object(), 1000ms, renderers);
    REQUIRE(results.has_value());
    REQUIRE(!results->at("web"));
    CHECK(results->at("web").error().code == ErrorCode::RenderError);
    REQUIRE(!results->at("desktop"));
    CHECK(results->at("desktop").error().code == ErrorCode::RenderError);
    CHECK(results->at("terminal").has_value());
}

TEST_CASE("renderOn turns renderer exceptions into errors", "[coordinator]")
{
    auto renderers = defaultRenderers();
    renderers.terminal = [](iur::Element const&, nlohmann::json const&) -> Result<AnyRendererState> {
        throw std::runtime_error("boom");
    };
    renderers.web = [](iur::Element const&, nlohmann::json const&) -> Result<AnyRendererState> {
        throw 42;
    };

    auto const platforms = std::vector<std::string> { "terminal", "web", "desktop" };
    auto const results = renderOn(sampleUi(), platforms, nlohmann::json::object(), renderers);
    REQUIRE(results.has_value());
    REQUIRE(!results->at("terminal"));
    CHECK(results->at("terminal").error().code == ErrorCode::RenderError);
    CHECK(results->at("terminal").error().message.find("boom") != std::string::npos);
    REQUIRE(!results->at("web"));
    CHECK(results->at("web").error().code == ErrorCode::RenderError);
    CHECK(results->at("desktop").has_value());
}
// }}}

// {{{ State
TEST_CASE("mergeStates deep-merges nested records", "[coordinator]")
{
    auto const states = std::vector<nlohmann::json> {
        nlohmann::json::parse(R"({"user": {"name": "Ada", "settings": {"theme": "light", "lang": "en"}}})"),
        nlohmann::json::parse(R"({"user": {"settings": {"theme": "dark"}}, "count": 1})"),
        nlohmann::json::parse(R"({"count": 2})"),
    };

    CHECK(mergeStates(states)
          == nlohmann::json::parse(
              R"({"user": {"name": "Ada", "settings": {"theme": "dark", "lang": "en"}}, "count": 2})"));
    CHECK(mergeStates({}) == nlohmann::json::object());
    CHECK(conflictResolution({ { "v", 1 } }, { { "v", 2 } }) == nlohmann::json { { "v", 2 } });
}

TEST_CASE("state sync acknowledges renderer states", "[coordinator]")
{
    auto const platforms = std::vector<std::string> { "terminal" };
    auto const results = renderOn(sampleUi(), platforms);
    REQUIRE(results.has_value());

    auto states = std::map<Platform, AnyRendererState> {};
    states.emplace(Platform::Terminal, *results->at("terminal"));

    CHECK(syncState({ { "page", 1 } }, states).has_value());
    CHECK(broadcastState({ { "page", 1 } }, states).has_value());
}
// }}}

// {{{ Event dispatch
TEST_CASE("normalizeEvent validates platform and payload", "[coordinator]")
{
    auto const click = normalizeEvent("terminal", "click", { { "widget_id", "ok" } });
    REQUIRE(click.has_value());
    CHECK(click->type == "unified.button.clicked");
    CHECK(click->data["platform"] == "terminal");

    CHECK(normalizeEvent("console", "click", nlohmann::json::object()).error().code == ErrorCode::InvalidPlatform);
    CHECK(normalizeEvent("web", "click", "oops").error().code == ErrorCode::InvalidEvent);
    CHECK(normalizeEvent("desktop", "window", { { "action", "format_disk" } }).error().code
          == ErrorCode::InvalidAction);
}

TEST_CASE("dispatchEvent delivers to a mailbox", "[coordinator]")
{
    auto const mailbox = std::make_shared<Mailbox>();
    auto const dispatcher = EventDispatcher {};

    auto const signal =
        dispatcher.dispatchEvent("desktop", "window", { { "action", "resize" }, { "width", 640 } }, Target { mailbox });
    REQUIRE(signal.has_value());
    CHECK(signal->type == "unified.window.resize");

    auto const received = mailbox->waitPop(100ms);
    REQUIRE(received);
    CHECK(*received == *signal);
    CHECK(mailbox->size() == 0);

    mailbox->close();
    auto const closed = dispatcher.dispatchEvent("desktop", "click", nlohmann::json::object(), Target { mailbox });
    REQUIRE(!closed);
    CHECK(closed.error().code == ErrorCode::NotFound);
}

TEST_CASE("dispatchEvent calls handlers and notifications", "[coordinator]")
{
    auto const dispatcher = EventDispatcher {};

    auto seen = std::string {};
    auto const handler = Target { SignalHandler { [&](events::Signal const& signal) -> VoidResult {
        seen = signal.type;
        return {};
    } } };
    REQUIRE(dispatcher.dispatchEvent("web", "change", { { "value", "x" } }, handler).has_value());
    CHECK(seen == "unified.input.changed");

    auto notified = 0;
    auto const notification = Target { Notification { [&]() -> VoidResult {
        ++notified;
        return {};
    } } };
    REQUIRE(dispatcher.dispatchEvent("web", "submit", nlohmann::json::object(), notification).has_value());
    CHECK(notified == 1);

    auto const rejecting = Target { SignalHandler { [](events::Signal const&) -> VoidResult {
        return makeError(ErrorCode::InvalidEvent, "not now");
    } } };
    auto const rejected = dispatcher.dispatchEvent("web", "submit", nlohmann::json::object(), rejecting);
    REQUIRE(!rejected);
    CHECK(rejected.error().message == "not now");
}

TEST_CASE("dispatchEvent rejects invalid targets", "[coordinator]")
{
    auto const dispatcher = EventDispatcher {};
    auto const data = nlohmann::json::object();

    CHECK(dispatcher.dispatchEvent("web", "click", data, Target {}).error().code == ErrorCode::InvalidTarget);
    CHECK(dispatcher.dispatchEvent("web", "click", data, Target { std::shared_ptr<Mailbox> {} }).error().code
          == ErrorCode::InvalidTarget);
    CHECK(dispatcher.dispatchEvent("web", "click", data, Target { SignalHandler {} }).error().code
          == ErrorCode::InvalidTarget);
    CHECK(dispatcher.dispatchEvent("web", "click", data, Target { RemoteCall { .module = "App" } }).error().code
          == ErrorCode::InvalidTarget);
    CHECK(dispatcher.dispatchEvent("web", "click", data, Target { RemoteCall { "App", "handle" } }).error().code
          == ErrorCode::NotFound);
}

TEST_CASE("remote calls go through the registry", "[coordinator]")
{
    auto registry = std::make_shared<RemoteCallRegistry>();
    auto calls = std::make_shared<std::atomic<int>>(0);
    registry->add("App", "handle", [calls](nlohmann::json const& args, events::Signal const& signal) -> VoidResult {
        if (args != nlohmann::json::array({ "extra" }) || signal.type != "unified.button.clicked")
            return makeError(ErrorCode::InvalidEvent, "unexpected call");
        ++*calls;
        return {};
    });
    registry->add("App", "reject", [](nlohmann::json const&, events::Signal const&) -> VoidResult {
        return makeError(ErrorCode::InvalidEvent, "rejected");
    });
    CHECK(registry->contains("App", "handle"));

    auto const dispatcher = EventDispatcher { registry };
    auto const call = Target { RemoteCall { "App", "handle", nlohmann::json::array({ "extra" }) } };
    REQUIRE(dispatcher.dispatchEvent("terminal", "click", nlohmann::json::object(), call).has_value());
    CHECK(*calls == 1);

    SECTION("broadcast collects failures as causes")
    {
        auto const mailbox = std::make_shared<Mailbox>();
        auto const targets = std::vector<Target> { call, Target { RemoteCall { "App", "reject" } }, Target { mailbox } };

        auto const result = dispatcher.broadcastEvent("terminal", "click", nlohmann::json::object(), targets);
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::DispatchFailed);
        REQUIRE(result.error().causes.size() == 1);
        CHECK(result.error().causes[0].message == "rejected");

        CHECK(*calls == 2);
        CHECK(mailbox->size() == 1);
    }

    SECTION("broadcast succeeds when every target accepts")
    {
        auto const mailbox = std::make_shared<Mailbox>();
        auto const targets = std::vector<Target> { call, Target { mailbox } };
        auto const result = dispatcher.broadcastEvent("terminal", "click", nlohmann::json::object(), targets);
        REQUIRE(result.has_value());
        CHECK(mailbox->tryPop()->id == result->id);
    }

    registry->remove("App", "handle");
    CHECK(!registry->contains("App", "handle"));
}
// }}}
