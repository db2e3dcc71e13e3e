// SPDX-License-Identifier: Apache-2.0
#include <coordinator/Coordinator.hpp>
#include <coordinator/Platforms.hpp>
#include <core/Log.hpp>
#include <iur/Builder.hpp>
#include <iur/TreeUtils.hpp>
#include <iur/Verifiers.hpp>
#include <renderers/web/WebRenderer.hpp>
#include <tui/TerminalOutput.hpp>
#include <uniui/Config.hpp>

#include <CLI/CLI.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <print>

namespace
{

auto writeOutput(std::filesystem::path const& path, std::string_view content) -> uniui::VoidResult
{
    auto file = std::ofstream(path);
    if (!file.is_open())
        return uniui::makeError(uniui::ErrorCode::IoError, std::format("Cannot write {}", path.string()));
    file << content;
    return {};
}

/// @brief Prints or writes one platform's output.
auto emit(uniui::coordinator::AnyRendererState const& state,
          std::optional<std::filesystem::path> const& outputDir,
          bool colors) -> uniui::VoidResult
{
    using namespace uniui::coordinator;

    if (auto const* terminal = std::get_if<TerminalState>(&state))
    {
        if (!terminal->root)
            return {};
        auto output = uniui::tui::TerminalOutput(colors);
        output.writeRaw(uniui::terminal::paint(*terminal->root, colors));
        output.newline();
        return output.flush();
    }

    if (auto const* desktop = std::get_if<DesktopState>(&state))
    {
        auto const text = desktop->root ? uniui::desktop::toJson(*desktop->root).dump(2) : std::string("null");
        if (outputDir)
            return writeOutput(*outputDir / "ui.desktop.json", text + '\n');
        std::println("{}", text);
        return {};
    }

    auto const& web = std::get<WebState>(state);
    auto const html = uniui::web::htmlDocument(web.root.value_or(""));
    if (outputDir)
        return writeOutput(*outputDir / "ui.html", html);
    std::println("{}", html);
    return {};
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "uniui - renders one UI definition on terminal, desktop and web" };

    auto definitionPath = std::string {};
    auto configPath = std::string {};
    auto platforms = std::vector<std::string> {};
    auto timeoutMs = 0;
    auto outputDir = std::string {};
    auto verbose = false;
    auto validateOnly = false;
    auto noColor = false;

    app.add_option("definition", definitionPath, "UI definition file (JSON)")->required()->check(CLI::ExistingFile);
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-p,--platform", platforms, "Platform to render on (terminal|desktop|web|auto), repeatable");
    app.add_option("--timeout", timeoutMs, "Per-platform render timeout in milliseconds");
    app.add_option("-o,--output-dir", outputDir, "Write ui.html and ui.desktop.json into this directory");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--validate-only", validateOnly, "Build and verify the definition without rendering");
    app.add_flag("--no-color", noColor, "Disable ANSI colors in terminal output");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? uniui::loadConfig() : uniui::loadConfigFromFile(configPath);
    if (!configResult)
    {
        uniui::log::error("Failed to load config: {}", configResult.error());
        return 1;
    }

    auto& config = *configResult;
    uniui::log::setLevel(config.logLevel);

    // Apply CLI overrides
    if (verbose)
        uniui::log::setLevel(uniui::log::Level::Debug);
    if (!platforms.empty())
        config.platforms = platforms;
    if (timeoutMs > 0)
        config.renderTimeoutMs = timeoutMs;

    auto definition = uniui::iur::loadDefinition(definitionPath);
    if (!definition)
    {
        uniui::log::error("Failed to load {}: {}", definitionPath, definition.error());
        return 1;
    }

    auto root = std::optional<uniui::iur::Element> {};
    try
    {
        root = uniui::iur::build(*definition);
        if (root)
            uniui::iur::verifyAll(*root);
    }
    catch (uniui::ConfigurationError const& e)
    {
        uniui::log::error("Invalid UI definition: {}", e.what());
        return 1;
    }

    if (!root)
    {
        uniui::log::error("{} contains no renderable element", definitionPath);
        return 1;
    }

    if (auto valid = uniui::iur::validate(*root); !valid)
    {
        uniui::log::error("Invalid UI definition: {}", valid.error());
        return 1;
    }

    for (auto const& issue: uniui::iur::validateTree(*root))
        uniui::log::warning("{}: {}", uniui::iur::treeIssueName(issue.kind), issue.detail);

    if (validateOnly)
    {
        uniui::log::info("{} is valid ({} elements)", definitionPath, uniui::iur::countElements(*root));
        return 0;
    }

    auto const output = outputDir.empty() ? std::nullopt : std::optional<std::filesystem::path>(outputDir);
    if (output)
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(*output, ec);
        if (ec)
        {
            uniui::log::error("Cannot create output directory {}: {}", outputDir, ec.message());
            return 1;
        }
    }

    // "auto" stands for the platform detected from the environment.
    for (auto& name: config.platforms)
    {
        if (name == "auto")
            name = uniui::platformToString(
                uniui::coordinator::detectPlatform({ .webEnabled = config.web.enabled }));
    }

    auto const selected = uniui::coordinator::enabledRenderers(config.platforms);
    auto names = std::vector<std::string> {};
    for (auto const platform: selected)
        names.emplace_back(uniui::platformToString(platform));

    auto workers = uniui::coordinator::RenderWorkers {};
    auto results = uniui::coordinator::concurrentRender(
        workers, *root, names, config.renderer, std::chrono::milliseconds { config.renderTimeoutMs });
    if (!results)
    {
        uniui::log::error("Rendering failed: {}", results.error());
        return 1;
    }

    auto exitCode = 0;
    for (auto const& [name, result]: *results)
    {
        if (!result)
        {
            uniui::log::error("{}: {}", name, result.error());
            exitCode = 1;
            continue;
        }

        if (auto emitted = emit(*result, output, !noColor); !emitted)
        {
            uniui::log::error("{}: {}", name, emitted.error());
            exitCode = 1;
        }
    }

    return exitCode;
}
