// SPDX-License-Identifier: Apache-2.0
#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <format>

#include <unistd.h>

#include <tui/TerminalOutput.hpp>

namespace uniui::tui
{

namespace
{
    constexpr auto ColorNames = std::array<std::string_view, 16> {
        "black",        "red",          "green",          "yellow",         "blue",           "magenta",
        "cyan",         "white",        "bright_black",   "bright_red",     "bright_green",   "bright_yellow",
        "bright_blue",  "bright_magenta", "bright_cyan",  "bright_white",
    };

    auto hexDigit(char c) -> std::optional<std::uint8_t>
    {
        if (c >= '0' && c <= '9')
            return static_cast<std::uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f')
            return static_cast<std::uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F')
            return static_cast<std::uint8_t>(c - 'A' + 10);
        return std::nullopt;
    }

    auto hexByte(std::string_view text) -> std::optional<std::uint8_t>
    {
        auto const high = hexDigit(text[0]);
        auto const low = hexDigit(text[1]);
        if (!high || !low)
            return std::nullopt;
        return static_cast<std::uint8_t>((*high << 4) | *low);
    }
} // namespace

// --- Style ---

auto Style::isDefault() const noexcept -> bool
{
    return std::holds_alternative<std::monostate>(fg) && std::holds_alternative<std::monostate>(bg) && !bold
           && !italic && !underline && !strikethrough && !dim && !inverse && !blink;
}

auto parseColor(std::string_view text) -> std::optional<Color>
{
    for (auto i = std::size_t { 0 }; i < ColorNames.size(); ++i)
    {
        if (ColorNames[i] == text)
            return Color { static_cast<std::uint8_t>(i) };
    }

    if (text.size() == 7 && text.front() == '#')
    {
        auto const r = hexByte(text.substr(1, 2));
        auto const g = hexByte(text.substr(3, 2));
        auto const b = hexByte(text.substr(5, 2));
        if (r && g && b)
            return Color { RgbColor { *r, *g, *b } };
        return std::nullopt;
    }

    auto index = 0;
    auto const [end, ec] = std::from_chars(text.data(), text.data() + text.size(), index);
    if (ec == std::errc {} && end == text.data() + text.size() && index >= 0 && index <= 255)
        return Color { static_cast<std::uint8_t>(index) };

    return std::nullopt;
}

// --- TerminalOutput ---

TerminalOutput::TerminalOutput(bool colors): _colors(colors)
{
}

void TerminalOutput::write(std::string_view text, Style const& style)
{
    if (!_colors || style.isDefault())
    {
        _buffer.append(text);
        return;
    }

    appendSgr(style);
    _buffer.append(text);
    appendSgrReset();
}

void TerminalOutput::writeRaw(std::string_view text)
{
    _buffer.append(text);
}

void TerminalOutput::newline()
{
    _buffer += '\n';
}

auto TerminalOutput::str() const noexcept -> std::string const&
{
    return _buffer;
}

auto TerminalOutput::flush() -> VoidResult
{
    auto remaining = std::string_view { _buffer };
    while (!remaining.empty())
    {
        auto const written = ::write(STDOUT_FILENO, remaining.data(), remaining.size());
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::IoError, std::format("Cannot write to stdout: {}", std::strerror(errno)));
        }
        remaining.remove_prefix(static_cast<std::size_t>(written));
    }
    _buffer.clear();
    return {};
}

void TerminalOutput::appendSgr(Style const& style)
{
    _buffer += "\033[";
    auto needSemicolon = false;
    auto const appendSep = [&]() {
        if (needSemicolon)
            _buffer += ';';
        needSemicolon = true;
    };

    if (style.bold)
    {
        appendSep();
        _buffer += '1';
    }
    if (style.dim)
    {
        appendSep();
        _buffer += '2';
    }
    if (style.italic)
    {
        appendSep();
        _buffer += '3';
    }
    if (style.underline)
    {
        appendSep();
        _buffer += '4';
    }
    if (style.blink)
    {
        appendSep();
        _buffer += '5';
    }
    if (style.inverse)
    {
        appendSep();
        _buffer += '7';
    }
    if (style.strikethrough)
    {
        appendSep();
        _buffer += '9';
    }

    // Foreground color
    if (auto const* idx = std::get_if<std::uint8_t>(&style.fg))
    {
        appendSep();
        _buffer += std::format("38;5;{}", *idx);
    }
    else if (auto const* rgb = std::get_if<RgbColor>(&style.fg))
    {
        appendSep();
        _buffer += std::format("38;2;{};{};{}", rgb->r, rgb->g, rgb->b);
    }

    // Background color
    if (auto const* idx = std::get_if<std::uint8_t>(&style.bg))
    {
        appendSep();
        _buffer += std::format("48;5;{}", *idx);
    }
    else if (auto const* rgb = std::get_if<RgbColor>(&style.bg))
    {
        appendSep();
        _buffer += std::format("48;2;{};{};{}", rgb->r, rgb->g, rgb->b);
    }

    _buffer += 'm';
}

void TerminalOutput::appendSgrReset()
{
    _buffer += "\033[m";
}

} // namespace uniui::tui
