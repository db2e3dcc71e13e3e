// SPDX-License-Identifier: Apache-2.0
#include <tui/Text.hpp>

#include <algorithm>
#include <cctype>

namespace uniui::tui
{

auto parseAlign(std::string_view name) -> TextAlign
{
    if (name == "center")
        return TextAlign::Center;
    if (name == "right" || name == "end")
        return TextAlign::Right;
    return TextAlign::Left;
}

// =============================================================================
// TextLine
// =============================================================================

auto TextLine::width() const noexcept -> int
{
    auto total = 0;
    for (auto const& span: spans)
        total += displayWidth(span.text);
    return total;
}

auto TextLine::text() const -> std::string
{
    auto result = std::string {};
    for (auto const& span: spans)
        result += span.text;
    return result;
}

void TextLine::append(std::string text, Style const& style)
{
    spans.push_back(TextSpan { .text = std::move(text), .style = style });
}

void TextLine::pad(int count)
{
    if (count > 0)
        spans.push_back(TextSpan { .text = std::string(static_cast<std::size_t>(count), ' '), .style = {} });
}

void TextLine::indent(int count)
{
    if (count > 0)
        spans.insert(spans.begin(), TextSpan { .text = std::string(static_cast<std::size_t>(count), ' '), .style = {} });
}

// =============================================================================
// Free functions
// =============================================================================

auto splitLines(std::string_view text) -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    auto start = std::size_t { 0 };
    while (true)
    {
        auto const end = text.find('\n', start);
        if (end == std::string_view::npos)
        {
            result.emplace_back(text.substr(start));
            break;
        }
        result.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    return result;
}

auto wordWrap(std::string_view text, int width) -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};

    if (text.empty() || width <= 0)
    {
        result.emplace_back(text);
        return result;
    }

    auto currentLine = std::string {};
    auto currentWidth = 0;
    auto wordStart = std::size_t { 0 };

    auto const flushWord = [&](std::size_t wordEnd) {
        if (wordStart >= wordEnd)
            return;

        auto word = std::string(text.substr(wordStart, wordEnd - wordStart));
        auto const wordWidth = displayWidth(word);

        if (currentLine.empty())
        {
            // First word on line - always add it even if too long
            currentLine = std::move(word);
            currentWidth = wordWidth;
        }
        else if (currentWidth + 1 + wordWidth <= width)
        {
            currentLine += ' ';
            currentLine += word;
            currentWidth += 1 + wordWidth;
        }
        else
        {
            result.push_back(std::move(currentLine));
            currentLine = std::move(word);
            currentWidth = wordWidth;
        }
    };

    for (auto i = std::size_t { 0 }; i < text.size(); ++i)
    {
        auto const ch = text[i];

        if (ch == '\n')
        {
            flushWord(i);
            result.push_back(std::move(currentLine));
            currentLine.clear();
            currentWidth = 0;
            wordStart = i + 1;
        }
        else if (std::isspace(static_cast<unsigned char>(ch)))
        {
            flushWord(i);
            wordStart = i + 1;
        }
    }

    flushWord(text.size());

    if (!currentLine.empty() || result.empty())
        result.push_back(std::move(currentLine));

    return result;
}

auto truncate(std::string_view text, int width) -> std::string
{
    if (width <= 0)
        return "";

    auto const textWidth = displayWidth(text);
    if (textWidth <= width)
        return std::string(text);

    if (width <= 3)
        return std::string(static_cast<std::size_t>(width), '.');

    auto const targetWidth = width - 1; // Leave room for ellipsis
    auto result = std::string {};
    auto currentWidth = 0;

    for (auto i = std::size_t { 0 }; i < text.size(); ++i)
    {
        auto const ch = static_cast<unsigned char>(text[i]);
        auto const isLead = (ch & 0xC0) != 0x80;
        if (isLead && currentWidth == targetWidth)
            break;
        result += text[i];
        if (isLead)
            ++currentWidth;
    }

    result += "…";
    return result;
}

auto alignText(std::string_view text, int width, TextAlign align) -> std::string
{
    auto const padding = std::max(0, width - displayWidth(text));
    auto const spaces = [](int n) { return std::string(static_cast<std::size_t>(n), ' '); };

    switch (align)
    {
        case TextAlign::Left: return std::string(text) + spaces(padding);
        case TextAlign::Right: return spaces(padding) + std::string(text);
        case TextAlign::Center: return spaces(padding / 2) + std::string(text) + spaces(padding - padding / 2);
    }
    return std::string(text);
}

auto displayWidth(std::string_view text) -> int
{
    auto width = 0;

    for (auto const c: text)
    {
        // Skip UTF-8 continuation bytes
        if ((static_cast<unsigned char>(c) & 0xC0) == 0x80)
            continue;

        // One cell per code point; wide CJK characters are not accounted for.
        ++width;
    }

    return width;
}

} // namespace uniui::tui
