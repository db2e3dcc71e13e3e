// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace uniui::tui
{

/// @brief Text alignment options.
enum class TextAlign : std::uint8_t
{
    Left,
    Center,
    Right,
};

/// @brief Parses "left", "center" or "right" (also "start" and "end").
/// @return The alignment; unknown names fall back to Left.
[[nodiscard]] auto parseAlign(std::string_view name) -> TextAlign;

/// @brief A styled text span within a line.
struct TextSpan
{
    std::string text;   ///< The text content.
    Style style;        ///< The style for this span.

    auto operator==(TextSpan const&) const -> bool = default;
};

/// @brief A line of styled text composed of multiple spans.
struct TextLine
{
    std::vector<TextSpan> spans;    ///< The spans in this line.

    /// @brief Returns the total display width of the line.
    [[nodiscard]] auto width() const noexcept -> int;

    /// @brief Returns the concatenated text of all spans.
    [[nodiscard]] auto text() const -> std::string;

    /// @brief Appends a span to the line.
    void append(std::string text, Style const& style = {});

    /// @brief Appends unstyled spaces.
    void pad(int count);

    /// @brief Inserts unstyled spaces at the start of the line.
    void indent(int count);

    auto operator==(TextLine const&) const -> bool = default;
};

/// @brief Splits text into lines at '\n'. Empty text yields one empty line.
[[nodiscard]] auto splitLines(std::string_view text) -> std::vector<std::string>;

/// @brief Word-wraps a string at the given width.
/// @param text The text to wrap.
/// @param width The maximum line width.
/// @return A vector of wrapped lines.
[[nodiscard]] auto wordWrap(std::string_view text, int width) -> std::vector<std::string>;

/// @brief Truncates a string to fit within the given width, adding ellipsis if needed.
/// @param text The text to truncate.
/// @param width The maximum width.
/// @return The truncated string.
[[nodiscard]] auto truncate(std::string_view text, int width) -> std::string;

/// @brief Pads a string with spaces to the given width; longer text is left unchanged.
/// @note Center alignment puts the extra space on the right.
[[nodiscard]] auto alignText(std::string_view text, int width, TextAlign align) -> std::string;

/// @brief Returns the display width of a string (accounting for multi-byte characters).
/// @param text The text to measure.
[[nodiscard]] auto displayWidth(std::string_view text) -> int;

} // namespace uniui::tui
