// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace uniui::tui
{

/// @brief RGB color representation.
struct RgbColor
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    auto operator==(RgbColor const&) const -> bool = default;
};

/// @brief Color representation: default, 256-color index, or true color (RGB).
using Color = std::variant<std::monostate, std::uint8_t, RgbColor>;

/// @brief Text styling attributes for terminal output.
struct Style
{
    Color fg;                   ///< Foreground color.
    Color bg;                   ///< Background color.
    bool bold = false;          ///< Bold text.
    bool italic = false;        ///< Italic text.
    bool underline = false;     ///< Underlined text.
    bool strikethrough = false; ///< Strikethrough text.
    bool dim = false;           ///< Dim/faint text.
    bool inverse = false;       ///< Inverse/reverse video.
    bool blink = false;         ///< Blinking text.

    /// @brief Returns true if no color or attribute is set.
    [[nodiscard]] auto isDefault() const noexcept -> bool;

    auto operator==(Style const&) const -> bool = default;
};

/// @brief Parses a color name ("red", "bright_blue"), a "#RRGGBB" hex string or a
///        256-color index ("208").
/// @return The color, or std::nullopt if the text is not a known color.
[[nodiscard]] auto parseColor(std::string_view text) -> std::optional<Color>;

/// @brief Accumulates styled terminal output.
///
/// Output is buffered internally; str() exposes the buffer for rendering into a string
/// and flush() writes it to stdout. With colors disabled, styles are ignored and only
/// the plain text is buffered.
class TerminalOutput
{
  public:
    explicit TerminalOutput(bool colors = true);

    /// @brief Writes styled text at the current cursor position.
    /// @param text The text to write.
    /// @param style The style to apply.
    void write(std::string_view text, Style const& style = {});

    /// @brief Writes raw text without styling.
    /// @param text The text to write directly to the buffer.
    void writeRaw(std::string_view text);

    /// @brief Ends the current line.
    void newline();

    /// @brief Returns the buffered output.
    [[nodiscard]] auto str() const noexcept -> std::string const&;

    /// @brief Flushes the internal buffer to stdout.
    /// @return Success or IoError if the write failed.
    [[nodiscard]] auto flush() -> VoidResult;

  private:
    std::string _buffer; ///< Output buffer for batching writes.
    bool _colors = true;

    /// @brief Appends SGR (Select Graphic Rendition) sequences for the given style.
    void appendSgr(Style const& style);

    /// @brief Appends the SGR reset sequence.
    void appendSgrReset();
};

} // namespace uniui::tui
