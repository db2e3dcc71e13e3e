// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>
#include <tui/Text.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace uniui::terminal
{

struct Node;

/// @brief Renders nothing.
struct EmptyNode
{
    auto operator==(EmptyNode const&) const -> bool = default;
};

/// @brief A block of text; embedded newlines start new lines.
struct TextNode
{
    std::string text;
    tui::Style style;

    auto operator==(TextNode const&) const -> bool = default;
};

enum class Direction : std::uint8_t
{
    Vertical,
    Horizontal,
};

/// @brief Layout options of a stack.
struct StackOptions
{
    int spacing = 0;                    ///< Blank lines (vertical) or columns (horizontal) between children.
    int padding = 0;                    ///< Blank lines above and below, columns on the left.
    std::optional<std::string> align;   ///< Cross-axis alignment: start, center or end.
    std::optional<std::string> justify; ///< Main-axis justification, kept for the sink.
    int indent = 0;                     ///< Extra left indentation of every line.

    auto operator==(StackOptions const&) const -> bool = default;
};

/// @brief Children laid out one after another.
struct StackNode
{
    Direction direction = Direction::Vertical;
    std::vector<Node> children;
    StackOptions options;

    auto operator==(StackNode const& other) const -> bool;
};

/// @brief Applies a style to every span of its child that does not set its own.
struct StyledNode
{
    std::shared_ptr<Node const> child;
    tui::Style style;

    auto operator==(StyledNode const& other) const -> bool;
};

/// @brief Attaches widget metadata (handlers, ids, source data) to a child for the event layer.
struct TaggedNode
{
    std::string kind;
    std::shared_ptr<Node const> child;
    nlohmann::json meta = nlohmann::json::object();

    auto operator==(TaggedNode const& other) const -> bool;
};

/// @brief A node of the terminal render tree. Compared by value.
struct Node
{
    std::variant<EmptyNode, TextNode, StackNode, StyledNode, TaggedNode> value;

    template <typename T>
    [[nodiscard]] auto as() const noexcept -> T const*
    {
        return std::get_if<T>(&value);
    }

    auto operator==(Node const& other) const -> bool;
};

[[nodiscard]] auto empty() -> Node;
[[nodiscard]] auto text(std::string content, tui::Style const& style = {}) -> Node;
[[nodiscard]] auto stack(Direction direction, std::vector<Node> children, StackOptions options = {}) -> Node;

/// @brief Wraps @p child in a style; a default style returns the child unchanged.
[[nodiscard]] auto styled(Node child, tui::Style const& style) -> Node;

[[nodiscard]] auto tagged(std::string kind, Node child, nlohmann::json meta) -> Node;

/// @brief Lays a node out into styled lines.
[[nodiscard]] auto layout(Node const& node) -> std::vector<tui::TextLine>;

/// @brief Paints a node into a string, with SGR sequences when @p colors is set.
[[nodiscard]] auto paint(Node const& node, bool colors = true) -> std::string;

/// @brief Lays a node out as plain text.
/// @param wrapWidth If set, lines longer than this are word-wrapped.
[[nodiscard]] auto plainText(Node const& node, std::optional<int> wrapWidth = std::nullopt) -> std::string;

} // namespace uniui::terminal
