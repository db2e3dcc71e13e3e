// SPDX-License-Identifier: Apache-2.0
#include <renderers/terminal/Node.hpp>

#include <algorithm>

namespace uniui::terminal
{

namespace
{
    using Lines = std::vector<tui::TextLine>;

    auto sameChild(std::shared_ptr<Node const> const& a, std::shared_ptr<Node const> const& b) -> bool
    {
        if (!a || !b)
            return a == b;
        return a == b || *a == *b;
    }

    auto inheritColor(tui::Color const& own, tui::Color const& outer) -> tui::Color
    {
        return std::holds_alternative<std::monostate>(own) ? outer : own;
    }

    /// Fills the unset parts of @p own from @p outer.
    auto inherit(tui::Style const& own, tui::Style const& outer) -> tui::Style
    {
        return tui::Style {
            .fg = inheritColor(own.fg, outer.fg),
            .bg = inheritColor(own.bg, outer.bg),
            .bold = own.bold || outer.bold,
            .italic = own.italic || outer.italic,
            .underline = own.underline || outer.underline,
            .strikethrough = own.strikethrough || outer.strikethrough,
            .dim = own.dim || outer.dim,
            .inverse = own.inverse || outer.inverse,
            .blink = own.blink || outer.blink,
        };
    }

    auto blockWidth(Lines const& lines) -> int
    {
        auto width = 0;
        for (auto const& line: lines)
            width = std::max(width, line.width());
        return width;
    }

    auto crossOffset(std::optional<std::string> const& align, int available) -> int
    {
        if (!align || available <= 0)
            return 0;
        if (*align == "center")
            return available / 2;
        if (*align == "end" || *align == "right" || *align == "bottom")
            return available;
        return 0;
    }

    void applyPadding(Lines& lines, int padding)
    {
        if (padding <= 0)
            return;
        for (auto& line: lines)
            line.indent(padding);
        lines.insert(lines.begin(), static_cast<std::size_t>(padding), tui::TextLine {});
        lines.insert(lines.end(), static_cast<std::size_t>(padding), tui::TextLine {});
    }

    auto layoutVertical(StackNode const& stack) -> Lines
    {
        auto lines = Lines {};
        for (auto i = std::size_t { 0 }; i < stack.children.size(); ++i)
        {
            if (i > 0)
                lines.insert(lines.end(), static_cast<std::size_t>(std::max(0, stack.options.spacing)), tui::TextLine {});
            auto child = layout(stack.children[i]);
            lines.insert(lines.end(), std::make_move_iterator(child.begin()), std::make_move_iterator(child.end()));
        }

        if (stack.options.align)
        {
            auto const width = blockWidth(lines);
            for (auto& line: lines)
                line.indent(crossOffset(stack.options.align, width - line.width()));
        }
        return lines;
    }

    auto layoutHorizontal(StackNode const& stack) -> Lines
    {
        auto blocks = std::vector<Lines> {};
        auto height = std::size_t { 0 };
        for (auto const& child: stack.children)
        {
            blocks.push_back(layout(child));
            height = std::max(height, blocks.back().size());
        }

        auto lines = Lines(height);
        for (auto b = std::size_t { 0 }; b < blocks.size(); ++b)
        {
            auto const& block = blocks[b];
            auto const width = blockWidth(block);
            auto const offset = static_cast<std::size_t>(
                crossOffset(stack.options.align, static_cast<int>(height - block.size())));
            auto const last = b + 1 == blocks.size();

            for (auto row = std::size_t { 0 }; row < height; ++row)
            {
                auto& line = lines[row];
                auto const startWidth = line.width();
                if (row >= offset && row - offset < block.size())
                {
                    auto const& source = block[row - offset].spans;
                    line.spans.insert(line.spans.end(), source.begin(), source.end());
                }
                if (!last)
                    line.pad(width - (line.width() - startWidth) + std::max(0, stack.options.spacing));
            }
        }
        return lines;
    }
} // namespace

// =============================================================================
// Node equality
// =============================================================================

auto StackNode::operator==(StackNode const& other) const -> bool
{
    return direction == other.direction && options == other.options && children == other.children;
}

auto StyledNode::operator==(StyledNode const& other) const -> bool
{
    return style == other.style && sameChild(child, other.child);
}

auto TaggedNode::operator==(TaggedNode const& other) const -> bool
{
    return kind == other.kind && meta == other.meta && sameChild(child, other.child);
}

auto Node::operator==(Node const& other) const -> bool
{
    return value == other.value;
}

// =============================================================================
// Builders
// =============================================================================

auto empty() -> Node
{
    return Node { EmptyNode {} };
}

auto text(std::string content, tui::Style const& style) -> Node
{
    return Node { TextNode { .text = std::move(content), .style = style } };
}

auto stack(Direction direction, std::vector<Node> children, StackOptions options) -> Node
{
    return Node { StackNode { .direction = direction, .children = std::move(children), .options = std::move(options) } };
}

auto styled(Node child, tui::Style const& style) -> Node
{
    if (style.isDefault())
        return child;
    return Node { StyledNode { .child = std::make_shared<Node const>(std::move(child)), .style = style } };
}

auto tagged(std::string kind, Node child, nlohmann::json meta) -> Node
{
    return Node { TaggedNode {
        .kind = std::move(kind),
        .child = std::make_shared<Node const>(std::move(child)),
        .meta = std::move(meta),
    } };
}

// =============================================================================
// Layout and painting
// =============================================================================

auto layout(Node const& node) -> std::vector<tui::TextLine>
{
    if (auto const* textNode = node.as<TextNode>())
    {
        auto lines = Lines {};
        for (auto& part: tui::splitLines(textNode->text))
        {
            auto& line = lines.emplace_back();
            line.append(std::move(part), textNode->style);
        }
        return lines;
    }

    if (auto const* stackNode = node.as<StackNode>())
    {
        auto lines = stackNode->direction == Direction::Vertical ? layoutVertical(*stackNode)
                                                                 : layoutHorizontal(*stackNode);
        applyPadding(lines, stackNode->options.padding);
        for (auto& line: lines)
            line.indent(stackNode->options.indent);
        return lines;
    }

    if (auto const* styledNode = node.as<StyledNode>())
    {
        auto lines = styledNode->child ? layout(*styledNode->child) : Lines {};
        for (auto& line: lines)
            for (auto& span: line.spans)
                span.style = inherit(span.style, styledNode->style);
        return lines;
    }

    if (auto const* taggedNode = node.as<TaggedNode>())
        return taggedNode->child ? layout(*taggedNode->child) : Lines {};

    return {};
}

auto paint(Node const& node, bool colors) -> std::string
{
    auto output = tui::TerminalOutput(colors);
    auto const lines = layout(node);
    for (auto i = std::size_t { 0 }; i < lines.size(); ++i)
    {
        if (i > 0)
            output.newline();
        for (auto const& span: lines[i].spans)
            output.write(span.text, span.style);
    }
    return output.str();
}

auto plainText(Node const& node, std::optional<int> wrapWidth) -> std::string
{
    auto result = std::string {};
    auto first = true;
    for (auto const& line: layout(node))
    {
        auto const content = line.text();
        auto const parts = wrapWidth ? tui::wordWrap(content, *wrapWidth) : std::vector<std::string> { content };
        for (auto const& part: parts)
        {
            if (!first)
                result += '\n';
            result += part;
            first = false;
        }
    }
    return result;
}

} // namespace uniui::terminal
