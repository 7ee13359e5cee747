#include "compression/huffman/code_index.hpp"

#include <algorithm>
#include <stdexcept>

namespace auraseal::compression::huffman {

CodeIndex::CodeIndex(const CanonicalCodeTable& codes)
{
    nodes_.reserve(kAlphabetSize);
    for (std::size_t symbol = 0; symbol < codes.size(); ++symbol) {
        if (codes[symbol].length == 0U) {
            continue;
        }
        insert(codes[symbol].bits, codes[symbol].length, static_cast<std::uint8_t>(symbol));
    }
}

std::uint32_t CodeIndex::makeKey(std::uint16_t bits, std::uint8_t length) noexcept
{
    return (static_cast<std::uint32_t>(length) << 16U) | bits;
}

void CodeIndex::insert(std::uint16_t bits, std::uint8_t length, std::uint8_t symbol)
{
    if (length == 0U || length > kMaxCodeLength) {
        throw std::invalid_argument("Code length out of range");
    }

    root_ = insertAt(root_, kNone, makeKey(bits, length), symbol);
    nodes_[static_cast<std::size_t>(root_)].parent = kNone;

    minLength_ = (minLength_ == 0U) ? length : std::min(minLength_, length);
    maxLength_ = std::max(maxLength_, length);
}

std::optional<std::uint8_t> CodeIndex::find(std::uint16_t bits, std::uint8_t length) const
{
    const auto key = makeKey(bits, length);
    auto current = root_;
    while (current != kNone) {
        const auto& node = nodes_[static_cast<std::size_t>(current)];
        if (key == node.key) {
            return node.symbol;
        }
        current = key < node.key ? node.left : node.right;
    }
    return std::nullopt;
}

std::size_t CodeIndex::size() const noexcept
{
    return nodes_.size();
}

std::int32_t CodeIndex::height() const noexcept
{
    return heightOf(root_);
}

std::uint8_t CodeIndex::minLength() const noexcept
{
    return minLength_;
}

std::uint8_t CodeIndex::maxLength() const noexcept
{
    return maxLength_;
}

std::int32_t CodeIndex::insertAt(std::int32_t node, std::int32_t parent, std::uint32_t key, std::uint8_t symbol)
{
    if (node == kNone) {
        Node created {};
        created.key = key;
        created.symbol = symbol;
        created.parent = parent;
        nodes_.push_back(created);
        return static_cast<std::int32_t>(nodes_.size() - 1U);
    }

    const auto nodeKey = nodes_[static_cast<std::size_t>(node)].key;
    if (key == nodeKey) {
        throw std::invalid_argument("Duplicate canonical code");
    }

    // The arena may grow during the recursive call; re-index afterwards.
    if (key < nodeKey) {
        const auto child = insertAt(nodes_[static_cast<std::size_t>(node)].left, node, key, symbol);
        nodes_[static_cast<std::size_t>(node)].left = child;
    } else {
        const auto child = insertAt(nodes_[static_cast<std::size_t>(node)].right, node, key, symbol);
        nodes_[static_cast<std::size_t>(node)].right = child;
    }

    updateHeight(node);
    return rebalance(node);
}

std::int32_t CodeIndex::rebalance(std::int32_t node)
{
    auto& current = nodes_[static_cast<std::size_t>(node)];
    const auto balance = heightOf(current.left) - heightOf(current.right);

    if (balance > 1) {
        const auto left = current.left;
        const auto& leftNode = nodes_[static_cast<std::size_t>(left)];
        if (heightOf(leftNode.left) < heightOf(leftNode.right)) {
            const auto rotated = rotateLeft(left);
            nodes_[static_cast<std::size_t>(node)].left = rotated;
        }
        return rotateRight(node);
    }

    if (balance < -1) {
        const auto right = current.right;
        const auto& rightNode = nodes_[static_cast<std::size_t>(right)];
        if (heightOf(rightNode.right) < heightOf(rightNode.left)) {
            const auto rotated = rotateRight(right);
            nodes_[static_cast<std::size_t>(node)].right = rotated;
        }
        return rotateLeft(node);
    }

    return node;
}

std::int32_t CodeIndex::rotateLeft(std::int32_t node)
{
    const auto pivot = nodes_[static_cast<std::size_t>(node)].right;
    const auto inner = nodes_[static_cast<std::size_t>(pivot)].left;

    nodes_[static_cast<std::size_t>(node)].right = inner;
    if (inner != kNone) {
        nodes_[static_cast<std::size_t>(inner)].parent = node;
    }

    nodes_[static_cast<std::size_t>(pivot)].left = node;
    nodes_[static_cast<std::size_t>(pivot)].parent = nodes_[static_cast<std::size_t>(node)].parent;
    nodes_[static_cast<std::size_t>(node)].parent = pivot;

    updateHeight(node);
    updateHeight(pivot);
    return pivot;
}

std::int32_t CodeIndex::rotateRight(std::int32_t node)
{
    const auto pivot = nodes_[static_cast<std::size_t>(node)].left;
    const auto inner = nodes_[static_cast<std::size_t>(pivot)].right;

    nodes_[static_cast<std::size_t>(node)].left = inner;
    if (inner != kNone) {
        nodes_[static_cast<std::size_t>(inner)].parent = node;
    }

    nodes_[static_cast<std::size_t>(pivot)].right = node;
    nodes_[static_cast<std::size_t>(pivot)].parent = nodes_[static_cast<std::size_t>(node)].parent;
    nodes_[static_cast<std::size_t>(node)].parent = pivot;

    updateHeight(node);
    updateHeight(pivot);
    return pivot;
}

std::int32_t CodeIndex::heightOf(std::int32_t node) const noexcept
{
    return node == kNone ? 0 : nodes_[static_cast<std::size_t>(node)].height;
}

void CodeIndex::updateHeight(std::int32_t node) noexcept
{
    auto& current = nodes_[static_cast<std::size_t>(node)];
    current.height = 1 + std::max(heightOf(current.left), heightOf(current.right));
}

} // namespace auraseal::compression::huffman
