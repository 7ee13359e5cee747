#pragma once

#include "compression/huffman/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace auraseal::compression::huffman {

// AVL tree keyed by (length, code) and stored as an index-addressed
// arena. Lookup and insertion are O(log n) in the alphabet size.
class CodeIndex {
public:
    CodeIndex() = default;
    explicit CodeIndex(const CanonicalCodeTable& codes);

    void insert(std::uint16_t bits, std::uint8_t length, std::uint8_t symbol);
    std::optional<std::uint8_t> find(std::uint16_t bits, std::uint8_t length) const;

    std::size_t size() const noexcept;
    std::int32_t height() const noexcept;
    std::uint8_t minLength() const noexcept;
    std::uint8_t maxLength() const noexcept;

private:
    static constexpr std::int32_t kNone = -1;

    struct Node {
        std::uint32_t key {0};
        std::uint8_t symbol {0};
        std::int32_t parent {kNone};
        std::int32_t left {kNone};
        std::int32_t right {kNone};
        std::int32_t height {1};
    };

    static std::uint32_t makeKey(std::uint16_t bits, std::uint8_t length) noexcept;

    std::int32_t insertAt(std::int32_t node, std::int32_t parent, std::uint32_t key, std::uint8_t symbol);
    std::int32_t rebalance(std::int32_t node);
    std::int32_t rotateLeft(std::int32_t node);
    std::int32_t rotateRight(std::int32_t node);
    std::int32_t heightOf(std::int32_t node) const noexcept;
    void updateHeight(std::int32_t node) noexcept;

    std::vector<Node> nodes_;
    std::int32_t root_ {kNone};
    std::uint8_t minLength_ {0};
    std::uint8_t maxLength_ {0};
};

} // namespace auraseal::compression::huffman
