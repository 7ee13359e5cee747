#include "compression/huffman/code_table.hpp"

#include "errors.hpp"

#include <omp.h>

#include <algorithm>
#include <cstddef>
#include <queue>
#include <string>

namespace auraseal::compression::huffman {
namespace {

constexpr std::size_t kParallelCountThreshold = 1U << 16U;
constexpr std::int32_t kNoNode = -1;

struct TreeNode {
    std::uint64_t frequency {0};
    std::int32_t symbol {-1};
    std::int32_t parent {kNoNode};
    std::int32_t left {kNoNode};
    std::int32_t right {kNoNode};
};

using TreeArena = std::vector<TreeNode>;

class NodeOrder {
public:
    explicit NodeOrder(const TreeArena& arena)
        : arena_(&arena)
    {
    }

    // Min-heap on frequency, earlier arena slots first on ties.
    bool operator()(std::int32_t lhs, std::int32_t rhs) const noexcept
    {
        const auto& a = (*arena_)[static_cast<std::size_t>(lhs)];
        const auto& b = (*arena_)[static_cast<std::size_t>(rhs)];
        if (a.frequency == b.frequency) {
            return lhs > rhs;
        }
        return a.frequency > b.frequency;
    }

private:
    const TreeArena* arena_;
};

TreeArena buildTree(const FrequencyTable& frequencies)
{
    TreeArena arena;
    arena.reserve(2U * kAlphabetSize);

    std::priority_queue<std::int32_t, std::vector<std::int32_t>, NodeOrder> queue {NodeOrder(arena)};
    for (std::size_t symbol = 0; symbol < frequencies.size(); ++symbol) {
        if (frequencies[symbol] == 0U) {
            continue;
        }
        arena.push_back(TreeNode {frequencies[symbol], static_cast<std::int32_t>(symbol)});
        queue.push(static_cast<std::int32_t>(arena.size() - 1U));
    }

    while (queue.size() > 1U) {
        const auto left = queue.top();
        queue.pop();
        const auto right = queue.top();
        queue.pop();

        const auto parent = static_cast<std::int32_t>(arena.size());
        const auto frequency = arena[static_cast<std::size_t>(left)].frequency + arena[static_cast<std::size_t>(right)].frequency;
        arena.push_back(TreeNode {frequency, -1, kNoNode, left, right});
        arena[static_cast<std::size_t>(left)].parent = parent;
        arena[static_cast<std::size_t>(right)].parent = parent;
        queue.push(parent);
    }

    return arena;
}

// Parents always sit after their children in the arena, so one backward
// sweep from the root resolves every depth.
CodeLengthTable leafDepths(const TreeArena& arena, std::uint32_t& maxDepth)
{
    CodeLengthTable lengths {};
    maxDepth = 0;
    if (arena.empty()) {
        return lengths;
    }

    std::vector<std::uint32_t> depth(arena.size(), 0);
    for (std::size_t index = arena.size(); index-- > 0;) {
        const auto parent = arena[index].parent;
        if (parent != kNoNode) {
            depth[index] = depth[static_cast<std::size_t>(parent)] + 1U;
        }
        if (arena[index].symbol >= 0) {
            // A lone symbol still needs one bit.
            const auto bits = std::max<std::uint32_t>(1U, depth[index]);
            maxDepth = std::max(maxDepth, bits);
            lengths[static_cast<std::size_t>(arena[index].symbol)] = static_cast<std::uint8_t>(std::min<std::uint32_t>(bits, 255U));
        }
    }
    return lengths;
}

} // namespace

FrequencyTable countFrequencies(const std::vector<std::uint8_t>& input)
{
    const auto threadCount = static_cast<std::size_t>(std::max(1, omp_get_max_threads()));
    std::vector<FrequencyTable> threadTables(threadCount, FrequencyTable {});
    const auto size = static_cast<std::int64_t>(input.size());

    #pragma omp parallel if (input.size() >= kParallelCountThreshold)
    {
        auto& local = threadTables[static_cast<std::size_t>(omp_get_thread_num()) % threadCount];

        #pragma omp for
        for (std::int64_t index = 0; index < size; ++index) {
            ++local[input[static_cast<std::size_t>(index)]];
        }
    }

    FrequencyTable frequencies {};
    for (const auto& local : threadTables) {
        for (std::size_t symbol = 0; symbol < kAlphabetSize; ++symbol) {
            frequencies[symbol] += local[symbol];
        }
    }
    return frequencies;
}

CodeLengthTable buildCodeLengths(const FrequencyTable& frequencies)
{
    FrequencyTable scaled = frequencies;
    while (true) {
        std::uint32_t maxDepth = 0;
        const auto lengths = leafDepths(buildTree(scaled), maxDepth);
        if (maxDepth <= kMaxCodeLength) {
            return lengths;
        }
        // Flatten the distribution until the deepest leaf fits a nibble.
        for (auto& frequency : scaled) {
            if (frequency != 0U) {
                frequency = std::max<std::uint64_t>(1U, frequency / 2U);
            }
        }
    }
}

CanonicalCodeTable assignCanonicalCodes(const CodeLengthTable& lengths)
{
    CanonicalCodeTable codes {};
    std::uint32_t next = 0;
    for (std::uint8_t length = 1; length <= kMaxCodeLength; ++length) {
        for (std::size_t symbol = 0; symbol < kAlphabetSize; ++symbol) {
            if (lengths[symbol] != length) {
                continue;
            }
            if (next >= (1U << length)) {
                throw CodecCorruptError("Over-subscribed code length table at length " + std::to_string(length));
            }
            codes[symbol] = CanonicalCode {static_cast<std::uint16_t>(next), length};
            ++next;
        }
        next <<= 1U;
    }

    for (std::size_t symbol = 0; symbol < kAlphabetSize; ++symbol) {
        if (lengths[symbol] > kMaxCodeLength) {
            throw CodecCorruptError("Code length exceeds " + std::to_string(kMaxCodeLength) + " bits for symbol "
                                    + std::to_string(symbol));
        }
    }
    return codes;
}

PackedCodeTable packCodeLengths(const CodeLengthTable& lengths)
{
    PackedCodeTable packed {};
    for (std::size_t index = 0; index < kPackedTableSize; ++index) {
        const auto high = lengths[2U * index];
        const auto low = lengths[2U * index + 1U];
        if (high > kMaxCodeLength || low > kMaxCodeLength) {
            throw std::invalid_argument("Code length does not fit the packed table");
        }
        packed[index] = static_cast<std::uint8_t>((high << 4U) | low);
    }
    return packed;
}

CodeLengthTable unpackCodeLengths(const PackedCodeTable& packed)
{
    CodeLengthTable lengths {};
    for (std::size_t index = 0; index < kPackedTableSize; ++index) {
        lengths[2U * index] = static_cast<std::uint8_t>(packed[index] >> 4U);
        lengths[2U * index + 1U] = static_cast<std::uint8_t>(packed[index] & 0x0FU);
    }
    return lengths;
}

} // namespace auraseal::compression::huffman
