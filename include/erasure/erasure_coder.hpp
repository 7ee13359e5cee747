#pragma once

#include "erasure/reed_solomon.hpp"
#include "partition/types.hpp"

#include <cstddef>
#include <vector>

namespace auraseal::erasure {

class ErasureCoder;

// Recovery of one component's missing data parts, solved once. rebuild()
// is safe to call concurrently for different indices.
class PartRecovery {
public:
    const std::vector<std::size_t>& indices() const noexcept { return plan_.targets(); }

    // Returns the sealed data part `index`; throws std::out_of_range when
    // `index` was not among the missing parts.
    partition::Part rebuild(std::size_t index) const;

private:
    friend class ErasureCoder;

    partition::PartHeader reference_ {};
    std::size_t parityCount_ {0};
    RecoveryPlan plan_;
};

// Part-level erasure coding over one stripe holding every data part of a
// component. Shards are payloads zero-padded to the first part's length.
class ErasureCoder {
public:
    explicit ErasureCoder(std::size_t parityCount);

    std::size_t parityCount() const noexcept { return parityCount_; }

    // `dataParts` must be the complete, ordered data parts of one component.
    std::vector<partition::Part> generateParity(const std::vector<partition::Part>& dataParts) const;

    // Rebuilds the data parts named in `missingIndices` from the remaining
    // data parts and the available parity parts. Throws UnrecoverableError
    // when more parts are missing than parity parts are available.
    // Validates the inputs and prepares the rebuild of `missingIndices`.
    // Throws like reconstruct().
    PartRecovery prepare(const std::vector<partition::Part>& presentParts,
                         const std::vector<std::size_t>& missingIndices,
                         const std::vector<partition::Part>& parityParts) const;

    std::vector<partition::Part> reconstruct(const std::vector<partition::Part>& presentParts,
                                             const std::vector<std::size_t>& missingIndices,
                                             const std::vector<partition::Part>& parityParts) const;

private:
    std::size_t parityCount_;
};

} // namespace auraseal::erasure
