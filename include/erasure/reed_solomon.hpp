#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace auraseal::erasure {

using Shard = std::vector<std::uint8_t>;

class ReedSolomon;

// A solved recovery system for one set of missing shards. Each missing
// shard is produced independently, so callers can rebuild them in parallel.
class RecoveryPlan {
public:
    const std::vector<std::size_t>& targets() const noexcept { return targets_; }

    // Throws std::out_of_range when `target` is not one of targets().
    Shard solve(std::size_t target) const;

private:
    friend class ReedSolomon;

    std::vector<std::size_t> targets_;
    std::vector<std::vector<std::uint8_t>> inverse_;
    std::vector<Shard> remainders_;
    std::size_t shardSize_ {0};
};

// Systematic Reed-Solomon code over GF(2^8) whose parity rows form a
// Cauchy matrix, so any dataShards of the dataShards + parityShards
// shards recover the data.
class ReedSolomon {
public:
    ReedSolomon(std::size_t dataShards, std::size_t parityShards);

    std::size_t dataShards() const noexcept { return dataShards_; }
    std::size_t parityShards() const noexcept { return parityShards_; }

    std::uint8_t coefficient(std::size_t parityRow, std::size_t dataColumn) const;

    // All shards must share one size.
    std::vector<Shard> encode(const std::vector<Shard>& data) const;

    // Returns the shards listed in `missing`, keyed by data index. Throws
    // UnrecoverableError when fewer parity shards than missing shards are
    // available. Uses the lowest-indexed parity shards, so identical inputs
    // produce identical output.
    // Validates the inputs and solves the recovery system once. Throws
    // like reconstruct().
    RecoveryPlan plan(const std::map<std::size_t, Shard>& presentData,
                      const std::vector<std::size_t>& missing,
                      const std::map<std::size_t, Shard>& parity) const;

    std::map<std::size_t, Shard> reconstruct(const std::map<std::size_t, Shard>& presentData,
                                             const std::vector<std::size_t>& missing,
                                             const std::map<std::size_t, Shard>& parity) const;

private:
    std::size_t dataShards_;
    std::size_t parityShards_;
    std::vector<std::uint8_t> matrix_;
};

} // namespace auraseal::erasure
