#include "erasure/reed_solomon.hpp"

#include "erasure/galois_field.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>
#include <set>
#include <stdexcept>
#include <string>

namespace auraseal::erasure {
namespace {

using Matrix = std::vector<std::vector<std::uint8_t>>;

void mulAdd(Shard& target, const Shard& source, std::uint8_t coefficient)
{
    if (coefficient == 0U) {
        return;
    }
    std::array<std::uint8_t, 256> row {};
    for (std::size_t value = 0; value < row.size(); ++value) {
        row[value] = GF256::mul(coefficient, static_cast<std::uint8_t>(value));
    }
    for (std::size_t index = 0; index < target.size(); ++index) {
        target[index] ^= row[source[index]];
    }
}

Matrix invert(Matrix matrix)
{
    const auto size = matrix.size();
    Matrix inverse(size, std::vector<std::uint8_t>(size, 0));
    for (std::size_t index = 0; index < size; ++index) {
        inverse[index][index] = 1;
    }

    for (std::size_t column = 0; column < size; ++column) {
        std::size_t pivot = column;
        while (pivot < size && matrix[pivot][column] == 0U) {
            ++pivot;
        }
        if (pivot == size) {
            throw UnrecoverableError("Singular recovery matrix");
        }
        std::swap(matrix[pivot], matrix[column]);
        std::swap(inverse[pivot], inverse[column]);

        const auto scale = GF256::inv(matrix[column][column]);
        for (std::size_t k = 0; k < size; ++k) {
            matrix[column][k] = GF256::mul(matrix[column][k], scale);
            inverse[column][k] = GF256::mul(inverse[column][k], scale);
        }

        for (std::size_t row = 0; row < size; ++row) {
            const auto factor = matrix[row][column];
            if (row == column || factor == 0U) {
                continue;
            }
            for (std::size_t k = 0; k < size; ++k) {
                matrix[row][k] ^= GF256::mul(factor, matrix[column][k]);
                inverse[row][k] ^= GF256::mul(factor, inverse[column][k]);
            }
        }
    }
    return inverse;
}

} // namespace

ReedSolomon::ReedSolomon(std::size_t dataShards, std::size_t parityShards)
    : dataShards_(dataShards)
    , parityShards_(parityShards)
{
    if (dataShards == 0U) {
        throw std::invalid_argument("Reed-Solomon code needs at least one data shard");
    }
    if (dataShards + parityShards > 256U) {
        throw std::invalid_argument("Data and parity shards exceed the GF(256) field size");
    }

    // Row i, column j holds 1 / (x_i + y_j) with x_i = k + i and y_j = j;
    // the two sets are disjoint so no denominator vanishes.
    matrix_.resize(parityShards * dataShards);
    for (std::size_t row = 0; row < parityShards; ++row) {
        for (std::size_t column = 0; column < dataShards; ++column) {
            const auto x = static_cast<std::uint8_t>(dataShards + row);
            const auto y = static_cast<std::uint8_t>(column);
            matrix_[row * dataShards + column] = GF256::inv(GF256::add(x, y));
        }
    }
}

std::uint8_t ReedSolomon::coefficient(std::size_t parityRow, std::size_t dataColumn) const
{
    if (parityRow >= parityShards_ || dataColumn >= dataShards_) {
        throw std::out_of_range("Reed-Solomon matrix index out of range");
    }
    return matrix_[parityRow * dataShards_ + dataColumn];
}

std::vector<Shard> ReedSolomon::encode(const std::vector<Shard>& data) const
{
    if (data.size() != dataShards_) {
        throw std::invalid_argument("Expected " + std::to_string(dataShards_) + " data shards, got "
                                    + std::to_string(data.size()));
    }
    const auto shardSize = data.front().size();
    for (const auto& shard : data) {
        if (shard.size() != shardSize) {
            throw std::invalid_argument("Data shards differ in size");
        }
    }

    std::vector<Shard> parity(parityShards_, Shard(shardSize, 0));
    for (std::size_t row = 0; row < parityShards_; ++row) {
        for (std::size_t column = 0; column < dataShards_; ++column) {
            mulAdd(parity[row], data[column], coefficient(row, column));
        }
    }
    return parity;
}

Shard RecoveryPlan::solve(std::size_t target) const
{
    const auto it = std::find(targets_.begin(), targets_.end(), target);
    if (it == targets_.end()) {
        throw std::out_of_range("Shard " + std::to_string(target) + " is not part of this recovery");
    }
    const auto c = static_cast<std::size_t>(it - targets_.begin());
    Shard shard(shardSize_, 0);
    for (std::size_t r = 0; r < remainders_.size(); ++r) {
        mulAdd(shard, remainders_[r], inverse_[c][r]);
    }
    return shard;
}

RecoveryPlan ReedSolomon::plan(const std::map<std::size_t, Shard>& presentData,
                               const std::vector<std::size_t>& missing,
                               const std::map<std::size_t, Shard>& parity) const
{
    RecoveryPlan result;
    if (missing.empty()) {
        return result;
    }

    const std::set<std::size_t> missingSet(missing.begin(), missing.end());
    if (missingSet.size() != missing.size()) {
        throw std::invalid_argument("Duplicate missing shard index");
    }
    for (std::size_t index = 0; index < dataShards_; ++index) {
        const bool isMissing = missingSet.count(index) != 0U;
        const bool isPresent = presentData.count(index) != 0U;
        if (isMissing == isPresent) {
            throw std::invalid_argument("Data shard " + std::to_string(index) + " must be either present or missing");
        }
    }
    if (*missingSet.rbegin() >= dataShards_) {
        throw std::invalid_argument("Missing shard index out of range");
    }

    if (missingSet.size() > parityShards_ || missingSet.size() > parity.size()) {
        throw UnrecoverableError(std::to_string(missingSet.size()) + " data shards missing but only "
                                 + std::to_string(std::min(parityShards_, parity.size())) + " parity shards available");
    }

    const std::vector<std::size_t> targets(missingSet.begin(), missingSet.end());
    std::vector<std::size_t> rows;
    for (const auto& entry : parity) {
        if (entry.first >= parityShards_) {
            throw std::invalid_argument("Parity shard index out of range");
        }
        if (rows.size() < targets.size()) {
            rows.push_back(entry.first);
        }
    }

    const auto shardSize = parity.at(rows.front()).size();
    for (const auto& entry : presentData) {
        if (entry.second.size() != shardSize) {
            throw std::invalid_argument("Present shard " + std::to_string(entry.first) + " differs in size");
        }
    }

    // Strip the known data contribution from each chosen parity shard,
    // leaving a square system in the missing shards only.
    const auto count = targets.size();
    Matrix system(count, std::vector<std::uint8_t>(count, 0));
    std::vector<Shard> remainders;
    remainders.reserve(count);
    for (std::size_t r = 0; r < count; ++r) {
        const auto& paritySource = parity.at(rows[r]);
        if (paritySource.size() != shardSize) {
            throw std::invalid_argument("Parity shards differ in size");
        }
        Shard remainder = paritySource;
        for (const auto& entry : presentData) {
            mulAdd(remainder, entry.second, coefficient(rows[r], entry.first));
        }
        remainders.emplace_back(std::move(remainder));
        for (std::size_t c = 0; c < count; ++c) {
            system[r][c] = coefficient(rows[r], targets[c]);
        }
    }

    result.targets_ = targets;
    result.inverse_ = invert(std::move(system));
    result.remainders_ = std::move(remainders);
    result.shardSize_ = shardSize;
    return result;
}

std::map<std::size_t, Shard> ReedSolomon::reconstruct(const std::map<std::size_t, Shard>& presentData,
                                                      const std::vector<std::size_t>& missing,
                                                      const std::map<std::size_t, Shard>& parity) const
{
    const auto recovery = plan(presentData, missing, parity);
    std::map<std::size_t, Shard> recovered;
    for (const auto target : recovery.targets()) {
        recovered.emplace(target, recovery.solve(target));
    }
    return recovered;
}

} // namespace auraseal::erasure
