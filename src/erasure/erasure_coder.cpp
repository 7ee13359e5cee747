#include "erasure/erasure_coder.hpp"

#include "erasure/reed_solomon.hpp"
#include "errors.hpp"
#include "partition/part_format.hpp"
#include "partition/partitioner.hpp"

#include <stdexcept>
#include <string>

namespace auraseal::erasure {
namespace {

Shard padded(const std::vector<std::uint8_t>& payload, std::size_t shardSize)
{
    if (payload.size() > shardSize) {
        throw std::invalid_argument("Payload larger than the stripe shard size");
    }
    Shard shard(payload);
    shard.resize(shardSize, 0);
    return shard;
}

} // namespace

ErasureCoder::ErasureCoder(std::size_t parityCount)
    : parityCount_(parityCount)
{
    if (parityCount >= partition::kMaxTotalParts) {
        throw std::invalid_argument("Parity count must leave room for data parts");
    }
}

std::vector<partition::Part> ErasureCoder::generateParity(const std::vector<partition::Part>& dataParts) const
{
    std::vector<partition::Part> parityParts;
    if (parityCount_ == 0U) {
        return parityParts;
    }
    if (dataParts.empty()) {
        throw std::invalid_argument("Cannot generate parity without data parts");
    }

    const auto& first = dataParts.front().header;
    const auto dataCount = dataParts.size();
    if (first.totalParts != dataCount) {
        throw std::invalid_argument("Parity generation needs all " + std::to_string(first.totalParts) + " data parts");
    }
    if (first.parityCount != parityCount_) {
        throw std::invalid_argument("Data parts were split for " + std::to_string(first.parityCount) + " parity parts");
    }

    const auto shardSize = dataParts.front().payload.size();
    std::vector<Shard> shards;
    shards.reserve(dataCount);
    for (std::size_t index = 0; index < dataCount; ++index) {
        const auto& part = dataParts[index];
        if (part.header.kind != partition::PartKind::Data || part.header.partNumber != index
            || part.header.componentId != first.componentId) {
            throw std::invalid_argument("Data parts must be ordered parts of one component");
        }
        shards.emplace_back(padded(part.payload, shardSize));
    }

    const ReedSolomon code(dataCount, parityCount_);
    auto parityShards = code.encode(shards);

    parityParts.reserve(parityCount_);
    for (std::size_t index = 0; index < parityShards.size(); ++index) {
        partition::Part part {};
        part.header = first;
        part.header.kind = partition::PartKind::Parity;
        part.header.partNumber = static_cast<std::uint8_t>(index);
        part.payload = std::move(parityShards[index]);
        partition::sealPart(part);
        parityParts.emplace_back(std::move(part));
    }
    return parityParts;
}

partition::Part PartRecovery::rebuild(std::size_t index) const
{
    const auto dataCount = static_cast<std::size_t>(reference_.totalParts);
    auto shard = plan_.solve(index);

    partition::Part part {};
    part.header = reference_;
    part.header.kind = partition::PartKind::Data;
    part.header.partNumber = static_cast<std::uint8_t>(index);
    part.header.parityCount = static_cast<std::uint8_t>(parityCount_);
    part.header.recoveryBits = partition::makeRecoveryBits(dataCount, parityCount_);
    const auto length = partition::expectedPayloadSize(reference_, index, shard.size());
    shard.resize(length);
    part.payload = std::move(shard);
    partition::sealPart(part);
    return part;
}

PartRecovery ErasureCoder::prepare(const std::vector<partition::Part>& presentParts,
                                   const std::vector<std::size_t>& missingIndices,
                                   const std::vector<partition::Part>& parityParts) const
{
    PartRecovery recovery;
    recovery.parityCount_ = parityCount_;
    if (missingIndices.empty()) {
        return recovery;
    }
    if (missingIndices.size() > parityCount_) {
        throw UnrecoverableError(std::to_string(missingIndices.size()) + " parts missing, parity covers at most "
                                 + std::to_string(parityCount_));
    }
    if (parityParts.empty()) {
        throw UnrecoverableError("No parity parts available to rebuild " + std::to_string(missingIndices.size())
                                 + " missing parts");
    }

    // Any surviving part carries the component metadata.
    const auto& reference = presentParts.empty() ? parityParts.front().header : presentParts.front().header;
    const auto dataCount = static_cast<std::size_t>(reference.totalParts);
    const auto shardSize = parityParts.front().payload.size();

    std::map<std::size_t, Shard> present;
    for (const auto& part : presentParts) {
        if (part.header.kind != partition::PartKind::Data || part.header.componentId != reference.componentId) {
            throw std::invalid_argument("Present parts must be data parts of one component");
        }
        const auto index = static_cast<std::size_t>(part.header.partNumber);
        if (part.payload.size() != partition::expectedPayloadSize(reference, index, shardSize)) {
            throw std::invalid_argument("Data part " + std::to_string(index) + " has an unexpected payload size");
        }
        present.emplace(index, padded(part.payload, shardSize));
    }

    std::map<std::size_t, Shard> parity;
    for (const auto& part : parityParts) {
        if (part.header.kind != partition::PartKind::Parity || part.header.componentId != reference.componentId) {
            throw std::invalid_argument("Parity parts must belong to the same component");
        }
        parity.emplace(static_cast<std::size_t>(part.header.partNumber), part.payload);
    }

    const ReedSolomon code(dataCount, parityCount_);
    recovery.reference_ = reference;
    recovery.plan_ = code.plan(present, missingIndices, parity);
    return recovery;
}

std::vector<partition::Part> ErasureCoder::reconstruct(const std::vector<partition::Part>& presentParts,
                                                       const std::vector<std::size_t>& missingIndices,
                                                       const std::vector<partition::Part>& parityParts) const
{
    const auto recovery = prepare(presentParts, missingIndices, parityParts);
    std::vector<partition::Part> rebuilt;
    rebuilt.reserve(recovery.indices().size());
    for (const auto index : recovery.indices()) {
        rebuilt.emplace_back(recovery.rebuild(index));
    }
    return rebuilt;
}

} // namespace auraseal::erasure
