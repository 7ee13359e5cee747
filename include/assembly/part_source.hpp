#pragma once

#include "concurrency/cancellation.hpp"
#include "partition/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

namespace auraseal::assembly {

struct PartRequest {
    std::uint8_t componentId {0};
    partition::PartKind kind {partition::PartKind::Data};
    std::size_t index {0};
    // Package-relative directory holding the part (a recovery reference).
    std::string location;
    // Cancelled once the fetch is no longer wanted: its timeout passed or
    // its component was cancelled. Long-running sources should poll it.
    concurrency::CancellationToken cancellation;
};

std::string describe(const PartRequest& request);

// Delivery of serialized parts from wherever the package lives.
// Implementations throw NetworkTimeoutError once `timeout` elapses,
// CancelledError once `request.cancellation` fires and ChunkCorruptError
// when the part cannot be produced at all. The Assembler enforces the
// timeout itself and stops waiting on a fetch that overruns it.
class PartSource {
public:
    virtual ~PartSource() = default;

    virtual std::vector<std::uint8_t> fetch(const PartRequest& request, std::chrono::milliseconds timeout) = 0;
};

class DirectoryPartSource : public PartSource {
public:
    explicit DirectoryPartSource(std::filesystem::path packageRoot);

    std::vector<std::uint8_t> fetch(const PartRequest& request, std::chrono::milliseconds timeout) override;

    const std::filesystem::path& root() const noexcept;

private:
    std::filesystem::path packageRoot_;
};

class MemoryPartSource : public PartSource {
public:
    void store(const partition::Part& part);
    void storeRaw(std::uint8_t componentId, partition::PartKind kind, std::size_t index, std::vector<std::uint8_t> bytes);
    bool remove(std::uint8_t componentId, partition::PartKind kind, std::size_t index);
    std::size_t size() const;

    std::vector<std::uint8_t> fetch(const PartRequest& request, std::chrono::milliseconds timeout) override;

private:
    using Key = std::tuple<std::uint8_t, partition::PartKind, std::size_t>;

    mutable std::mutex mutex_;
    std::map<Key, std::vector<std::uint8_t>> parts_;
};

} // namespace auraseal::assembly
