#include "assembly/part_source.hpp"

#include "errors.hpp"
#include "filesystem/package_layout.hpp"
#include "partition/part_format.hpp"
#include "utils/file_io.hpp"

#include <system_error>

namespace auraseal::assembly {

std::string describe(const PartRequest& request)
{
    return std::string(request.kind == partition::PartKind::Data ? "data" : "parity") + " part "
        + std::to_string(request.index) + " of component " + std::to_string(request.componentId);
}

DirectoryPartSource::DirectoryPartSource(std::filesystem::path packageRoot)
    : packageRoot_(std::move(packageRoot))
{
}

const std::filesystem::path& DirectoryPartSource::root() const noexcept
{
    return packageRoot_;
}

std::vector<std::uint8_t> DirectoryPartSource::fetch(const PartRequest& request, std::chrono::milliseconds)
{
    request.cancellation.throwIfCancelled(describe(request));

    std::filesystem::path path;
    try {
        path = filesystem::partPath(packageRoot_, request.location, request.index);
    } catch (const std::invalid_argument& ex) {
        throw ChunkCorruptError("Bad location for " + describe(request) + ": " + ex.what());
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ChunkCorruptError("Missing " + describe(request) + " at " + path.string());
    }
    try {
        return utils::readFileBytes(path);
    } catch (const std::runtime_error& ex) {
        throw ChunkCorruptError("Unreadable " + describe(request) + ": " + ex.what());
    }
}

void MemoryPartSource::store(const partition::Part& part)
{
    storeRaw(part.header.componentId, part.header.kind, part.header.partNumber, partition::serializePart(part));
}

void MemoryPartSource::storeRaw(std::uint8_t componentId, partition::PartKind kind, std::size_t index, std::vector<std::uint8_t> bytes)
{
    std::lock_guard<std::mutex> lock(mutex_);
    parts_[Key {componentId, kind, index}] = std::move(bytes);
}

bool MemoryPartSource::remove(std::uint8_t componentId, partition::PartKind kind, std::size_t index)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return parts_.erase(Key {componentId, kind, index}) != 0U;
}

std::size_t MemoryPartSource::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return parts_.size();
}

std::vector<std::uint8_t> MemoryPartSource::fetch(const PartRequest& request, std::chrono::milliseconds)
{
    request.cancellation.throwIfCancelled(describe(request));

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = parts_.find(Key {request.componentId, request.kind, request.index});
    if (it == parts_.end()) {
        throw ChunkCorruptError("Missing " + describe(request));
    }
    return it->second;
}

} // namespace auraseal::assembly
