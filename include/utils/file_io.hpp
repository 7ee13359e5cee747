#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace auraseal::utils {

void ensureParentDirectory(const std::filesystem::path& path);
void writeBufferToFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);

// Writes beside the destination and renames over it, so readers never see
// a partially written file.
void writeBufferAtomically(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);

std::vector<std::uint8_t> readFileBytes(const std::filesystem::path& path);

} // namespace auraseal::utils
