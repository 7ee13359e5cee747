#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace auraseal::filesystem {

struct SourceFile {
    std::filesystem::path absolutePath;
    // Generic ('/'-separated) path relative to the listed root.
    std::string relativePath;
    std::uintmax_t size {0};
};

// Regular files below `root`, recursively, sorted by relative path.
std::vector<SourceFile> listSourceFiles(const std::filesystem::path& root);

std::filesystem::path manifestPath(const std::filesystem::path& packageRoot);
std::filesystem::path partPath(const std::filesystem::path& packageRoot, const std::string& location, std::size_t index);

// Joins a manifest path under `destination`; throws std::invalid_argument
// for absolute paths or paths that climb out of it.
std::filesystem::path resolveInside(const std::filesystem::path& destination, const std::string& relativePath);

} // namespace auraseal::filesystem
