#include "filesystem/package_layout.hpp"

#include "integrity/manifest.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace auraseal::filesystem {

std::vector<SourceFile> listSourceFiles(const std::filesystem::path& root)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        throw std::invalid_argument("Source root is not a directory: " + root.string());
    }

    std::vector<SourceFile> files;
    std::filesystem::recursive_directory_iterator iterator(root, std::filesystem::directory_options::none, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("recursive_directory_iterator", root, ec);
    }

    for (const auto& entry : iterator) {
        std::error_code statusError;
        if (!entry.is_regular_file(statusError) || statusError) {
            continue;
        }

        SourceFile file {};
        file.absolutePath = entry.path();
        file.relativePath = std::filesystem::relative(entry.path(), root).generic_string();
        file.size = entry.file_size(statusError);
        if (statusError) {
            throw std::filesystem::filesystem_error("file_size", entry.path(), statusError);
        }
        files.emplace_back(std::move(file));
    }

    std::sort(files.begin(), files.end(), [](const SourceFile& lhs, const SourceFile& rhs) {
        return lhs.relativePath < rhs.relativePath;
    });
    return files;
}

std::filesystem::path manifestPath(const std::filesystem::path& packageRoot)
{
    return packageRoot / integrity::kManifestFileName;
}

std::filesystem::path partPath(const std::filesystem::path& packageRoot, const std::string& location, std::size_t index)
{
    return resolveInside(packageRoot, location) / (std::to_string(index) + ".part");
}

std::filesystem::path resolveInside(const std::filesystem::path& destination, const std::string& relativePath)
{
    const std::filesystem::path relative(relativePath);
    if (relativePath.empty() || relative.is_absolute() || relative.has_root_name()) {
        throw std::invalid_argument("Path must be relative: " + relativePath);
    }
    for (const auto& element : relative.lexically_normal()) {
        if (element == "..") {
            throw std::invalid_argument("Path escapes its root: " + relativePath);
        }
    }
    return destination / relative.lexically_normal();
}

} // namespace auraseal::filesystem
