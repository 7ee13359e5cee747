#include "errors.hpp"
#include "filesystem/package_layout.hpp"
#include "integrity/integrity_string.hpp"
#include "packaging/package.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace auraseal::packaging;

class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& prefix)
    {
        const auto unique = prefix + "_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count());
        path_ = std::filesystem::temp_directory_path() / unique;
        std::filesystem::create_directories(path_);
    }

    ~ScopedTempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

void writeBinaryFile(const std::filesystem::path& path, const std::string& content)
{
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

std::string readBinaryFile(const std::filesystem::path& path)
{
    std::ifstream input(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

std::string randomText(std::size_t size, std::uint32_t seed)
{
    std::mt19937 generator(seed);
    std::uniform_int_distribution<int> distribution(0, 255);
    std::string text(size, '\0');
    for (auto& c : text) {
        c = static_cast<char>(distribution(generator));
    }
    return text;
}

// a.txt (one part, id 0) and nested/b.bin (several parts with parity, id 1).
struct SampleTree {
    explicit SampleTree(const std::filesystem::path& root)
        : small("hello, package\n")
        , large(randomText(20000, 17))
    {
        writeBinaryFile(root / "a.txt", small);
        writeBinaryFile(root / "nested" / "b.bin", large);
    }

    std::string small;
    std::string large;
};

BuildOptions testBuildOptions()
{
    BuildOptions options {};
    options.threadCount = 2;
    return options;
}

auraseal::assembly::AssemblyOptions testAssemblyOptions()
{
    auraseal::assembly::AssemblyOptions options {};
    options.threadCount = 2;
    return options;
}

} // namespace

TEST(PackageLayoutTest, ListsFilesSortedByRelativePath)
{
    ScopedTempDir temp("layout");
    writeBinaryFile(temp.path() / "z.txt", "z");
    writeBinaryFile(temp.path() / "dir" / "a.txt", "aa");
    std::filesystem::create_directories(temp.path() / "empty");

    const auto files = auraseal::filesystem::listSourceFiles(temp.path());

    ASSERT_EQ(files.size(), 2U);
    EXPECT_EQ(files[0].relativePath, "dir/a.txt");
    EXPECT_EQ(files[0].size, 2U);
    EXPECT_EQ(files[1].relativePath, "z.txt");
    EXPECT_THROW(auraseal::filesystem::listSourceFiles(temp.path() / "z.txt"), std::invalid_argument);
}

TEST(PackageLayoutTest, ResolvesOnlyContainedPaths)
{
    const std::filesystem::path root("/pkg");

    EXPECT_EQ(auraseal::filesystem::resolveInside(root, "a/b.txt"), root / "a" / "b.txt");
    EXPECT_EQ(auraseal::filesystem::partPath(root, "parts/3/data", 7), root / "parts" / "3" / "data" / "7.part");
    EXPECT_THROW(auraseal::filesystem::resolveInside(root, "../escape"), std::invalid_argument);
    EXPECT_THROW(auraseal::filesystem::resolveInside(root, "a/../../escape"), std::invalid_argument);
    EXPECT_THROW(auraseal::filesystem::resolveInside(root, "/etc/passwd"), std::invalid_argument);
    EXPECT_THROW(auraseal::filesystem::resolveInside(root, ""), std::invalid_argument);
}

TEST(PackagingTest, PackComponentAddsParityOnlyToMultiPartComponents)
{
    const std::string text = randomText(20000, 3);
    const auto large = packComponent("big", 4, std::vector<std::uint8_t>(text.begin(), text.end()));
    EXPECT_EQ(large.record.parts, 4U);
    EXPECT_EQ(large.record.parity, 1U);
    EXPECT_EQ(large.parityParts.size(), 1U);
    EXPECT_TRUE(auraseal::integrity::parseIntegrityString(large.record.integrity).isDual());
    ASSERT_TRUE(large.record.recovery.has_value());
    EXPECT_EQ(large.record.recovery->secondary, "parts/4/parity");

    const auto small = packComponent("small", 5, {1, 2, 3});
    EXPECT_EQ(small.record.parts, 1U);
    EXPECT_EQ(small.record.parity, 0U);
    EXPECT_FALSE(auraseal::integrity::parseIntegrityString(small.record.integrity).isDual());
    EXPECT_FALSE(small.record.recovery.has_value());

    const auto empty = packComponent("empty", 6, {});
    EXPECT_EQ(empty.record.parts, 1U);
    EXPECT_EQ(empty.record.size, 0U);
}

TEST(PackagingTest, BuildAndInstallRoundTrip)
{
    ScopedTempDir temp("package_roundtrip");
    const SampleTree tree(temp.path() / "src");
    const auto packageDir = temp.path() / "pkg";
    const auto installDir = temp.path() / "out";

    const auto manifest = buildPackage(temp.path() / "src", packageDir, testBuildOptions());
    ASSERT_EQ(manifest.size(), 2U);
    EXPECT_EQ(manifest.at("a.txt").id, 0U);
    EXPECT_EQ(manifest.at("nested/b.bin").id, 1U);
    EXPECT_TRUE(std::filesystem::exists(packageDir / "manifest.json"));
    EXPECT_TRUE(std::filesystem::exists(packageDir / "parts" / "0" / "data" / "0.part"));
    EXPECT_TRUE(std::filesystem::exists(packageDir / "parts" / "1" / "parity" / "0.part"));
    EXPECT_FALSE(std::filesystem::exists(packageDir / "parts" / "0" / "parity"));

    const auto report = installPackage(packageDir, installDir, testAssemblyOptions());
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.installed(), 2U);
    EXPECT_EQ(readBinaryFile(installDir / "a.txt"), tree.small);
    EXPECT_EQ(readBinaryFile(installDir / "nested" / "b.bin"), tree.large);
}

TEST(PackagingTest, InstallRecoversDeletedPartFile)
{
    ScopedTempDir temp("package_recover");
    const SampleTree tree(temp.path() / "src");
    const auto packageDir = temp.path() / "pkg";
    buildPackage(temp.path() / "src", packageDir, testBuildOptions());

    std::filesystem::remove(packageDir / "parts" / "1" / "data" / "0.part");

    const auto report = installPackage(packageDir, temp.path() / "out", testAssemblyOptions());
    ASSERT_TRUE(report.ok());
    std::size_t recovered = 0;
    for (const auto& result : report.components) {
        recovered += result.recoveredParts;
    }
    EXPECT_EQ(recovered, 1U);
    EXPECT_EQ(readBinaryFile(temp.path() / "out" / "nested" / "b.bin"), tree.large);
}

TEST(PackagingTest, FailedComponentIsNeverPartiallyInstalled)
{
    ScopedTempDir temp("package_failure");
    const SampleTree tree(temp.path() / "src");
    const auto packageDir = temp.path() / "pkg";
    buildPackage(temp.path() / "src", packageDir, testBuildOptions());

    std::filesystem::remove(packageDir / "parts" / "1" / "data" / "0.part");
    std::filesystem::remove(packageDir / "parts" / "1" / "data" / "1.part");

    const auto installDir = temp.path() / "out";
    const auto report = installPackage(packageDir, installDir, testAssemblyOptions());

    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.failed(), 1U);
    EXPECT_EQ(readBinaryFile(installDir / "a.txt"), tree.small);
    EXPECT_FALSE(std::filesystem::exists(installDir / "nested" / "b.bin"));
    EXPECT_FALSE(std::filesystem::exists(installDir / "nested" / "b.bin.partial"));
}

TEST(PackagingTest, VerifyChecksTheParitySet)
{
    ScopedTempDir temp("package_verify");
    const SampleTree tree(temp.path() / "src");
    const auto packageDir = temp.path() / "pkg";
    buildPackage(temp.path() / "src", packageDir, testBuildOptions());

    const auto clean = verifyPackage(packageDir, testAssemblyOptions());
    ASSERT_EQ(clean.components.size(), 2U);
    EXPECT_TRUE(clean.ok());
    EXPECT_FALSE(clean.components[0].hasParity);
    EXPECT_TRUE(clean.components[1].hasParity);
    EXPECT_TRUE(clean.components[1].paritySetIntact);

    const auto parityFile = packageDir / "parts" / "1" / "parity" / "0.part";
    auto bytes = readBinaryFile(parityFile);
    bytes[300] = static_cast<char>(bytes[300] ^ 0x01);
    writeBinaryFile(parityFile, bytes);

    const auto damaged = verifyPackage(packageDir, testAssemblyOptions());
    EXPECT_FALSE(damaged.ok());
    EXPECT_TRUE(damaged.components[1].result.ok());
    EXPECT_FALSE(damaged.components[1].paritySetIntact);
}

TEST(PackagingTest, MalformedManifestAbortsInstall)
{
    ScopedTempDir temp("package_malformed");
    writeBinaryFile(temp.path() / "pkg" / "manifest.json", "{\"a\": {\"size\": 1}}");

    EXPECT_THROW(installPackage(temp.path() / "pkg", temp.path() / "out"), auraseal::MalformedManifestError);
    EXPECT_FALSE(std::filesystem::exists(temp.path() / "out"));
}
