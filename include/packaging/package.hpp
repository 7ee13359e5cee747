#pragma once

#include "assembly/assembler.hpp"
#include "integrity/manifest.hpp"
#include "partition/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace auraseal::packaging {

struct BuildOptions {
    std::size_t maxPartSize {partition::kMaxPartPayload};
    std::size_t parityCount {1};
    // Components split into fewer data parts carry no parity.
    std::size_t minPartsForParity {2};
    // 0 picks the hardware concurrency.
    std::size_t threadCount {0};
};

struct ComponentPackage {
    integrity::IntegrityRecord record;
    std::vector<partition::Part> dataParts;
    std::vector<partition::Part> parityParts;
};

ComponentPackage packComponent(const std::string& path,
                               std::uint8_t componentId,
                               const std::vector<std::uint8_t>& content,
                               const BuildOptions& options = {});

// Writes parts/<id>/data/<n>.part and parts/<id>/parity/<i>.part.
void writeComponentParts(const std::filesystem::path& packageDirectory, const ComponentPackage& component);

integrity::Manifest buildPackage(const std::filesystem::path& sourceDirectory,
                                 const std::filesystem::path& packageDirectory,
                                 const BuildOptions& options = {});

struct InstallReport {
    // Component bytes are released once written.
    std::vector<assembly::ComponentResult> components;

    std::size_t installed() const noexcept;
    std::size_t failed() const noexcept;
    bool ok() const noexcept { return failed() == 0U; }
};

// Throws MalformedManifestError or MalformedIntegrityStringError before
// any part is read. Component faults land in the report.
InstallReport installPackage(const std::filesystem::path& packageDirectory,
                             const std::filesystem::path& destinationDirectory,
                             const assembly::AssemblyOptions& options = {});

struct VerificationEntry {
    assembly::ComponentResult result;
    bool hasParity {false};
    // Parity parts parse and hash to the secondary digest.
    bool paritySetIntact {false};

    bool ok() const noexcept { return result.ok() && (!hasParity || paritySetIntact); }
};

struct VerificationReport {
    std::vector<VerificationEntry> components;

    std::size_t failed() const noexcept;
    bool ok() const noexcept { return failed() == 0U; }
};

VerificationReport verifyPackage(const std::filesystem::path& packageDirectory,
                                 const assembly::AssemblyOptions& options = {});

} // namespace auraseal::packaging
