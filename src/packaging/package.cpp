#include "packaging/package.hpp"

#include "assembly/part_source.hpp"
#include "compression/huffman/codec.hpp"
#include "concurrency/thread_pool.hpp"
#include "erasure/erasure_coder.hpp"
#include "errors.hpp"
#include "filesystem/package_layout.hpp"
#include "integrity/integrity_string.hpp"
#include "partition/part_format.hpp"
#include "partition/partitioner.hpp"
#include "utils/file_io.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

namespace auraseal::packaging {
namespace {

using utils::Logger;
using utils::LogLevel;

std::vector<std::uint8_t> parityPayloads(const std::vector<partition::Part>& parityParts)
{
    std::vector<std::uint8_t> joined;
    for (const auto& part : parityParts) {
        joined.insert(joined.end(), part.payload.begin(), part.payload.end());
    }
    return joined;
}

bool checkParitySet(assembly::PartSource& source,
                    const integrity::IntegrityRecord& record,
                    const integrity::Digest& expected,
                    const assembly::AssemblyOptions& options)
{
    std::vector<partition::Part> parity;
    for (std::size_t index = 0; index < record.parity; ++index) {
        assembly::PartRequest request {};
        request.componentId = record.id;
        request.kind = partition::PartKind::Parity;
        request.index = index;
        request.location = integrity::parityLocation(record);
        try {
            parity.emplace_back(partition::parsePart(source.fetch(request, options.partTimeout)));
        } catch (const ChunkCorruptError& ex) {
            Logger::instance().log(LogLevel::Warn, "%s: %s", record.path.c_str(), ex.what());
            return false;
        } catch (const NetworkTimeoutError& ex) {
            Logger::instance().log(LogLevel::Warn, "%s: %s", record.path.c_str(), ex.what());
            return false;
        }
    }
    return integrity::digestEquals(integrity::digest(parityPayloads(parity)), expected);
}

} // namespace

ComponentPackage packComponent(const std::string& path,
                               std::uint8_t componentId,
                               const std::vector<std::uint8_t>& content,
                               const BuildOptions& options)
{
    if (options.maxPartSize == 0U || options.maxPartSize > partition::kMaxPartPayload) {
        throw std::invalid_argument("Part size must be within 1.." + std::to_string(partition::kMaxPartPayload));
    }

    const auto encoded = compression::huffman::encodeBuffer(content);
    const auto dataCount
        = std::max<std::size_t>(1U, (encoded.compressed.size() + options.maxPartSize - 1U) / options.maxPartSize);
    const auto parityCount = dataCount >= options.minPartsForParity ? options.parityCount : 0U;
    if (parityCount >= partition::kMaxTotalParts) {
        throw std::invalid_argument("Parity count must be below " + std::to_string(partition::kMaxTotalParts));
    }

    ComponentPackage component {};
    component.dataParts
        = partition::split(encoded, componentId, options.maxPartSize, static_cast<std::uint8_t>(parityCount));
    component.parityParts = erasure::ErasureCoder(parityCount).generateParity(component.dataParts);

    auto& record = component.record;
    record.path = path;
    record.id = componentId;
    record.size = content.size();
    record.parts = component.dataParts.size();
    record.parity = component.parityParts.size();
    if (component.parityParts.empty()) {
        record.integrity = integrity::singleIntegrityString(content);
    } else {
        record.integrity = integrity::dualIntegrityString(content, parityPayloads(component.parityParts));
        record.recovery = integrity::defaultRecoveryReference(componentId);
    }
    return component;
}

void writeComponentParts(const std::filesystem::path& packageDirectory, const ComponentPackage& component)
{
    const auto& record = component.record;
    for (const auto& part : component.dataParts) {
        utils::writeBufferToFile(filesystem::partPath(packageDirectory, integrity::dataLocation(record),
                                                      part.header.partNumber),
                                 partition::serializePart(part));
    }
    for (const auto& part : component.parityParts) {
        utils::writeBufferToFile(filesystem::partPath(packageDirectory, integrity::parityLocation(record),
                                                      part.header.partNumber),
                                 partition::serializePart(part));
    }
}

integrity::Manifest buildPackage(const std::filesystem::path& sourceDirectory,
                                 const std::filesystem::path& packageDirectory,
                                 const BuildOptions& options)
{
    const auto files = filesystem::listSourceFiles(sourceDirectory);
    if (files.size() > partition::kMaxTotalParts) {
        throw std::length_error("A package holds at most " + std::to_string(partition::kMaxTotalParts)
                                + " components, found " + std::to_string(files.size()));
    }

    std::vector<integrity::IntegrityRecord> records;
    records.reserve(files.size());

    if (!files.empty()) {
        concurrency::ThreadPool pool(options.threadCount);
        std::vector<std::future<integrity::IntegrityRecord>> futures;
        futures.reserve(files.size());

        for (std::size_t index = 0; index < files.size(); ++index) {
            futures.emplace_back(pool.enqueue([file = files[index], index, &options, &packageDirectory]() {
                const auto component = packComponent(file.relativePath, static_cast<std::uint8_t>(index),
                                                     utils::readFileBytes(file.absolutePath), options);
                writeComponentParts(packageDirectory, component);
                Logger::instance().log(LogLevel::Debug, "Packed %s: %zu data parts, %zu parity parts",
                                       file.relativePath.c_str(), component.dataParts.size(),
                                       component.parityParts.size());
                return component.record;
            }));
        }
        records = concurrency::waitAll(futures);
    }

    auto manifest = integrity::Manifest::fromRecords(std::move(records));
    manifest.save(filesystem::manifestPath(packageDirectory));
    Logger::instance().log(LogLevel::Info, "Built package %s with %zu components", packageDirectory.string().c_str(),
                           manifest.size());
    return manifest;
}

std::size_t InstallReport::installed() const noexcept
{
    return static_cast<std::size_t>(std::count_if(components.begin(), components.end(),
                                                  [](const assembly::ComponentResult& result) { return result.ok(); }));
}

std::size_t InstallReport::failed() const noexcept
{
    return components.size() - installed();
}

InstallReport installPackage(const std::filesystem::path& packageDirectory,
                             const std::filesystem::path& destinationDirectory,
                             const assembly::AssemblyOptions& options)
{
    const auto manifest = integrity::Manifest::load(filesystem::manifestPath(packageDirectory));
    assembly::DirectoryPartSource source(packageDirectory);
    const assembly::Assembler assembler(manifest, source, options);

    InstallReport report {};
    report.components = assembler.assembleAll();
    for (auto& result : report.components) {
        if (!result.ok()) {
            continue;
        }
        try {
            utils::writeBufferAtomically(filesystem::resolveInside(destinationDirectory, result.path), result.data);
        } catch (const std::exception& ex) {
            result.status = assembly::ComponentStatus::Failed;
            result.failure = assembly::FailureKind::Internal;
            result.error = ex.what();
            Logger::instance().log(LogLevel::Error, "Failed to install %s: %s", result.path.c_str(), ex.what());
        }
        result.data.clear();
        result.data.shrink_to_fit();
    }

    Logger::instance().log(LogLevel::Info, "Installed %zu of %zu components into %s", report.installed(),
                           report.components.size(), destinationDirectory.string().c_str());
    return report;
}

std::size_t VerificationReport::failed() const noexcept
{
    return static_cast<std::size_t>(std::count_if(components.begin(), components.end(),
                                                  [](const VerificationEntry& entry) { return !entry.ok(); }));
}

VerificationReport verifyPackage(const std::filesystem::path& packageDirectory,
                                 const assembly::AssemblyOptions& options)
{
    const auto manifest = integrity::Manifest::load(filesystem::manifestPath(packageDirectory));
    assembly::DirectoryPartSource source(packageDirectory);
    const assembly::Assembler assembler(manifest, source, options);

    VerificationReport report {};
    auto results = assembler.assembleAll();
    report.components.reserve(results.size());
    for (auto& result : results) {
        VerificationEntry entry {};
        const auto& record = manifest.at(result.path);
        const auto parsed = integrity::parseIntegrityString(record.integrity);
        entry.hasParity = parsed.isDual();
        if (entry.hasParity) {
            entry.paritySetIntact = checkParitySet(source, record, *parsed.secondary, options);
            if (!entry.paritySetIntact) {
                Logger::instance().log(LogLevel::Warn, "%s: parity set does not match its integrity record",
                                       record.path.c_str());
            }
        }
        result.data.clear();
        result.data.shrink_to_fit();
        entry.result = std::move(result);
        report.components.emplace_back(std::move(entry));
    }
    return report;
}

} // namespace auraseal::packaging
