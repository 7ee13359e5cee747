#include "assembly/assembler.hpp"

#include "compression/huffman/codec.hpp"
#include "erasure/erasure_coder.hpp"
#include "errors.hpp"
#include "integrity/integrity_string.hpp"
#include "partition/partitioner.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>

namespace auraseal::assembly {
namespace {

using utils::Logger;
using utils::LogLevel;

// How often a waiting fetch re-checks its component's cancellation.
constexpr std::chrono::milliseconds kCancellationPoll {10};

const char* kindName(partition::PartKind kind)
{
    return kind == partition::PartKind::Data ? "data" : "parity";
}

} // namespace

const char* toString(ComponentStatus status) noexcept
{
    switch (status) {
    case ComponentStatus::Assembled:
        return "assembled";
    case ComponentStatus::Failed:
        return "failed";
    case ComponentStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

const char* toString(FailureKind failure) noexcept
{
    switch (failure) {
    case FailureKind::None:
        return "none";
    case FailureKind::UnknownComponent:
        return "unknown-component";
    case FailureKind::InsufficientParts:
        return "insufficient-parts";
    case FailureKind::CodecCorrupt:
        return "codec-corrupt";
    case FailureKind::IntegrityMismatch:
        return "integrity-mismatch";
    case FailureKind::Cancelled:
        return "cancelled";
    case FailureKind::Internal:
        return "internal";
    }
    return "unknown";
}

AssemblyHandle::AssemblyHandle(concurrency::CancellationToken token, std::future<ComponentResult> result)
    : token_(std::move(token))
    , result_(std::move(result))
{
}

void AssemblyHandle::cancel() noexcept
{
    token_.cancel();
}

bool AssemblyHandle::ready() const
{
    return result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

ComponentResult AssemblyHandle::get()
{
    return result_.get();
}

Assembler::Assembler(const integrity::Manifest& manifest, PartSource& source, AssemblyOptions options)
    : manifest_(manifest)
    , source_(source)
    , options_(options)
{
    if (options_.maxFetchAttempts == 0U) {
        throw std::invalid_argument("maxFetchAttempts must be at least 1");
    }
    if (!(options_.minCoherence >= 0.0 && options_.minCoherence <= 1.0)) {
        throw std::invalid_argument("minCoherence must lie within [0, 1]");
    }
    if (options_.partTimeout.count() <= 0) {
        throw std::invalid_argument("partTimeout must be positive");
    }
    pool_ = std::make_unique<concurrency::ThreadPool>(options_.threadCount);
    fetchPool_ = std::make_unique<concurrency::ThreadPool>(options_.threadCount);
}

ComponentResult Assembler::assemble(const std::string& path, const concurrency::CancellationToken& token) const
{
    ComponentResult result {};
    result.path = path;

    const auto* record = manifest_.find(path);
    if (record == nullptr) {
        result.failure = FailureKind::UnknownComponent;
        result.error = "Component not in manifest: " + path;
        Logger::instance().log(LogLevel::Error, "%s", result.error.c_str());
        return result;
    }

    PartTracker tracker(record->parts);
    try {
        result.data = assembleComponent(*record, tracker, token, result.recoveredParts);
        result.status = ComponentStatus::Assembled;
    } catch (const CancelledError& ex) {
        result.status = ComponentStatus::Cancelled;
        result.failure = FailureKind::Cancelled;
        result.error = ex.what();
    } catch (const InsufficientPartsError& ex) {
        result.failure = FailureKind::InsufficientParts;
        result.error = ex.what();
    } catch (const CodecCorruptError& ex) {
        result.failure = FailureKind::CodecCorrupt;
        result.error = ex.what();
    } catch (const IntegrityMismatchError& ex) {
        result.failure = FailureKind::IntegrityMismatch;
        result.error = ex.what();
    } catch (const std::exception& ex) {
        result.failure = FailureKind::Internal;
        result.error = ex.what();
    }
    result.partStates = tracker.snapshot();

    if (result.ok()) {
        Logger::instance().log(LogLevel::Info, "Assembled %s (%zu bytes, %zu parts recovered)", path.c_str(),
                               result.data.size(), result.recoveredParts);
    } else if (result.status == ComponentStatus::Cancelled) {
        Logger::instance().log(LogLevel::Warn, "Assembly of %s cancelled", path.c_str());
    } else {
        Logger::instance().log(LogLevel::Error, "Failed to assemble %s: [%s] %s", path.c_str(),
                               toString(result.failure), result.error.c_str());
    }
    return result;
}

AssemblyHandle Assembler::assembleAsync(const std::string& path) const
{
    concurrency::CancellationToken token;
    auto future = std::async(std::launch::async, [this, path, token]() { return assemble(path, token); });
    return AssemblyHandle(token, std::move(future));
}

std::vector<ComponentResult> Assembler::assembleAll(const std::vector<std::string>& paths) const
{
    std::vector<AssemblyHandle> handles;
    handles.reserve(paths.size());
    for (const auto& path : paths) {
        handles.emplace_back(assembleAsync(path));
    }

    std::vector<ComponentResult> results;
    results.reserve(handles.size());
    for (auto& handle : handles) {
        results.emplace_back(handle.get());
    }
    return results;
}

std::vector<ComponentResult> Assembler::assembleAll() const
{
    return assembleAll(manifest_.paths());
}

std::optional<partition::Part> Assembler::acquirePart(const integrity::IntegrityRecord& record,
                                                      partition::PartKind kind,
                                                      std::size_t index,
                                                      const concurrency::CancellationToken& token) const
{
    PartRequest request {};
    request.componentId = record.id;
    request.kind = kind;
    request.index = index;
    request.location = kind == partition::PartKind::Data ? integrity::dataLocation(record)
                                                         : integrity::parityLocation(record);

    PartExpectation expectation {};
    expectation.kind = kind;
    expectation.componentId = record.id;
    expectation.index = index;
    expectation.totalParts = record.parts;
    expectation.fullSize = record.size;

    for (std::size_t attempt = 1; attempt <= options_.maxFetchAttempts; ++attempt) {
        token.throwIfCancelled(record.path);

        std::vector<std::uint8_t> bytes;
        try {
            bytes = fetchWithDeadline(request, token);
        } catch (const NetworkTimeoutError& ex) {
            Logger::instance().log(LogLevel::Warn, "%s %s#%zu attempt %zu/%zu timed out: %s", record.path.c_str(),
                                   kindName(kind), index, attempt, options_.maxFetchAttempts, ex.what());
            continue;
        } catch (const ChunkCorruptError& ex) {
            Logger::instance().log(LogLevel::Warn, "%s %s#%zu attempt %zu/%zu unavailable: %s", record.path.c_str(),
                                   kindName(kind), index, attempt, options_.maxFetchAttempts, ex.what());
            continue;
        }

        auto assessment = assessPart(bytes, expectation, options_.minCoherence);
        if (assessment.accepted) {
            return std::move(assessment.part);
        }
        Logger::instance().log(LogLevel::Warn, "%s %s#%zu attempt %zu/%zu rejected: %s", record.path.c_str(),
                               kindName(kind), index, attempt, options_.maxFetchAttempts, assessment.reason.c_str());
    }
    return std::nullopt;
}

std::vector<std::uint8_t> Assembler::fetchWithDeadline(PartRequest request,
                                                       const concurrency::CancellationToken& token) const
{
    concurrency::CancellationToken attempt;
    request.cancellation = attempt;

    auto pending = fetchPool_->enqueue([this, request]() {
        request.cancellation.throwIfCancelled(describe(request));
        return source_.fetch(request, options_.partTimeout);
    });

    const auto deadline = std::chrono::steady_clock::now() + options_.partTimeout;
    for (;;) {
        const auto wake = std::min(deadline, std::chrono::steady_clock::now() + kCancellationPoll);
        if (pending.wait_until(wake) == std::future_status::ready) {
            return pending.get();
        }
        if (token.isCancelled()) {
            attempt.cancel();
            token.throwIfCancelled(describe(request));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            attempt.cancel();
            throw NetworkTimeoutError(describe(request) + " did not arrive within "
                                      + std::to_string(options_.partTimeout.count()) + " ms");
        }
    }
}

std::vector<partition::Part> Assembler::acquireParity(const integrity::IntegrityRecord& record,
                                                      std::size_t parityCount,
                                                      const concurrency::CancellationToken& token) const
{
    std::vector<std::future<std::optional<partition::Part>>> pending;
    pending.reserve(parityCount);
    for (std::size_t index = 0; index < parityCount; ++index) {
        pending.emplace_back(pool_->enqueue([this, &record, token, index]() {
            return acquirePart(record, partition::PartKind::Parity, index, token);
        }));
    }

    std::vector<partition::Part> parity;
    for (auto& part : concurrency::waitAll(pending)) {
        if (part) {
            parity.emplace_back(std::move(*part));
        }
    }
    return parity;
}

std::vector<partition::Part> Assembler::discoverParity(const integrity::IntegrityRecord& record,
                                                       std::size_t needed,
                                                       const concurrency::CancellationToken& token) const
{
    std::vector<partition::Part> parity;
    for (std::size_t index = 0; parity.size() < needed && record.parts + index < partition::kMaxTotalParts; ++index) {
        auto part = acquirePart(record, partition::PartKind::Parity, index, token);
        if (!part) {
            break;
        }
        parity.emplace_back(std::move(*part));
    }
    Logger::instance().log(LogLevel::Debug, "%s: discovered %zu parity parts", record.path.c_str(), parity.size());
    return parity;
}

std::vector<std::uint8_t> Assembler::assembleComponent(const integrity::IntegrityRecord& record,
                                                       PartTracker& tracker,
                                                       const concurrency::CancellationToken& token,
                                                       std::size_t& recoveredParts) const
{
    const auto partCount = record.parts;

    std::vector<std::future<std::optional<partition::Part>>> pending;
    pending.reserve(partCount);
    for (std::size_t index = 0; index < partCount; ++index) {
        pending.emplace_back(pool_->enqueue([this, &record, &tracker, token, index]() {
            auto part = acquirePart(record, partition::PartKind::Data, index, token);
            tracker.transition(index, part ? PartState::Validated : PartState::Corrupt);
            return part;
        }));
    }
    auto parts = concurrency::waitAll(pending);
    token.throwIfCancelled(record.path);

    const auto corrupt = tracker.inState(PartState::Corrupt);
    if (!corrupt.empty()) {
        Logger::instance().log(LogLevel::Warn, "%s: %zu of %zu data parts failed validation", record.path.c_str(),
                               corrupt.size(), partCount);

        std::size_t parityCount = record.parity;
        std::vector<partition::Part> present;
        for (const auto& part : parts) {
            if (part) {
                parityCount = std::max<std::size_t>(parityCount, part->header.parityCount);
                present.push_back(*part);
            }
        }

        for (const auto index : corrupt) {
            tracker.transition(index, PartState::Recovering);
        }

        std::vector<partition::Part> parity;
        if (parityCount > 0U) {
            parity = acquireParity(record, parityCount, token);
        } else if (integrity::parseIntegrityString(record.integrity).isDual()) {
            parity = discoverParity(record, corrupt.size(), token);
            parityCount = parity.size();
            for (const auto& part : parity) {
                parityCount = std::max<std::size_t>(parityCount, part.header.parityCount);
            }
        }
        if (corrupt.size() > parity.size()) {
            for (const auto index : corrupt) {
                tracker.transition(index, PartState::Unrecoverable);
            }
            throw InsufficientPartsError(record.path + ": " + std::to_string(corrupt.size())
                                         + " data parts lost, " + std::to_string(parity.size())
                                         + " parity parts available");
        }

        std::vector<partition::Part> recovered;
        try {
            const erasure::ErasureCoder coder(parityCount);
            const auto recovery = coder.prepare(present, corrupt, parity);

            std::vector<std::future<partition::Part>> recoveries;
            recoveries.reserve(corrupt.size());
            for (const auto index : corrupt) {
                recoveries.emplace_back(pool_->enqueue([&recovery, &record, &tracker, token, index]() {
                    token.throwIfCancelled(record.path);
                    auto part = recovery.rebuild(index);
                    tracker.transition(index, PartState::Recovered);
                    return part;
                }));
            }
            recovered = concurrency::waitAll(recoveries);
        } catch (const UnrecoverableError& ex) {
            for (const auto index : tracker.inState(PartState::Recovering)) {
                tracker.transition(index, PartState::Unrecoverable);
            }
            throw InsufficientPartsError(record.path + ": " + ex.what());
        }

        for (auto& part : recovered) {
            const auto index = static_cast<std::size_t>(part.header.partNumber);
            tracker.transition(index, PartState::Validated);
            parts[index] = std::move(part);
            ++recoveredParts;
            Logger::instance().log(LogLevel::Info, "%s: recovered data part %zu from parity", record.path.c_str(),
                                   index);
        }
    }

    token.throwIfCancelled(record.path);
    if (!tracker.allValidated()) {
        throw std::logic_error(record.path + ": assembling with unvalidated parts");
    }

    std::vector<partition::Part> ordered;
    ordered.reserve(partCount);
    for (auto& part : parts) {
        ordered.emplace_back(std::move(*part));
    }

    const auto& header = ordered.front().header;
    const auto compressed = partition::concatenatePayloads(ordered);
    if (compressed.size() != header.compressedSize) {
        throw IntegrityMismatchError(record.path + ": reassembled stream is " + std::to_string(compressed.size())
                                     + " bytes, header declares " + std::to_string(header.compressedSize));
    }

    const auto decoded = compression::huffman::decodeBuffer(partition::metadataOf(header), compressed);
    if (decoded.size() != record.size || !integrity::verify(record.integrity, decoded)) {
        throw IntegrityMismatchError(record.path + ": content does not match its integrity record");
    }
    return decoded;
}

} // namespace auraseal::assembly
