#pragma once

#include "assembly/part_source.hpp"
#include "assembly/part_state.hpp"
#include "assembly/part_validator.hpp"
#include "concurrency/cancellation.hpp"
#include "concurrency/thread_pool.hpp"
#include "integrity/manifest.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace auraseal::assembly {

struct AssemblyOptions {
    double minCoherence {kDefaultMinCoherence};
    std::size_t maxFetchAttempts {3};
    std::chrono::milliseconds partTimeout {5000};
    // 0 picks the hardware concurrency.
    std::size_t threadCount {0};
};

enum class ComponentStatus {
    Assembled,
    Failed,
    Cancelled
};

enum class FailureKind {
    None,
    UnknownComponent,
    InsufficientParts,
    CodecCorrupt,
    IntegrityMismatch,
    Cancelled,
    Internal
};

const char* toString(ComponentStatus status) noexcept;
const char* toString(FailureKind failure) noexcept;

struct ComponentResult {
    std::string path;
    ComponentStatus status {ComponentStatus::Failed};
    FailureKind failure {FailureKind::None};
    std::string error;
    std::vector<std::uint8_t> data;
    std::vector<PartState> partStates;
    std::size_t recoveredParts {0};

    bool ok() const noexcept { return status == ComponentStatus::Assembled; }
};

// An in-flight component assembly. The Assembler that started it must
// outlive the handle.
class AssemblyHandle {
public:
    AssemblyHandle(concurrency::CancellationToken token, std::future<ComponentResult> result);

    void cancel() noexcept;
    bool ready() const;
    ComponentResult get();

private:
    concurrency::CancellationToken token_;
    std::future<ComponentResult> result_;
};

// Rebuilds manifest components from their parts. Per-part validation and
// recovery run on an internal thread pool; each component is driven from
// its own thread so pool workers never block on pool tasks. Source fetches
// run on a second pool and are abandoned once they overrun partTimeout or
// their component is cancelled. The PartSource must outlive the Assembler.
// A failed component never affects the others.
class Assembler {
public:
    Assembler(const integrity::Manifest& manifest, PartSource& source, AssemblyOptions options = {});

    ComponentResult assemble(const std::string& path,
                             const concurrency::CancellationToken& token = concurrency::CancellationToken()) const;
    AssemblyHandle assembleAsync(const std::string& path) const;

    std::vector<ComponentResult> assembleAll(const std::vector<std::string>& paths) const;
    std::vector<ComponentResult> assembleAll() const;

    const AssemblyOptions& options() const noexcept { return options_; }

private:
    std::vector<std::uint8_t> assembleComponent(const integrity::IntegrityRecord& record,
                                                PartTracker& tracker,
                                                const concurrency::CancellationToken& token,
                                                std::size_t& recoveredParts) const;

    std::optional<partition::Part> acquirePart(const integrity::IntegrityRecord& record,
                                               partition::PartKind kind,
                                               std::size_t index,
                                               const concurrency::CancellationToken& token) const;

    // Runs one fetch attempt on the fetch pool and waits for it until the
    // part timeout passes (NetworkTimeoutError) or `token` is cancelled
    // (CancelledError). Either way the attempt's own token is cancelled.
    std::vector<std::uint8_t> fetchWithDeadline(PartRequest request,
                                                const concurrency::CancellationToken& token) const;

    std::vector<partition::Part> acquireParity(const integrity::IntegrityRecord& record,
                                               std::size_t parityCount,
                                               const concurrency::CancellationToken& token) const;

    // For records that state no parity count: fetches parity parts in
    // order until one is missing or `needed` have arrived.
    std::vector<partition::Part> discoverParity(const integrity::IntegrityRecord& record,
                                                std::size_t needed,
                                                const concurrency::CancellationToken& token) const;

    const integrity::Manifest& manifest_;
    PartSource& source_;
    AssemblyOptions options_;
    std::unique_ptr<concurrency::ThreadPool> pool_;
    std::unique_ptr<concurrency::ThreadPool> fetchPool_;
};

} // namespace auraseal::assembly
