#include "assembly/assembler.hpp"
#include "assembly/part_source.hpp"
#include "assembly/part_state.hpp"
#include "errors.hpp"
#include "integrity/integrity_string.hpp"
#include "packaging/package.hpp"
#include "partition/part_format.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <limits>
#include <map>
#include <mutex>
#include <random>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <vector>

namespace {

using namespace auraseal::assembly;
using auraseal::integrity::Manifest;
using auraseal::packaging::ComponentPackage;
using auraseal::partition::PartKind;

std::vector<std::uint8_t> randomBytes(std::size_t size, std::uint32_t seed)
{
    std::mt19937 generator(seed);
    std::uniform_int_distribution<int> distribution(0, 255);
    std::vector<std::uint8_t> bytes(size);
    for (auto& value : bytes) {
        value = static_cast<std::uint8_t>(distribution(generator));
    }
    return bytes;
}

// Incompressible content of this size splits into several data parts.
ComponentPackage packRandom(const std::string& path, std::uint8_t id, std::size_t size, std::size_t parity = 1)
{
    auraseal::packaging::BuildOptions options {};
    options.parityCount = parity;
    return auraseal::packaging::packComponent(path, id, randomBytes(size, 1000U + id), options);
}

void storeAll(MemoryPartSource& source, const ComponentPackage& component)
{
    for (const auto& part : component.dataParts) {
        source.store(part);
    }
    for (const auto& part : component.parityParts) {
        source.store(part);
    }
}

std::vector<std::uint8_t> contentOf(const ComponentPackage& component, std::size_t size)
{
    return randomBytes(size, 1000U + component.record.id);
}

AssemblyOptions fastOptions()
{
    AssemblyOptions options {};
    options.threadCount = 4;
    options.partTimeout = std::chrono::milliseconds(50);
    return options;
}

// Wraps a MemoryPartSource with scripted faults and a fetch counter.
class ScriptedSource : public PartSource {
public:
    explicit ScriptedSource(MemoryPartSource& inner)
        : inner_(inner)
    {
    }

    void timeoutFirst(std::uint8_t component, PartKind kind, std::size_t index, std::size_t times)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timeouts_[Key {component, kind, index}] = times;
    }

    void delayEachFetch(std::chrono::milliseconds delay) { delay_ = delay; }

    // The part's fetches block until the request is cancelled, or for at
    // most kHangLimit.
    void hangOn(std::uint8_t component, PartKind kind, std::size_t index)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hanging_[Key {component, kind, index}] = true;
    }

    std::size_t abortedFetches() const { return aborted_.load(); }

    std::size_t fetchCount(std::uint8_t component, PartKind kind, std::size_t index) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = fetches_.find(Key {component, kind, index});
        return it == fetches_.end() ? 0U : it->second;
    }

    std::size_t fetchCount(PartKind kind) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t total = 0;
        for (const auto& entry : fetches_) {
            total += std::get<1>(entry.first) == kind ? entry.second : 0U;
        }
        return total;
    }

    std::vector<std::uint8_t> fetch(const PartRequest& request, std::chrono::milliseconds timeout) override
    {
        const Key key {request.componentId, request.kind, request.index};
        bool hang = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++fetches_[key];
            hang = hanging_.count(key) != 0U;
            auto it = timeouts_.find(key);
            if (it != timeouts_.end() && it->second > 0U) {
                --it->second;
                throw auraseal::NetworkTimeoutError("no response within " + std::to_string(timeout.count()) + " ms");
            }
        }
        if (hang) {
            const auto giveUp = std::chrono::steady_clock::now() + kHangLimit;
            while (std::chrono::steady_clock::now() < giveUp) {
                if (request.cancellation.isCancelled()) {
                    ++aborted_;
                    throw auraseal::CancelledError(describe(request) + " aborted");
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        return inner_.fetch(request, timeout);
    }

    static constexpr std::chrono::milliseconds kHangLimit {3000};

private:
    using Key = std::tuple<std::uint8_t, PartKind, std::size_t>;

    MemoryPartSource& inner_;
    mutable std::mutex mutex_;
    std::map<Key, std::size_t> timeouts_;
    std::map<Key, std::size_t> fetches_;
    std::map<Key, bool> hanging_;
    std::atomic<std::size_t> aborted_ {0};
    std::chrono::milliseconds delay_ {0};
};

} // namespace

TEST(PartStateTest, FollowsTheRecoveryLifecycle)
{
    PartTracker tracker(2);
    tracker.transition(0, PartState::Validated);
    tracker.transition(1, PartState::Corrupt);
    tracker.transition(1, PartState::Recovering);
    tracker.transition(1, PartState::Recovered);
    tracker.transition(1, PartState::Validated);

    EXPECT_TRUE(tracker.allValidated());
    EXPECT_THROW(tracker.transition(0, PartState::Corrupt), std::logic_error);
    EXPECT_THROW(tracker.transition(2, PartState::Validated), std::out_of_range);
    EXPECT_FALSE(canTransition(PartState::Pending, PartState::Recovered));
    EXPECT_FALSE(canTransition(PartState::Unrecoverable, PartState::Recovering));
    EXPECT_TRUE(isTerminal(PartState::Unrecoverable));
}

TEST(AssemblerTest, AssemblesIntactComponent)
{
    const auto component = packRandom("bin/tool", 0, 12000);
    ASSERT_EQ(component.record.parts, 3U);
    MemoryPartSource memory;
    storeAll(memory, component);
    ScriptedSource source(memory);

    const auto manifest = Manifest::fromRecords({component.record});
    const Assembler assembler(manifest, source, fastOptions());
    const auto result = assembler.assemble("bin/tool");

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.data, contentOf(component, 12000));
    EXPECT_EQ(result.recoveredParts, 0U);
    EXPECT_EQ(result.partStates, std::vector<PartState>(3, PartState::Validated));
    EXPECT_EQ(source.fetchCount(PartKind::Parity), 0U);
}

TEST(AssemblerTest, RecoversMissingDataPart)
{
    const auto component = packRandom("bin/tool", 0, 12000);
    MemoryPartSource memory;
    storeAll(memory, component);
    ASSERT_TRUE(memory.remove(0, PartKind::Data, 0));

    const auto manifest = Manifest::fromRecords({component.record});
    const Assembler assembler(manifest, memory, fastOptions());
    const auto result = assembler.assemble("bin/tool");

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.data, contentOf(component, 12000));
    EXPECT_EQ(result.recoveredParts, 1U);
    EXPECT_EQ(result.partStates[0], PartState::Validated);
}

TEST(AssemblerTest, RecoversCorruptDataPart)
{
    const auto component = packRandom("bin/tool", 0, 12000, 2);
    MemoryPartSource memory;
    storeAll(memory, component);
    for (const std::size_t index : {1U, 2U}) {
        auto bytes = auraseal::partition::serializePart(component.dataParts[index]);
        bytes[auraseal::partition::kHeaderSize + 100] ^= 0x40U;
        memory.storeRaw(0, PartKind::Data, index, bytes);
    }

    const auto manifest = Manifest::fromRecords({component.record});
    const Assembler assembler(manifest, memory, fastOptions());
    const auto result = assembler.assemble("bin/tool");

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.data, contentOf(component, 12000));
    EXPECT_EQ(result.recoveredParts, 2U);
}

TEST(AssemblerTest, RetriesTimedOutFetch)
{
    const auto component = packRandom("bin/tool", 0, 12000);
    MemoryPartSource memory;
    storeAll(memory, component);
    ScriptedSource source(memory);
    source.timeoutFirst(0, PartKind::Data, 1, 2);

    const auto manifest = Manifest::fromRecords({component.record});
    const Assembler assembler(manifest, source, fastOptions());
    const auto result = assembler.assemble("bin/tool");

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.recoveredParts, 0U);
    EXPECT_EQ(source.fetchCount(0, PartKind::Data, 1), 3U);
    EXPECT_EQ(source.fetchCount(PartKind::Parity), 0U);
}

TEST(AssemblerTest, RecoversPartThatNeverArrives)
{
    const auto component = packRandom("bin/tool", 0, 12000);
    MemoryPartSource memory;
    storeAll(memory, component);
    ScriptedSource source(memory);
    source.timeoutFirst(0, PartKind::Data, 2, 100);

    const auto manifest = Manifest::fromRecords({component.record});
    const Assembler assembler(manifest, source, fastOptions());
    const auto result = assembler.assemble("bin/tool");

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.recoveredParts, 1U);
    EXPECT_EQ(source.fetchCount(0, PartKind::Data, 2), 3U);
    EXPECT_EQ(source.fetchCount(0, PartKind::Parity, 0), 1U);
}

TEST(AssemblerTest, AbandonsFetchThatOverrunsItsTimeout)
{
    const auto component = packRandom("bin/tool", 0, 12000);
    MemoryPartSource memory;
    storeAll(memory, component);
    ScriptedSource source(memory);
    source.hangOn(0, PartKind::Data, 0);

    auto options = fastOptions();
    options.maxFetchAttempts = 1;
    const auto manifest = Manifest::fromRecords({component.record});
    {
        const Assembler assembler(manifest, source, options);
        const auto started = std::chrono::steady_clock::now();
        const auto result = assembler.assemble("bin/tool");
        const auto elapsed = std::chrono::steady_clock::now() - started;

        ASSERT_TRUE(result.ok()) << result.error;
        EXPECT_EQ(result.data, contentOf(component, 12000));
        EXPECT_EQ(result.recoveredParts, 1U);
        EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
    }
    // The Assembler joins its fetch workers, so the abandoned fetch has
    // observed its cancellation by now.
    EXPECT_EQ(source.abortedFetches(), 1U);
}

TEST(AssemblerTest, CancellingHandleInterruptsHangingFetch)
{
    const auto component = packRandom("bin/tool", 0, 12000);
    MemoryPartSource memory;
    storeAll(memory, component);
    ScriptedSource source(memory);
    source.hangOn(0, PartKind::Data, 0);

    auto options = fastOptions();
    options.partTimeout = std::chrono::milliseconds(10000);
    options.maxFetchAttempts = 1;
    const auto manifest = Manifest::fromRecords({component.record});
    {
        const Assembler assembler(manifest, source, options);
        const auto started = std::chrono::steady_clock::now();
        auto handle = assembler.assembleAsync("bin/tool");
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        handle.cancel();

        const auto result = handle.get();
        const auto elapsed = std::chrono::steady_clock::now() - started;
        EXPECT_EQ(result.status, ComponentStatus::Cancelled);
        EXPECT_EQ(result.failure, FailureKind::Cancelled);
        EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
    }
    EXPECT_EQ(source.abortedFetches(), 1U);
}

TEST(AssemblerTest, DiscoversParityWhenRecordOmitsCount)
{
    auraseal::packaging::BuildOptions build {};
    build.parityCount = 1;
    build.minPartsForParity = 1;
    auto component = auraseal::packaging::packComponent("small.bin", 0, randomBytes(900, 77), build);
    ASSERT_EQ(component.record.parts, 1U);
    ASSERT_EQ(component.parityParts.size(), 1U);
    component.record.parity = 0;

    MemoryPartSource memory;
    storeAll(memory, component);
    memory.remove(0, PartKind::Data, 0);
    ScriptedSource source(memory);

    const auto manifest = Manifest::fromRecords({component.record});
    const Assembler assembler(manifest, source, fastOptions());
    const auto result = assembler.assemble("small.bin");

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.data, randomBytes(900, 77));
    EXPECT_EQ(result.recoveredParts, 1U);
    EXPECT_EQ(source.fetchCount(0, PartKind::Parity, 0), 1U);
    EXPECT_EQ(source.fetchCount(0, PartKind::Parity, 1), 0U);
}

TEST(AssemblerTest, UnrecoverableComponentDoesNotAffectOthers)
{
    const auto broken = packRandom("broken.bin", 0, 12000);
    const auto healthy = packRandom("healthy.bin", 1, 9000);
    MemoryPartSource memory;
    storeAll(memory, broken);
    storeAll(memory, healthy);
    memory.remove(0, PartKind::Data, 0);
    memory.remove(0, PartKind::Data, 2);

    const auto manifest = Manifest::fromRecords({broken.record, healthy.record});
    const Assembler assembler(manifest, memory, fastOptions());
    const auto results = assembler.assembleAll();

    ASSERT_EQ(results.size(), 2U);
    const auto& failed = results[0];
    EXPECT_EQ(failed.path, "broken.bin");
    EXPECT_EQ(failed.status, ComponentStatus::Failed);
    EXPECT_EQ(failed.failure, FailureKind::InsufficientParts);
    EXPECT_TRUE(failed.data.empty());
    EXPECT_EQ(failed.partStates[0], PartState::Unrecoverable);
    EXPECT_EQ(failed.partStates[1], PartState::Validated);
    EXPECT_EQ(failed.partStates[2], PartState::Unrecoverable);

    const auto& assembled = results[1];
    EXPECT_EQ(assembled.path, "healthy.bin");
    ASSERT_TRUE(assembled.ok()) << assembled.error;
    EXPECT_EQ(assembled.data, contentOf(healthy, 9000));
}

TEST(AssemblerTest, ComponentWithoutParityCannotRecover)
{
    const auto component = packRandom("small.bin", 0, 900);
    ASSERT_EQ(component.record.parts, 1U);
    ASSERT_TRUE(component.parityParts.empty());
    MemoryPartSource memory;
    storeAll(memory, component);
    memory.remove(0, PartKind::Data, 0);

    const auto manifest = Manifest::fromRecords({component.record});
    const Assembler assembler(manifest, memory, fastOptions());
    const auto result = assembler.assemble("small.bin");

    EXPECT_EQ(result.failure, FailureKind::InsufficientParts);
    EXPECT_EQ(result.partStates[0], PartState::Unrecoverable);
}

TEST(AssemblerTest, ReportsIntegrityMismatch)
{
    auto component = packRandom("small.bin", 0, 900);
    MemoryPartSource memory;
    storeAll(memory, component);
    component.record.integrity = auraseal::integrity::singleIntegrityString(randomBytes(900, 5));

    const auto manifest = Manifest::fromRecords({component.record});
    const Assembler assembler(manifest, memory, fastOptions());
    const auto result = assembler.assemble("small.bin");

    EXPECT_EQ(result.status, ComponentStatus::Failed);
    EXPECT_EQ(result.failure, FailureKind::IntegrityMismatch);
    EXPECT_TRUE(result.data.empty());
}

TEST(AssemblerTest, UnknownComponentFails)
{
    const Manifest manifest {};
    MemoryPartSource memory;
    const Assembler assembler(manifest, memory, fastOptions());

    const auto result = assembler.assemble("missing");
    EXPECT_EQ(result.failure, FailureKind::UnknownComponent);
}

TEST(AssemblerTest, CancelledTokenStopsAssembly)
{
    const auto component = packRandom("bin/tool", 0, 12000);
    MemoryPartSource memory;
    storeAll(memory, component);
    ScriptedSource source(memory);

    const auto manifest = Manifest::fromRecords({component.record});
    const Assembler assembler(manifest, source, fastOptions());
    auraseal::concurrency::CancellationToken token;
    token.cancel();

    const auto result = assembler.assemble("bin/tool", token);
    EXPECT_EQ(result.status, ComponentStatus::Cancelled);
    EXPECT_EQ(result.failure, FailureKind::Cancelled);
    EXPECT_EQ(source.fetchCount(PartKind::Data), 0U);
}

TEST(AssemblerTest, CancellingHandleYieldsCancelledResult)
{
    const auto component = packRandom("bin/tool", 0, 12000);
    MemoryPartSource memory;
    storeAll(memory, component);
    ScriptedSource source(memory);
    source.delayEachFetch(std::chrono::milliseconds(200));

    const auto manifest = Manifest::fromRecords({component.record});
    const Assembler assembler(manifest, source, fastOptions());
    auto handle = assembler.assembleAsync("bin/tool");
    handle.cancel();

    const auto result = handle.get();
    EXPECT_EQ(result.status, ComponentStatus::Cancelled);
    EXPECT_TRUE(result.data.empty());
}

TEST(AssemblerTest, RejectsInvalidOptions)
{
    const Manifest manifest {};
    MemoryPartSource memory;
    AssemblyOptions options = fastOptions();
    options.maxFetchAttempts = 0;
    EXPECT_THROW(Assembler(manifest, memory, options).options(), std::invalid_argument);

    options = fastOptions();
    options.minCoherence = 1.5;
    EXPECT_THROW(Assembler(manifest, memory, options).options(), std::invalid_argument);

    options.minCoherence = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(Assembler(manifest, memory, options).options(), std::invalid_argument);

    options = fastOptions();
    options.partTimeout = std::chrono::milliseconds(0);
    EXPECT_THROW(Assembler(manifest, memory, options).options(), std::invalid_argument);
}
