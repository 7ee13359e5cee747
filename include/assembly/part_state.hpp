#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

namespace auraseal::assembly {

// Pending -> Validated
// Pending -> Corrupt -> Recovering -> Recovered -> Validated
//                                  -> Unrecoverable
enum class PartState {
    Pending,
    Validated,
    Corrupt,
    Recovering,
    Recovered,
    Unrecoverable
};

const char* toString(PartState state) noexcept;
bool isTerminal(PartState state) noexcept;
bool canTransition(PartState from, PartState to) noexcept;

// Per-component part states, shared by the workers of one assembly.
class PartTracker {
public:
    explicit PartTracker(std::size_t partCount);

    // Throws std::logic_error on a transition the lifecycle does not allow.
    void transition(std::size_t part, PartState to);

    PartState state(std::size_t part) const;
    std::vector<PartState> snapshot() const;
    std::vector<std::size_t> inState(PartState state) const;
    bool allValidated() const;
    std::size_t size() const noexcept { return partCount_; }

private:
    const std::size_t partCount_;
    mutable std::mutex mutex_;
    std::vector<PartState> states_;
};

} // namespace auraseal::assembly
