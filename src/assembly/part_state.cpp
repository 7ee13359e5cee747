#include "assembly/part_state.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace auraseal::assembly {

const char* toString(PartState state) noexcept
{
    switch (state) {
    case PartState::Pending:
        return "pending";
    case PartState::Validated:
        return "validated";
    case PartState::Corrupt:
        return "corrupt";
    case PartState::Recovering:
        return "recovering";
    case PartState::Recovered:
        return "recovered";
    case PartState::Unrecoverable:
        return "unrecoverable";
    }
    return "unknown";
}

bool isTerminal(PartState state) noexcept
{
    return state == PartState::Validated || state == PartState::Unrecoverable;
}

bool canTransition(PartState from, PartState to) noexcept
{
    switch (from) {
    case PartState::Pending:
        return to == PartState::Validated || to == PartState::Corrupt;
    case PartState::Corrupt:
        return to == PartState::Recovering;
    case PartState::Recovering:
        return to == PartState::Recovered || to == PartState::Unrecoverable;
    case PartState::Recovered:
        return to == PartState::Validated;
    case PartState::Validated:
    case PartState::Unrecoverable:
        return false;
    }
    return false;
}

PartTracker::PartTracker(std::size_t partCount)
    : partCount_(partCount)
    , states_(partCount, PartState::Pending)
{
}

void PartTracker::transition(std::size_t part, PartState to)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& current = states_.at(part);
    if (!canTransition(current, to)) {
        throw std::logic_error("Part " + std::to_string(part) + " cannot move from " + toString(current) + " to "
                               + toString(to));
    }
    current = to;
}

PartState PartTracker::state(std::size_t part) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.at(part);
}

std::vector<PartState> PartTracker::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return states_;
}

std::vector<std::size_t> PartTracker::inState(PartState state) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::size_t> parts;
    for (std::size_t index = 0; index < states_.size(); ++index) {
        if (states_[index] == state) {
            parts.push_back(index);
        }
    }
    return parts;
}

bool PartTracker::allValidated() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::all_of(states_.begin(), states_.end(), [](PartState state) { return state == PartState::Validated; });
}

} // namespace auraseal::assembly
