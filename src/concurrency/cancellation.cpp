#include "concurrency/cancellation.hpp"

#include "errors.hpp"

namespace auraseal::concurrency {

CancellationToken::CancellationToken()
    : cancelled_(std::make_shared<std::atomic<bool>>(false))
{
}

void CancellationToken::cancel() noexcept
{
    cancelled_->store(true, std::memory_order_release);
}

bool CancellationToken::isCancelled() const noexcept
{
    return cancelled_->load(std::memory_order_acquire);
}

void CancellationToken::throwIfCancelled(const std::string& what) const
{
    if (isCancelled()) {
        throw CancelledError(what + " cancelled");
    }
}

} // namespace auraseal::concurrency
